#pragma once
#include <QObject>
#include <QHash>
#include <QTimer>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <vector>
#include "include/types.hpp"
#include "config/DiscoveryParams.hpp"

class DeviceRegistry;

// 소유 장치 heartbeat + 전체 장치 availability sweep
//  - 장치가 보내는 프레임마다 응답하지 않는다. 조용한 구간에만 probe 1회.
class LivenessScheduler : public QObject {
		Q_OBJECT
public:
		using Clock = std::function<qint64()>;
		using ProbeSender = std::function<bool(const QString& deviceId)>;

		LivenessScheduler(DeviceRegistry& registry, const DiscoveryParams& params,
						  Clock clock = Clock(), QObject* parent = nullptr);
		~LivenessScheduler() override;

		void setProbeSender(ProbeSender fn) { probe_ = std::move(fn); }

		void recordActivity(const QString& deviceId);

		// Owned(Authenticated) 진입/이탈 시 OwnershipController 가 호출
		void startSchedule(const QString& deviceId);
		void cancelSchedule(const QString& deviceId);
		void cancelAll();

		bool hasSchedule(const QString& deviceId) const { return schedules_.count(deviceId) > 0; }
		bool hasPendingHeartbeat(const QString& deviceId) const;
		int remainingMs(const QString& deviceId) const;
		std::optional<qint64> lastActivity(const QString& deviceId) const;
		int scheduleCount() const { return static_cast<int>(schedules_.size()); }

		void startSweep();
		void stopSweep();
		bool isSweeping() const { return sweepTimer_.isActive(); }

		std::vector<DeviceDelta> sweep();
		std::optional<DeviceDelta> testDeviceAvailability(const QString& deviceId);

public slots:
		void onHeartbeatTimer(const QString& deviceId);

signals:
		void probeSent(const QString& deviceId);
		void deviceWentOffline(const DeviceDelta& delta);

private:
		struct HeartbeatSchedule {
			qint64 lastActivity = 0;
			std::unique_ptr<QTimer> timer;
		};

		void arm_(const QString& deviceId, HeartbeatSchedule& s, int delayMs);

		DeviceRegistry& registry_;
		DiscoveryParams params_;
		Clock clock_;
		ProbeSender probe_;

		std::map<QString, HeartbeatSchedule> schedules_;
		QHash<QString, qint64> lastActivity_;		// 미소유 장치 포함
		QTimer sweepTimer_;
};
