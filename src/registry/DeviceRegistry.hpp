#pragma once
#include <functional>
#include <map>
#include <optional>
#include <vector>
#include <QString>
#include "include/types.hpp"

class OwnershipController;

// 장치별 단일 진실 원본. 이벤트 루프 한 곳에서만 접근한다.
class DeviceRegistry {
public:
		using Clock = std::function<qint64()>;

		explicit DeviceRegistry(Clock clock = Clock());

		// discovery 관측 병합. last_seen 외에 바뀐 것이 없으면 nullopt
		std::optional<DeviceDelta> observe(const DiscoveryFrame& frame,
										   States::Transport transport,
										   const QString& sourceAddress,
										   quint16 sourcePort = 0);

		std::optional<DeviceDelta> markTransportInactive(const QString& deviceId, States::Transport transport);
		std::vector<DeviceDelta> sweepTimeouts(qint64 nowMs, qint64 timeoutMs);
		std::optional<DeviceDelta> sweepDevice(const QString& deviceId, qint64 nowMs, qint64 timeoutMs);
		std::optional<DeviceDelta> applyLedStatus(const QString& deviceId, States::LedStatus led);

		std::optional<DeviceRecord> get(const QString& deviceId) const;
		std::vector<DeviceRecord> list() const;
		bool contains(const QString& deviceId) const { return records_.count(deviceId) > 0; }
		int size() const { return static_cast<int>(records_.size()); }

		qint64 now() const { return clock_(); }

private:
		// 소유권 필드는 OwnershipController 만 바꾼다
		friend class OwnershipController;
		std::optional<DeviceUpdate> applyOwnership(const QString& deviceId, const OwnershipInfo& info);
		bool restore(const DeviceRecord& rec);

		std::optional<DeviceDelta> goOffline_(DeviceRecord& rec);

		Clock clock_;
		std::map<QString, DeviceRecord> records_;
};
