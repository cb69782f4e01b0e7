#pragma once
#include <QObject>
#include <QHostAddress>
#include <QJsonObject>
#include <QTimer>
#include <optional>
#include <vector>

#include "session/DiscoveryContext.hpp"
#include "registry/DeviceRegistry.hpp"
#include "notify/ChangeNotifier.hpp"
#include "liveness/LivenessScheduler.hpp"
#include "services/OwnershipController.hpp"
#include "codec/FrameCodec.hpp"

// discovery 전체 수명 관리: transport bind, broadcast, sweep, claim/release 위임
class DiscoverySession : public QObject {
		Q_OBJECT
public:
		using Subscriber     = ChangeNotifier::Subscriber;
		using ResultCallback = OwnershipController::ResultCallback;

		explicit DiscoverySession(const DiscoveryContext& ctx, QObject* parent = nullptr);
		~DiscoverySession() override;

		bool startDiscovery();
		void stopDiscovery();

		void setForciblyDisabled(bool disabled);
		bool isForciblyDisabled() const { return params_.forciblyDisabled; }

		void claimOwnership(const QString& deviceId, ResultCallback done);
		void releaseOwnership(const QString& deviceId, ResultCallback done);

		std::vector<DeviceRecord> listDevices() const { return registry_.list(); }
		std::optional<DeviceRecord> getDevice(const QString& deviceId) const { return registry_.get(deviceId); }

		int subscribe(Subscriber fn) { return notifier_.subscribe(std::move(fn)); }
		void unsubscribe(int id) { notifier_.unsubscribe(id); }

		// 소유 장치에만. 실제 상태는 장치가 heartbeat 로 다시 알려준다
		OwnershipError setLedState(const QString& deviceId, States::LedStatus led);

		// 즉시 한 장치 timeout 검사. 레코드가 없으면 false
		bool testDeviceAvailability(const QString& deviceId);
		QJsonObject getDeviceOwnershipStatus(const QString& deviceId) const;

		States::SessionState state() const { return state_; }
		bool isRunning() const { return state_ == States::SessionState::Running; }
		const AppIdentity& identity() const { return ctx_.identity; }

		DeviceRegistry& registry() { return registry_; }
		ChangeNotifier& notifier() { return notifier_; }
		LivenessScheduler& liveness() { return liveness_; }
		OwnershipController& ownership() { return owner_; }

public slots:
		void onDatagram(const QByteArray& data, const QHostAddress& from, quint16 port);
		void onAdvertisement(const AdvertisementRecord& record);
		void onBleScanFinished();
		void broadcastPresence();
		void runAvailabilitySweep();

signals:
		void stateChanged(States::SessionState s);
		void discoveryStarted();
		void discoveryStopped();
		void deviceDiscovered(const DeviceRecord& record);
		void deviceUpdated(const DeviceUpdate& update);
		void deviceLost(const QString& deviceId);
		void errorOccurred(const QString& msg);

		// VC_RESPONSE / VC_ACK: credential 서비스로 전달
		void ackReceived(const FrameCodec::AckFrame& ack, const QHostAddress& from, quint16 port);
		// discovery/heartbeat 외 패킷은 해석하지 않고 넘긴다
		void handshakeDatagram(const QByteArray& data, const QHostAddress& from, quint16 port);

private:
		void setState_(States::SessionState s);
		void handleDiscovery_(const DiscoveryFrame& frame, States::Transport transport,
							  const QString& address, quint16 port);
		void handleHeartbeat_(const FrameCodec::HeartbeatFrame& hb, const QHostAddress& from, quint16 port);
		void publish_(const DeviceDelta& delta);
		bool sendProbe_(const QString& deviceId);

		DiscoveryContext ctx_;
		DiscoveryParams& params_;

		DeviceRegistry registry_;
		ChangeNotifier notifier_;
		LivenessScheduler liveness_;
		OwnershipController owner_;

		QTimer broadcastTimer_;
		States::SessionState state_ = States::SessionState::Stopped;
		bool udpUp_ = false;
		bool bleUp_ = false;
};
