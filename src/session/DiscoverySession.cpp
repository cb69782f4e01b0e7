#include "DiscoverySession.hpp"
#include <QDateTime>
#include <QDebug>
#include <stdexcept>
#include "net/IDatagramTransport.hpp"
#include "ble/IAdvertisementSource.hpp"
#include "services/ICredentialService.hpp"
#include "log/SystemLogger.hpp"
#include "log/disco_logging.hpp"

using States::SessionState;
using States::Transport;

namespace {
	ICredentialService& requireCredentials(const DiscoveryContext& ctx)
	{
		if (!ctx.credentials) throw std::invalid_argument("DiscoverySession: credential service is required");
		return *ctx.credentials;
	}

	std::function<qint64()> clockOrWall(const std::function<qint64()>& c)
	{
		if (c) return c;
		return [] { return QDateTime::currentMSecsSinceEpoch(); };
	}
}

DiscoverySession::DiscoverySession(const DiscoveryContext& ctx, QObject* parent)
	: QObject(parent)
	, ctx_(ctx)
	, params_(ctx_.params)
	, registry_(clockOrWall(ctx.clock))
	, notifier_(ctx.params.updateDebounceMs, this)
	, liveness_(registry_, ctx.params, clockOrWall(ctx.clock), this)
	, owner_(registry_, liveness_, requireCredentials(ctx), ctx.store,
			 ctx.identity.deviceId, ctx.params.claimTimeoutMs, clockOrWall(ctx.clock), this)
{
	ctx_.clock = clockOrWall(ctx.clock);

	broadcastTimer_.setInterval(params_.broadcastIntervalMs);
	connect(&broadcastTimer_, &QTimer::timeout, this, &DiscoverySession::broadcastPresence);

	liveness_.setProbeSender([this](const QString& id) { return sendProbe_(id); });

	connect(&owner_, &OwnershipController::ownershipUpdated, this, [this](const DeviceUpdate& u) {
		notifier_.notify(u.deviceId, u);
	});
	connect(&liveness_, &LivenessScheduler::deviceWentOffline, this, [this](const DeviceDelta& d) {
		publish_(d);
	});
	connect(&notifier_, &ChangeNotifier::updateEmitted, this, &DiscoverySession::deviceUpdated);
}

DiscoverySession::~DiscoverySession()
{
	if (state_ != SessionState::Stopped) stopDiscovery();
}

void DiscoverySession::setState_(SessionState s)
{
	if (state_ == s) return;
	state_ = s;
	qCDebug(LC_SESSION) << "[session] state" << States::toString(s);
	emit stateChanged(s);
}

bool DiscoverySession::startDiscovery()
{
	if (params_.forciblyDisabled) {
		qCDebug(LC_SESSION) << "[startDiscovery] forcibly disabled, ignored";
		return false;
	}
	if (state_ == SessionState::Running || state_ == SessionState::Starting) return true;

	setState_(SessionState::Starting);

	udpUp_ = false;
	if (ctx_.udp) {
		udpUp_ = ctx_.udp->open(params_.discoveryPort);
		if (!udpUp_) {
			qWarning() << "[startDiscovery] UDP unavailable on port" << params_.discoveryPort;
			emit errorOccurred(QStringLiteral("udp transport unavailable"));
		}
	}

	bleUp_ = false;
	if (ctx_.ble && params_.enableBle) {
		if (!ctx_.ble->isAvailable()) {
			qInfo() << "[startDiscovery] no bluetooth adapter, continuing with UDP only";
			emit errorOccurred(QStringLiteral("ble transport unavailable"));
		} else {
			bleUp_ = ctx_.ble->startScan();
			if (bleUp_ && params_.enableAdvertising && !ctx_.identity.deviceId.isEmpty())
				ctx_.ble->startAdvertising(ctx_.identity);
		}
	}

	if (!udpUp_ && !bleUp_) {
		qCritical() << "[startDiscovery] no transport available";
		SystemLogger::error("SESSION", QStringLiteral("start failed: no transport"));
		setState_(SessionState::Stopped);
		return false;
	}

	owner_.restoreOwned();
	owner_.resumeSchedules();

	if (udpUp_) {
		broadcastTimer_.start();
		broadcastPresence();
	}
	liveness_.startSweep();

	setState_(SessionState::Running);
	qInfo() << "[startDiscovery] running (udp=" << udpUp_ << ", ble=" << bleUp_ << ")";
	SystemLogger::info("SESSION", QStringLiteral("discovery started"));
	emit discoveryStarted();
	return true;
}

void DiscoverySession::stopDiscovery()
{
	if (state_ == SessionState::Stopped || state_ == SessionState::Stopping) return;

	setState_(SessionState::Stopping);

	broadcastTimer_.stop();
	liveness_.stopSweep();
	liveness_.cancelAll();
	owner_.cancelAll();
	notifier_.cancelAll();

	if (ctx_.ble && bleUp_) {
		ctx_.ble->stopScan();
		ctx_.ble->stopAdvertising();
	}
	if (ctx_.udp && udpUp_) ctx_.udp->close();
	udpUp_ = bleUp_ = false;

	setState_(SessionState::Stopped);
	qInfo() << "[stopDiscovery] stopped";
	SystemLogger::info("SESSION", QStringLiteral("discovery stopped"));
	emit discoveryStopped();
}

void DiscoverySession::setForciblyDisabled(bool disabled)
{
	params_.forciblyDisabled = disabled;
	if (disabled && state_ != SessionState::Stopped) stopDiscovery();
}

void DiscoverySession::claimOwnership(const QString& deviceId, ResultCallback done)
{
	owner_.claim(deviceId, std::move(done));
}

void DiscoverySession::releaseOwnership(const QString& deviceId, ResultCallback done)
{
	owner_.release(deviceId, std::move(done));
}

void DiscoverySession::broadcastPresence()
{
	if (!ctx_.udp || !udpUp_) return;
	const QByteArray pkt = FrameCodec::encodeBroadcast(ctx_.identity);
	if (!ctx_.udp->sendBroadcast(pkt, params_.discoveryPort))
		qCWarning(LC_SESSION) << "[broadcastPresence] send failed";
}

void DiscoverySession::runAvailabilitySweep()
{
	liveness_.sweep();
}

bool DiscoverySession::testDeviceAvailability(const QString& deviceId)
{
	if (!registry_.contains(deviceId)) return false;
	liveness_.testDeviceAvailability(deviceId);
	const auto rec = registry_.get(deviceId);
	return rec && rec->online;
}

QJsonObject DiscoverySession::getDeviceOwnershipStatus(const QString& deviceId) const
{
	QJsonObject o;
	o["device_id"] = deviceId;
	const auto rec = registry_.get(deviceId);
	if (!rec) {
		o["known"] = false;
		return o;
	}
	o["known"]                = true;
	o["owner_id"]             = rec->ownership.ownerId ? QJsonValue(*rec->ownership.ownerId) : QJsonValue();
	o["is_owned_by_me"]       = rec->ownership.ownerId && *rec->ownership.ownerId == ctx_.identity.deviceId;
	o["has_valid_credential"] = rec->ownership.hasValidCredential;
	o["is_authenticated"]     = rec->ownership.isAuthenticated;
	o["state"]                = States::toString(owner_.ownershipState(deviceId));
	o["claim_pending"]        = owner_.hasPendingClaim(deviceId);
	return o;
}

OwnershipError DiscoverySession::setLedState(const QString& deviceId, States::LedStatus led)
{
	const auto rec = registry_.get(deviceId);
	if (!rec) return OwnershipError::UnknownDevice;
	if (!owner_.isLocallyOwned(deviceId)) return OwnershipError::NotOwned;
	if (!ctx_.udp || !udpUp_ || rec->networkAddress.isEmpty() || rec->networkPort == 0)
		return OwnershipError::TransportUnavailable;

	QString action;
	switch (led) {
		case States::LedStatus::On:    action = QStringLiteral("on"); break;
		case States::LedStatus::Off:   action = QStringLiteral("off"); break;
		case States::LedStatus::Blink: action = QStringLiteral("blink"); break;
		case States::LedStatus::Unknown:
			return OwnershipError::None;
	}

	QJsonObject j;
	j["type"]      = "led_control";
	j["action"]    = action;
	j["device_id"] = deviceId;
	j["timestamp"] = static_cast<double>(ctx_.clock());

	const QByteArray pkt = FrameCodec::encodeControlFrame(FrameCodec::FrameType::Command, j,
														  FrameCodec::connectionIdFor(deviceId),
														  FrameCodec::connectionIdFor(ctx_.identity.deviceId));
	if (!ctx_.udp->sendDatagram(pkt, QHostAddress(rec->networkAddress), rec->networkPort)) {
		qWarning() << "[setLedState] send failed ->" << deviceId;
		return OwnershipError::TransportUnavailable;
	}
	qInfo() << "[setLedState]" << deviceId << action;
	SystemLogger::info("LED", action, deviceId);
	return OwnershipError::None;
}

bool DiscoverySession::sendProbe_(const QString& deviceId)
{
	const auto rec = registry_.get(deviceId);
	if (!rec || !ctx_.udp || !udpUp_ || rec->networkAddress.isEmpty() || rec->networkPort == 0)
		return false;

	QJsonObject data;
	data["reason"] = "keepalive_after_inactivity";

	QJsonObject j;
	j["type"]      = "ping";
	j["command"]   = "ping";
	j["deviceId"]  = deviceId;
	j["timestamp"] = static_cast<double>(ctx_.clock());
	j["data"]      = data;

	const QByteArray pkt = FrameCodec::encodeControlFrame(FrameCodec::FrameType::Heartbeat, j,
														  FrameCodec::connectionIdFor(deviceId),
														  FrameCodec::connectionIdFor(ctx_.identity.deviceId));
	return ctx_.udp->sendDatagram(pkt, QHostAddress(rec->networkAddress), rec->networkPort);
}

void DiscoverySession::publish_(const DeviceDelta& delta)
{
	const QString& id = delta.update.deviceId;
	switch (delta.kind) {
		case DeviceDelta::Kind::Created:
			if (const auto rec = registry_.get(id)) emit deviceDiscovered(*rec);
			break;
		case DeviceDelta::Kind::WentOffline:
			SystemLogger::info("LIVE", QStringLiteral("device offline"), id);
			emit deviceLost(id);
			break;
		case DeviceDelta::Kind::Updated:
			break;
	}
	notifier_.notify(id, delta.update);
}

void DiscoverySession::handleDiscovery_(const DiscoveryFrame& frame, Transport transport,
										const QString& address, quint16 port)
{
	// 자기 broadcast 가 되돌아온 경우
	if (frame.deviceId == ctx_.identity.deviceId) return;

	const auto delta = registry_.observe(frame, transport, address, port);
	liveness_.recordActivity(frame.deviceId);
	if (delta) publish_(*delta);
}

void DiscoverySession::onDatagram(const QByteArray& data, const QHostAddress& from, quint16 port)
{
	if (state_ != SessionState::Running) return;

	const FrameCodec::DecodeResult r = FrameCodec::decodeDiscoveryFrame(data);
	if (r.ok()) {
		handleDiscovery_(r.frame, Transport::Wifi, from.toString(), port);
		return;
	}
	if (r.error != FrameCodec::CodecError::NotDiscovery) {
		qCDebug(LC_CODEC) << "[onDatagram] drop from" << from.toString() << FrameCodec::toString(r.error);
		return;
	}

	const FrameCodec::ControlResult c = FrameCodec::decodeControlFrame(data);
	if (!c.ok()) {
		// 모르는 frame type: 다른 계층의 handshake
		emit handshakeDatagram(data, from, port);
		return;
	}

	switch (c.frame.type) {
		case FrameCodec::FrameType::Heartbeat: {
			const FrameCodec::HeartbeatResult hb = FrameCodec::decodeHeartbeat(c.frame);
			if (!hb.ok()) {
				qCDebug(LC_CODEC) << "[onDatagram] drop heartbeat from" << from.toString() << FrameCodec::toString(hb.error);
				return;
			}
			handleHeartbeat_(hb.frame, from, port);
			break;
		}
		case FrameCodec::FrameType::VcResponse:
		case FrameCodec::FrameType::VcAck: {
			const FrameCodec::AckResult ack = FrameCodec::decodeAck(c.frame);
			if (!ack.ok()) {
				qCDebug(LC_CODEC) << "[onDatagram] drop ack from" << from.toString() << FrameCodec::toString(ack.error);
				return;
			}
			emit ackReceived(ack.frame, from, port);
			break;
		}
		default:
			emit handshakeDatagram(data, from, port);
			break;
	}
}

void DiscoverySession::handleHeartbeat_(const FrameCodec::HeartbeatFrame& hb, const QHostAddress& from, quint16 port)
{
	if (hb.deviceId == ctx_.identity.deviceId) return;

	// 모르는 장치의 heartbeat 로 레코드를 만들지 않는다
	if (registry_.contains(hb.deviceId)) {
		DiscoveryFrame f;
		f.deviceId  = hb.deviceId;
		f.status    = hb.status;
		f.ledStatus = hb.ledStatus;
		handleDiscovery_(f, Transport::Wifi, from.toString(), port);
	}

	if (hb.credential) owner_.onCredentialObserved(hb.deviceId, *hb.credential);
	else if (hb.credentialMalformed)
		qCDebug(LC_OWNER) << "[handleHeartbeat_] malformed credential from" << hb.deviceId;
}

void DiscoverySession::onAdvertisement(const AdvertisementRecord& record)
{
	if (state_ != SessionState::Running) return;

	const FrameCodec::DecodeResult r = FrameCodec::decodeAdvertisement(record);
	if (!r.ok()) {
		qCDebug(LC_CODEC) << "[onAdvertisement] skip" << record.address << FrameCodec::toString(r.error);
		return;
	}
	handleDiscovery_(r.frame, Transport::Ble, record.address, 0);
}

void DiscoverySession::onBleScanFinished()
{
	// 스캔 창이 끝나면 다시 연다
	if (state_ == SessionState::Running && bleUp_ && ctx_.ble && !ctx_.ble->isScanning()) {
		if (!ctx_.ble->startScan())
			qCWarning(LC_SESSION) << "[onBleScanFinished] rescan failed";
	}
}
