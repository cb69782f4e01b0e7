#include "DiscoveryPresenter.hpp"
#include <QDebug>
#include <QJsonDocument>

#include "net/UdpDiscoveryTransport.hpp"
#include "ble/BleDiscoveryAgent.hpp"
#include "services/CredentialService.hpp"
#include "session/DiscoverySession.hpp"
#include "log/SystemLogger.hpp"

DiscoveryPresenter::DiscoveryPresenter(const DiscoveryParams& params, QObject* p)
    : QObject(p), params_(params)
{
	udp_ = new UdpDiscoveryTransport(this);
	if (params_.enableBle)
		ble_ = new BleDiscoveryAgent(params_.bleScanWindowMs, this);

	credentials_ = new CredentialService(*udp_, params_.credentialSecret, params_.credentialValidityMs,
										 CredentialService::Clock(), this);

	DiscoveryContext ctx;
	ctx.params              = params_;
	ctx.identity.deviceId   = params_.personId;
	ctx.identity.deviceName = params_.deviceName;
	ctx.udp                 = udp_;
	ctx.ble                 = ble_;
	ctx.credentials         = credentials_;
	ctx.store               = &db_;

	session_ = new DiscoverySession(ctx, this);

	qDebug() << "[DiscoveryPresenter] identity:" << params_.personId << "name:" << params_.deviceName;

	connectEvents_();
}

void DiscoveryPresenter::connectEvents_()
{
	// 수신 경로
	connect(udp_, &UdpDiscoveryTransport::datagramReceived, session_, &DiscoverySession::onDatagram);
	connect(session_, &DiscoverySession::ackReceived, credentials_, &CredentialService::onAck);
	if (ble_) {
		connect(ble_, &BleDiscoveryAgent::advertisementReceived, session_, &DiscoverySession::onAdvertisement);
		connect(ble_, &BleDiscoveryAgent::scanFinished, session_, &DiscoverySession::onBleScanFinished);
		connect(ble_, &BleDiscoveryAgent::errorHappened, this, [](const QString& s) {
			SystemLogger::warn("BLE", s);
		});
	}

	// 로깅/상태
	connect(session_, &DiscoverySession::deviceDiscovered, this, [](const DeviceRecord& r) {
		qInfo().noquote() << "[device] discovered" << r.deviceId << r.deviceType
						  << (r.networkAddress.isEmpty() ? r.bleAddress : r.networkAddress);
		SystemLogger::info("SESSION", QStringLiteral("device discovered"), r.deviceId);
	});
	connect(session_, &DiscoverySession::deviceLost, this, [](const QString& id) {
		qInfo() << "[device] lost" << id;
	});
	connect(session_, &DiscoverySession::errorOccurred, this, [](const QString& msg) {
		qWarning() << "[session] error:" << msg;
		SystemLogger::warn("SESSION", msg);
	});
	connect(session_, &DiscoverySession::handshakeDatagram, this,
		[](const QByteArray& data, const QHostAddress& from, quint16 port) {
			qDebug() << "[session] handshake datagram" << data.size() << "bytes from" << from.toString() << port;
		});

	// 병합된 갱신 한 줄씩
	subId_ = session_->subscribe([this](const DeviceUpdate& u) {
		const auto rec = session_->getDevice(u.deviceId);
		if (!rec) return;
		qDebug().noquote() << "[update]" << QJsonDocument(rec->toJson()).toJson(QJsonDocument::Compact);
	});
}

bool DiscoveryPresenter::start()
{
	return session_->startDiscovery();
}

void DiscoveryPresenter::stop()
{
	session_->stopDiscovery();
}

DiscoveryPresenter::~DiscoveryPresenter()
{
	if (session_) {
		session_->unsubscribe(subId_);
		session_->stopDiscovery();
	}
}
