#include "CredentialService.hpp"
#include <QDateTime>
#include <QMessageAuthenticationCode>
#include <QMetaObject>
#include <QUuid>
#include <QDebug>
#include "net/IDatagramTransport.hpp"
#include "log/disco_logging.hpp"

CredentialService::CredentialService(IDatagramTransport& transport,
									 const QByteArray& secret,
									 qint64 validityMs,
									 Clock clock,
									 QObject* parent)
	: QObject(parent)
	, transport_(transport)
	, secret_(secret)
	, validityMs_(validityMs)
	, clock_(clock ? std::move(clock) : Clock([] { return QDateTime::currentMSecsSinceEpoch(); }))
{
	if (secret_.isEmpty())
		qWarning() << "[CredentialService] empty credential secret: every verification will fail";
}

QByteArray CredentialService::proofFor(const Credential& c) const
{
	const QByteArray msg = QStringLiteral("%1|%2|%3|%4|%5")
		.arg(c.id, c.issuer, c.subject)
		.arg(c.issuedAt)
		.arg(c.expiresAt)
		.toUtf8();
	return QMessageAuthenticationCode::hash(msg, secret_, QCryptographicHash::Sha256);
}

Credential CredentialService::issueCredential(const QString& deviceId, const QString& ownerId)
{
	Credential c;
	c.id        = QUuid::createUuid().toString(QUuid::WithoutBraces);
	c.issuer    = ownerId;
	c.subject   = deviceId;
	c.issuedAt  = clock_();
	c.expiresAt = c.issuedAt + validityMs_;
	c.proof     = proofFor(c);
	return c;
}

void CredentialService::verifyCredential(const Credential& cred, VerifyCallback done)
{
	CredentialError err = CredentialError::None;
	if (cred.isNull() || cred.proof.isEmpty()) err = CredentialError::Malformed;
	else if (secret_.isEmpty() || proofFor(cred) != cred.proof) err = CredentialError::InvalidProof;
	else if (cred.expiresAt > 0 && cred.expiresAt < clock_()) err = CredentialError::Expired;

	VerifiedInfo info;
	if (err == CredentialError::None) {
		info.issuer    = cred.issuer;
		info.subject   = cred.subject;
		info.expiresAt = cred.expiresAt;
	}

	// 결과는 다음 이벤트 루프 턴에서 전달
	QMetaObject::invokeMethod(this, [done, err, info] { if (done) done(err, info); }, Qt::QueuedConnection);
}

QString CredentialService::endpointKey_(const QHostAddress& address, quint16 port)
{
	// ::ffff:a.b.c.d 와 a.b.c.d 를 같은 endpoint 로
	bool v4 = false;
	const quint32 ip4 = address.toIPv4Address(&v4);
	const QString host = v4 ? QHostAddress(ip4).toString() : address.toString();
	return QStringLiteral("%1:%2").arg(host).arg(port);
}

bool CredentialService::send_(const QString& deviceId, const QJsonObject& json,
							  const QString& address, quint16 port)
{
	const QByteArray pkt = FrameCodec::encodeControlFrame(FrameCodec::FrameType::VcInit, json,
														  FrameCodec::connectionIdFor(deviceId));
	if (pkt.isEmpty()) return false;
	return transport_.sendDatagram(pkt, QHostAddress(address), port);
}

void CredentialService::transmitCredential(const Credential& cred, const QString& address, quint16 port,
										   AckCallback done)
{
	QJsonObject j;
	j["type"]       = "provision_device";
	j["device_id"]  = cred.subject;
	j["credential"] = cred.toJson();
	j["timestamp"]  = static_cast<double>(clock_());

	pending_.insert(cred.subject, PendingAck{ FrameCodec::AckKind::Provisioning, done,
											  endpointKey_(QHostAddress(address), port) });
	if (!send_(cred.subject, j, address, port)) {
		qWarning() << "[transmitCredential] send failed ->" << address << port;
		pending_.remove(cred.subject);
		if (done) done(CredentialError::TransportUnavailable, QStringLiteral("send failed"));
		return;
	}
	qCDebug(LC_TRANSPORT) << "[transmitCredential]" << cred.subject << "->" << address << port;
}

void CredentialService::requestRelease(const QString& deviceId, const QString& ownerId,
									   const QString& address, quint16 port, AckCallback done)
{
	QJsonObject j;
	j["type"]           = "ownership_remove";
	j["senderPersonId"] = ownerId;
	j["deviceId"]       = deviceId;
	j["timestamp"]      = static_cast<double>(clock_());

	pending_.insert(deviceId, PendingAck{ FrameCodec::AckKind::Removal, done,
										  endpointKey_(QHostAddress(address), port) });
	if (!send_(deviceId, j, address, port)) {
		qWarning() << "[requestRelease] send failed ->" << address << port;
		pending_.remove(deviceId);
		if (done) done(CredentialError::TransportUnavailable, QStringLiteral("send failed"));
	}
}

void CredentialService::cancel(const QString& deviceId)
{
	pending_.remove(deviceId);
}

void CredentialService::onAck(const FrameCodec::AckFrame& ack, const QHostAddress& from, quint16 port)
{
	const QString key = endpointKey_(from, port);

	QString deviceId = ack.deviceId;
	if (deviceId.isEmpty()) {
		// 구버전 펌웨어: device_id 없이 응답 -> 송신 주소로 매칭
		for (auto it = pending_.cbegin(); it != pending_.cend(); ++it) {
			if (it.value().endpoint == key && it.value().kind == ack.kind) { deviceId = it.key(); break; }
		}
	}

	auto it = pending_.find(deviceId);
	if (it == pending_.end()) {
		qCDebug(LC_TRANSPORT) << "[onAck] unsolicited ack from" << key << deviceId;
		return;
	}
	if (it.value().endpoint != key) {
		qWarning() << "[onAck] ack for" << deviceId << "from unexpected endpoint" << key
				   << "(expected" << it.value().endpoint << ")";
		return;
	}
	if (it.value().kind != ack.kind) {
		qWarning() << "[onAck] ack kind mismatch for" << deviceId << "from" << key;
		return;
	}

	const AckCallback done = it.value().done;
	pending_.erase(it);
	if (done) done(ack.success ? CredentialError::None : CredentialError::Rejected, ack.status);
}
