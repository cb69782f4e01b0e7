#pragma once
#include <QObject>
#include <QHash>
#include <QHostAddress>
#include <functional>
#include "services/ICredentialService.hpp"
#include "codec/FrameCodec.hpp"

class IDatagramTransport;

// HMAC-SHA256 proof 기반 credential + UDP(VC_INIT) 전송, 장치 응답(provisioning_response) 대기
class CredentialService : public QObject, public ICredentialService {
		Q_OBJECT
public:
		using Clock = std::function<qint64()>;

		CredentialService(IDatagramTransport& transport,
						  const QByteArray& secret,
						  qint64 validityMs,
						  Clock clock = Clock(),
						  QObject* parent = nullptr);

		Credential issueCredential(const QString& deviceId, const QString& ownerId) override;
		void verifyCredential(const Credential& cred, VerifyCallback done) override;
		void transmitCredential(const Credential& cred, const QString& address, quint16 port,
								AckCallback done) override;
		void requestRelease(const QString& deviceId, const QString& ownerId,
							const QString& address, quint16 port, AckCallback done) override;
		void cancel(const QString& deviceId) override;

		bool hasPendingAck(const QString& deviceId) const { return pending_.contains(deviceId); }
		QByteArray proofFor(const Credential& cred) const;

public slots:
		// 장치 응답. 요청을 보낸 endpoint 에서 온 같은 종류의 응답만 인정
		void onAck(const FrameCodec::AckFrame& ack, const QHostAddress& from, quint16 port);

private:
		struct PendingAck {
			FrameCodec::AckKind kind = FrameCodec::AckKind::Provisioning;
			AckCallback done;
			QString endpoint;		// "addr:port"
		};

		bool send_(const QString& deviceId, const QJsonObject& json, const QString& address, quint16 port);
		static QString endpointKey_(const QHostAddress& address, quint16 port);

		IDatagramTransport& transport_;
		QByteArray secret_;
		qint64 validityMs_;
		Clock clock_;
		QHash<QString, PendingAck> pending_;
};
