#pragma once
#include <functional>
#include <QString>
#include "include/types.hpp"

enum class CredentialError {
		None = 0,
		Malformed,
		InvalidProof,
		Expired,
		Rejected,				// 장치가 nack (detail 에 사유)
		TransportUnavailable
};

inline const char* toString(CredentialError e)
{
		switch (e) {
			case CredentialError::None:                 return "none";
			case CredentialError::Malformed:            return "malformed";
			case CredentialError::InvalidProof:         return "invalid proof";
			case CredentialError::Expired:              return "expired";
			case CredentialError::Rejected:             return "rejected";
			case CredentialError::TransportUnavailable: return "transport unavailable";
		}
		return "?";
}

struct VerifiedInfo {
		QString issuer;
		QString subject;
		qint64 expiresAt = 0;
};

// 서명/검증/전송 프리미티브. 이 코어는 시그니처 이상은 모른다.
class ICredentialService {
public:
		using VerifyCallback = std::function<void(CredentialError, const VerifiedInfo&)>;
		using AckCallback    = std::function<void(CredentialError, const QString& detail)>;

		virtual ~ICredentialService() = default;

		virtual Credential issueCredential(const QString& deviceId, const QString& ownerId) = 0;
		virtual void verifyCredential(const Credential& cred, VerifyCallback done) = 0;

		// 장치로 credential 전송 후 application-level ack 대기
		virtual void transmitCredential(const Credential& cred, const QString& address, quint16 port,
										AckCallback done) = 0;
		// 소유권 해제 handshake
		virtual void requestRelease(const QString& deviceId, const QString& ownerId,
									const QString& address, quint16 port, AckCallback done) = 0;

		// 대기 중인 ack 포기 (timeout / 세션 종료)
		virtual void cancel(const QString& deviceId) = 0;
};
