#pragma once
#include <QObject>
#include <QHash>
#include <QTimer>
#include <functional>
#include <map>
#include <memory>
#include "include/types.hpp"
#include "fsm/ownership_fsm.hpp"
#include "services/ICredentialService.hpp"

class DeviceRegistry;
class LivenessScheduler;
class IDeviceStore;

enum class OwnershipError {
		None = 0,
		UnknownDevice,
		AlreadyOwned,
		ClaimInProgress,
		OperationInProgress,		// 같은 장치에 release 가 진행 중
		ClaimTimeout,
		ClaimRejected,
		NotOwned,
		ReleaseUnconfirmed,			// 로컬 소유권은 해제됨, 장치 ack 없음
		CredentialIssuerMismatch,
		TransportUnavailable,
		NoIdentity,
		Cancelled
};

const char* toString(OwnershipError e);

struct OwnershipResult {
		OwnershipError error = OwnershipError::None;
		QString deviceId;
		QString message;
		bool ok() const { return error == OwnershipError::None; }
};

// claim / release / credential 복구. 레지스트리 소유권 필드를 바꾸는 유일한 곳.
class OwnershipController : public QObject {
		Q_OBJECT
public:
		using ResultCallback = std::function<void(const OwnershipResult&)>;
		using Clock = std::function<qint64()>;

		OwnershipController(DeviceRegistry& registry,
							LivenessScheduler& liveness,
							ICredentialService& credentials,
							IDeviceStore* store,
							const QString& localIdentity,
							int ackTimeoutMs = 5000,
							Clock clock = Clock(),
							QObject* parent = nullptr);
		~OwnershipController() override;

		void claim(const QString& deviceId, ResultCallback done);
		void release(const QString& deviceId, ResultCallback done);
		void onCredentialObserved(const QString& deviceId, const Credential& credential);

		// 세션 종료: 대기 중인 호출자 전부 Cancelled
		void cancelAll();

		// load_all_owned: 미인증(Owned(Authenticating)) 상태로 복원
		int restoreOwned();

		// 세션 재시작 후 인증된 장치의 heartbeat 예약 재개
		int resumeSchedules();

		States::OwnershipState ownershipState(const QString& deviceId) const { return fsm_.state(deviceId); }
		bool hasPendingClaim(const QString& deviceId) const;
		bool hasPendingOperation(const QString& deviceId) const { return pending_.count(deviceId) > 0; }
		bool isLocallyOwned(const QString& deviceId) const;
		const QString& localIdentity() const { return localId_; }

public slots:
		void onAckTimeout(const QString& deviceId, quint64 token);

signals:
		void ownershipUpdated(const DeviceUpdate& update);
		void ownershipStateChanged(const QString& deviceId, States::OwnershipState s);

private:
		struct PendingOp {
			enum class Kind { Claim, Release };
			Kind kind = Kind::Claim;
			QString deviceId;
			qint64 startedAt = 0;
			quint64 token = 0;
			States::OwnershipState prevState = States::OwnershipState::Unclaimed;
			ResultCallback done;
			std::unique_ptr<QTimer> timer;
		};

		quint64 beginPending_(PendingOp::Kind kind, const QString& deviceId,
							  States::OwnershipState prevState, ResultCallback done);
		bool takePending_(const QString& deviceId, quint64 token, PendingOp& out);

		void onClaimAck_(const QString& deviceId, quint64 token, CredentialError err, const QString& detail);
		void onReleaseAck_(const QString& deviceId, quint64 token, CredentialError err, const QString& detail);
		void onRecoveryVerified_(const QString& deviceId, quint64 token, CredentialError err, const VerifiedInfo& info);

		bool establish_(const QString& deviceId, const QString& journalEvent);
		void clearOwnership_(const QString& deviceId);
		void persist_(const QString& deviceId);
		void journal_(const QString& deviceId, const QString& event, const QString& detail = QString());
		static void finish_(const ResultCallback& done, OwnershipError err, const QString& deviceId,
							const QString& message = QString());

		DeviceRegistry& registry_;
		LivenessScheduler& liveness_;
		ICredentialService& credentials_;
		IDeviceStore* store_ = nullptr;
		QString localId_;
		int ackTimeoutMs_;
		Clock clock_;

		OwnershipFsm fsm_;
		std::map<QString, PendingOp> pending_;
		QHash<QString, quint64> recoveries_;		// credential 검증 대기 중
		quint64 nextToken_ = 1;
};
