#include "OwnershipController.hpp"
#include <QDateTime>
#include <QDebug>
#include <vector>
#include "registry/DeviceRegistry.hpp"
#include "liveness/LivenessScheduler.hpp"
#include "services/IDeviceStore.hpp"
#include "log/SystemLogger.hpp"
#include "log/disco_logging.hpp"

using States::OwnershipState;

const char* toString(OwnershipError e)
{
	switch (e) {
		case OwnershipError::None:                     return "ok";
		case OwnershipError::UnknownDevice:            return "unknown device";
		case OwnershipError::AlreadyOwned:             return "already owned";
		case OwnershipError::ClaimInProgress:          return "claim in progress";
		case OwnershipError::OperationInProgress:      return "operation in progress";
		case OwnershipError::ClaimTimeout:             return "claim timeout";
		case OwnershipError::ClaimRejected:            return "claim rejected";
		case OwnershipError::NotOwned:                 return "not owned";
		case OwnershipError::ReleaseUnconfirmed:       return "release unconfirmed";
		case OwnershipError::CredentialIssuerMismatch: return "credential issuer mismatch";
		case OwnershipError::TransportUnavailable:     return "transport unavailable";
		case OwnershipError::NoIdentity:               return "no local identity";
		case OwnershipError::Cancelled:                return "cancelled";
	}
	return "?";
}

OwnershipController::OwnershipController(DeviceRegistry& registry,
										 LivenessScheduler& liveness,
										 ICredentialService& credentials,
										 IDeviceStore* store,
										 const QString& localIdentity,
										 int ackTimeoutMs,
										 Clock clock,
										 QObject* parent)
	: QObject(parent)
	, registry_(registry)
	, liveness_(liveness)
	, credentials_(credentials)
	, store_(store)
	, localId_(localIdentity)
	, ackTimeoutMs_(ackTimeoutMs > 0 ? ackTimeoutMs : 5000)
	, clock_(clock ? std::move(clock) : Clock([] { return QDateTime::currentMSecsSinceEpoch(); }))
{
	setupOwnershipFsm(fsm_);
	connect(&fsm_, &OwnershipFsm::stateChanged, this, &OwnershipController::ownershipStateChanged);
}

OwnershipController::~OwnershipController()
{
	// 소멸 시 남은 타이머만 정리 (콜백은 호출하지 않음)
	for (auto& kv : pending_) {
		if (kv.second.timer) kv.second.timer->stop();
	}
}

void OwnershipController::finish_(const ResultCallback& done, OwnershipError err,
								  const QString& deviceId, const QString& message)
{
	if (!done) return;
	OwnershipResult r;
	r.error    = err;
	r.deviceId = deviceId;
	r.message  = message.isEmpty() ? QString::fromLatin1(toString(err)) : message;
	done(r);
}

bool OwnershipController::hasPendingClaim(const QString& deviceId) const
{
	auto it = pending_.find(deviceId);
	return it != pending_.end() && it->second.kind == PendingOp::Kind::Claim;
}

bool OwnershipController::isLocallyOwned(const QString& deviceId) const
{
	const auto rec = registry_.get(deviceId);
	return rec && rec->ownership.ownerId && *rec->ownership.ownerId == localId_;
}

quint64 OwnershipController::beginPending_(PendingOp::Kind kind, const QString& deviceId,
										   States::OwnershipState prevState, ResultCallback done)
{
	const quint64 token = nextToken_++;

	PendingOp op;
	op.kind      = kind;
	op.deviceId  = deviceId;
	op.startedAt = clock_();
	op.token     = token;
	op.prevState = prevState;
	op.done      = std::move(done);
	op.timer     = std::make_unique<QTimer>();
	op.timer->setSingleShot(true);
	connect(op.timer.get(), &QTimer::timeout, this, [this, deviceId, token] { onAckTimeout(deviceId, token); });
	op.timer->start(ackTimeoutMs_);

	pending_[deviceId] = std::move(op);
	return token;
}

bool OwnershipController::takePending_(const QString& deviceId, quint64 token, PendingOp& out)
{
	auto it = pending_.find(deviceId);
	if (it == pending_.end() || it->second.token != token) return false;

	out = std::move(it->second);
	pending_.erase(it);
	if (out.timer) {
		out.timer->stop();
		out.timer.release()->deleteLater();
	}
	return true;
}

void OwnershipController::claim(const QString& deviceId, ResultCallback done)
{
	if (localId_.isEmpty()) {
		finish_(done, OwnershipError::NoIdentity, deviceId);
		return;
	}
	const auto busy = pending_.find(deviceId);
	if (busy != pending_.end()) {
		finish_(done, busy->second.kind == PendingOp::Kind::Claim ? OwnershipError::ClaimInProgress
																   : OwnershipError::OperationInProgress,
				deviceId);
		return;
	}

	const auto rec = registry_.get(deviceId);
	if (!rec) {
		finish_(done, OwnershipError::UnknownDevice, deviceId);
		return;
	}

	const auto& owner = rec->ownership.ownerId;
	if (owner && !owner->isEmpty() && *owner != localId_) {
		qInfo() << "[claim]" << deviceId << "already owned by another identity";
		finish_(done, OwnershipError::AlreadyOwned, deviceId);
		return;
	}
	if (owner && *owner == localId_ && fsm_.state(deviceId) == OwnershipState::OwnedAuthenticated) {
		finish_(done, OwnershipError::None, deviceId, QStringLiteral("already owned locally"));
		return;
	}
	if (rec->networkAddress.isEmpty() || rec->networkPort == 0) {
		finish_(done, OwnershipError::TransportUnavailable, deviceId,
				QStringLiteral("no network endpoint for device"));
		return;
	}
	const OwnershipState prev = fsm_.state(deviceId);
	if (!fsm_.transition(deviceId, OwnershipState::Claiming)) {
		finish_(done, OwnershipError::ClaimInProgress, deviceId);
		return;
	}

	const quint64 token = beginPending_(PendingOp::Kind::Claim, deviceId, prev, std::move(done));
	qInfo() << "[claim]" << deviceId << "->" << rec->networkAddress << rec->networkPort << "token=" << token;
	SystemLogger::info("OWN", QStringLiteral("claim started"), deviceId);

	const Credential cred = credentials_.issueCredential(deviceId, localId_);
	credentials_.transmitCredential(cred, rec->networkAddress, rec->networkPort,
		[this, deviceId, token](CredentialError err, const QString& detail) {
			onClaimAck_(deviceId, token, err, detail);
		});
}

void OwnershipController::onClaimAck_(const QString& deviceId, quint64 token,
									  CredentialError err, const QString& detail)
{
	PendingOp op;
	if (!takePending_(deviceId, token, op)) {
		qCDebug(LC_OWNER) << "[onClaimAck_] stale ack ignored" << deviceId << token;
		return;
	}

	if (err != CredentialError::None) {
		fsm_.transition(deviceId, op.prevState);
		journal_(deviceId, QStringLiteral("ownership_claim_failed"), detail);
		SystemLogger::warn("OWN", QStringLiteral("claim failed: %1").arg(detail), deviceId);

		OwnershipError e = OwnershipError::ClaimRejected;
		if (err == CredentialError::TransportUnavailable) e = OwnershipError::TransportUnavailable;
		else if (detail == QLatin1String("already_owned")) e = OwnershipError::AlreadyOwned;
		finish_(op.done, e, deviceId, detail.isEmpty() ? QString() : detail);
		return;
	}

	// await 이후 레코드 재확인
	if (!registry_.contains(deviceId)) {
		fsm_.reset(deviceId);
		finish_(op.done, OwnershipError::UnknownDevice, deviceId);
		return;
	}

	// ack 자체가 장치 측 인증 완료 (provisioning_ack)
	establish_(deviceId, QStringLiteral("ownership_established"));
	qInfo() << "[onClaimAck_]" << deviceId << "owned after" << (clock_() - op.startedAt) << "ms";
	finish_(op.done, OwnershipError::None, deviceId);
}

void OwnershipController::onAckTimeout(const QString& deviceId, quint64 token)
{
	PendingOp op;
	if (!takePending_(deviceId, token, op)) return;

	credentials_.cancel(deviceId);

	if (op.kind == PendingOp::Kind::Claim) {
		qWarning() << "[onAckTimeout] claim timeout for" << deviceId << "after" << ackTimeoutMs_ << "ms";
		fsm_.transition(deviceId, op.prevState);
		journal_(deviceId, QStringLiteral("ownership_claim_failed"), QStringLiteral("timeout"));
		SystemLogger::warn("OWN", QStringLiteral("claim timeout"), deviceId);
		finish_(op.done, OwnershipError::ClaimTimeout, deviceId);
		return;
	}

	// release: 장치 응답이 없어도 로컬 소유권은 해제
	qWarning() << "[onAckTimeout] release not acknowledged by" << deviceId;
	clearOwnership_(deviceId);
	journal_(deviceId, QStringLiteral("ownership_removal_failed"), QStringLiteral("timeout"));
	finish_(op.done, OwnershipError::ReleaseUnconfirmed, deviceId, QStringLiteral("timeout"));
}

void OwnershipController::release(const QString& deviceId, ResultCallback done)
{
	if (pending_.count(deviceId)) {
		finish_(done, OwnershipError::OperationInProgress, deviceId);
		return;
	}

	const auto rec = registry_.get(deviceId);
	if (!rec) {
		finish_(done, OwnershipError::UnknownDevice, deviceId);
		return;
	}
	if (!isLocallyOwned(deviceId)) {
		finish_(done, OwnershipError::NotOwned, deviceId);
		return;
	}

	if (rec->networkAddress.isEmpty() || rec->networkPort == 0) {
		// handshake 불가. 로컬 상태는 더 이상 신뢰하지 않는다
		clearOwnership_(deviceId);
		journal_(deviceId, QStringLiteral("ownership_removal_failed"), QStringLiteral("unreachable"));
		finish_(done, OwnershipError::ReleaseUnconfirmed, deviceId, QStringLiteral("unreachable"));
		return;
	}

	const quint64 token = beginPending_(PendingOp::Kind::Release, deviceId, fsm_.state(deviceId), std::move(done));
	qInfo() << "[release]" << deviceId << "token=" << token;
	SystemLogger::info("OWN", QStringLiteral("release started"), deviceId);

	credentials_.requestRelease(deviceId, localId_, rec->networkAddress, rec->networkPort,
		[this, deviceId, token](CredentialError err, const QString& detail) {
			onReleaseAck_(deviceId, token, err, detail);
		});
}

void OwnershipController::onReleaseAck_(const QString& deviceId, quint64 token,
										CredentialError err, const QString& detail)
{
	PendingOp op;
	if (!takePending_(deviceId, token, op)) {
		qCDebug(LC_OWNER) << "[onReleaseAck_] stale ack ignored" << deviceId << token;
		return;
	}

	clearOwnership_(deviceId);

	if (err != CredentialError::None) {
		qWarning() << "[onReleaseAck_]" << deviceId << "device answered:" << toString(err) << detail;
		journal_(deviceId, QStringLiteral("ownership_removal_failed"), detail);
		finish_(op.done, OwnershipError::ReleaseUnconfirmed, deviceId, detail);
		return;
	}

	journal_(deviceId, QStringLiteral("ownership_removed"));
	SystemLogger::info("OWN", QStringLiteral("ownership removed"), deviceId);
	finish_(op.done, OwnershipError::None, deviceId);
}

void OwnershipController::onCredentialObserved(const QString& deviceId, const Credential& credential)
{
	if (credential.issuer != localId_ || localId_.isEmpty()) {
		// 다른 사람이 소유한 장치: 로그만
		qCInfo(LC_OWNER) << "[onCredentialObserved]" << deviceId << "issuer mismatch, ignored";
		SystemLogger::debug("OWN", QString::fromLatin1(toString(OwnershipError::CredentialIssuerMismatch)), deviceId);
		return;
	}
	if (!credential.subject.isEmpty() && credential.subject != deviceId) {
		qCInfo(LC_OWNER) << "[onCredentialObserved]" << deviceId << "subject mismatch, ignored";
		return;
	}
	if (!registry_.contains(deviceId) || pending_.count(deviceId)) return;
	if (fsm_.state(deviceId) == OwnershipState::OwnedAuthenticated) return;
	if (recoveries_.contains(deviceId)) return;		// 이미 검증 중

	const quint64 token = nextToken_++;
	recoveries_.insert(deviceId, token);
	qCDebug(LC_OWNER) << "[onCredentialObserved] verifying credential for" << deviceId;

	credentials_.verifyCredential(credential,
		[this, deviceId, token](CredentialError err, const VerifiedInfo& info) {
			onRecoveryVerified_(deviceId, token, err, info);
		});
}

void OwnershipController::onRecoveryVerified_(const QString& deviceId, quint64 token,
											  CredentialError err, const VerifiedInfo& info)
{
	if (recoveries_.value(deviceId, 0) != token) {
		qCDebug(LC_OWNER) << "[onRecoveryVerified_] stale verification" << deviceId;
		return;
	}
	recoveries_.remove(deviceId);

	if (err != CredentialError::None) {
		qWarning() << "[onRecoveryVerified_]" << deviceId << "credential rejected:" << toString(err);
		return;
	}
	if (info.issuer != localId_) return;

	// 검증 대기 중 다른 경로가 상태를 바꿨을 수 있음
	if (!registry_.contains(deviceId) || pending_.count(deviceId)) return;
	if (fsm_.state(deviceId) == OwnershipState::OwnedAuthenticated) return;

	if (establish_(deviceId, QStringLiteral("ownership_recovered")))
		qInfo() << "[onRecoveryVerified_]" << deviceId << "ownership recovered from credential";
}

bool OwnershipController::establish_(const QString& deviceId, const QString& journalEvent)
{
	OwnershipInfo info;
	info.ownerId            = localId_;
	info.hasValidCredential = true;
	info.isAuthenticated    = true;

	const auto update = registry_.applyOwnership(deviceId, info);
	if (!update) return false;

	if (fsm_.state(deviceId) != OwnershipState::OwnedAuthenticating)
		fsm_.transition(deviceId, OwnershipState::OwnedAuthenticating);
	fsm_.transition(deviceId, OwnershipState::OwnedAuthenticated);

	persist_(deviceId);
	journal_(deviceId, journalEvent);
	SystemLogger::info("OWN", journalEvent, deviceId);

	liveness_.recordActivity(deviceId);
	liveness_.startSchedule(deviceId);

	emit ownershipUpdated(*update);
	return true;
}

void OwnershipController::clearOwnership_(const QString& deviceId)
{
	liveness_.cancelSchedule(deviceId);
	recoveries_.remove(deviceId);

	if (const auto update = registry_.applyOwnership(deviceId, OwnershipInfo{}))
		emit ownershipUpdated(*update);

	fsm_.transition(deviceId, OwnershipState::Unclaimed);

	if (store_ && !store_->deleteDevice(deviceId)) {
		qWarning() << "[clearOwnership_] persisted record not removed for" << deviceId;
		SystemLogger::error("OWN", QStringLiteral("persistence delete failed"), deviceId);
	}
}

void OwnershipController::persist_(const QString& deviceId)
{
	if (!store_) return;
	const auto rec = registry_.get(deviceId);
	if (!rec) return;
	if (!store_->saveDevice(*rec)) {
		qWarning() << "[persist_] save failed for" << deviceId << "(continuing)";
		SystemLogger::error("OWN", QStringLiteral("persistence save failed"), deviceId);
	}
}

void OwnershipController::journal_(const QString& deviceId, const QString& event, const QString& detail)
{
	if (!store_) return;
	if (!store_->appendOwnershipJournal(deviceId, event, localId_, detail))
		qWarning() << "[journal_] write failed:" << deviceId << event;
}

void OwnershipController::cancelAll()
{
	std::map<QString, PendingOp> drained;
	drained.swap(pending_);
	recoveries_.clear();

	for (auto& kv : drained) {
		PendingOp& op = kv.second;
		if (op.timer) {
			op.timer->stop();
			op.timer.release()->deleteLater();
		}
		credentials_.cancel(op.deviceId);
		if (op.kind == PendingOp::Kind::Claim)
			fsm_.transition(op.deviceId, op.prevState);

		qInfo() << "[cancelAll] abandon pending" << (op.kind == PendingOp::Kind::Claim ? "claim" : "release")
				<< "for" << op.deviceId;
		finish_(op.done, OwnershipError::Cancelled, op.deviceId);
	}
}

int OwnershipController::restoreOwned()
{
	if (!store_) return 0;

	int restored = 0;
	const std::vector<DeviceRecord> rows = store_->loadAllOwned();
	for (const auto& rec : rows) {
		if (!rec.ownership.ownerId || *rec.ownership.ownerId != localId_) {
			qWarning() << "[restoreOwned] skip" << rec.deviceId << "owned by another identity";
			continue;
		}
		if (fsm_.state(rec.deviceId) != OwnershipState::Unclaimed) continue;

		if (!registry_.restore(rec)) {
			// 이미 discovery 로 보인 장치: 소유권만 복원 (미인증)
			OwnershipInfo info;
			info.ownerId            = localId_;
			info.hasValidCredential = rec.ownership.hasValidCredential;
			info.isAuthenticated    = false;
			const auto update = registry_.applyOwnership(rec.deviceId, info);
			if (update) emit ownershipUpdated(*update);
		} else {
			DeviceUpdate u;
			u.deviceId           = rec.deviceId;
			u.ownerId            = localId_;
			u.hasValidCredential = rec.ownership.hasValidCredential;
			u.isAuthenticated    = false;
			u.online             = false;
			emit ownershipUpdated(u);
		}

		fsm_.transition(rec.deviceId, OwnershipState::OwnedAuthenticating);
		++restored;
	}

	if (restored > 0) qInfo() << "[restoreOwned]" << restored << "owned devices restored (unverified)";
	return restored;
}

int OwnershipController::resumeSchedules()
{
	int resumed = 0;
	for (const auto& rec : registry_.list()) {
		if (fsm_.state(rec.deviceId) != OwnershipState::OwnedAuthenticated) continue;
		liveness_.startSchedule(rec.deviceId);
		++resumed;
	}
	if (resumed > 0) qCDebug(LC_OWNER) << "[resumeSchedules]" << resumed << "heartbeat schedules resumed";
	return resumed;
}
