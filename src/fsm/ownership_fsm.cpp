#include "ownership_fsm.hpp"
#include <QDebug>
#include "log/disco_logging.hpp"

using States::OwnershipState;

OwnershipFsm::OwnershipFsm(QObject* parent) : QObject(parent)
{
}

void OwnershipFsm::addTransition(const OwnershipTransition& t)
{
		trans_.push_back(t);
}

const OwnershipTransition* OwnershipFsm::find_(OwnershipState from, OwnershipState to) const
{
		for (const auto& t : trans_) {
			if (t.from == from && t.to == to) return &t;
		}
		return nullptr;
}

OwnershipState OwnershipFsm::state(const QString& deviceId) const
{
		return states_.value(deviceId, OwnershipState::Unclaimed);
}

bool OwnershipFsm::canTransition(const QString& deviceId, OwnershipState to) const
{
		const OwnershipState from = state(deviceId);
		return from == to || find_(from, to) != nullptr;
}

bool OwnershipFsm::transition(const QString& deviceId, OwnershipState to)
{
		const OwnershipState from = state(deviceId);
		if (from == to) return true;

		const OwnershipTransition* t = find_(from, to);
		if (!t) {
			qCWarning(LC_OWNER) << "[FSM] reject" << deviceId
				<< States::toString(from) << "->" << States::toString(to);
			return false;
		}

		qCDebug(LC_OWNER) << "[FSM]" << t->name << deviceId;
		if (to == OwnershipState::Unclaimed) states_.remove(deviceId);
		else states_[deviceId] = to;

		emit stateChanged(deviceId, to);
		return true;
}

void OwnershipFsm::reset(const QString& deviceId)
{
		if (states_.remove(deviceId) > 0)
			emit stateChanged(deviceId, OwnershipState::Unclaimed);
}

void OwnershipFsm::clear()
{
		states_.clear();
}

void setupOwnershipFsm(OwnershipFsm& fsm)
{
		// claim
		fsm.addTransition({ "unclaimed->claiming",            OwnershipState::Unclaimed,           OwnershipState::Claiming });
		fsm.addTransition({ "claiming->unclaimed",            OwnershipState::Claiming,            OwnershipState::Unclaimed });
		fsm.addTransition({ "claiming->authenticating",       OwnershipState::Claiming,            OwnershipState::OwnedAuthenticating });
		fsm.addTransition({ "authenticating->authenticated",  OwnershipState::OwnedAuthenticating, OwnershipState::OwnedAuthenticated });

		// 복원된 소유 장치 재-claim
		fsm.addTransition({ "authenticating->claiming",       OwnershipState::OwnedAuthenticating, OwnershipState::Claiming });

		// 저장소 복원 / credential 기반 복구
		fsm.addTransition({ "unclaimed->authenticating",      OwnershipState::Unclaimed,           OwnershipState::OwnedAuthenticating });

		// release
		fsm.addTransition({ "authenticated->unclaimed",       OwnershipState::OwnedAuthenticated,  OwnershipState::Unclaimed });
		fsm.addTransition({ "authenticating->unclaimed",      OwnershipState::OwnedAuthenticating, OwnershipState::Unclaimed });
}
