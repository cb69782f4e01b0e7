#pragma once
#include <QObject>
#include <QHash>
#include <QString>
#include <vector>
#include "include/states.hpp"

struct OwnershipTransition {
		const char* name = "unnamed";			// 전환 식별용 이름
		States::OwnershipState from;
		States::OwnershipState to;
};

// 장치별 소유권 상태. 표에 없는 전환은 거부한다.
class OwnershipFsm : public QObject {
		Q_OBJECT
public:
		explicit OwnershipFsm(QObject* parent = nullptr);

		void addTransition(const OwnershipTransition& t);
		bool canTransition(const QString& deviceId, States::OwnershipState to) const;
		bool transition(const QString& deviceId, States::OwnershipState to);
		void reset(const QString& deviceId);
		void clear();

		States::OwnershipState state(const QString& deviceId) const;

signals:
		void stateChanged(const QString& deviceId, States::OwnershipState s);

private:
		const OwnershipTransition* find_(States::OwnershipState from, States::OwnershipState to) const;

		QHash<QString, States::OwnershipState> states_;
		std::vector<OwnershipTransition> trans_;
};

// 전환 표 구성
void setupOwnershipFsm(OwnershipFsm& fsm);
