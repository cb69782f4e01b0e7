#pragma once
#include <QObject>
#include <QString>

namespace States {
	enum class Transport		{ Wifi, Ble };
	enum class LinkStatus		{ Inactive, Active };
	enum class SessionState		{ Stopped, Starting, Running, Stopping };
	enum class OwnershipState	{
		Unclaimed = 0,
		Claiming,				// 1  credential 전송 후 ack 대기
		OwnedAuthenticating,	// 2  소유 기록은 있으나 장치 인증 전
		OwnedAuthenticated		// 3
	};
	enum class LedStatus		{ Unknown, On, Off, Blink };

	inline const char* toString(Transport t) { return t == Transport::Wifi ? "wifi" : "ble"; }
	inline const char* toString(LinkStatus s) { return s == LinkStatus::Active ? "active" : "inactive"; }

	inline const char* toString(SessionState s)
	{
		switch (s) {
			case SessionState::Stopped:  return "Stopped";
			case SessionState::Starting: return "Starting";
			case SessionState::Running:  return "Running";
			case SessionState::Stopping: return "Stopping";
		}
		return "?";
	}

	inline const char* toString(OwnershipState s)
	{
		switch (s) {
			case OwnershipState::Unclaimed:           return "Unclaimed";
			case OwnershipState::Claiming:            return "Claiming";
			case OwnershipState::OwnedAuthenticating: return "Owned(Authenticating)";
			case OwnershipState::OwnedAuthenticated:  return "Owned(Authenticated)";
		}
		return "?";
	}

	inline QString toString(LedStatus s)
	{
		switch (s) {
			case LedStatus::On:    return QStringLiteral("on");
			case LedStatus::Off:   return QStringLiteral("off");
			case LedStatus::Blink: return QStringLiteral("blink");
			default:               return QStringLiteral("unknown");
		}
	}

	inline LedStatus ledStatusFromString(const QString& s)
	{
		const QString v = s.trimmed().toLower();
		if (v == "on" || v == "true" || v == "1")   return LedStatus::On;
		if (v == "off" || v == "false" || v == "0") return LedStatus::Off;
		if (v == "blink" || v == "blinking")        return LedStatus::Blink;
		return LedStatus::Unknown;
	}
}

Q_DECLARE_METATYPE(States::Transport)
Q_DECLARE_METATYPE(States::SessionState)
Q_DECLARE_METATYPE(States::OwnershipState)
Q_DECLARE_METATYPE(States::LedStatus)
