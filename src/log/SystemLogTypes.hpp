#pragma once
#include <QString>
#include <QDateTime>
#include <QMetaType>

// system_logs.level 컬럼 값과 동일
enum class SysLogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Critical = 4 };

inline const char* toString(SysLogLevel lv)
{
	switch (lv) {
		case SysLogLevel::Debug:    return "debug";
		case SysLogLevel::Info:     return "info";
		case SysLogLevel::Warn:     return "warn";
		case SysLogLevel::Error:    return "error";
		case SysLogLevel::Critical: return "critical";
	}
	return "info";
}

// 설정 파일 log_level. 모르는 값이면 fallback
inline SysLogLevel sysLogLevelFromString(const QString& s, SysLogLevel fallback = SysLogLevel::Info)
{
	const QString v = s.trimmed().toLower();
	if (v == "debug")                      return SysLogLevel::Debug;
	if (v == "info")                       return SysLogLevel::Info;
	if (v == "warn" || v == "warning")     return SysLogLevel::Warn;
	if (v == "error")                      return SysLogLevel::Error;
	if (v == "critical")                   return SysLogLevel::Critical;
	return fallback;
}

// SESSION / OWN / LIVE / LED / BLE / APP
struct SystemLogEntry {
	SysLogLevel level = SysLogLevel::Info;
	QString tag;
	QString message;
	QDateTime ts;
	QString deviceId;		// system_logs.extra
};

Q_DECLARE_METATYPE(SystemLogEntry)
