#pragma once
#include <QObject>
#include <QThread>
#include <atomic>

#include "SystemLogTypes.hpp"

namespace disco_syslog { class SysLogWriter; }

// 운영 이벤트(세션 시작/정지, 소유권 변화, 장치 offline)를 system_logs 에 남긴다.
//  - 기록은 전용 writer 스레드에서. 호출 스레드는 막지 않음
//  - init() 전/shutdown() 후 호출은 무시 (단위 테스트)
//  - 모든 항목은 disco.syslog 카테고리로도 출력
class SystemLogger final : public QObject {
		Q_OBJECT
public:
		static SystemLogger& instance();
		static void init(SysLogLevel minLevel = SysLogLevel::Info);
		// 대기 중인 항목을 모두 기록한 뒤 writer 종료
		static void shutdown();
		static bool isRunning();
		static int droppedCount();

		static void debug(const QString& tag, const QString& msg, const QString& deviceId = {});
		static void info (const QString& tag, const QString& msg, const QString& deviceId = {});
		static void warn (const QString& tag, const QString& msg, const QString& deviceId = {});
		static void error(const QString& tag, const QString& msg, const QString& deviceId = {});
		static void critical(const QString& tag, const QString& msg, const QString& deviceId = {});

signals:
		void entryPosted(const SystemLogEntry& e);

private:
		friend class disco_syslog::SysLogWriter;
		static void post_(SysLogLevel lv, const QString& tag, const QString& msg, const QString& deviceId);

		QThread* thread_ = nullptr;
		disco_syslog::SysLogWriter* writer_ = nullptr;
		std::atomic<int> minLevel_{ static_cast<int>(SysLogLevel::Info) };
		std::atomic<bool> running_{ false };
		std::atomic<int> dropped_{ 0 };

		explicit SystemLogger(QObject* parent = nullptr);
		~SystemLogger() override;
};
