#include "SystemLogger.hpp"
#include <QMetaObject>
#include <QDebug>
#include "services/QSqliteService.hpp"
#include "log/disco_logging.hpp"

namespace disco_syslog {
// writer 스레드 전용. QSqliteService 가 이 스레드용 커넥션을 따로 연다
class SysLogWriter : public QObject {
		Q_OBJECT
public slots:
		void write(const SystemLogEntry& e)
		{
			const QDateTime ts = e.ts.isValid() ? e.ts : QDateTime::currentDateTime();
			if (!db_.insertSystemLog(static_cast<int>(e.level), e.tag, e.message, ts, e.deviceId)) {
				++SystemLogger::instance().dropped_;
				qWarning() << "[SysLogWriter] drop:" << e.tag << e.message;
			}
		}
private:
		QSqliteService db_;
};
} // namespace disco_syslog

SystemLogger& SystemLogger::instance()
{
	static SystemLogger inst;
	return inst;
}

SystemLogger::SystemLogger(QObject* parent) : QObject(parent) {}

SystemLogger::~SystemLogger() = default;

void SystemLogger::init(SysLogLevel minLevel)
{
	auto& self = instance();
	self.minLevel_ = static_cast<int>(minLevel);
	if (self.thread_) return;

	qRegisterMetaType<SystemLogEntry>("SystemLogEntry");

	self.thread_ = new QThread;
	self.thread_->setObjectName(QStringLiteral("disco-syslog"));
	self.writer_ = new disco_syslog::SysLogWriter;
	self.writer_->moveToThread(self.thread_);

	connect(&self, &SystemLogger::entryPosted,
			self.writer_, &disco_syslog::SysLogWriter::write, Qt::QueuedConnection);
	connect(self.thread_, &QThread::finished, self.writer_, &QObject::deleteLater);

	self.dropped_ = 0;
	self.thread_->start();
	self.running_ = true;
	qCDebug(LC_SYSLOG) << "[SystemLogger] writer started, min level" << toString(minLevel);
}

void SystemLogger::shutdown()
{
	auto& self = instance();
	if (!self.thread_) return;

	self.running_ = false;

	// 앞서 큐에 들어간 write 가 모두 처리될 때까지 대기
	if (self.thread_->isRunning())
		QMetaObject::invokeMethod(self.writer_, [] {}, Qt::BlockingQueuedConnection);

	self.thread_->quit();
	if (!self.thread_->wait(3000)) {
		qWarning() << "[SystemLogger] writer thread did not stop in time";
		self.thread_->terminate();
		self.thread_->wait();
	}

	delete self.thread_;
	self.thread_ = nullptr;
	self.writer_ = nullptr;
	qCDebug(LC_SYSLOG) << "[SystemLogger] writer stopped, dropped" << self.dropped_.load();
}

bool SystemLogger::isRunning() { return instance().running_; }

int SystemLogger::droppedCount() { return instance().dropped_; }

void SystemLogger::post_(SysLogLevel lv, const QString& tag, const QString& msg, const QString& deviceId)
{
	auto& self = instance();
	if (!self.running_ || static_cast<int>(lv) < self.minLevel_) return;

	qCDebug(LC_SYSLOG).noquote() << toString(lv) << tag << msg << deviceId;
	emit self.entryPosted(SystemLogEntry{ lv, tag, msg, QDateTime::currentDateTime(), deviceId });
}

void SystemLogger::debug(const QString& tag, const QString& msg, const QString& deviceId)    { post_(SysLogLevel::Debug, tag, msg, deviceId); }
void SystemLogger::info (const QString& tag, const QString& msg, const QString& deviceId)    { post_(SysLogLevel::Info, tag, msg, deviceId); }
void SystemLogger::warn (const QString& tag, const QString& msg, const QString& deviceId)    { post_(SysLogLevel::Warn, tag, msg, deviceId); }
void SystemLogger::error(const QString& tag, const QString& msg, const QString& deviceId)    { post_(SysLogLevel::Error, tag, msg, deviceId); }
void SystemLogger::critical(const QString& tag, const QString& msg, const QString& deviceId) { post_(SysLogLevel::Critical, tag, msg, deviceId); }

#include "SystemLogger.moc"
