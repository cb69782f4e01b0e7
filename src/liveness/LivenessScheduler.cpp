#include "LivenessScheduler.hpp"
#include <QDateTime>
#include <QDebug>
#include "registry/DeviceRegistry.hpp"
#include "log/disco_logging.hpp"
#include "log/SystemLogger.hpp"

LivenessScheduler::LivenessScheduler(DeviceRegistry& registry, const DiscoveryParams& params,
									 Clock clock, QObject* parent)
	: QObject(parent)
	, registry_(registry)
	, params_(params)
	, clock_(clock ? std::move(clock) : Clock([] { return QDateTime::currentMSecsSinceEpoch(); }))
{
	sweepTimer_.setInterval(params_.sweepIntervalMs);
	connect(&sweepTimer_, &QTimer::timeout, this, [this] { sweep(); });
}

LivenessScheduler::~LivenessScheduler()
{
	stopSweep();
	cancelAll();
}

void LivenessScheduler::recordActivity(const QString& deviceId)
{
	const qint64 now = clock_();
	lastActivity_[deviceId] = now;

	auto it = schedules_.find(deviceId);
	if (it == schedules_.end()) return;

	// 활동이 있었으니 대기 중인 probe 취소 후 다시 예약
	it->second.lastActivity = now;
	arm_(deviceId, it->second, params_.heartbeatInactivityMs);
}

void LivenessScheduler::startSchedule(const QString& deviceId)
{
	auto it = schedules_.find(deviceId);
	if (it == schedules_.end()) {
		HeartbeatSchedule s;
		s.timer = std::make_unique<QTimer>();
		s.timer->setSingleShot(true);
		connect(s.timer.get(), &QTimer::timeout, this, [this, deviceId] { onHeartbeatTimer(deviceId); });
		it = schedules_.emplace(deviceId, std::move(s)).first;
	}

	it->second.lastActivity = lastActivity_.value(deviceId, clock_());
	arm_(deviceId, it->second, params_.heartbeatInactivityMs);
	qCDebug(LC_LIVENESS) << "[startSchedule]" << deviceId << "threshold=" << params_.heartbeatInactivityMs;
}

void LivenessScheduler::cancelSchedule(const QString& deviceId)
{
	auto it = schedules_.find(deviceId);
	if (it == schedules_.end()) return;

	it->second.timer->stop();
	it->second.timer.release()->deleteLater();
	schedules_.erase(it);
	qCDebug(LC_LIVENESS) << "[cancelSchedule]" << deviceId;
}

void LivenessScheduler::cancelAll()
{
	for (auto& kv : schedules_) {
		kv.second.timer->stop();
		kv.second.timer.release()->deleteLater();
	}
	schedules_.clear();
}

bool LivenessScheduler::hasPendingHeartbeat(const QString& deviceId) const
{
	auto it = schedules_.find(deviceId);
	return it != schedules_.end() && it->second.timer->isActive();
}

int LivenessScheduler::remainingMs(const QString& deviceId) const
{
	auto it = schedules_.find(deviceId);
	if (it == schedules_.end() || !it->second.timer->isActive()) return -1;
	return it->second.timer->remainingTime();
}

std::optional<qint64> LivenessScheduler::lastActivity(const QString& deviceId) const
{
	if (!lastActivity_.contains(deviceId)) return std::nullopt;
	return lastActivity_.value(deviceId);
}

void LivenessScheduler::arm_(const QString& deviceId, HeartbeatSchedule& s, int delayMs)
{
	Q_UNUSED(deviceId);
	s.timer->stop();
	s.timer->start(qMax(1, delayMs));
}

void LivenessScheduler::onHeartbeatTimer(const QString& deviceId)
{
	auto it = schedules_.find(deviceId);
	if (it == schedules_.end()) return;

	HeartbeatSchedule& s = it->second;
	const qint64 now = clock_();
	const qint64 idle = now - s.lastActivity;

	// 예약 이후 활동이 있었으면 이미 재예약됨
	if (idle < params_.heartbeatInactivityMs) {
		if (!s.timer->isActive())
			arm_(deviceId, s, static_cast<int>(params_.heartbeatInactivityMs - idle));
		return;
	}

	bool sent = false;
	if (probe_) sent = probe_(deviceId);

	if (sent) {
		qCDebug(LC_LIVENESS) << "[onHeartbeatTimer] probe ->" << deviceId << "idle=" << idle << "ms";
		emit probeSent(deviceId);
	} else {
		qWarning() << "[onHeartbeatTimer] probe send failed for" << deviceId;
		SystemLogger::warn("LIVE", QStringLiteral("heartbeat probe failed"), deviceId);
	}

	// 다음 probe 는 지금부터 threshold 뒤. probe 자체는 활동으로 치지 않는다
	s.lastActivity = now;
	arm_(deviceId, s, params_.heartbeatInactivityMs);
}

void LivenessScheduler::startSweep()
{
	sweepTimer_.setInterval(params_.sweepIntervalMs);
	sweepTimer_.start();
}

void LivenessScheduler::stopSweep()
{
	sweepTimer_.stop();
}

std::vector<DeviceDelta> LivenessScheduler::sweep()
{
	const auto deltas = registry_.sweepTimeouts(clock_(), params_.deviceTimeoutMs);
	for (const auto& d : deltas) {
		qInfo() << "[sweep] device offline:" << d.update.deviceId;
		emit deviceWentOffline(d);
	}
	return deltas;
}

std::optional<DeviceDelta> LivenessScheduler::testDeviceAvailability(const QString& deviceId)
{
	auto d = registry_.sweepDevice(deviceId, clock_(), params_.deviceTimeoutMs);
	if (d) emit deviceWentOffline(*d);
	return d;
}
