#include "ChangeNotifier.hpp"
#include <exception>
#include <QDebug>
#include "log/disco_logging.hpp"

ChangeNotifier::ChangeNotifier(int windowMs, QObject* parent)
	: QObject(parent), windowMs_(windowMs > 0 ? windowMs : 100)
{
}

ChangeNotifier::~ChangeNotifier()
{
	cancelAll();
}

void ChangeNotifier::notify(const QString& deviceId, const DeviceUpdate& partial)
{
	if (deviceId.isEmpty() || partial.isEmpty()) return;

	auto it = pending_.find(deviceId);
	if (it != pending_.end()) {
		// 창 안: 병합만 하고 타이머는 그대로 (첫 갱신 기준으로 flush)
		it->second.merged.mergeFrom(partial);
		return;
	}

	Pending p;
	p.merged.deviceId = deviceId;
	p.merged.mergeFrom(partial);
	p.timer = std::make_unique<QTimer>();
	p.timer->setSingleShot(true);
	p.timer->setInterval(windowMs_);
	connect(p.timer.get(), &QTimer::timeout, this, [this, deviceId] { flush(deviceId); });
	p.timer->start();
	pending_.emplace(deviceId, std::move(p));
}

int ChangeNotifier::subscribe(Subscriber fn)
{
	if (!fn) return 0;
	const int id = nextSubId_++;
	subs_.emplace_back(id, std::move(fn));
	return id;
}

void ChangeNotifier::unsubscribe(int id)
{
	for (auto it = subs_.begin(); it != subs_.end(); ++it) {
		if (it->first == id) { subs_.erase(it); return; }
	}
}

void ChangeNotifier::flush(const QString& deviceId)
{
	auto it = pending_.find(deviceId);
	if (it == pending_.end()) return;

	const DeviceUpdate update = it->second.merged;
	// 타이머 슬롯 안에서 호출될 수 있으므로 바로 지우지 않는다
	it->second.timer->stop();
	it->second.timer.release()->deleteLater();
	pending_.erase(it);

	deliver_(update);
}

void ChangeNotifier::flushAll()
{
	std::vector<QString> ids;
	ids.reserve(pending_.size());
	for (const auto& kv : pending_) ids.push_back(kv.first);
	for (const auto& id : ids) flush(id);
}

void ChangeNotifier::cancelAll()
{
	for (auto& kv : pending_) {
		kv.second.timer->stop();
		kv.second.timer.release()->deleteLater();
	}
	if (!pending_.empty())
		qCDebug(LC_NOTIFY) << "[cancelAll] dropped" << int(pending_.size()) << "pending updates";
	pending_.clear();
}

void ChangeNotifier::deliver_(const DeviceUpdate& update)
{
	// 콜백 안에서 subscribe/unsubscribe 해도 안전하도록 복사본 순회
	const auto subs = subs_;
	for (const auto& s : subs) {
		try {
			s.second(update);
		} catch (const std::exception& e) {
			qWarning() << "[ChangeNotifier] subscriber" << s.first << "threw:" << e.what();
			emit subscriberFailed(s.first, QString::fromUtf8(e.what()));
		}
	}
	emit updateEmitted(update);
}
