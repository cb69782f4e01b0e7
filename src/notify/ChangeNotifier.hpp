#pragma once
#include <QObject>
#include <QTimer>
#include <functional>
#include <map>
#include <memory>
#include <utility>
#include <vector>
#include "include/types.hpp"

// 장치별 debounce: 창 안에서 들어온 갱신을 필드 단위로 병합해 한 번만 내보낸다
class ChangeNotifier : public QObject {
		Q_OBJECT
public:
		using Subscriber = std::function<void(const DeviceUpdate&)>;

		explicit ChangeNotifier(int windowMs = 100, QObject* parent = nullptr);
		~ChangeNotifier() override;

		void notify(const QString& deviceId, const DeviceUpdate& partial);

		int subscribe(Subscriber fn);
		void unsubscribe(int id);

		void flush(const QString& deviceId);
		void flushAll();
		void cancelAll();

		bool hasPending(const QString& deviceId) const { return pending_.count(deviceId) > 0; }
		int pendingCount() const { return static_cast<int>(pending_.size()); }
		int windowMs() const { return windowMs_; }

signals:
		void updateEmitted(const DeviceUpdate& update);
		void subscriberFailed(int subscriberId, const QString& what);

private:
		struct Pending {
			DeviceUpdate merged;
			std::unique_ptr<QTimer> timer;
		};

		void deliver_(const DeviceUpdate& update);

		int windowMs_;
		std::map<QString, Pending> pending_;
		std::vector<std::pair<int, Subscriber>> subs_;
		int nextSubId_ = 1;
};
