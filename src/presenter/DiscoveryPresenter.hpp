#pragma once

#include <QObject>
#include <memory>

#include "config/DiscoveryParams.hpp"
#include "services/QSqliteService.hpp"

class UdpDiscoveryTransport;
class BleDiscoveryAgent;
class CredentialService;
class DiscoverySession;

// 데몬 조립: transport / credential / 저장소 / 세션 생성과 signal 연결
class DiscoveryPresenter : public QObject {
		Q_OBJECT

public:
		explicit DiscoveryPresenter(const DiscoveryParams& params, QObject* parent = nullptr);
		~DiscoveryPresenter() override;

		bool start();
		void stop();

		DiscoverySession* session() const { return session_; }

private:
		void connectEvents_();

		DiscoveryParams params_;
		QSqliteService db_;

		UdpDiscoveryTransport* udp_ = nullptr;
		BleDiscoveryAgent* ble_ = nullptr;
		CredentialService* credentials_ = nullptr;
		DiscoverySession* session_ = nullptr;
		int subId_ = 0;
};
