#pragma once
#include <QObject>
#include <QUdpSocket>
#include <QHostAddress>
#include "net/IDatagramTransport.hpp"

// discovery 포트 하나에 바인딩된 UDP 소켓. 수신은 datagramReceived 로 전달
class UdpDiscoveryTransport : public QObject, public IDatagramTransport {
		Q_OBJECT
public:
		explicit UdpDiscoveryTransport(QObject* parent = nullptr);
		~UdpDiscoveryTransport() override;

		bool open(quint16 port) override;
		void close() override;
		bool isOpen() const override;

		bool sendDatagram(const QByteArray& data, const QHostAddress& to, quint16 port) override;
		bool sendBroadcast(const QByteArray& data, quint16 port) override;

		quint16 localPort() const { return sock_.localPort(); }

signals:
		void datagramReceived(const QByteArray& data, const QHostAddress& from, quint16 port);
		void errorHappened(QString msg);

private slots:
		void onReadyRead_();

private:
		QUdpSocket sock_;
};
