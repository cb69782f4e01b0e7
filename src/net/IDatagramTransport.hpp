#pragma once
#include <QByteArray>
#include <QHostAddress>

// UDP 송수신 추상화 (세션/credential 서비스가 사용)
class IDatagramTransport {
public:
		virtual ~IDatagramTransport() = default;

		virtual bool open(quint16 port) = 0;
		virtual void close() = 0;
		virtual bool isOpen() const = 0;

		virtual bool sendDatagram(const QByteArray& data, const QHostAddress& to, quint16 port) = 0;
		virtual bool sendBroadcast(const QByteArray& data, quint16 port) = 0;
};
