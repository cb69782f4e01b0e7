#include "UdpDiscoveryTransport.hpp"
#include <QNetworkDatagram>
#include <QDebug>
#include "log/disco_logging.hpp"

UdpDiscoveryTransport::UdpDiscoveryTransport(QObject* parent)
	: QObject(parent), sock_(this)
{
	connect(&sock_, &QUdpSocket::readyRead, this, &UdpDiscoveryTransport::onReadyRead_);
	connect(&sock_, &QAbstractSocket::errorOccurred, this, [this](QAbstractSocket::SocketError e) {
		qCWarning(LC_TRANSPORT) << "[udp] socket error" << int(e) << sock_.errorString();
		emit errorHappened(sock_.errorString());
	});
}

UdpDiscoveryTransport::~UdpDiscoveryTransport()
{
	close();
}

bool UdpDiscoveryTransport::open(quint16 port)
{
	if (isOpen()) return true;

	// 같은 포트를 쓰는 다른 프로세스(앱 인스턴스)와 공유
	if (!sock_.bind(QHostAddress::AnyIPv4, port,
					QAbstractSocket::ShareAddress | QAbstractSocket::ReuseAddressHint)) {
		qWarning() << "[UdpDiscoveryTransport::open] bind failed port=" << port << sock_.errorString();
		return false;
	}
	qInfo() << "[UdpDiscoveryTransport::open] listening on" << sock_.localPort();
	return true;
}

void UdpDiscoveryTransport::close()
{
	if (sock_.state() != QAbstractSocket::UnconnectedState) {
		sock_.close();
		qCDebug(LC_TRANSPORT) << "[udp] closed";
	}
}

bool UdpDiscoveryTransport::isOpen() const
{
	return sock_.state() == QAbstractSocket::BoundState;
}

bool UdpDiscoveryTransport::sendDatagram(const QByteArray& data, const QHostAddress& to, quint16 port)
{
	if (!isOpen()) {
		qCWarning(LC_TRANSPORT) << "[udp] send while closed ->" << to.toString() << port;
		return false;
	}
	const qint64 n = sock_.writeDatagram(data, to, port);
	if (n != data.size()) {
		qCWarning(LC_TRANSPORT) << "[udp] writeDatagram" << n << "/" << data.size() << sock_.errorString();
		return false;
	}
	return true;
}

bool UdpDiscoveryTransport::sendBroadcast(const QByteArray& data, quint16 port)
{
	return sendDatagram(data, QHostAddress::Broadcast, port);
}

void UdpDiscoveryTransport::onReadyRead_()
{
	while (sock_.hasPendingDatagrams()) {
		const QNetworkDatagram dg = sock_.receiveDatagram();
		if (!dg.isValid()) continue;

		// IPv4-mapped IPv6 주소는 IPv4 로 정규화
		QHostAddress from = dg.senderAddress();
		bool isV4 = false;
		const quint32 v4 = from.toIPv4Address(&isV4);
		if (isV4) from = QHostAddress(v4);

		emit datagramReceived(dg.data(), from, static_cast<quint16>(dg.senderPort()));
	}
}
