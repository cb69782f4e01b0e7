#pragma once
#include <optional>
#include <QString>
#include <QStringList>
#include <QByteArray>
#include <QMap>
#include <QJsonObject>
#include <QJsonArray>
#include <QMetaType>
#include "include/states.hpp"

// 코덱이 검증을 마친 discovery 정보. 이 구조체 밖으로 raw JSON 이 나가지 않는다.
struct DiscoveryFrame {
	QString deviceId;
	QString deviceType;
	QString displayName;
	QStringList capabilities;
	bool hasCapabilities = false;		// 프레임에 capabilities 필드가 있었는지
	QString status;
	QString protocol;
	States::LedStatus ledStatus = States::LedStatus::Unknown;
	QString address;					// BLE: MAC
	int rssi = 0;
	QString ownershipHint;				// 장치가 보낸 "o" 값 (참고용, 레지스트리에 반영 금지)
};

// BLE advertisement 한 건 (플랫폼 스택 타입과 분리)
struct AdvertisementRecord {
	QString address;
	QString name;
	QStringList serviceUuids;
	QMap<quint16, QByteArray> manufacturerData;
	int rssi = 0;
};

struct OwnershipInfo {
	std::optional<QString> ownerId;
	bool hasValidCredential = false;
	bool isAuthenticated = false;
};

struct DeviceRecord {
	QString deviceId;
	QString displayName;
	QString deviceType;

	QString networkAddress;				// wifi 경로 전용
	quint16 networkPort = 0;
	QString bleAddress;					// ble 경로 전용
	int rssi = 0;

	States::LinkStatus wifiStatus = States::LinkStatus::Inactive;
	States::LinkStatus bleStatus  = States::LinkStatus::Inactive;

	bool online = false;
	bool connected = false;
	qint64 lastSeenMs = 0;
	qint64 firstSeenMs = 0;

	OwnershipInfo ownership;

	QStringList capabilities;			// 정렬 + 중복 제거 상태 유지
	States::LedStatus ledStatus = States::LedStatus::Unknown;
	QString status;
	QString protocol;

	QJsonObject toJson() const {
		QJsonObject o;
		o["device_id"]      = deviceId;
		o["name"]           = displayName;
		o["device_type"]    = deviceType;
		o["address"]        = networkAddress;
		o["port"]           = static_cast<int>(networkPort);
		o["ble_address"]    = bleAddress;
		o["rssi"]           = rssi;
		o["wifi_status"]    = States::toString(wifiStatus);
		o["ble_status"]     = States::toString(bleStatus);
		o["online"]         = online;
		o["connected"]      = connected;
		o["last_seen"]      = lastSeenMs;
		o["first_seen"]     = firstSeenMs;
		o["owner_id"]       = ownership.ownerId ? QJsonValue(*ownership.ownerId) : QJsonValue();
		o["has_valid_credential"] = ownership.hasValidCredential;
		o["is_authenticated"]     = ownership.isAuthenticated;
		o["capabilities"]   = QJsonArray::fromStringList(capabilities);
		o["led_status"]     = States::toString(ledStatus);
		o["status"]         = status;
		o["protocol"]       = protocol;
		return o;
	}
};

// 부분 갱신. 채워진 필드만 의미가 있다.
struct DeviceUpdate {
	QString deviceId;

	std::optional<QString> displayName;
	std::optional<QString> deviceType;
	std::optional<QString> networkAddress;
	std::optional<quint16> networkPort;
	std::optional<QString> bleAddress;
	std::optional<int> rssi;
	std::optional<States::LinkStatus> wifiStatus;
	std::optional<States::LinkStatus> bleStatus;
	std::optional<bool> online;
	std::optional<bool> connected;
	std::optional<qint64> lastSeenMs;
	std::optional<QStringList> capabilities;
	std::optional<States::LedStatus> ledStatus;
	std::optional<QString> status;
	std::optional<QString> protocol;

	std::optional<QString> ownerId;		// 빈 문자열 = 소유자 해제
	std::optional<bool> hasValidCredential;
	std::optional<bool> isAuthenticated;

	bool isEmpty() const {
		return !displayName && !deviceType && !networkAddress && !networkPort && !bleAddress
			&& !rssi && !wifiStatus && !bleStatus && !online && !connected && !lastSeenMs
			&& !capabilities && !ledStatus && !status && !protocol
			&& !ownerId && !hasValidCredential && !isAuthenticated;
	}

	// field-wise last-write-wins
	void mergeFrom(const DeviceUpdate& o) {
		auto take = [](auto& dst, const auto& src) { if (src) dst = src; };
		take(displayName, o.displayName);
		take(deviceType, o.deviceType);
		take(networkAddress, o.networkAddress);
		take(networkPort, o.networkPort);
		take(bleAddress, o.bleAddress);
		take(rssi, o.rssi);
		take(wifiStatus, o.wifiStatus);
		take(bleStatus, o.bleStatus);
		take(online, o.online);
		take(connected, o.connected);
		take(lastSeenMs, o.lastSeenMs);
		take(capabilities, o.capabilities);
		take(ledStatus, o.ledStatus);
		take(status, o.status);
		take(protocol, o.protocol);
		take(ownerId, o.ownerId);
		take(hasValidCredential, o.hasValidCredential);
		take(isAuthenticated, o.isAuthenticated);
	}
};

struct DeviceDelta {
	enum class Kind { Created, Updated, WentOffline };
	Kind kind = Kind::Updated;
	DeviceUpdate update;
};

// 이 앱 자신을 알리는 정보 (broadcast / advertising 용)
struct AppIdentity {
	QString deviceId;					// person id 기반
	QString deviceName;
	QString deviceType = QStringLiteral("MobileApp");
	QStringList capabilities { QStringLiteral("device_discovery"),
							   QStringLiteral("credential_provisioning"),
							   QStringLiteral("heartbeat") };
};

struct Credential {
	QString id;
	QString issuer;						// owner person id
	QString subject;					// device id
	qint64 issuedAt = 0;
	qint64 expiresAt = 0;
	QByteArray proof;

	bool isNull() const { return id.isEmpty() || issuer.isEmpty(); }

	QJsonObject toJson() const {
		QJsonObject o;
		o["id"]         = id;
		o["issuer"]     = issuer;
		o["subject"]    = subject;
		o["issued_at"]  = QString::number(issuedAt);
		o["expires_at"] = QString::number(expiresAt);
		o["proof"]      = QString::fromLatin1(proof.toBase64());
		return o;
	}

	static std::optional<Credential> fromJson(const QJsonObject& o) {
		if (!o.value("id").isString() || !o.value("issuer").isString())
			return std::nullopt;
		Credential c;
		c.id        = o.value("id").toString();
		c.issuer    = o.value("issuer").toString();
		c.subject   = o.value("subject").toString();
		c.issuedAt  = o.value("issued_at").toString().toLongLong();
		c.expiresAt = o.value("expires_at").toString().toLongLong();
		c.proof     = QByteArray::fromBase64(o.value("proof").toString().toLatin1());
		if (c.isNull()) return std::nullopt;
		return c;
	}
};

Q_DECLARE_METATYPE(DeviceRecord)
Q_DECLARE_METATYPE(DeviceUpdate)
Q_DECLARE_METATYPE(AdvertisementRecord)
