#include "FrameCodec.hpp"
#include <QCryptographicHash>
#include <QDateTime>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QRegularExpression>
#include <QStringDecoder>
#include <QtEndian>
#include <QDebug>
#include "log/disco_logging.hpp"

namespace FrameCodec {

namespace {

	struct Envelope {
		quint8 flags = 0;
		quint32 version = 0;
		QByteArray dcid;
		QByteArray scid;
		quint8 packetNumber = 0;
		int frameOffset = 0;
	};

	struct RawFrame {
		quint8 type = 0;
		QByteArray payload;
	};

	quint8 byteAt(const QByteArray& d, int pos) { return static_cast<quint8>(d.at(pos)); }

	CodecError readEnvelope(const QByteArray& d, Envelope& env)
	{
		if (d.isEmpty()) return CodecError::Truncated;

		env.flags = byteAt(d, 0);
		if (!(env.flags & kLongHeaderBit)) return CodecError::NotDiscovery;

		int pos = 1;
		if (d.size() < pos + 4) return CodecError::Truncated;
		env.version = qFromBigEndian<quint32>(reinterpret_cast<const uchar*>(d.constData() + pos));
		pos += 4;
		if (env.version != kProtocolVersion) return CodecError::UnsupportedVersion;

		for (QByteArray* cid : { &env.dcid, &env.scid }) {
			if (pos >= d.size()) return CodecError::Truncated;
			const int len = byteAt(d, pos++);
			if (len > kMaxCidLength) return CodecError::ConnectionIdTooLong;
			if (pos + len > d.size()) return CodecError::Truncated;
			*cid = d.mid(pos, len);
			pos += len;
		}

		if (pos >= d.size()) return CodecError::Truncated;
		env.packetNumber = byteAt(d, pos++);

		// 프레임이 하나도 없으면 잘린 패킷
		if (pos >= d.size()) return CodecError::Truncated;
		env.frameOffset = pos;
		return CodecError::None;
	}

	CodecError readFrame(const QByteArray& d, int& pos, RawFrame& out)
	{
		if (pos + 3 > d.size()) return CodecError::Truncated;
		out.type = byteAt(d, pos);
		const int len = qFromBigEndian<quint16>(reinterpret_cast<const uchar*>(d.constData() + pos + 1));
		if (len > kMaxFramePayload) return CodecError::LengthOutOfRange;
		if (pos + 3 + len > d.size()) return CodecError::Truncated;
		out.payload = d.mid(pos + 3, len);
		pos += 3 + len;
		return CodecError::None;
	}

	CodecError decodeText(const QByteArray& bytes, QString& out)
	{
		QStringDecoder dec(QStringDecoder::Utf8);
		out = dec.decode(bytes);
		return dec.hasError() ? CodecError::InvalidUtf8 : CodecError::None;
	}

	// ESP32 구버전 펌웨어: <meta itemprop="id" content="..."> 형태
	QJsonObject parseMicrodata(const QString& html)
	{
		static const QRegularExpression re(
			QStringLiteral("itemprop=\"([A-Za-z_]+)\"[^>]*content=\"([^\"]*)\""));
		QJsonObject o;
		auto it = re.globalMatch(html);
		while (it.hasNext()) {
			const auto m = it.next();
			const QString key = m.captured(1);
			const QString val = m.captured(2);
			if (key == "id" || key == "deviceId")        o["device_id"] = val;
			else if (key == "type" || key == "deviceType") o["device_type"] = val;
			else if (key == "name")                       o["device_name"] = val;
			else if (key == "status")                     o["status"] = val;
			else if (key == "state" || key == "blue_led") o["led_status"] = val;
			else if (key == "capabilities")
				o["capabilities"] = QJsonArray::fromStringList(val.split(',', Qt::SkipEmptyParts));
		}
		return o;
	}

	// 있으면 문자열이어야 함
	bool optString(const QJsonObject& o, const char* key, QString& dst)
	{
		const QJsonValue v = o.value(QLatin1String(key));
		if (v.isUndefined() || v.isNull()) return true;
		if (!v.isString()) return false;
		dst = v.toString().trimmed();
		return true;
	}

	CodecError validateDeviceId(const QString& id)
	{
		if (id.isEmpty()) return CodecError::MissingDeviceId;
		if (id.size() > kMaxDeviceIdLen) return CodecError::InvalidField;
		for (const QChar c : id) {
			if (c.category() == QChar::Other_Control) return CodecError::InvalidField;
		}
		return CodecError::None;
	}

	CodecError readCapabilities(const QJsonValue& v, QStringList& out)
	{
		if (!v.isArray()) return CodecError::InvalidField;
		QStringList caps;
		for (const auto& e : v.toArray()) {
			if (!e.isString() || e.toString().trimmed().isEmpty()) return CodecError::InvalidField;
			caps << e.toString().trimmed();
		}
		caps.sort();
		caps.removeDuplicates();
		out = caps;
		return CodecError::None;
	}

	// led_status (또는 blue_led): bool 또는 문자열
	CodecError readLedStatus(const QJsonObject& o, States::LedStatus& out)
	{
		const QJsonValue led = o.contains("led_status") ? o.value("led_status") : o.value("blue_led");
		if (led.isBool())        out = led.toBool() ? States::LedStatus::On : States::LedStatus::Off;
		else if (led.isString()) out = States::ledStatusFromString(led.toString());
		else if (!led.isUndefined() && !led.isNull()) return CodecError::InvalidField;
		return CodecError::None;
	}

	// device_id 또는 deviceId. required 가 아니면 없거나 빈 값일 때 빈 문자열
	CodecError readDeviceId(const QJsonObject& o, bool required, QString& out)
	{
		if (!o.contains("device_id") && !o.contains("deviceId"))
			return required ? CodecError::MissingDeviceId : CodecError::None;
		if (!optString(o, "device_id", out)) return CodecError::InvalidField;
		if (out.isEmpty() && !optString(o, "deviceId", out)) return CodecError::InvalidField;
		if (out.isEmpty() && !required) return CodecError::None;
		return validateDeviceId(out);
	}

	CodecError frameFromJson(const QJsonObject& o, DiscoveryFrame& f)
	{
		// compact: {"t":"DevicePresence","i":id,"s":status,"o":ownership}
		if (o.value("t").toString() == QLatin1String("DevicePresence")) {
			if (!optString(o, "i", f.deviceId) || !optString(o, "s", f.status)
				|| !optString(o, "o", f.ownershipHint))
				return CodecError::InvalidField;
			return validateDeviceId(f.deviceId);
		}

		const CodecError idErr = readDeviceId(o, true, f.deviceId);
		if (idErr != CodecError::None) return idErr;

		if (!optString(o, "device_type", f.deviceType)) return CodecError::InvalidField;
		if (f.deviceType.isEmpty() && !optString(o, "type", f.deviceType)) return CodecError::InvalidField;

		if (!optString(o, "device_name", f.displayName)) return CodecError::InvalidField;
		if (f.displayName.isEmpty() && !optString(o, "name", f.displayName)) return CodecError::InvalidField;

		if (!optString(o, "status", f.status))     return CodecError::InvalidField;
		if (!optString(o, "protocol", f.protocol)) return CodecError::InvalidField;
		if (!optString(o, "ownership", f.ownershipHint)) return CodecError::InvalidField;

		const QJsonValue caps = o.contains("capabilities") ? o.value("capabilities") : o.value("caps");
		if (!caps.isUndefined()) {
			const CodecError e = readCapabilities(caps, f.capabilities);
			if (e != CodecError::None) return e;
			f.hasCapabilities = true;
		}

		return readLedStatus(o, f.ledStatus);
	}

	CodecError decodeDiscoveryPayload(const QByteArray& payload, DiscoveryFrame& f)
	{
		QString text;
		const CodecError utf = decodeText(payload, text);
		if (utf != CodecError::None) return utf;

		if (text.trimmed().startsWith(QLatin1Char('<')))
			return frameFromJson(parseMicrodata(text), f);

		QJsonParseError err{};
		const QJsonDocument jd = QJsonDocument::fromJson(payload, &err);
		if (err.error != QJsonParseError::NoError || !jd.isObject()) return CodecError::MalformedJson;
		return frameFromJson(jd.object(), f);
	}

	QString deviceTypeForTag(quint8 tag)
	{
		switch (tag) {
			case 0x01: return QStringLiteral("ESP32");
			case 0x02: return QStringLiteral("Ring");
			case 0x03: return QStringLiteral("LamaDevice");
			default:   return QString();
		}
	}

	QStringList capabilitiesForBits(quint8 bits)
	{
		static const char* names[] = {
			"led_control", "credential_provisioning", "wifi_provisioning", "sensor_data", "heartbeat"
		};
		QStringList caps;
		for (int i = 0; i < 5; ++i) {
			if (bits & (1u << i)) caps << QString::fromLatin1(names[i]);
		}
		caps.sort();
		return caps;
	}

} // namespace

QString toString(CodecError e)
{
	switch (e) {
		case CodecError::None:                return QStringLiteral("none");
		case CodecError::NotDiscovery:        return QStringLiteral("not a discovery frame");
		case CodecError::Truncated:           return QStringLiteral("truncated");
		case CodecError::UnsupportedVersion:  return QStringLiteral("unsupported version");
		case CodecError::ConnectionIdTooLong: return QStringLiteral("connection id too long");
		case CodecError::LengthOutOfRange:    return QStringLiteral("length out of range");
		case CodecError::InvalidUtf8:         return QStringLiteral("invalid utf-8");
		case CodecError::MalformedJson:       return QStringLiteral("malformed json");
		case CodecError::MissingDeviceId:     return QStringLiteral("missing device id");
		case CodecError::InvalidField:        return QStringLiteral("invalid field");
		case CodecError::UnknownDeviceType:   return QStringLiteral("unknown device type");
	}
	return QStringLiteral("?");
}

DecodeResult decodeDiscoveryFrame(const QByteArray& datagram)
{
	DecodeResult r;
	Envelope env;
	r.error = readEnvelope(datagram, env);
	if (r.error != CodecError::None) return r;

	int pos = env.frameOffset;
	while (pos < datagram.size()) {
		RawFrame raw;
		r.error = readFrame(datagram, pos, raw);
		if (r.error != CodecError::None) return r;
		if (raw.type != static_cast<quint8>(FrameType::Discovery)) continue;

		r.error = decodeDiscoveryPayload(raw.payload, r.frame);
		if (r.error != CodecError::None) {
			qCDebug(LC_CODEC) << "[decodeDiscoveryFrame] drop:" << toString(r.error);
			r.frame = DiscoveryFrame{};
		}
		return r;
	}

	r.error = CodecError::NotDiscovery;
	return r;
}

DecodeResult decodeAdvertisement(const AdvertisementRecord& record)
{
	DecodeResult r;
	const auto it = record.manufacturerData.constFind(kEspressifCompanyId);
	if (it == record.manufacturerData.constEnd()) {
		r.error = CodecError::UnknownDeviceType;
		return r;
	}

	// [type_tag:1][cap_bits:1][id_len:1][device_id:id_len]
	const QByteArray& d = it.value();
	if (d.size() < 3) { r.error = CodecError::Truncated; return r; }

	const quint8 tag  = byteAt(d, 0);
	const quint8 bits = byteAt(d, 1);
	const int idLen   = byteAt(d, 2);

	const QString type = deviceTypeForTag(tag);
	if (type.isEmpty()) { r.error = CodecError::UnknownDeviceType; return r; }
	if (idLen == 0)     { r.error = CodecError::MissingDeviceId; return r; }
	if (3 + idLen > d.size()) { r.error = CodecError::Truncated; return r; }

	QString id;
	r.error = decodeText(d.mid(3, idLen), id);
	if (r.error != CodecError::None) return r;
	r.error = validateDeviceId(id.trimmed());
	if (r.error != CodecError::None) return r;

	r.frame.deviceId        = id.trimmed();
	r.frame.deviceType      = type;
	r.frame.displayName     = record.name.trimmed();
	r.frame.capabilities    = capabilitiesForBits(bits);
	r.frame.hasCapabilities = true;
	r.frame.address         = record.address;
	r.frame.rssi            = record.rssi;
	return r;
}

QByteArray connectionIdFor(const QString& id)
{
	return QCryptographicHash::hash(id.toUtf8(), QCryptographicHash::Sha256).left(8);
}

QByteArray encodeControlFrame(FrameType type, const QJsonObject& json,
							  const QByteArray& dcid, const QByteArray& scid)
{
	const QByteArray payload = QJsonDocument(json).toJson(QJsonDocument::Compact);
	if (payload.size() > kMaxFramePayload) {
		qWarning() << "[encodeControlFrame] payload too large:" << payload.size();
		return QByteArray();
	}

	const QByteArray d = dcid.left(kMaxCidLength);
	const QByteArray s = scid.left(kMaxCidLength);

	QByteArray out;
	out.reserve(1 + 4 + 2 + d.size() + s.size() + 1 + 3 + payload.size());
	out.append(static_cast<char>(kInitialFlags));

	uchar ver[4];
	qToBigEndian<quint32>(kProtocolVersion, ver);
	out.append(reinterpret_cast<const char*>(ver), 4);

	out.append(static_cast<char>(d.size()));
	out.append(d);
	out.append(static_cast<char>(s.size()));
	out.append(s);
	out.append(static_cast<char>(0));			// packet number

	out.append(static_cast<char>(type));
	uchar len[2];
	qToBigEndian<quint16>(static_cast<quint16>(payload.size()), len);
	out.append(reinterpret_cast<const char*>(len), 2);
	out.append(payload);
	return out;
}

QByteArray encodeBroadcast(const AppIdentity& identity)
{
	QJsonObject j;
	j["type"]         = "app_discovery";
	j["device_id"]    = identity.deviceId;
	j["device_type"]  = identity.deviceType;
	j["device_name"]  = identity.deviceName;
	j["capabilities"] = QJsonArray::fromStringList(identity.capabilities);
	j["protocol"]     = "quicvc/1";
	j["timestamp"]    = static_cast<double>(QDateTime::currentMSecsSinceEpoch());
	return encodeControlFrame(FrameType::Discovery, j, QByteArray(), connectionIdFor(identity.deviceId));
}

ControlResult decodeControlFrame(const QByteArray& datagram)
{
	ControlResult r;
	Envelope env;
	r.error = readEnvelope(datagram, env);
	if (r.error != CodecError::None) return r;

	int pos = env.frameOffset;
	while (pos < datagram.size()) {
		RawFrame raw;
		r.error = readFrame(datagram, pos, raw);
		if (r.error != CodecError::None) return r;
		if (raw.type == static_cast<quint8>(FrameType::Discovery)) continue;

		switch (raw.type) {
			case static_cast<quint8>(FrameType::VcInit):
			case static_cast<quint8>(FrameType::VcResponse):
			case static_cast<quint8>(FrameType::VcAck):
			case static_cast<quint8>(FrameType::Heartbeat):
			case static_cast<quint8>(FrameType::Command):
				break;
			default:
				r.error = CodecError::InvalidField;
				return r;
		}

		QString text;
		r.error = decodeText(raw.payload, text);
		if (r.error != CodecError::None) return r;

		QJsonParseError err{};
		const QJsonDocument jd = QJsonDocument::fromJson(raw.payload, &err);
		if (err.error != QJsonParseError::NoError || !jd.isObject()) {
			r.error = CodecError::MalformedJson;
			return r;
		}

		r.frame.type = static_cast<FrameType>(raw.type);
		r.frame.dcid = env.dcid;
		r.frame.scid = env.scid;
		r.frame.json = jd.object();
		return r;
	}

	r.error = CodecError::NotDiscovery;
	return r;
}

HeartbeatResult decodeHeartbeat(const ControlFrame& frame)
{
	HeartbeatResult r;
	if (frame.type != FrameType::Heartbeat) { r.error = CodecError::InvalidField; return r; }

	const QJsonObject& o = frame.json;
	r.error = readDeviceId(o, true, r.frame.deviceId);
	if (r.error != CodecError::None) return r;
	if (!optString(o, "status", r.frame.status)) { r.error = CodecError::InvalidField; return r; }
	r.error = readLedStatus(o, r.frame.ledStatus);
	if (r.error != CodecError::None) return r;

	// credential 이 깨져 있어도 상태 보고는 유효
	const QJsonValue cv = o.value("credential");
	if (cv.isObject()) {
		r.frame.credential = Credential::fromJson(cv.toObject());
		if (r.frame.credential && !r.frame.credential->subject.isEmpty()
			&& validateDeviceId(r.frame.credential->subject) != CodecError::None)
			r.frame.credential.reset();
		r.frame.credentialMalformed = !r.frame.credential.has_value();
	} else if (!cv.isUndefined() && !cv.isNull()) {
		r.frame.credentialMalformed = true;
	}
	return r;
}

AckResult decodeAck(const ControlFrame& frame)
{
	AckResult r;
	if (frame.type != FrameType::VcResponse && frame.type != FrameType::VcAck) {
		r.error = CodecError::InvalidField;
		return r;
	}

	const QJsonObject& o = frame.json;
	const QString type = o.value("type").toString();
	if (type == QLatin1String("provisioning_response") || type == QLatin1String("provisioning_ack"))
		r.frame.kind = AckKind::Provisioning;
	else if (type == QLatin1String("ownership_remove_ack"))
		r.frame.kind = AckKind::Removal;
	else {
		r.error = CodecError::InvalidField;
		return r;
	}

	r.error = readDeviceId(o, false, r.frame.deviceId);
	if (r.error != CodecError::None) return r;

	const QJsonValue ok = o.value("success");
	if (ok.isBool()) r.frame.success = ok.toBool();
	else if (!ok.isUndefined() && !ok.isNull()) { r.error = CodecError::InvalidField; return r; }

	if (!optString(o, "status", r.frame.status)) r.error = CodecError::InvalidField;
	return r;
}

} // namespace FrameCodec
