#include "DiscoveryParams.hpp"
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QDebug>

namespace {
	void readInt(const QJsonObject& o, const char* key, int& dst)
	{
		const QJsonValue v = o.value(QLatin1String(key));
		if (v.isDouble() && v.toInt(-1) > 0) dst = v.toInt();
		else if (!v.isUndefined()) qWarning() << "[loadDiscoveryParams] ignore invalid" << key << v;
	}

	void readBool(const QJsonObject& o, const char* key, bool& dst)
	{
		const QJsonValue v = o.value(QLatin1String(key));
		if (v.isBool()) dst = v.toBool();
	}
}

bool loadDiscoveryParams(const QString& path, DiscoveryParams* out)
{
	if (!out) return false;

	QFile f(path);
	if (!f.exists()) {
		qWarning() << "[loadDiscoveryParams] file not found ->" << path;
		return false;
	}
	if (!f.open(QIODevice::ReadOnly)) {
		qWarning() << "[loadDiscoveryParams] open failed ->" << path << f.errorString();
		return false;
	}

	QJsonParseError err{};
	const QJsonDocument jd = QJsonDocument::fromJson(f.readAll(), &err);
	f.close();
	if (err.error != QJsonParseError::NoError || !jd.isObject()) {
		qWarning() << "[loadDiscoveryParams] parse failed ->" << path << err.errorString();
		return false;
	}

	const QJsonObject root = jd.object();
	DiscoveryParams p = *out;

	int port = p.discoveryPort;
	readInt(root, "discovery_port", port);
	if (port > 0 && port <= 0xFFFF) p.discoveryPort = static_cast<quint16>(port);

	readInt(root, "broadcast_interval_ms",   p.broadcastIntervalMs);
	readInt(root, "sweep_interval_ms",       p.sweepIntervalMs);
	readInt(root, "device_timeout_ms",       p.deviceTimeoutMs);
	readInt(root, "heartbeat_inactivity_ms", p.heartbeatInactivityMs);
	readInt(root, "update_debounce_ms",      p.updateDebounceMs);
	readInt(root, "claim_timeout_ms",        p.claimTimeoutMs);
	readInt(root, "ble_scan_window_ms",      p.bleScanWindowMs);

	readBool(root, "enable_ble",         p.enableBle);
	readBool(root, "enable_advertising", p.enableAdvertising);
	readBool(root, "forcibly_disabled",  p.forciblyDisabled);

	if (root.value("person_id").isString())   p.personId   = root.value("person_id").toString();
	if (root.value("device_name").isString()) p.deviceName = root.value("device_name").toString();
	if (root.value("db_file").isString())     p.dbFile     = root.value("db_file").toString();
	if (root.value("log_level").isString())   p.logLevel   = root.value("log_level").toString();
	if (root.value("credential_secret").isString())
		p.credentialSecret = root.value("credential_secret").toString().toUtf8();

	*out = p;
	qInfo() << "[loadDiscoveryParams] loaded" << path << "port=" << p.discoveryPort;
	return true;
}
