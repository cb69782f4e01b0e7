#include "DeviceRegistry.hpp"
#include <QDateTime>
#include <QDebug>
#include "log/disco_logging.hpp"

namespace {
	template <typename T>
	bool assign(T& field, const T& value, std::optional<T>& out)
	{
		if (field == value) return false;
		field = value;
		out = value;
		return true;
	}

	DeviceUpdate fullUpdate(const DeviceRecord& r)
	{
		DeviceUpdate u;
		u.deviceId       = r.deviceId;
		u.displayName    = r.displayName;
		u.deviceType     = r.deviceType;
		u.networkAddress = r.networkAddress;
		u.networkPort    = r.networkPort;
		u.bleAddress     = r.bleAddress;
		u.rssi           = r.rssi;
		u.wifiStatus     = r.wifiStatus;
		u.bleStatus      = r.bleStatus;
		u.online         = r.online;
		u.connected      = r.connected;
		u.lastSeenMs     = r.lastSeenMs;
		u.capabilities   = r.capabilities;
		u.ledStatus      = r.ledStatus;
		u.status         = r.status;
		u.protocol       = r.protocol;
		u.ownerId            = r.ownership.ownerId.value_or(QString());
		u.hasValidCredential = r.ownership.hasValidCredential;
		u.isAuthenticated    = r.ownership.isAuthenticated;
		return u;
	}
}

DeviceRegistry::DeviceRegistry(Clock clock)
	: clock_(clock ? std::move(clock) : Clock([] { return QDateTime::currentMSecsSinceEpoch(); }))
{
}

std::optional<DeviceDelta> DeviceRegistry::observe(const DiscoveryFrame& frame,
												   States::Transport transport,
												   const QString& sourceAddress,
												   quint16 sourcePort)
{
	if (frame.deviceId.isEmpty()) return std::nullopt;

	const qint64 now = clock_();
	const bool wifi = (transport == States::Transport::Wifi);
	const QString bleAddr = sourceAddress.isEmpty() ? frame.address : sourceAddress;

	auto it = records_.find(frame.deviceId);
	if (it == records_.end()) {
		DeviceRecord rec;
		rec.deviceId     = frame.deviceId;
		rec.displayName  = frame.displayName.isEmpty() ? frame.deviceId : frame.displayName;
		rec.deviceType   = frame.deviceType;
		rec.capabilities = frame.capabilities;
		rec.status       = frame.status;
		rec.protocol     = frame.protocol;
		rec.ledStatus    = frame.ledStatus;
		if (wifi) {
			rec.networkAddress = sourceAddress;
			rec.networkPort    = sourcePort;
			rec.wifiStatus     = States::LinkStatus::Active;
			rec.connected      = true;
		} else {
			rec.bleAddress = bleAddr;
			rec.rssi       = frame.rssi;
			rec.bleStatus  = States::LinkStatus::Active;
		}
		rec.online      = true;
		rec.firstSeenMs = now;
		rec.lastSeenMs  = now;
		// 새 레코드는 항상 미소유 상태로 시작
		rec.ownership   = OwnershipInfo{};

		qCDebug(LC_REGISTRY) << "[observe] created" << rec.deviceId << "via" << States::toString(transport);

		DeviceDelta d;
		d.kind   = DeviceDelta::Kind::Created;
		d.update = fullUpdate(rec);
		records_.emplace(rec.deviceId, rec);
		return d;
	}

	DeviceRecord& rec = it->second;
	DeviceUpdate u;
	u.deviceId = rec.deviceId;
	bool changed = false;

	rec.lastSeenMs = now;

	// 해당 transport 가 권한을 가진 필드만 갱신
	if (wifi) {
		changed |= assign(rec.networkAddress, sourceAddress, u.networkAddress);
		changed |= assign(rec.networkPort, sourcePort, u.networkPort);
		changed |= assign(rec.wifiStatus, States::LinkStatus::Active, u.wifiStatus);
		changed |= assign(rec.connected, true, u.connected);
	} else {
		changed |= assign(rec.bleAddress, bleAddr, u.bleAddress);
		changed |= assign(rec.bleStatus, States::LinkStatus::Active, u.bleStatus);
		rec.rssi = frame.rssi;		// 매번 흔들리는 값이라 변경으로 치지 않음
	}

	if (!frame.displayName.isEmpty()) changed |= assign(rec.displayName, frame.displayName, u.displayName);
	if (!frame.deviceType.isEmpty())  changed |= assign(rec.deviceType, frame.deviceType, u.deviceType);
	if (frame.hasCapabilities)        changed |= assign(rec.capabilities, frame.capabilities, u.capabilities);
	if (!frame.status.isEmpty())      changed |= assign(rec.status, frame.status, u.status);
	if (!frame.protocol.isEmpty())    changed |= assign(rec.protocol, frame.protocol, u.protocol);
	if (frame.ledStatus != States::LedStatus::Unknown)
		changed |= assign(rec.ledStatus, frame.ledStatus, u.ledStatus);

	changed |= assign(rec.online, true, u.online);

	if (!changed) return std::nullopt;

	u.lastSeenMs = now;
	DeviceDelta d;
	d.kind   = DeviceDelta::Kind::Updated;
	d.update = u;
	return d;
}

std::optional<DeviceDelta> DeviceRegistry::markTransportInactive(const QString& deviceId, States::Transport transport)
{
	auto it = records_.find(deviceId);
	if (it == records_.end()) return std::nullopt;

	DeviceRecord& rec = it->second;
	DeviceUpdate u;
	u.deviceId = deviceId;
	bool changed = false;

	if (transport == States::Transport::Wifi) {
		changed |= assign(rec.wifiStatus, States::LinkStatus::Inactive, u.wifiStatus);
		changed |= assign(rec.connected, false, u.connected);
	} else {
		changed |= assign(rec.bleStatus, States::LinkStatus::Inactive, u.bleStatus);
	}

	DeviceDelta d;
	d.kind = DeviceDelta::Kind::Updated;
	if (rec.wifiStatus == States::LinkStatus::Inactive && rec.bleStatus == States::LinkStatus::Inactive) {
		const bool wasOnline = rec.online;
		changed |= assign(rec.online, false, u.online);
		changed |= assign(rec.connected, false, u.connected);
		if (wasOnline) d.kind = DeviceDelta::Kind::WentOffline;
	}

	if (!changed) return std::nullopt;
	d.update = u;
	return d;
}

std::optional<DeviceDelta> DeviceRegistry::goOffline_(DeviceRecord& rec)
{
	if (!rec.online) return std::nullopt;

	DeviceUpdate u;
	u.deviceId = rec.deviceId;
	assign(rec.online, false, u.online);
	assign(rec.connected, false, u.connected);
	assign(rec.wifiStatus, States::LinkStatus::Inactive, u.wifiStatus);
	assign(rec.bleStatus, States::LinkStatus::Inactive, u.bleStatus);

	DeviceDelta d;
	d.kind   = DeviceDelta::Kind::WentOffline;
	d.update = u;
	return d;
}

std::vector<DeviceDelta> DeviceRegistry::sweepTimeouts(qint64 nowMs, qint64 timeoutMs)
{
	std::vector<DeviceDelta> out;
	for (auto& kv : records_) {
		DeviceRecord& rec = kv.second;
		if (!rec.online || nowMs - rec.lastSeenMs <= timeoutMs) continue;

		qCDebug(LC_REGISTRY) << "[sweepTimeouts]" << rec.deviceId
			<< "silent for" << (nowMs - rec.lastSeenMs) << "ms";
		if (auto d = goOffline_(rec)) out.push_back(*d);
	}
	return out;
}

std::optional<DeviceDelta> DeviceRegistry::sweepDevice(const QString& deviceId, qint64 nowMs, qint64 timeoutMs)
{
	auto it = records_.find(deviceId);
	if (it == records_.end()) return std::nullopt;
	if (nowMs - it->second.lastSeenMs <= timeoutMs) return std::nullopt;
	return goOffline_(it->second);
}

std::optional<DeviceDelta> DeviceRegistry::applyLedStatus(const QString& deviceId, States::LedStatus led)
{
	auto it = records_.find(deviceId);
	if (it == records_.end()) return std::nullopt;

	DeviceDelta d;
	d.update.deviceId = deviceId;
	if (!assign(it->second.ledStatus, led, d.update.ledStatus)) return std::nullopt;
	return d;
}

std::optional<DeviceRecord> DeviceRegistry::get(const QString& deviceId) const
{
	auto it = records_.find(deviceId);
	if (it == records_.end()) return std::nullopt;
	return it->second;
}

std::vector<DeviceRecord> DeviceRegistry::list() const
{
	std::vector<DeviceRecord> out;
	out.reserve(records_.size());
	for (const auto& kv : records_) out.push_back(kv.second);
	return out;
}

std::optional<DeviceUpdate> DeviceRegistry::applyOwnership(const QString& deviceId, const OwnershipInfo& info)
{
	auto it = records_.find(deviceId);
	if (it == records_.end()) return std::nullopt;

	it->second.ownership = info;

	DeviceUpdate u;
	u.deviceId           = deviceId;
	u.ownerId            = info.ownerId.value_or(QString());
	u.hasValidCredential = info.hasValidCredential;
	u.isAuthenticated    = info.isAuthenticated;
	return u;
}

bool DeviceRegistry::restore(const DeviceRecord& rec)
{
	if (rec.deviceId.isEmpty() || records_.count(rec.deviceId)) return false;

	DeviceRecord r = rec;
	r.online     = false;
	r.connected  = false;
	r.wifiStatus = States::LinkStatus::Inactive;
	r.bleStatus  = States::LinkStatus::Inactive;
	// credential 재확인 전까지 미인증
	r.ownership.isAuthenticated = false;
	records_.emplace(r.deviceId, r);
	return true;
}
