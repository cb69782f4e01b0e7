#include "BleDiscoveryAgent.hpp"
#include <QtBluetooth/QBluetoothLocalDevice>
#include <QDebug>
#include "codec/FrameCodec.hpp"
#include "log/disco_logging.hpp"

BleDiscoveryAgent::BleDiscoveryAgent(int scanWindowMs, QObject* parent)
  : QObject(parent), scanWindowMs_(scanWindowMs > 0 ? scanWindowMs : 10000) {}

BleDiscoveryAgent::~BleDiscoveryAgent() { teardown_(); }

bool BleDiscoveryAgent::isAvailable() const
{
	const auto adapters = QBluetoothLocalDevice::allDevices();
	if (adapters.isEmpty()) return false;

	QBluetoothLocalDevice local(adapters.first().address());
	return local.isValid() && local.hostMode() != QBluetoothLocalDevice::HostPoweredOff;
}

AdvertisementRecord BleDiscoveryAgent::toRecord(const QBluetoothDeviceInfo& info)
{
	AdvertisementRecord r;
	r.address = info.address().toString();
	r.name    = info.name();
	r.rssi    = info.rssi();
	for (const QBluetoothUuid& u : info.serviceUuids())
		r.serviceUuids << u.toString(QUuid::WithoutBraces);

	// 같은 company id 가 여러 번 오면 마지막 값
	const auto md = info.manufacturerData();
	for (auto it = md.constBegin(); it != md.constEnd(); ++it)
		r.manufacturerData.insert(it.key(), it.value());
	return r;
}

bool BleDiscoveryAgent::startScan()
{
	if (isScanning()) return true;

	if (!agent_) {
		agent_.reset(new QBluetoothDeviceDiscoveryAgent());
		addConnect_();
	}
	agent_->setLowEnergyDiscoveryTimeout(scanWindowMs_);
	agent_->start(QBluetoothDeviceDiscoveryAgent::LowEnergyMethod);

	if (agent_->error() != QBluetoothDeviceDiscoveryAgent::NoError) {
		qWarning() << "[BleDiscoveryAgent::startScan] start failed:" << agent_->errorString();
		return false;
	}
	qCDebug(LC_TRANSPORT) << "[ble] scan started, window" << scanWindowMs_ << "ms";
	return true;
}

void BleDiscoveryAgent::stopScan()
{
	if (agent_ && agent_->isActive()) agent_->stop();
}

bool BleDiscoveryAgent::isScanning() const
{
	return agent_ && agent_->isActive();
}

void BleDiscoveryAgent::addConnect_()
{
	QObject::connect(agent_.data(), &QBluetoothDeviceDiscoveryAgent::deviceDiscovered,
		this, [this](const QBluetoothDeviceInfo& info) { onDeviceInfo_(info); });

	QObject::connect(agent_.data(), &QBluetoothDeviceDiscoveryAgent::deviceUpdated,
		this, [this](const QBluetoothDeviceInfo& info, QBluetoothDeviceInfo::Fields fields) {
			// rssi 만 바뀐 갱신도 last_seen 갱신용으로 전달
			if (!fields) return;
			onDeviceInfo_(info);
		});

	QObject::connect(agent_.data(), &QBluetoothDeviceDiscoveryAgent::finished,
		this, [this]() {
			qCDebug(LC_TRANSPORT) << "[ble] scan window finished";
			emit scanFinished();
		});

	QObject::connect(agent_.data(), &QBluetoothDeviceDiscoveryAgent::errorOccurred,
		this, [this](QBluetoothDeviceDiscoveryAgent::Error e) {
			qWarning() << "[ble] scan error:" << int(e) << agent_->errorString();
			emit errorHappened(agent_->errorString());
		});
}

void BleDiscoveryAgent::onDeviceInfo_(const QBluetoothDeviceInfo& info)
{
	if (!(info.coreConfigurations() & QBluetoothDeviceInfo::LowEnergyCoreConfiguration))
		return;

	// vendor record 나 관심 서비스가 없는 장치는 여기서 거른다
	const bool hasVendor = info.manufacturerIds().contains(FrameCodec::kEspressifCompanyId);
	const auto uuids = info.serviceUuids();
	const bool hasService = uuids.contains(ESP32_SERVICE_UUID) || uuids.contains(RING_SERVICE_UUID);
	if (!hasVendor && !hasService) return;

	emit advertisementReceived(toRecord(info));
}

bool BleDiscoveryAgent::startAdvertising(const AppIdentity& identity)
{
	if (advertising_) return true;

	if (!peripheral_) {
		peripheral_.reset(QLowEnergyController::createPeripheral());
		if (!peripheral_) {
			qWarning() << "[startAdvertising] peripheral controller unavailable";
			return false;
		}
		QObject::connect(peripheral_.data(), &QLowEnergyController::errorOccurred,
			this, [this](QLowEnergyController::Error e) {
				qWarning() << "[ble] peripheral error:" << int(e);
				advertising_ = false;
				emit errorHappened(QStringLiteral("peripheral error %1").arg(int(e)));
			});
	}

	// 1) AdvInd (connectable, legacy)
	QLowEnergyAdvertisingParameters params;
	params.setMode(QLowEnergyAdvertisingParameters::AdvInd);
	params.setInterval(160, 320);   // 100~200ms

	// 2) 31바이트 이내: 짧은 이름 + 16-bit 서비스 하나
	QLowEnergyAdvertisingData adv;
	adv.setDiscoverability(QLowEnergyAdvertisingData::DiscoverabilityGeneral);
	adv.setIncludePowerLevel(false);
	adv.setLocalName(identity.deviceName.left(12));
	adv.setServices({ APP_SERVICE_UUID });

	// 3) 스캔 응답에 id 전체
	QLowEnergyAdvertisingData resp;
	resp.setManufacturerData(0xFFFF, identity.deviceId.toUtf8().left(24));

	peripheral_->startAdvertising(params, adv, resp);
	advertising_ = true;

	qInfo() << "[BLE] advertising as" << identity.deviceName << "(legacy AdvInd)";
	return true;
}

void BleDiscoveryAgent::stopAdvertising()
{
	if (peripheral_ && advertising_) peripheral_->stopAdvertising();
	advertising_ = false;
}

void BleDiscoveryAgent::teardown_()
{
	stopScan();
	stopAdvertising();
	if (agent_) { QObject::disconnect(agent_.data(), nullptr, this, nullptr); agent_.reset(); }
	if (peripheral_) { QObject::disconnect(peripheral_.data(), nullptr, this, nullptr); peripheral_.reset(); }
}
