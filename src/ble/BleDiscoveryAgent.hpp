#ifndef BLEDISCOVERYAGENT_HPP
#define BLEDISCOVERYAGENT_HPP
#include <QObject>
#include <QScopedPointer>
#include <QtBluetooth/QBluetoothDeviceDiscoveryAgent>
#include <QtBluetooth/QBluetoothDeviceInfo>
#include <QtBluetooth/QLowEnergyAdvertisingData>
#include <QtBluetooth/QLowEnergyAdvertisingParameters>
#include <QtBluetooth/QLowEnergyController>
#include <QtBluetooth/QBluetoothUuid>

#include "ble/IAdvertisementSource.hpp"
#include "include/types.hpp"

extern const QBluetoothUuid APP_SERVICE_UUID;
extern const QBluetoothUuid ESP32_SERVICE_UUID;
extern const QBluetoothUuid RING_SERVICE_UUID;

// BLE advertisement 스캔 + 앱 자신 광고 (peripheral)
class BleDiscoveryAgent : public QObject, public IAdvertisementSource {
	Q_OBJECT
	public:
		explicit BleDiscoveryAgent(int scanWindowMs = 10000, QObject* parent = nullptr);
		~BleDiscoveryAgent() override;

		bool isAvailable() const override;

		bool startScan() override;
		void stopScan() override;
		bool isScanning() const override;

		bool startAdvertising(const AppIdentity& identity) override;
		void stopAdvertising() override;

		// QBluetoothDeviceInfo -> 스택 독립 레코드
		static AdvertisementRecord toRecord(const QBluetoothDeviceInfo& info);

signals:
		void advertisementReceived(const AdvertisementRecord& record);
		void scanFinished();
		void errorHappened(QString msg);

	private:
		void addConnect_();
		void onDeviceInfo_(const QBluetoothDeviceInfo& info);
		void teardown_();

	private:
		int scanWindowMs_;
		QScopedPointer<QBluetoothDeviceDiscoveryAgent> agent_;
		QScopedPointer<QLowEnergyController>           peripheral_;
		bool advertising_ = false;
};
#endif // BLEDISCOVERYAGENT_HPP
