#pragma once
#include "include/types.hpp"

// BLE 스캔/광고 추상화. 어댑터가 없으면 isAvailable() == false
class IAdvertisementSource {
public:
		virtual ~IAdvertisementSource() = default;

		virtual bool isAvailable() const = 0;

		virtual bool startScan() = 0;
		virtual void stopScan() = 0;
		virtual bool isScanning() const = 0;

		virtual bool startAdvertising(const AppIdentity& identity) = 0;
		virtual void stopAdvertising() = 0;
};
