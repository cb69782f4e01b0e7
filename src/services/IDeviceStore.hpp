#pragma once
#include <vector>
#include <QString>
#include "include/types.hpp"

// 소유 장치 영속화. 실패는 치명적이지 않음 (호출측은 로그만 남긴다)
class IDeviceStore {
public:
		virtual ~IDeviceStore() = default;

		virtual bool saveDevice(const DeviceRecord& rec) = 0;
		virtual std::vector<DeviceRecord> loadAllOwned() = 0;
		virtual bool deleteDevice(const QString& deviceId) = 0;

		virtual bool appendOwnershipJournal(const QString& deviceId, const QString& event,
											const QString& ownerId, const QString& detail = QString()) = 0;
};
