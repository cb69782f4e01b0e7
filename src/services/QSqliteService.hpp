#pragma once
#include <QDateTime>
#include <QVector>
#include <QString>
#include <QMutex>
#include <vector>
#include "include/LogDtos.hpp"
#include "services/IDeviceStore.hpp"


class QSqliteService : public IDeviceStore {
public:
    bool initializeDatabase();

    // IDeviceStore
    bool saveDevice(const DeviceRecord& rec) override;
    std::vector<DeviceRecord> loadAllOwned() override;
    bool deleteDevice(const QString& deviceId) override;
    bool appendOwnershipJournal(const QString& deviceId, const QString& event,
                                const QString& ownerId, const QString& detail = QString()) override;

    bool selectOwnershipJournal(const QString& deviceId, int limit,
                                QVector<OwnershipJournalEntry>* outRows);

    // 시스템로그
    bool insertSystemLog(int level, const QString& tag, const QString& message,
                         const QDateTime& timestamp, const QString& extra = QString());

    bool selectSystemLogs(int offset, int limit,
                          int minLevel, const QString& tagLike, const QString& sinceIso,
                          QVector<SystemLog>* outRows,
                          int* outTotal);

	bool deleteSysLogs();

private:
	QMutex dbMutex;
};
