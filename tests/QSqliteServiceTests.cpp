#include <gtest/gtest.h>
#include <QDateTime>
#include <QTemporaryDir>

#include "services/QSqliteService.hpp"
#include "services/SqlCommon.hpp"
#include "log/SystemLogger.hpp"

namespace {
// 테스트마다 임시 DB 파일
class TempDatabase {
public:
    TempDatabase() {
        SqlCommon::dbFileOverride() = dir_.filePath(QStringLiteral("devices.db"));
    }
    ~TempDatabase() { SqlCommon::dbFileOverride().clear(); }
    bool valid() const { return dir_.isValid(); }
private:
    QTemporaryDir dir_;
};

DeviceRecord ownedRecord(const QString& id, const QString& owner)
{
    DeviceRecord r;
    r.deviceId = id;
    r.displayName = QStringLiteral("Kitchen LED");
    r.deviceType = QStringLiteral("ESP32");
    r.networkAddress = QStringLiteral("10.0.0.5");
    r.networkPort = 49497;
    r.capabilities = { QStringLiteral("heartbeat"), QStringLiteral("led_control") };
    r.ledStatus = States::LedStatus::On;
    r.ownership.ownerId = owner;
    r.ownership.hasValidCredential = true;
    r.ownership.isAuthenticated = true;
    r.firstSeenMs = 1000;
    r.lastSeenMs = 2000;
    return r;
}
} // namespace

// Owned devices round-trip through the store and always load unauthenticated.
TEST(QSqliteService, SaveAndLoadOwned) {
    TempDatabase tmp;
    ASSERT_TRUE(tmp.valid());
    QSqliteService db;
    ASSERT_TRUE(db.initializeDatabase());

    ASSERT_TRUE(db.saveDevice(ownedRecord("esp-01", "person-1")));
    const auto rows = db.loadAllOwned();
    ASSERT_EQ(rows.size(), 1u);

    const DeviceRecord& r = rows[0];
    EXPECT_EQ(r.deviceId, QStringLiteral("esp-01"));
    EXPECT_EQ(r.networkAddress, QStringLiteral("10.0.0.5"));
    EXPECT_EQ(r.networkPort, 49497);
    EXPECT_EQ(r.ownership.ownerId.value_or(QString()), QStringLiteral("person-1"));
    EXPECT_TRUE(r.ownership.hasValidCredential);
    EXPECT_FALSE(r.ownership.isAuthenticated);
    EXPECT_EQ(r.capabilities, (QStringList{ "heartbeat", "led_control" }));
    EXPECT_EQ(r.ledStatus, States::LedStatus::On);
}

// Unowned records are never persisted, and delete removes a saved one.
TEST(QSqliteService, RefusesUnownedAndDeletes) {
    TempDatabase tmp;
    QSqliteService db;
    ASSERT_TRUE(db.initializeDatabase());

    DeviceRecord unowned = ownedRecord("esp-02", "person-1");
    unowned.ownership.ownerId.reset();
    EXPECT_FALSE(db.saveDevice(unowned));

    ASSERT_TRUE(db.saveDevice(ownedRecord("esp-03", "person-1")));
    ASSERT_TRUE(db.saveDevice(ownedRecord("esp-03", "person-1"))) << "saving twice replaces";
    EXPECT_EQ(db.loadAllOwned().size(), 1u);

    EXPECT_TRUE(db.deleteDevice("esp-03"));
    EXPECT_TRUE(db.loadAllOwned().empty());
}

// Journal entries are returned newest first and can be filtered by device.
TEST(QSqliteService, OwnershipJournal) {
    TempDatabase tmp;
    QSqliteService db;
    ASSERT_TRUE(db.initializeDatabase());

    ASSERT_TRUE(db.appendOwnershipJournal("esp-01", "ownership_established", "person-1"));
    ASSERT_TRUE(db.appendOwnershipJournal("esp-02", "ownership_claim_failed", "person-1", "timeout"));
    ASSERT_TRUE(db.appendOwnershipJournal("esp-01", "ownership_removed", "person-1"));

    QVector<OwnershipJournalEntry> rows;
    ASSERT_TRUE(db.selectOwnershipJournal("esp-01", 10, &rows));
    ASSERT_EQ(rows.size(), 2);
    EXPECT_EQ(rows[0].event, QStringLiteral("ownership_removed"));
    EXPECT_EQ(rows[1].event, QStringLiteral("ownership_established"));

    ASSERT_TRUE(db.selectOwnershipJournal(QString(), 10, &rows));
    EXPECT_EQ(rows.size(), 3);
    EXPECT_EQ(rows[1].detail, QStringLiteral("timeout"));
}

// System log rows are filtered by level and tag and can be wiped.
TEST(QSqliteService, SystemLogsFilterAndDelete) {
    TempDatabase tmp;
    QSqliteService db;
    ASSERT_TRUE(db.initializeDatabase());

    const QDateTime now = QDateTime::currentDateTime();
    ASSERT_TRUE(db.insertSystemLog(1, "SESSION", "discovery started", now));
    ASSERT_TRUE(db.insertSystemLog(3, "OWN", "persistence save failed", now, "esp-01"));

    QVector<SystemLog> rows;
    int total = 0;
    ASSERT_TRUE(db.selectSystemLogs(0, 10, 2, QString(), QString(), &rows, &total));
    EXPECT_EQ(total, 1);
    ASSERT_EQ(rows.size(), 1);
    EXPECT_EQ(rows[0].tag, QStringLiteral("OWN"));
    EXPECT_EQ(rows[0].extra, QStringLiteral("esp-01"));

    ASSERT_TRUE(db.selectSystemLogs(0, 10, 0, "SESS", QString(), &rows, &total));
    EXPECT_EQ(total, 1);

    ASSERT_TRUE(db.deleteSysLogs());
    ASSERT_TRUE(db.selectSystemLogs(0, 10, 0, QString(), QString(), &rows, &total));
    EXPECT_EQ(total, 0);
}

// SystemLogger drains queued entries on shutdown and honours the minimum level.
TEST(QSqliteService, SystemLoggerWritesThroughWorker) {
    TempDatabase tmp;
    QSqliteService db;
    ASSERT_TRUE(db.initializeDatabase());

    SystemLogger::init(SysLogLevel::Info);
    ASSERT_TRUE(SystemLogger::isRunning());
    SystemLogger::debug("LIVE", "below threshold");
    SystemLogger::warn("LIVE", "heartbeat probe failed", "esp-01");
    SystemLogger::shutdown();
    EXPECT_FALSE(SystemLogger::isRunning());
    EXPECT_EQ(SystemLogger::droppedCount(), 0);

    SystemLogger::info("LIVE", "after shutdown");

    QVector<SystemLog> rows;
    int total = 0;
    ASSERT_TRUE(db.selectSystemLogs(0, 10, 0, "LIVE", QString(), &rows, &total));
    EXPECT_EQ(total, 1) << "debug entries and entries after shutdown must be dropped";
    ASSERT_EQ(rows.size(), 1);
    EXPECT_EQ(rows[0].message, QStringLiteral("heartbeat probe failed"));
    EXPECT_EQ(rows[0].level, static_cast<int>(SysLogLevel::Warn));
    EXPECT_EQ(rows[0].extra, QStringLiteral("esp-01"));
}
