#include "QSqliteService.hpp"
#include "services/SqlCommon.hpp"
#include <QJsonArray>
#include <QJsonDocument>
#include <QSqlDatabase>
#include <QSqlDriver>
#include <QSqlError>
#include <QSqlQuery>
#include <QVariant>
#include <QDebug>

using namespace SqlCommon;

// 무상태: 호출 시점에 스레드별 커넥션 확보
static QSqlDatabase ensureOpenConnectionForThisThread() {
    const QString name = SqlCommon::connectionNameForCurrentThread();
    const QString path = SqlCommon::dbFilePath();
    QSqlDatabase db;

    if (!QSqlDatabase::contains(name)) {
        db = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), name);
        db.setDatabaseName(path);
    } else {
        db = QSqlDatabase::database(name, /*open=*/false);
        // 경로가 바뀌었으면 (테스트/설정 변경) 다시 연다
        if (db.databaseName() != path) {
            db.close();
            db.setDatabaseName(path);
        }
    }

    if (!db.isOpen() && !db.open()) {
        qCritical() << "[SQL] DB open failed:" << db.lastError().text()
                    << " path=" << db.databaseName()
                    << " drivers=" << QSqlDatabase::drivers();
    }
    return db;
}

static QString capabilitiesToText(const QStringList& caps)
{
    return QString::fromUtf8(QJsonDocument(QJsonArray::fromStringList(caps)).toJson(QJsonDocument::Compact));
}

static QStringList capabilitiesFromText(const QString& text)
{
    QStringList out;
    const QJsonDocument jd = QJsonDocument::fromJson(text.toUtf8());
    if (!jd.isArray()) return out;
    for (const auto& v : jd.array()) {
        if (v.isString()) out << v.toString();
    }
    return out;
}


bool QSqliteService::initializeDatabase()
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread();
    if (!db.isOpen()) {
        qCritical() << "[SQL] Open failed:" << db.lastError().text()
                    << " path=" << db.databaseName();
        return false;
    }

    {   // 신뢰성 옵션
        QSqlQuery pragma(db);
        if (!pragma.exec("PRAGMA journal_mode=WAL;"))
            qWarning() << "[SQL] journal_mode=WAL failed (ignored):" << pragma.lastError().text();
        if (!pragma.exec("PRAGMA synchronous=NORMAL;"))
            qWarning() << "[SQL] synchronous=NORMAL failed (ignored):" << pragma.lastError().text();
    }

    QSqlQuery q(db);

    // 소유 장치
    if (!q.exec(
        "CREATE TABLE IF NOT EXISTS owned_devices ("
        "device_id   TEXT PRIMARY KEY, "
        "name        TEXT, "
        "device_type TEXT, "
        "address     TEXT, "
        "port        INTEGER, "
        "ble_address TEXT, "
        "owner_id    TEXT NOT NULL, "
        "has_valid_credential INTEGER NOT NULL DEFAULT 0, "
        "capabilities TEXT, "
        "led_status  TEXT, "
        "first_seen  INTEGER, "
        "last_seen   INTEGER, "
        "updated_at  TEXT NOT NULL)"
    )) {
        qCritical() << "Failed to create owned_devices:" << q.lastError().text();
        return false;
    }

    // 소유권 저널
    if (!q.exec(
        "CREATE TABLE IF NOT EXISTS ownership_journal ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT, "
        "device_id TEXT NOT NULL, "
        "event     TEXT NOT NULL, "
        "owner_id  TEXT, "
        "timestamp TEXT NOT NULL, "
        "detail    TEXT)"
    )) {
        qCritical() << "Failed to create ownership_journal:" << q.lastError().text();
        return false;
    }

    // 시스템로그
    if (!q.exec(
        "CREATE TABLE IF NOT EXISTS system_logs ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT, "
        "level INTEGER NOT NULL, "
        "tag TEXT, "
        "message TEXT NOT NULL, "
        "timestamp TEXT NOT NULL, "
        "extra TEXT)"
    )) {
        qCritical() << "Failed to create system_logs:" << q.lastError().text();
        return false;
    }

    // 인덱스
    const char* indexes[] = {
        "CREATE INDEX IF NOT EXISTS idx_journal_dev ON ownership_journal(device_id)",
        "CREATE INDEX IF NOT EXISTS idx_sys_ts      ON system_logs(timestamp)",
        "CREATE INDEX IF NOT EXISTS idx_sys_level   ON system_logs(level)",
        "CREATE INDEX IF NOT EXISTS idx_sys_tag     ON system_logs(tag)"
    };
    for (const char* sql : indexes) {
        if (!q.exec(QString::fromLatin1(sql)))
            qWarning() << "[SQL] index create failed (ignored):" << q.lastError().text();
    }

    qDebug() << "[SQL] Database opened & schema ready. path=" << db.databaseName()
             << " driver=" << db.driverName();
    return true;
}

bool QSqliteService::saveDevice(const DeviceRecord& rec)
{
    if (!rec.ownership.ownerId || rec.ownership.ownerId->isEmpty()) {
        qWarning() << "[saveDevice] refuse to persist unowned device" << rec.deviceId;
        return false;
    }

	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread();
    if (!db.isOpen()) {
        qCritical() << "[SQL] DB open failed:" << db.lastError().text();
        return false;
    }

    QSqlQuery q(db);
    q.prepare("INSERT OR REPLACE INTO owned_devices "
              "(device_id, name, device_type, address, port, ble_address, owner_id, "
              " has_valid_credential, capabilities, led_status, first_seen, last_seen, updated_at) "
              "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    q.addBindValue(rec.deviceId);
    q.addBindValue(rec.displayName);
    q.addBindValue(rec.deviceType);
    q.addBindValue(rec.networkAddress);
    q.addBindValue(static_cast<int>(rec.networkPort));
    q.addBindValue(rec.bleAddress);
    q.addBindValue(*rec.ownership.ownerId);
    q.addBindValue(rec.ownership.hasValidCredential ? 1 : 0);
    q.addBindValue(capabilitiesToText(rec.capabilities));
    q.addBindValue(States::toString(rec.ledStatus));
    q.addBindValue(rec.firstSeenMs);
    q.addBindValue(rec.lastSeenMs);
    q.addBindValue(QDateTime::currentDateTime().toString(Qt::ISODateWithMs));

    if (!q.exec()) {
        qCritical() << "[SQL] save device failed:" << rec.deviceId << q.lastError().text();
        return false;
    }
    return true;
}

std::vector<DeviceRecord> QSqliteService::loadAllOwned()
{
    std::vector<DeviceRecord> out;

	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread();
    if (!db.isOpen()) return out;

    QSqlQuery q(db);
    if (!q.exec("SELECT device_id, name, device_type, address, port, ble_address, owner_id, "
                "has_valid_credential, capabilities, led_status, first_seen, last_seen "
                "FROM owned_devices ORDER BY device_id")) {
        qCritical() << "[SQL] load owned devices failed:" << q.lastError().text();
        return out;
    }

    while (q.next()) {
        DeviceRecord r;
        r.deviceId       = q.value(0).toString();
        r.displayName    = q.value(1).toString();
        r.deviceType     = q.value(2).toString();
        r.networkAddress = q.value(3).toString();
        r.networkPort    = static_cast<quint16>(q.value(4).toUInt());
        r.bleAddress     = q.value(5).toString();
        r.ownership.ownerId            = q.value(6).toString();
        r.ownership.hasValidCredential = q.value(7).toInt() != 0;
        r.ownership.isAuthenticated    = false;
        r.capabilities   = capabilitiesFromText(q.value(8).toString());
        r.ledStatus      = States::ledStatusFromString(q.value(9).toString());
        r.firstSeenMs    = q.value(10).toLongLong();
        r.lastSeenMs     = q.value(11).toLongLong();
        out.push_back(r);
    }
    return out;
}

bool QSqliteService::deleteDevice(const QString& deviceId)
{
	QMutexLocker locker(&dbMutex);
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen()) {
		qCritical() << "[deleteDevice] DB open failed:" << db.lastError().text();
		return false;
	}

	QSqlQuery q(db);
	q.prepare("DELETE FROM owned_devices WHERE device_id = ?");
	q.addBindValue(deviceId);
	if (!q.exec()) {
		qCritical() << "[deleteDevice] failed:" << deviceId << q.lastError().text();
		return false;
	}
	return true;
}

bool QSqliteService::appendOwnershipJournal(const QString& deviceId, const QString& event,
                                            const QString& ownerId, const QString& detail)
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread();
    if (!db.isOpen()) return false;

    QSqlQuery q(db);
    q.prepare("INSERT INTO ownership_journal (device_id, event, owner_id, timestamp, detail) "
              "VALUES (?, ?, ?, ?, ?)");
    q.addBindValue(deviceId);
    q.addBindValue(event);
    q.addBindValue(ownerId);
    q.addBindValue(QDateTime::currentDateTime().toString(Qt::ISODateWithMs));
    q.addBindValue(detail);

    if (!q.exec()) {
        qCritical() << "[SQL] journal insert failed:" << q.lastError().text();
        return false;
    }
    return true;
}

bool QSqliteService::selectOwnershipJournal(const QString& deviceId, int limit,
                                            QVector<OwnershipJournalEntry>* outRows)
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread();
    if (!db.isOpen()) return false;

    QSqlQuery q(db);
    if (deviceId.isEmpty()) {
        q.prepare("SELECT id, device_id, event, owner_id, timestamp, detail "
                  "FROM ownership_journal ORDER BY id DESC LIMIT ?");
    } else {
        q.prepare("SELECT id, device_id, event, owner_id, timestamp, detail "
                  "FROM ownership_journal WHERE device_id = ? ORDER BY id DESC LIMIT ?");
        q.addBindValue(deviceId);
    }
    q.addBindValue(qMax(1, limit));

    if (!q.exec()) {
        qCritical() << "[SQL] journal select failed:" << q.lastError().text();
        return false;
    }

    if (outRows) {
        outRows->clear();
        while (q.next()) {
            OwnershipJournalEntry e;
            e.id        = q.value(0).toInt();
            e.deviceId  = q.value(1).toString();
            e.event     = q.value(2).toString();
            e.ownerId   = q.value(3).toString();
            e.timestamp = QDateTime::fromString(q.value(4).toString(), Qt::ISODateWithMs);
            e.detail    = q.value(5).toString();
            outRows->push_back(e);
        }
    }
    return true;
}

bool QSqliteService::insertSystemLog(int level, const QString& tag, const QString& message,
                                     const QDateTime& timestamp, const QString& extra)
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread();
    if (!db.isOpen()) {
        qCritical() << "[SQL] DB open failed:" << db.lastError().text();
        return false;
    }

    QSqlQuery q(db);
    q.prepare("INSERT INTO system_logs (level, tag, message, timestamp, extra) "
              "VALUES (?, ?, ?, ?, ?)");
    q.addBindValue(level);
    q.addBindValue(tag);
    q.addBindValue(message);
    q.addBindValue(timestamp.toString(Qt::ISODateWithMs));
    q.addBindValue(extra);

    if (!q.exec()) {
        qCritical() << "Insert system log failed:" << q.lastError().text();
        return false;
    }
    return true;
}

bool QSqliteService::selectSystemLogs(int offset, int limit,
                                      int minLevel, const QString& tagLike, const QString& sinceIso,
                                      QVector<SystemLog>* outRows, int* outTotal)
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread();
    if (!db.isOpen()) return false;

    QString where = "WHERE level >= ?";
    QList<QVariant> binds; binds << minLevel;

    if (!tagLike.isEmpty()) { where += " AND tag LIKE ?";     binds << ("%" + tagLike + "%"); }
    if (!sinceIso.isEmpty()){ where += " AND timestamp >= ?"; binds << sinceIso; }

    // total
    QSqlQuery qc(db);
    qc.prepare("SELECT COUNT(*) FROM system_logs " + where);
    for (const auto& v : binds) qc.addBindValue(v);
    if (!qc.exec() || !qc.next()) return false;
    if (outTotal) *outTotal = qc.value(0).toInt();

    // rows
    QSqlQuery q(db);
    q.prepare("SELECT id, level, tag, message, timestamp, extra "
              "FROM system_logs " + where + " ORDER BY id DESC LIMIT ? OFFSET ?");
    for (const auto& v : binds) q.addBindValue(v);
    q.addBindValue(limit);
    q.addBindValue(offset);

    if (!q.exec()) return false;

    if (outRows) {
        outRows->clear();
        while (q.next()) {
            SystemLog r;
            r.id        = q.value(0).toInt();
            r.level     = q.value(1).toInt();
            r.tag       = q.value(2).toString();
            r.message   = q.value(3).toString();
            r.timestamp = QDateTime::fromString(q.value(4).toString(), Qt::ISODateWithMs);
            r.extra     = q.value(5).toString();
            outRows->push_back(r);
        }
    }
    return true;
}

bool QSqliteService::deleteSysLogs()
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread();
    if (!db.isOpen()) {
        qCritical() << "[SQL] DB open failed:" << db.lastError().text();
        return false;
    }

    QSqlQuery q(db);
    if (!q.exec("DELETE FROM system_logs;")) {
        qCritical() << "[SQL] DELETE FROM system_logs failed:" << q.lastError().text();
        return false;
    }

    if (!q.exec("DELETE FROM sqlite_sequence WHERE name='system_logs';")) {
        qWarning() << "[SQL] reset sqlite_sequence failed (ignored):" << q.lastError().text();
    }
    return true;
}
