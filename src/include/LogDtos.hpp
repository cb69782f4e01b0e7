#pragma once
#include <QString>
#include <QDateTime>

// 시스템 로그 DTO
struct SystemLog {
    int id{};
    int level{};        // 0~4
    QString tag;
    QString message;
    QDateTime timestamp;
    QString extra;
};

// 소유권 저널 DTO
struct OwnershipJournalEntry {
    int id{};
    QString deviceId;
    QString event;      // ownership_established, ownership_recovered, ownership_claim_failed, ...
    QString ownerId;
    QDateTime timestamp;
    QString detail;
};
