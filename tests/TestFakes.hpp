#pragma once
#include <QCoreApplication>
#include <QElapsedTimer>
#include <QHostAddress>
#include <functional>
#include <map>
#include <vector>

#include "include/types.hpp"
#include "net/IDatagramTransport.hpp"
#include "ble/IAdvertisementSource.hpp"
#include "services/ICredentialService.hpp"
#include "services/IDeviceStore.hpp"
#include "codec/FrameCodec.hpp"

namespace testing_support {

// 테스트가 직접 진행시키는 시계
struct FakeClock {
    qint64 now = 1'700'000'000'000;
    std::function<qint64()> fn() { return [this] { return now; }; }
    void advance(qint64 ms) { now += ms; }
};

// 이벤트 루프를 ms 동안 돌린다 (QTimer 기반 debounce 검증용)
inline void spinEventLoop(int ms)
{
    QElapsedTimer t;
    t.start();
    while (t.elapsed() < ms)
        QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
}

inline DiscoveryFrame makeFrame(const QString& id, const QString& type = QStringLiteral("ESP32"))
{
    DiscoveryFrame f;
    f.deviceId     = id;
    f.deviceType   = type;
    f.displayName  = id;
    f.capabilities = { QStringLiteral("led_control") };
    f.hasCapabilities = true;
    f.status       = QStringLiteral("ready");
    return f;
}

// discovery 프레임 한 개짜리 datagram
inline QByteArray discoveryDatagram(const QJsonObject& payload)
{
    return FrameCodec::encodeControlFrame(FrameCodec::FrameType::Discovery, payload);
}

struct SentDatagram {
    QByteArray data;
    QHostAddress to;
    quint16 port = 0;
};

class FakeUdp : public IDatagramTransport {
public:
    bool openOk = true;
    bool sendOk = true;
    bool opened = false;
    quint16 boundPort = 0;
    std::vector<SentDatagram> sent;
    std::vector<QByteArray> broadcasts;

    bool open(quint16 port) override { opened = openOk; boundPort = port; return openOk; }
    void close() override { opened = false; }
    bool isOpen() const override { return opened; }

    bool sendDatagram(const QByteArray& data, const QHostAddress& to, quint16 port) override {
        if (!opened || !sendOk) return false;
        sent.push_back({ data, to, port });
        return true;
    }
    bool sendBroadcast(const QByteArray& data, quint16 port) override {
        Q_UNUSED(port);
        if (!opened || !sendOk) return false;
        broadcasts.push_back(data);
        return true;
    }

    // 특정 frame type 으로 보낸 것만
    std::vector<SentDatagram> sentOfType(FrameCodec::FrameType type) const {
        std::vector<SentDatagram> out;
        for (const auto& s : sent) {
            const auto r = FrameCodec::decodeControlFrame(s.data);
            if (r.ok() && r.frame.type == type) out.push_back(s);
        }
        return out;
    }
};

class FakeBle : public IAdvertisementSource {
public:
    bool available = true;
    bool scanning = false;
    bool advertising = false;
    int scanStarts = 0;

    bool isAvailable() const override { return available; }
    bool startScan() override { if (!available) return false; scanning = true; ++scanStarts; return true; }
    void stopScan() override { scanning = false; }
    bool isScanning() const override { return scanning; }
    bool startAdvertising(const AppIdentity&) override { advertising = available; return available; }
    void stopAdvertising() override { advertising = false; }
};

// ack/검증을 테스트가 원하는 시점에 응답
class FakeCredentialService : public ICredentialService {
public:
    struct Transmit {
        Credential cred;
        QString address;
        quint16 port = 0;
        AckCallback done;
    };
    struct Release {
        QString deviceId;
        QString ownerId;
        AckCallback done;
    };

    bool transportDown = false;
    std::vector<Transmit> transmits;
    std::vector<Release> releases;
    std::vector<std::pair<Credential, VerifyCallback>> verifies;
    std::vector<QString> cancelled;

    Credential issueCredential(const QString& deviceId, const QString& ownerId) override {
        Credential c;
        c.id = QStringLiteral("cred-%1").arg(transmits.size() + 1);
        c.issuer = ownerId;
        c.subject = deviceId;
        c.issuedAt = 1;
        c.expiresAt = 0;
        c.proof = QByteArray("proof");
        return c;
    }
    void verifyCredential(const Credential& cred, VerifyCallback done) override {
        verifies.emplace_back(cred, std::move(done));
    }
    void transmitCredential(const Credential& cred, const QString& address, quint16 port,
                            AckCallback done) override {
        if (transportDown) { done(CredentialError::TransportUnavailable, QStringLiteral("send failed")); return; }
        transmits.push_back({ cred, address, port, std::move(done) });
    }
    void requestRelease(const QString& deviceId, const QString& ownerId,
                        const QString&, quint16, AckCallback done) override {
        if (transportDown) { done(CredentialError::TransportUnavailable, QStringLiteral("send failed")); return; }
        releases.push_back({ deviceId, ownerId, std::move(done) });
    }
    void cancel(const QString& deviceId) override { cancelled.push_back(deviceId); }

    void ackLastClaim(CredentialError e = CredentialError::None, const QString& detail = QString()) {
        auto done = transmits.back().done;
        done(e, detail);
    }
    void ackLastRelease(CredentialError e = CredentialError::None, const QString& detail = QString()) {
        auto done = releases.back().done;
        done(e, detail);
    }
    void answerLastVerify(CredentialError e, const QString& issuer) {
        VerifiedInfo info;
        info.issuer = issuer;
        info.subject = verifies.back().first.subject;
        auto done = verifies.back().second;
        done(e, info);
    }
};

class FakeStore : public IDeviceStore {
public:
    struct JournalRow {
        QString deviceId;
        QString event;
        QString ownerId;
        QString detail;
    };

    bool failWrites = false;
    std::map<QString, DeviceRecord> saved;
    std::vector<JournalRow> journal;
    int deletes = 0;

    bool saveDevice(const DeviceRecord& rec) override {
        if (failWrites) return false;
        saved[rec.deviceId] = rec;
        return true;
    }
    std::vector<DeviceRecord> loadAllOwned() override {
        std::vector<DeviceRecord> out;
        for (const auto& kv : saved) out.push_back(kv.second);
        return out;
    }
    bool deleteDevice(const QString& deviceId) override {
        ++deletes;
        if (failWrites) return false;
        saved.erase(deviceId);
        return true;
    }
    bool appendOwnershipJournal(const QString& deviceId, const QString& event,
                                const QString& ownerId, const QString& detail) override {
        if (failWrites) return false;
        journal.push_back({ deviceId, event, ownerId, detail });
        return true;
    }

    bool hasEvent(const QString& deviceId, const QString& event) const {
        for (const auto& j : journal)
            if (j.deviceId == deviceId && j.event == event) return true;
        return false;
    }
};

} // namespace testing_support
