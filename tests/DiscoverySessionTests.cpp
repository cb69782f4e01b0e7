#include <gtest/gtest.h>
#include <QJsonDocument>
#include <QJsonObject>
#include <memory>

#include "session/DiscoverySession.hpp"
#include "TestFakes.hpp"

using namespace testing_support;
using States::SessionState;

namespace {

const QHostAddress kEspAddr(QStringLiteral("10.0.0.5"));
constexpr quint16 kEspPort = 49497;

QJsonObject espPayload(const QString& id = QStringLiteral("esp-01"))
{
    QJsonObject j;
    j["device_id"]   = id;
    j["device_type"] = "ESP32";
    j["device_name"] = "Kitchen LED";
    j["status"]      = "ready";
    return j;
}

QJsonObject jsonOf(const QByteArray& datagram)
{
    const auto r = FrameCodec::decodeControlFrame(datagram);
    return r.ok() ? r.frame.json : QJsonObject();
}

class SessionFixture : public ::testing::Test {
protected:
    FakeClock clock;
    FakeUdp udp;
    FakeBle ble;
    FakeCredentialService creds;
    FakeStore store;
    std::unique_ptr<DiscoverySession> session;

    std::vector<DeviceRecord> discovered;
    std::vector<QString> lost;
    std::vector<QString> errors;

    void SetUp() override { build(); }

    void build(bool withBle = true, bool withUdp = true)
    {
        DiscoveryContext ctx;
        ctx.params.personId = QStringLiteral("person-1");
        ctx.identity.deviceId = QStringLiteral("person-1");
        ctx.identity.deviceName = QStringLiteral("phone");
        ctx.clock = clock.fn();
        ctx.udp = withUdp ? &udp : nullptr;
        ctx.ble = withBle ? &ble : nullptr;
        ctx.credentials = &creds;
        ctx.store = &store;

        session.reset();
        session = std::make_unique<DiscoverySession>(ctx);
        QObject::connect(session.get(), &DiscoverySession::deviceDiscovered,
                         [this](const DeviceRecord& r) { discovered.push_back(r); });
        QObject::connect(session.get(), &DiscoverySession::deviceLost,
                         [this](const QString& id) { lost.push_back(id); });
        QObject::connect(session.get(), &DiscoverySession::errorOccurred,
                         [this](const QString& m) { errors.push_back(m); });
    }

    void discoverEsp(const QString& id = QStringLiteral("esp-01"))
    {
        session->onDatagram(discoveryDatagram(espPayload(id)), kEspAddr, kEspPort);
    }

    void claimEsp()
    {
        OwnershipResult res;
        session->claimOwnership("esp-01", [&res](const OwnershipResult& r) { res = r; });
        ASSERT_EQ(creds.transmits.size(), 1u);
        creds.ackLastClaim();
        ASSERT_TRUE(res.ok()) << toString(res.error);
    }
};

} // namespace

// A device seen over UDP is claimed, probed after silence and reported lost after the timeout.
TEST_F(SessionFixture, DiscoverClaimProbeAndLose) {
    ASSERT_TRUE(session->startDiscovery());
    discoverEsp();

    ASSERT_EQ(discovered.size(), 1u);
    auto rec = session->getDevice("esp-01");
    ASSERT_TRUE(rec.has_value());
    EXPECT_TRUE(rec->online);
    EXPECT_FALSE(rec->ownership.ownerId.has_value());
    EXPECT_EQ(rec->networkAddress, QStringLiteral("10.0.0.5"));
    EXPECT_EQ(rec->networkPort, kEspPort);

    claimEsp();
    rec = session->getDevice("esp-01");
    EXPECT_EQ(rec->ownership.ownerId.value_or(QString()), QStringLiteral("person-1"));
    EXPECT_TRUE(rec->ownership.isAuthenticated);
    EXPECT_TRUE(session->liveness().hasSchedule("esp-01"));

    clock.advance(30000);
    session->liveness().onHeartbeatTimer("esp-01");
    const auto pings = udp.sentOfType(FrameCodec::FrameType::Heartbeat);
    ASSERT_EQ(pings.size(), 1u) << "exactly one probe after the inactivity window";
    EXPECT_EQ(pings[0].to, kEspAddr);
    EXPECT_EQ(pings[0].port, kEspPort);
    EXPECT_EQ(jsonOf(pings[0].data).value("type").toString(), QStringLiteral("ping"));

    clock.advance(31000);
    session->runAvailabilitySweep();
    EXPECT_FALSE(session->getDevice("esp-01")->online);
    ASSERT_EQ(lost.size(), 1u);
    EXPECT_EQ(lost[0], QStringLiteral("esp-01"));
}

// A forcibly disabled session refuses to start and never touches the transports.
TEST_F(SessionFixture, ForciblyDisabledNeverStarts) {
    session->setForciblyDisabled(true);
    EXPECT_FALSE(session->startDiscovery());
    EXPECT_FALSE(udp.opened);
    EXPECT_FALSE(ble.scanning);
    EXPECT_EQ(session->state(), SessionState::Stopped);
}

// Starting twice is a no-op, and start announces the app once immediately.
TEST_F(SessionFixture, StartIsIdempotent) {
    ASSERT_TRUE(session->startDiscovery());
    EXPECT_TRUE(session->startDiscovery());
    EXPECT_TRUE(session->isRunning());
    EXPECT_EQ(ble.scanStarts, 1);
    EXPECT_TRUE(ble.advertising);
    EXPECT_EQ(udp.broadcasts.size(), 1u);
    EXPECT_EQ(udp.boundPort, kEspPort);
}

// Stopping cancels pending claims and heartbeat schedules and closes the transports.
TEST_F(SessionFixture, StopCancelsEverything) {
    ASSERT_TRUE(session->startDiscovery());
    discoverEsp();
    discoverEsp("esp-02");
    claimEsp();

    OwnershipResult pending;
    session->claimOwnership("esp-02", [&pending](const OwnershipResult& r) { pending = r; });
    ASSERT_TRUE(session->ownership().hasPendingClaim("esp-02"));

    session->stopDiscovery();
    EXPECT_EQ(pending.error, OwnershipError::Cancelled);
    EXPECT_EQ(session->liveness().scheduleCount(), 0);
    EXPECT_FALSE(udp.opened);
    EXPECT_FALSE(ble.scanning);
    EXPECT_FALSE(ble.advertising);
    EXPECT_EQ(session->state(), SessionState::Stopped);

    // 정지 후 수신 패킷은 무시
    discoverEsp("esp-03");
    EXPECT_FALSE(session->getDevice("esp-03").has_value());
}

// An owned device keeps getting heartbeats after the session is stopped and started again.
TEST_F(SessionFixture, OwnedDeviceHeartbeatResumesAfterRestart) {
    ASSERT_TRUE(session->startDiscovery());
    discoverEsp();
    claimEsp();

    session->stopDiscovery();
    EXPECT_FALSE(session->liveness().hasSchedule("esp-01"));

    ASSERT_TRUE(session->startDiscovery());
    EXPECT_EQ(session->ownership().ownershipState("esp-01"), States::OwnershipState::OwnedAuthenticated);
    EXPECT_TRUE(session->liveness().hasSchedule("esp-01"));

    udp.sent.clear();
    clock.advance(30000);
    session->liveness().onHeartbeatTimer("esp-01");
    const auto pings = udp.sentOfType(FrameCodec::FrameType::Heartbeat);
    ASSERT_EQ(pings.size(), 1u);
    EXPECT_EQ(pings[0].to, kEspAddr);
    EXPECT_EQ(pings[0].port, kEspPort);
}

// Two frames inside the debounce window reach subscribers as a single merged update.
TEST_F(SessionFixture, RapidFramesMergeIntoOneUpdate) {
    ASSERT_TRUE(session->startDiscovery());
    discoverEsp();
    spinEventLoop(250);

    std::vector<DeviceUpdate> updates;
    QObject::connect(session.get(), &DiscoverySession::deviceUpdated,
                     [&updates](const DeviceUpdate& u) { updates.push_back(u); });

    QJsonObject first = espPayload();
    first["status"]     = "busy";
    first["led_status"] = "on";
    session->onDatagram(discoveryDatagram(first), kEspAddr, kEspPort);

    clock.advance(40);
    QJsonObject second = espPayload();
    second["status"]     = "idle";
    second["led_status"] = "blink";
    session->onDatagram(discoveryDatagram(second), kEspAddr, kEspPort);

    spinEventLoop(250);
    ASSERT_EQ(updates.size(), 1u);
    EXPECT_EQ(updates[0].deviceId, QStringLiteral("esp-01"));
    EXPECT_EQ(updates[0].status.value_or(QString()), QStringLiteral("idle"));
    ASSERT_TRUE(updates[0].ledStatus.has_value());
    EXPECT_EQ(*updates[0].ledStatus, States::LedStatus::Blink);
}

// Turning on the privacy switch while running stops discovery.
TEST_F(SessionFixture, DisablingWhileRunningStops) {
    ASSERT_TRUE(session->startDiscovery());
    session->setForciblyDisabled(true);
    EXPECT_FALSE(session->isRunning());
    EXPECT_FALSE(udp.opened);

    session->setForciblyDisabled(false);
    EXPECT_TRUE(session->startDiscovery());
}

// The app's own broadcast echoing back never becomes a device.
TEST_F(SessionFixture, IgnoresOwnBroadcast) {
    ASSERT_TRUE(session->startDiscovery());
    ASSERT_FALSE(udp.broadcasts.empty());
    session->onDatagram(udp.broadcasts.front(), QHostAddress("10.0.0.9"), kEspPort);
    EXPECT_TRUE(session->listDevices().empty());
    EXPECT_TRUE(discovered.empty());
}

// Without a bluetooth adapter the session runs on UDP alone and reports the degradation.
TEST_F(SessionFixture, RunsUdpOnlyWithoutAdapter) {
    ble.available = false;
    ASSERT_TRUE(session->startDiscovery());
    EXPECT_TRUE(udp.opened);
    EXPECT_FALSE(ble.scanning);
    ASSERT_EQ(errors.size(), 1u);
}

// With neither transport usable, start fails and the session stays stopped.
TEST_F(SessionFixture, FailsWithoutAnyTransport) {
    ble.available = false;
    udp.openOk = false;
    EXPECT_FALSE(session->startDiscovery());
    EXPECT_EQ(session->state(), SessionState::Stopped);
    EXPECT_EQ(errors.size(), 2u);

    build(false, false);
    EXPECT_FALSE(session->startDiscovery());
}

// A heartbeat carrying our credential restores ownership after verification.
TEST_F(SessionFixture, HeartbeatCredentialRecoversOwnership) {
    ASSERT_TRUE(session->startDiscovery());
    discoverEsp();

    Credential c;
    c.id = "cred-9";
    c.issuer = "person-1";
    c.subject = "esp-01";
    c.issuedAt = 1;
    c.proof = "proof";

    QJsonObject hb;
    hb["type"]       = "heartbeat";
    hb["device_id"]  = "esp-01";
    hb["led_status"] = "off";
    hb["credential"] = c.toJson();
    session->onDatagram(FrameCodec::encodeControlFrame(FrameCodec::FrameType::Heartbeat, hb), kEspAddr, kEspPort);

    ASSERT_EQ(creds.verifies.size(), 1u);
    EXPECT_EQ(creds.verifies[0].first.id, QStringLiteral("cred-9"));
    creds.answerLastVerify(CredentialError::None, "person-1");

    const auto rec = session->getDevice("esp-01");
    EXPECT_EQ(rec->ownership.ownerId.value_or(QString()), QStringLiteral("person-1"));
    EXPECT_TRUE(rec->ownership.hasValidCredential);
    EXPECT_EQ(rec->ledStatus, States::LedStatus::Off);
    EXPECT_TRUE(store.hasEvent("esp-01", "ownership_recovered"));

    const QJsonObject status = session->getDeviceOwnershipStatus("esp-01");
    EXPECT_TRUE(status.value("is_owned_by_me").toBool());
    EXPECT_FALSE(status.value("claim_pending").toBool());
}

// Heartbeats go through the same id and LED validation as discovery frames.
TEST_F(SessionFixture, HeartbeatFieldsAreValidated) {
    ASSERT_TRUE(session->startDiscovery());
    discoverEsp();

    QJsonObject hb;
    hb["type"]       = "heartbeat";
    hb["device_id"]  = "esp-01";
    hb["led_status"] = true;
    session->onDatagram(FrameCodec::encodeControlFrame(FrameCodec::FrameType::Heartbeat, hb), kEspAddr, kEspPort);
    EXPECT_EQ(session->getDevice("esp-01")->ledStatus, States::LedStatus::On);

    QJsonObject bad;
    bad["type"]       = "heartbeat";
    bad["device_id"]  = QStringLiteral("esp-01\x07");
    bad["led_status"] = false;
    session->onDatagram(FrameCodec::encodeControlFrame(FrameCodec::FrameType::Heartbeat, bad), kEspAddr, kEspPort);
    EXPECT_EQ(session->getDevice("esp-01")->ledStatus, States::LedStatus::On) << "control characters in the id drop the frame";
    EXPECT_EQ(session->listDevices().size(), 1u);
}

// A heartbeat from a device never discovered does not create a record.
TEST_F(SessionFixture, HeartbeatFromUnknownDeviceIgnored) {
    ASSERT_TRUE(session->startDiscovery());
    QJsonObject hb;
    hb["type"]      = "heartbeat";
    hb["device_id"] = "ghost";
    session->onDatagram(FrameCodec::encodeControlFrame(FrameCodec::FrameType::Heartbeat, hb), kEspAddr, kEspPort);
    EXPECT_FALSE(session->getDevice("ghost").has_value());
    EXPECT_FALSE(session->getDeviceOwnershipStatus("ghost").value("known").toBool());
}

// LED commands need a known, locally owned device and go out as command frames.
TEST_F(SessionFixture, SetLedState) {
    ASSERT_TRUE(session->startDiscovery());
    EXPECT_EQ(session->setLedState("esp-01", States::LedStatus::On), OwnershipError::UnknownDevice);

    discoverEsp();
    EXPECT_EQ(session->setLedState("esp-01", States::LedStatus::On), OwnershipError::NotOwned);

    claimEsp();
    EXPECT_EQ(session->setLedState("esp-01", States::LedStatus::Blink), OwnershipError::None);
    const auto cmds = udp.sentOfType(FrameCodec::FrameType::Command);
    ASSERT_EQ(cmds.size(), 1u);
    const QJsonObject j = jsonOf(cmds[0].data);
    EXPECT_EQ(j.value("type").toString(), QStringLiteral("led_control"));
    EXPECT_EQ(j.value("action").toString(), QStringLiteral("blink"));
    EXPECT_EQ(session->getDevice("esp-01")->ledStatus, States::LedStatus::Unknown)
        << "led state changes only when the device reports it";

    udp.sendOk = false;
    EXPECT_EQ(session->setLedState("esp-01", States::LedStatus::Off), OwnershipError::TransportUnavailable);
}

// BLE advertisements from allow-listed devices create records on the BLE path.
TEST_F(SessionFixture, AdvertisementCreatesBleRecord) {
    ASSERT_TRUE(session->startDiscovery());

    AdvertisementRecord adv;
    adv.address = "AA:BB:CC:DD:EE:01";
    adv.rssi = -55;
    QByteArray md;
    md.append(char(0x01));
    md.append(char(0x01));
    md.append(char(5));
    md.append("esp-7");
    adv.manufacturerData.insert(FrameCodec::kEspressifCompanyId, md);
    session->onAdvertisement(adv);

    const auto rec = session->getDevice("esp-7");
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->bleAddress, QStringLiteral("AA:BB:CC:DD:EE:01"));
    EXPECT_TRUE(rec->networkAddress.isEmpty());
    EXPECT_EQ(rec->bleStatus, States::LinkStatus::Active);

    OwnershipResult res;
    session->claimOwnership("esp-7", [&res](const OwnershipResult& r) { res = r; });
    EXPECT_EQ(res.error, OwnershipError::TransportUnavailable) << "claims need a UDP endpoint";
}

// Provisioning responses are forwarded, other packets are passed on untouched.
TEST_F(SessionFixture, ForwardsControlAndHandshakeFrames) {
    ASSERT_TRUE(session->startDiscovery());
    int control = 0;
    int handshake = 0;
    FrameCodec::AckFrame last;
    QObject::connect(session.get(), &DiscoverySession::ackReceived,
                     [&control, &last](const FrameCodec::AckFrame& a, const QHostAddress&, quint16) { ++control; last = a; });
    QObject::connect(session.get(), &DiscoverySession::handshakeDatagram,
                     [&handshake](const QByteArray&, const QHostAddress&, quint16) { ++handshake; });

    QJsonObject ack;
    ack["type"] = "provisioning_ack";
    ack["device_id"] = "esp-01";
    session->onDatagram(FrameCodec::encodeControlFrame(FrameCodec::FrameType::VcAck, ack), kEspAddr, kEspPort);
    EXPECT_EQ(control, 1);
    EXPECT_EQ(last.kind, FrameCodec::AckKind::Provisioning);
    EXPECT_EQ(last.deviceId, QStringLiteral("esp-01"));

    // 모르는 응답 type 은 전달하지 않음
    QJsonObject odd;
    odd["type"] = "provisioning_maybe";
    odd["device_id"] = "esp-01";
    session->onDatagram(FrameCodec::encodeControlFrame(FrameCodec::FrameType::VcAck, odd), kEspAddr, kEspPort);
    EXPECT_EQ(control, 1);

    QJsonObject cmd;
    cmd["type"] = "session_open";
    session->onDatagram(FrameCodec::encodeControlFrame(FrameCodec::FrameType::Command, cmd), kEspAddr, kEspPort);
    EXPECT_EQ(handshake, 1);

    // 헤더가 깨진 패킷은 버린다
    session->onDatagram(QByteArray("\x40\x01", 2), kEspAddr, kEspPort);
    EXPECT_EQ(handshake, 1);
    EXPECT_TRUE(session->listDevices().empty());
}
