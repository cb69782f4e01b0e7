#include <gtest/gtest.h>

#include "registry/DeviceRegistry.hpp"
#include "TestFakes.hpp"

using States::LinkStatus;
using States::Transport;
using testing_support::FakeClock;
using testing_support::makeFrame;

// First observation creates an unowned, online record with a "created" delta.
TEST(DeviceRegistry, FirstObservationCreatesUnownedRecord) {
    FakeClock clock;
    DeviceRegistry reg(clock.fn());

    const auto d = reg.observe(makeFrame("esp-01"), Transport::Wifi, "10.0.0.5", 49497);
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->kind, DeviceDelta::Kind::Created);

    const auto rec = reg.get("esp-01");
    ASSERT_TRUE(rec.has_value());
    EXPECT_TRUE(rec->online);
    EXPECT_FALSE(rec->ownership.ownerId.has_value());
    EXPECT_FALSE(rec->ownership.hasValidCredential);
    EXPECT_FALSE(rec->ownership.isAuthenticated);
    EXPECT_EQ(rec->wifiStatus, LinkStatus::Active);
    EXPECT_EQ(rec->bleStatus, LinkStatus::Inactive);
    EXPECT_EQ(rec->networkAddress, QStringLiteral("10.0.0.5"));
    EXPECT_EQ(rec->networkPort, 49497);
    EXPECT_EQ(rec->firstSeenMs, clock.now);
}

// Re-observing unchanged data only moves last_seen and yields no delta.
TEST(DeviceRegistry, UnchangedObservationYieldsNoDelta) {
    FakeClock clock;
    DeviceRegistry reg(clock.fn());
    reg.observe(makeFrame("esp-01"), Transport::Wifi, "10.0.0.5", 49497);

    clock.advance(1000);
    EXPECT_FALSE(reg.observe(makeFrame("esp-01"), Transport::Wifi, "10.0.0.5", 49497).has_value());
    EXPECT_EQ(reg.get("esp-01")->lastSeenMs, clock.now) << "last_seen must still advance";
}

// Ownership survives observations from either transport, and discovery never writes it.
TEST(DeviceRegistry, OwnershipIsNotTouchedByDiscovery) {
    FakeClock clock;
    DeviceRegistry reg(clock.fn());
    reg.observe(makeFrame("esp-01"), Transport::Wifi, "10.0.0.5", 49497);

    // 장치가 보낸 소유 힌트는 레코드에 반영되지 않는다
    DiscoveryFrame hinted = makeFrame("esp-01");
    hinted.ownershipHint = "claimed";
    reg.observe(hinted, Transport::Ble, "AA:BB:CC:DD:EE:01");
    reg.observe(hinted, Transport::Wifi, "10.0.0.6", 49497);

    const auto rec = reg.get("esp-01");
    ASSERT_TRUE(rec.has_value());
    EXPECT_FALSE(rec->ownership.ownerId.has_value());
    EXPECT_FALSE(rec->ownership.isAuthenticated);
}

// Each transport only writes its own flag and address fields.
TEST(DeviceRegistry, TransportFieldsAreScoped) {
    FakeClock clock;
    DeviceRegistry reg(clock.fn());
    reg.observe(makeFrame("esp-01"), Transport::Wifi, "10.0.0.5", 49497);

    DiscoveryFrame ble = makeFrame("esp-01");
    ble.rssi = -70;
    const auto d = reg.observe(ble, Transport::Ble, "AA:BB:CC:DD:EE:01");
    ASSERT_TRUE(d.has_value());
    EXPECT_FALSE(d->update.networkAddress.has_value()) << "ble path must not write the wifi address";
    EXPECT_TRUE(d->update.bleStatus.has_value());

    const auto rec = reg.get("esp-01");
    EXPECT_EQ(rec->networkAddress, QStringLiteral("10.0.0.5"));
    EXPECT_EQ(rec->bleAddress, QStringLiteral("AA:BB:CC:DD:EE:01"));
    EXPECT_EQ(rec->wifiStatus, LinkStatus::Active);
    EXPECT_EQ(rec->bleStatus, LinkStatus::Active);
    EXPECT_EQ(rec->rssi, -70);
}

// Losing one transport keeps the device online; losing both takes it offline.
TEST(DeviceRegistry, MarkTransportInactive) {
    FakeClock clock;
    DeviceRegistry reg(clock.fn());
    reg.observe(makeFrame("esp-01"), Transport::Wifi, "10.0.0.5", 49497);
    reg.observe(makeFrame("esp-01"), Transport::Ble, "AA:BB:CC:DD:EE:01");

    const auto a = reg.markTransportInactive("esp-01", Transport::Wifi);
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->kind, DeviceDelta::Kind::Updated);
    EXPECT_TRUE(reg.get("esp-01")->online);
    EXPECT_FALSE(reg.get("esp-01")->connected);

    const auto b = reg.markTransportInactive("esp-01", Transport::Ble);
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->kind, DeviceDelta::Kind::WentOffline);
    EXPECT_FALSE(reg.get("esp-01")->online);

    EXPECT_FALSE(reg.markTransportInactive("nope", Transport::Ble).has_value());
}

// Sweeping marks silent devices offline exactly once and never deletes them.
TEST(DeviceRegistry, SweepMarksOfflineWithoutRemoving) {
    FakeClock clock;
    DeviceRegistry reg(clock.fn());
    reg.observe(makeFrame("esp-01"), Transport::Wifi, "10.0.0.5", 49497);
    clock.advance(30'000);
    reg.observe(makeFrame("esp-02"), Transport::Wifi, "10.0.0.6", 49497);

    clock.advance(31'000);
    auto deltas = reg.sweepTimeouts(clock.now, 60'000);
    ASSERT_EQ(deltas.size(), 1u);
    EXPECT_EQ(deltas[0].update.deviceId, QStringLiteral("esp-01"));
    EXPECT_EQ(deltas[0].kind, DeviceDelta::Kind::WentOffline);

    EXPECT_TRUE(reg.sweepTimeouts(clock.now, 60'000).empty()) << "second sweep must be quiet";
    EXPECT_EQ(reg.size(), 2);
    EXPECT_FALSE(reg.get("esp-01")->online);
    EXPECT_EQ(reg.get("esp-01")->wifiStatus, LinkStatus::Inactive);

    // 다시 보이면 online 복귀
    const auto back = reg.observe(makeFrame("esp-01"), Transport::Wifi, "10.0.0.5", 49497);
    ASSERT_TRUE(back.has_value());
    EXPECT_TRUE(back->update.online.value_or(false));
}

// LED status changes produce a delta only when the value actually changes.
TEST(DeviceRegistry, ApplyLedStatus) {
    FakeClock clock;
    DeviceRegistry reg(clock.fn());
    reg.observe(makeFrame("esp-01"), Transport::Wifi, "10.0.0.5", 49497);

    const auto d = reg.applyLedStatus("esp-01", States::LedStatus::Blink);
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->update.ledStatus.value_or(States::LedStatus::Unknown), States::LedStatus::Blink);
    EXPECT_FALSE(reg.applyLedStatus("esp-01", States::LedStatus::Blink).has_value());
    EXPECT_FALSE(reg.applyLedStatus("missing", States::LedStatus::On).has_value());
}
