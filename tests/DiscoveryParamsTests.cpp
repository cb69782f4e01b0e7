#include <gtest/gtest.h>
#include <QFile>
#include <QTemporaryDir>

#include "config/DiscoveryParams.hpp"
#include "log/SystemLogTypes.hpp"

namespace {
QString writeFile(const QTemporaryDir& dir, const QByteArray& body)
{
    const QString path = dir.filePath(QStringLiteral("discovery.json"));
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly)) return QString();
    f.write(body);
    return path;
}
} // namespace

// Defaults match the protocol constants the devices are flashed with.
TEST(DiscoveryParams, Defaults) {
    const DiscoveryParams p;
    EXPECT_EQ(p.discoveryPort, 49497);
    EXPECT_EQ(p.deviceTimeoutMs, 60000);
    EXPECT_EQ(p.heartbeatInactivityMs, 30000);
    EXPECT_EQ(p.updateDebounceMs, 100);
    EXPECT_EQ(p.claimTimeoutMs, 5000);
    EXPECT_FALSE(p.forciblyDisabled);
}

// A missing or broken file leaves the defaults untouched.
TEST(DiscoveryParams, MissingOrBrokenFile) {
    DiscoveryParams p;
    EXPECT_FALSE(loadDiscoveryParams(QStringLiteral("/nonexistent/discovery.json"), &p));
    EXPECT_FALSE(loadDiscoveryParams(QString(), nullptr));

    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    EXPECT_FALSE(loadDiscoveryParams(writeFile(dir, "[1, 2, 3]"), &p)) << "root must be an object";
    EXPECT_FALSE(loadDiscoveryParams(writeFile(dir, "{ \"discovery_port\": "), &p));
    EXPECT_EQ(p.discoveryPort, 49497);
}

// Known keys override the defaults, the rest keep them.
TEST(DiscoveryParams, OverridesFromFile) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = writeFile(dir, R"({
        "discovery_port": 50000,
        "device_timeout_ms": 90000,
        "enable_ble": false,
        "forcibly_disabled": true,
        "person_id": "person-1",
        "device_name": "phone",
        "credential_secret": "s3cret",
        "log_level": "warn"
    })");

    DiscoveryParams p;
    ASSERT_TRUE(loadDiscoveryParams(path, &p));
    EXPECT_EQ(p.discoveryPort, 50000);
    EXPECT_EQ(p.deviceTimeoutMs, 90000);
    EXPECT_EQ(p.heartbeatInactivityMs, 30000);
    EXPECT_FALSE(p.enableBle);
    EXPECT_TRUE(p.forciblyDisabled);
    EXPECT_EQ(p.personId, QStringLiteral("person-1"));
    EXPECT_EQ(p.deviceName, QStringLiteral("phone"));
    EXPECT_EQ(p.credentialSecret, QByteArray("s3cret"));
    EXPECT_EQ(sysLogLevelFromString(p.logLevel), SysLogLevel::Warn);
}

// Out-of-range or mistyped values are ignored one by one.
TEST(DiscoveryParams, IgnoresInvalidValues) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = writeFile(dir, R"({
        "discovery_port": 70000,
        "sweep_interval_ms": -5,
        "claim_timeout_ms": "fast",
        "update_debounce_ms": 250,
        "enable_advertising": "no"
    })");

    DiscoveryParams p;
    ASSERT_TRUE(loadDiscoveryParams(path, &p));
    EXPECT_EQ(p.discoveryPort, 49497);
    EXPECT_EQ(p.sweepIntervalMs, 10000);
    EXPECT_EQ(p.claimTimeoutMs, 5000);
    EXPECT_EQ(p.updateDebounceMs, 250);
    EXPECT_TRUE(p.enableAdvertising);
}
