#include <gtest/gtest.h>

#include "Device/LocalDeviceConfig.hpp"
#include "Net/HostInterface.hpp"

using namespace BACN;
using namespace BACN::Device;

namespace {

ConfigOverrides WithAddresses() {
    ConfigOverrides overrides;
    overrides.localAddress = "10.0.0.5";
    overrides.broadcastAddress = "10.0.0.255";
    return overrides;
}

} // namespace

// =============================================================================
// ResolveConfig
// =============================================================================

TEST(LocalDeviceConfig, OmittedFieldsTakeDefaults) {
    auto config = ResolveConfig(WithAddresses());
    ASSERT_TRUE(config.has_value());

    EXPECT_EQ(config->deviceId, kDefaultDeviceId);
    EXPECT_EQ(config->port, 47808);
    EXPECT_EQ(config->destinationPort, 47808);
    EXPECT_EQ(config->timeoutMs, 10000u);
    EXPECT_EQ(config->apduTimeoutMs, 10000u);
    EXPECT_EQ(config->retries, 2u);
    EXPECT_EQ(config->segTimeoutMs, 5000u);
    EXPECT_EQ(config->segWindow, 5u);
    EXPECT_EQ(config->localAddress, "10.0.0.5");
    EXPECT_EQ(config->broadcastAddress, "10.0.0.255");
}

TEST(LocalDeviceConfig, ApduTimeoutFollowsTimeoutUnlessGiven) {
    auto overrides = WithAddresses();
    overrides.timeoutMs = 3000;

    auto derived = ResolveConfig(overrides);
    ASSERT_TRUE(derived.has_value());
    EXPECT_EQ(derived->apduTimeoutMs, 3000u);

    overrides.apduTimeoutMs = 750;
    auto explicitApdu = ResolveConfig(overrides);
    ASSERT_TRUE(explicitApdu.has_value());
    EXPECT_EQ(explicitApdu->timeoutMs, 3000u);
    EXPECT_EQ(explicitApdu->apduTimeoutMs, 750u);
}

TEST(LocalDeviceConfig, DeviceIdAboveInstanceSpaceIsConfigError) {
    auto overrides = WithAddresses();
    overrides.deviceId = kMaxDeviceInstance;
    EXPECT_TRUE(ResolveConfig(overrides).has_value());

    overrides.deviceId = kMaxDeviceInstance + 1;
    auto config = ResolveConfig(overrides);
    ASSERT_FALSE(config.has_value());
    EXPECT_TRUE(config.error().Is(NodeStatus::kConfigError));
}

TEST(LocalDeviceConfig, ZeroPortIsConfigError) {
    auto overrides = WithAddresses();
    overrides.port = 0;
    auto config = ResolveConfig(overrides);
    ASSERT_FALSE(config.has_value());
    EXPECT_TRUE(config.error().Is(NodeStatus::kConfigError));
}

TEST(LocalDeviceConfig, MalformedAddressIsConfigError) {
    auto overrides = WithAddresses();
    overrides.broadcastAddress = "10.0.0";
    auto config = ResolveConfig(overrides);
    ASSERT_FALSE(config.has_value());
    EXPECT_TRUE(config.error().Is(NodeStatus::kConfigError));
}

// =============================================================================
// MergeConfig / ToOverrides
// =============================================================================

TEST(LocalDeviceConfig, MergeKeepsFieldsThatAreNotOverridden) {
    auto base = ResolveConfig(WithAddresses());
    ASSERT_TRUE(base.has_value());

    ConfigOverrides overrides;
    overrides.port = 47809;
    overrides.retries = 4;

    auto merged = MergeConfig(*base, overrides);
    ASSERT_TRUE(merged.has_value());
    EXPECT_EQ(merged->port, 47809);
    EXPECT_EQ(merged->retries, 4u);
    EXPECT_EQ(merged->deviceId, base->deviceId);
    EXPECT_EQ(merged->localAddress, base->localAddress);
    EXPECT_EQ(merged->segWindow, base->segWindow);
}

TEST(LocalDeviceConfig, MergedTimeoutCarriesApduTimeoutUnlessGiven) {
    auto base = ResolveConfig(WithAddresses());
    ASSERT_TRUE(base.has_value());

    ConfigOverrides overrides;
    overrides.timeoutMs = 5000;
    auto merged = MergeConfig(*base, overrides);
    ASSERT_TRUE(merged.has_value());
    EXPECT_EQ(merged->timeoutMs, 5000u);
    EXPECT_EQ(merged->apduTimeoutMs, 5000u);

    overrides.apduTimeoutMs = 800;
    merged = MergeConfig(*base, overrides);
    ASSERT_TRUE(merged.has_value());
    EXPECT_EQ(merged->timeoutMs, 5000u);
    EXPECT_EQ(merged->apduTimeoutMs, 800u);
}

TEST(LocalDeviceConfig, MergeValidatesTheResult) {
    auto base = ResolveConfig(WithAddresses());
    ASSERT_TRUE(base.has_value());

    ConfigOverrides overrides;
    overrides.localAddress = "not-an-address";
    auto merged = MergeConfig(*base, overrides);
    ASSERT_FALSE(merged.has_value());
    EXPECT_TRUE(merged.error().Is(NodeStatus::kConfigError));
}

TEST(LocalDeviceConfig, ToOverridesReproducesConfig) {
    auto overrides = WithAddresses();
    overrides.deviceId = 77;
    overrides.segWindow = 9;
    auto config = ResolveConfig(overrides);
    ASSERT_TRUE(config.has_value());

    auto again = ResolveConfig(ToOverrides(*config));
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(*again, *config);
}

// =============================================================================
// Address helpers
// =============================================================================

TEST(HostInterface, DeriveBroadcastFromNetmask) {
    auto broadcast = Net::DeriveBroadcast("192.168.4.17", "255.255.252.0");
    ASSERT_TRUE(broadcast.has_value());
    EXPECT_EQ(*broadcast, "192.168.7.255");
}

TEST(HostInterface, Ipv4Validation) {
    EXPECT_TRUE(Net::IsValidIPv4("127.0.0.1"));
    EXPECT_FALSE(Net::IsValidIPv4("256.0.0.1"));
    EXPECT_FALSE(Net::IsValidIPv4(""));
}
