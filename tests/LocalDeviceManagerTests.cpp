// LocalDeviceManagerTests.cpp
// Node context behaviour on the simulated network:
//   - create / initialize / terminate leaves the port reusable at once
//   - one live device per port
//   - object upsert is idempotent and never rewrites identity
//   - Reset keeps every object and every field that is not overridden
//

#include <gtest/gtest.h>

#include "SimNodeHarness.hpp"

using namespace BACN;
using namespace BACN::Device;
using namespace BACN::Testing;

class LocalDeviceManagerTest : public SimNodeTest {};

// =============================================================================
// Lifecycle
// =============================================================================

TEST_F(LocalDeviceManagerTest, OperationsBeforeCreateReportNotInitialized) {
    EXPECT_TRUE(node_.Initialize().error().Is(NodeStatus::kNotInitialized));
    EXPECT_TRUE(node_.Config().error().Is(NodeStatus::kNotInitialized));
    EXPECT_TRUE(node_.LocalObjects().error().Is(NodeStatus::kNotInitialized));
    EXPECT_TRUE(node_.Backup().error().Is(NodeStatus::kNotInitialized));
    EXPECT_TRUE(node_.Reset().error().Is(NodeStatus::kNotInitialized));
    EXPECT_FALSE(node_.IsInitialized());

    // Terminate without a device is a no-op.
    node_.Terminate();
}

TEST_F(LocalDeviceManagerTest, CreateInitializeTerminateFreesPortImmediately) {
    BootNode();
    EXPECT_TRUE(node_.IsInitialized());
    EXPECT_TRUE(network_.IsPortBound(kDefaultBACnetPort));

    node_.Terminate();
    EXPECT_FALSE(node_.IsInitialized());
    EXPECT_FALSE(network_.IsPortBound(kDefaultBACnetPort));

    ASSERT_TRUE(node_.Create(TestOverrides(1339)).has_value());
    ASSERT_TRUE(node_.Initialize().has_value());
    EXPECT_TRUE(network_.IsPortBound(kDefaultBACnetPort));
    EXPECT_EQ(node_.Current()->Id(), 1339u);
}

TEST_F(LocalDeviceManagerTest, SecondLiveDeviceOnSamePortFailsToBind) {
    BootNode();

    Device::LocalDeviceManager other(factory_);
    ASSERT_TRUE(other.Create(TestOverrides(2000)).has_value());
    auto bound = other.Initialize();
    ASSERT_FALSE(bound.has_value());
    EXPECT_TRUE(bound.error().Is(NodeStatus::kBindError));
    EXPECT_EQ(other.Current()->State(), DeviceState::Terminated);

    // The failed instance is terminal; the first node still holds the port.
    EXPECT_TRUE(other.Initialize().error().Is(NodeStatus::kInvalidState));
    EXPECT_TRUE(node_.IsInitialized());
}

TEST_F(LocalDeviceManagerTest, ClearAllDropsTheDevice) {
    BootNode();
    node_.ClearAll();
    EXPECT_EQ(node_.Current(), nullptr);
    EXPECT_FALSE(network_.IsPortBound(kDefaultBACnetPort));
}

// =============================================================================
// Object table
// =============================================================================

TEST_F(LocalDeviceManagerTest, LocalObjectsExcludeTheDeviceObject) {
    BootNode();
    auto objects = node_.LocalObjects();
    ASSERT_TRUE(objects.has_value());
    EXPECT_TRUE(objects->empty());

    // ... but the device object is still served.
    EXPECT_TRUE(node_.GetObject(DeviceObject(kDefaultDeviceId)).has_value());
}

TEST_F(LocalDeviceManagerTest, AddOrUpdateIsIdempotentOnIdentifier) {
    BootNode();
    const auto record = AnalogValue(1, 20.0);

    auto first = node_.AddOrUpdateObject(record);
    auto second = node_.AddOrUpdateObject(record);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*first, *second);

    auto objects = node_.LocalObjects();
    ASSERT_TRUE(objects.has_value());
    ASSERT_EQ(objects->size(), 1u);
    EXPECT_EQ(objects->front(), *first);
}

TEST_F(LocalDeviceManagerTest, UpdateNeverAltersIdentity) {
    BootNode();
    ASSERT_TRUE(node_.AddOrUpdateObject(AnalogValue(1, 20.0)).has_value());

    auto update = AnalogValue(1, 23.5);
    update.properties[PropertyId::ObjectType] = static_cast<uint32_t>(ObjectType::BinaryValue);
    update.properties[PropertyId::ObjectIdentifier] = ObjectIdentifier{ObjectType::BinaryValue, 9};

    auto stored = node_.AddOrUpdateObject(update);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(*stored->Find(PropertyId::PresentValue), PropertyValue(23.5));
    EXPECT_EQ(*stored->Find(PropertyId::ObjectType),
              PropertyValue(static_cast<uint32_t>(ObjectType::AnalogValue)));
    EXPECT_EQ(*stored->Find(PropertyId::ObjectIdentifier),
              PropertyValue(ObjectIdentifier{ObjectType::AnalogValue, 1}));
}

TEST_F(LocalDeviceManagerTest, RemoveObjects) {
    BootNode();
    ASSERT_TRUE(node_.AddOrUpdateObject(AnalogValue(1, 1.0)).has_value());
    ASSERT_TRUE(node_.AddOrUpdateObject(AnalogValue(2, 2.0)).has_value());

    ASSERT_TRUE(node_.RemoveObject({ObjectType::AnalogValue, 1}).has_value());
    EXPECT_TRUE(node_.RemoveObject({ObjectType::AnalogValue, 1}).error().Is(NodeStatus::kNotFound));

    auto self = node_.RemoveObject(DeviceObject(kDefaultDeviceId));
    ASSERT_FALSE(self.has_value());
    EXPECT_TRUE(self.error().Is(NodeStatus::kInvalidArgument));

    ASSERT_TRUE(node_.RemoveAllObjects().has_value());
    EXPECT_TRUE(node_.LocalObjects()->empty());
    EXPECT_TRUE(node_.GetObject(DeviceObject(kDefaultDeviceId)).has_value());
}

// =============================================================================
// Reset / Backup
// =============================================================================

TEST_F(LocalDeviceManagerTest, ResetPreservesObjectsAndConfig) {
    BootNode();
    ASSERT_TRUE(node_.AddOrUpdateObject(AnalogValue(1, 72.5, "supply-temp")).has_value());
    ASSERT_TRUE(node_.AddOrUpdateObject(AnalogValue(2, 55.0, "return-temp")).has_value());

    auto before = node_.Backup();
    ASSERT_TRUE(before.has_value());
    auto previous = node_.Current();

    ASSERT_TRUE(node_.Reset().has_value());

    EXPECT_NE(node_.Current(), previous);
    EXPECT_EQ(previous->State(), DeviceState::Terminated);
    EXPECT_TRUE(node_.IsInitialized());

    auto after = node_.Backup();
    ASSERT_TRUE(after.has_value());
    EXPECT_EQ(*after, *before);
}

TEST_F(LocalDeviceManagerTest, ResetAppliesOverridesOnly) {
    BootNode();
    ASSERT_TRUE(node_.AddOrUpdateObject(AnalogValue(1, 10.0)).has_value());
    auto before = node_.Config();
    ASSERT_TRUE(before.has_value());

    ConfigOverrides overrides;
    overrides.port = 47900;
    ASSERT_TRUE(node_.Reset(overrides).has_value());

    auto after = node_.Config();
    ASSERT_TRUE(after.has_value());
    EXPECT_EQ(after->port, 47900);
    EXPECT_EQ(after->deviceId, before->deviceId);
    EXPECT_EQ(after->localAddress, before->localAddress);
    EXPECT_EQ(after->apduTimeoutMs, before->apduTimeoutMs);

    EXPECT_TRUE(network_.IsPortBound(47900));
    EXPECT_FALSE(network_.IsPortBound(kDefaultBACnetPort));
    EXPECT_EQ(node_.LocalObjects()->size(), 1u);
}

TEST_F(LocalDeviceManagerTest, ResetCarriesRuntimeTunablesUnlessOverridden) {
    BootNode();
    node_.Current()->ApplyTunables(DeviceTunables{7, 1200, 3, 250});

    ASSERT_TRUE(node_.Reset().has_value());
    EXPECT_EQ(node_.Current()->Tunables(), (DeviceTunables{7, 1200, 3, 250}));

    ConfigOverrides overrides;
    overrides.retries = 1;
    overrides.apduTimeoutMs = 600;
    ASSERT_TRUE(node_.Reset(overrides).has_value());
    EXPECT_EQ(node_.Current()->Tunables(), (DeviceTunables{1, 1200, 3, 600}));
}

TEST_F(LocalDeviceManagerTest, ResetAppliesTimeoutOverride) {
    auto overrides = TestOverrides();
    overrides.timeoutMs = 300;
    overrides.apduTimeoutMs.reset();
    ASSERT_TRUE(node_.Create(overrides).has_value());
    ASSERT_TRUE(node_.Initialize().has_value());
    ASSERT_EQ(node_.Current()->Tunables().timeoutMs, 300u);

    ConfigOverrides reset;
    reset.timeoutMs = 5000;
    ASSERT_TRUE(node_.Reset(reset).has_value());

    auto config = node_.Config();
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->timeoutMs, 5000u);
    EXPECT_EQ(config->apduTimeoutMs, 5000u);
    EXPECT_EQ(node_.Current()->Tunables().timeoutMs, 5000u);
}

TEST_F(LocalDeviceManagerTest, ResetWithInvalidOverrideKeepsCurrentDevice) {
    BootNode();
    auto current = node_.Current();

    ConfigOverrides overrides;
    overrides.deviceId = kMaxDeviceInstance + 1;
    auto reset = node_.Reset(overrides);
    ASSERT_FALSE(reset.has_value());
    EXPECT_TRUE(reset.error().Is(NodeStatus::kConfigError));

    EXPECT_EQ(node_.Current(), current);
    EXPECT_TRUE(node_.IsInitialized());
}
