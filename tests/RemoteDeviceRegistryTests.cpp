#include <gtest/gtest.h>

#include "Discovery/RemoteDeviceRegistry.hpp"

using namespace BACN;
using namespace BACN::Discovery;
using BACN::Transport::RemoteDeviceInfo;

namespace {

RemoteDeviceInfo TableEntry(DeviceId id, std::string address = "10.0.0.1") {
    RemoteDeviceInfo info;
    info.deviceId = id;
    info.address = std::move(address);
    info.vendorId = 260;
    return info;
}

RemoteDeviceInfo Extended(DeviceId id, std::string name) {
    auto info = TableEntry(id);
    info.extendedInfo = true;
    info.objectName = std::move(name);
    info.vendorName = "Vendor";
    return info;
}

} // namespace

TEST(RemoteDeviceRegistry, UpsertIsIdempotent) {
    RemoteDeviceRegistry registry;
    registry.UpsertFromTable(TableEntry(5), 1);
    registry.UpsertFromTable(TableEntry(5), 1);

    EXPECT_EQ(registry.Size(), 1u);
    auto record = registry.Find(5);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->state, LifeState::Announced);
    EXPECT_EQ(record->lastSeenRound, 1u);
}

TEST(RemoteDeviceRegistry, RefreshKeepsExtendedFields) {
    RemoteDeviceRegistry registry;
    registry.UpsertFromTable(TableEntry(5), 1);
    registry.MarkIdentified(Extended(5, "ahu-5"));

    // Later table entry moved address but knows nothing about the name.
    auto record = registry.UpsertFromTable(TableEntry(5, "10.0.0.9"), 2);
    EXPECT_EQ(record.state, LifeState::Identified);
    EXPECT_EQ(record.info.address, "10.0.0.9");
    EXPECT_TRUE(record.info.extendedInfo);
    EXPECT_EQ(record.info.objectName, "ahu-5");
    EXPECT_EQ(record.lastSeenRound, 2u);
}

TEST(RemoteDeviceRegistry, ExtendedTableEntryIdentifies) {
    RemoteDeviceRegistry registry;
    auto record = registry.UpsertFromTable(Extended(7, "vav-7"), 3);
    EXPECT_EQ(record.state, LifeState::Identified);
}

TEST(RemoteDeviceRegistry, UnreachableOnlyAffectsKnownDevices) {
    RemoteDeviceRegistry registry;
    registry.UpsertFromTable(TableEntry(5), 1);

    registry.MarkUnreachable(5);
    registry.MarkUnreachable(6);

    EXPECT_EQ(registry.Find(5)->state, LifeState::Unreachable);
    EXPECT_FALSE(registry.Find(6).has_value());
    EXPECT_EQ(registry.Size(), 1u);
}

TEST(RemoteDeviceRegistry, NamesAreEmptyUntilIdentified) {
    RemoteDeviceRegistry registry;
    registry.UpsertFromTable(TableEntry(9), 1);
    registry.UpsertFromTable(TableEntry(3), 1);
    registry.MarkIdentified(Extended(9, "chiller"));

    const std::vector<std::pair<DeviceId, std::string>> expected{{3, ""}, {9, "chiller"}};
    EXPECT_EQ(registry.Names(), expected);
    EXPECT_EQ(registry.Ids(), (std::vector<DeviceId>{3, 9}));

    registry.Clear();
    EXPECT_EQ(registry.Size(), 0u);
}
