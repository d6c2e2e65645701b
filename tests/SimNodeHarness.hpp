#pragma once

// Shared wiring for tests that run a whole node against the simulated network.

#include <chrono>
#include <memory>
#include <string>

#include <gtest/gtest.h>

#include "Device/LocalDeviceManager.hpp"
#include "Transport/Sim/SimNetwork.hpp"
#include "Transport/Sim/SimRemoteDevice.hpp"

namespace BACN::Testing {

inline constexpr const char* kLocalAddress = "192.168.1.10";
inline constexpr const char* kBroadcastAddress = "192.168.1.255";

// Explicit addresses keep tests independent of the host's interfaces.
// Short APDU timeout and no retries keep silent-device tests fast.
inline Device::ConfigOverrides TestOverrides(DeviceId id = Device::kDefaultDeviceId,
                                             uint16_t port = kDefaultBACnetPort) {
    Device::ConfigOverrides overrides;
    overrides.deviceId = id;
    overrides.port = port;
    overrides.localAddress = kLocalAddress;
    overrides.broadcastAddress = kBroadcastAddress;
    overrides.apduTimeoutMs = 100;
    overrides.retries = 0;
    return overrides;
}

inline ObjectRecord AnalogValue(uint32_t instance, double presentValue, std::string name = {}) {
    ObjectRecord record;
    record.identifier = ObjectIdentifier{ObjectType::AnalogValue, instance};
    record.properties[PropertyId::PresentValue] = presentValue;
    record.properties[PropertyId::ObjectName] =
        name.empty() ? "av-" + std::to_string(instance) : std::move(name);
    return record;
}

inline std::shared_ptr<Transport::Sim::SimRemoteDevice> AddRemote(Transport::Sim::SimNetwork& network,
                                                                  DeviceId id) {
    return network.AddDevice(
        std::make_shared<Transport::Sim::SimRemoteDevice>(id, "sim-" + std::to_string(id)));
}

/// Network, factory and node context, in destruction-safe order.
class SimNodeTest : public ::testing::Test {
protected:
    void BootNode(DeviceId id = Device::kDefaultDeviceId) {
        ASSERT_TRUE(node_.Create(TestOverrides(id)).has_value());
        ASSERT_TRUE(node_.Initialize().has_value());
    }

    Transport::Sim::SimNetwork network_;
    Transport::Sim::SimTransportFactory factory_{network_};
    Device::LocalDeviceManager node_{factory_};
};

} // namespace BACN::Testing
