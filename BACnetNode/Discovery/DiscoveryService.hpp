#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "../Device/LocalDeviceManager.hpp"
#include "RemoteDeviceRegistry.hpp"

namespace BACN::Discovery {

struct DiscoveryParams {
    std::chrono::milliseconds settleInterval{500};  // wait between Who-Is and reading the table
    uint32_t attempts{5};                           // default for DiscoverWithRetry
};

struct DiscoveryResult {
    std::vector<DeviceId> devices;
    uint32_t attempts{0};
};

using WhoHasTarget = std::variant<ObjectIdentifier, std::string>;

/**
 * @brief Who-Is / Who-Has broadcasts and the remote device view.
 *
 * All operations require an initialized local device (NotInitialized).
 * Silence on the network is never an error: discovery just returns nothing.
 */
class DiscoveryService {
public:
    explicit DiscoveryService(Device::LocalDeviceManager& node, DiscoveryParams params = {});

    DiscoveryService(const DiscoveryService&) = delete;
    DiscoveryService& operator=(const DiscoveryService&) = delete;

    /// Without a range the request is unrestricted; a missing bound becomes 0 / 4194304.
    Result<void> SendWhoIs(std::optional<InstanceRange> range = std::nullopt,
                           std::optional<uint16_t> destinationPort = std::nullopt);

    /// Global broadcast. Range bounds default to 0 / 4194303.
    Result<void> SendWhoHas(const WhoHasTarget& target,
                            std::optional<InstanceRange> range = std::nullopt);

    /// Who-Is, settle, fetch extended information for every table entry.
    Result<std::vector<DeviceId>> FindDevicesAndExtendedInfo(
        std::optional<InstanceRange> range = std::nullopt);

    /// Repeat FindDevicesAndExtendedInfo until something answers or attempts run out.
    Result<DiscoveryResult> DiscoverWithRetry(std::optional<InstanceRange> range = std::nullopt,
                                              std::optional<uint32_t> attempts = std::nullopt);

    [[nodiscard]] Result<std::vector<DeviceId>> RemoteDevices();
    [[nodiscard]] Result<Transport::RemoteDeviceInfo> RemoteDevice(DeviceId id);
    [[nodiscard]] Result<std::vector<std::pair<DeviceId, std::string>>> RemoteDevicesAndNames();

    [[nodiscard]] const RemoteDeviceRegistry& Registry() const noexcept { return registry_; }
    [[nodiscard]] const DiscoveryParams& Params() const noexcept { return params_; }

private:
    // Re-sync the registry with the current device's transport table. A device
    // swap (Create/Reset) starts a fresh registry.
    Result<std::shared_ptr<Device::LocalDevice>> Refresh();

    Device::LocalDeviceManager& node_;
    const DiscoveryParams params_;

    RemoteDeviceRegistry registry_;
    std::mutex ownerLock_;
    std::weak_ptr<Device::LocalDevice> registryOwner_;
    std::atomic<uint32_t> round_{0};
};

} // namespace BACN::Discovery
