#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "../Common/BACnetCommon.hpp"
#include "../Core/Error.hpp"

namespace BACN::Device {

// Defaults applied to omitted fields.
inline constexpr DeviceId kDefaultDeviceId = 1338;
inline constexpr uint16_t kDefaultPort = kDefaultBACnetPort;
inline constexpr uint16_t kDefaultDestinationPort = kDefaultBACnetPort;
inline constexpr uint32_t kDefaultTimeoutMs = 10000;
inline constexpr uint32_t kDefaultRetries = 2;
inline constexpr uint32_t kDefaultSegTimeoutMs = 5000;
inline constexpr uint32_t kDefaultSegWindow = 5;

/// Fully-resolved configuration of one local device. Stored verbatim in backups.
struct LocalDeviceConfig {
    DeviceId deviceId{kDefaultDeviceId};
    std::string broadcastAddress;
    uint16_t port{kDefaultPort};
    uint16_t destinationPort{kDefaultDestinationPort};
    std::string localAddress;
    uint32_t timeoutMs{kDefaultTimeoutMs};
    uint32_t apduTimeoutMs{kDefaultTimeoutMs};
    uint32_t retries{kDefaultRetries};
    uint32_t segTimeoutMs{kDefaultSegTimeoutMs};
    uint32_t segWindow{kDefaultSegWindow};

    bool operator==(const LocalDeviceConfig&) const = default;
};

/// Same fields, each optional. Omitted = default (Create) or keep (Reset).
struct ConfigOverrides {
    std::optional<DeviceId> deviceId;
    std::optional<std::string> broadcastAddress;
    std::optional<uint16_t> port;
    std::optional<uint16_t> destinationPort;
    std::optional<std::string> localAddress;
    std::optional<uint32_t> timeoutMs;
    std::optional<uint32_t> apduTimeoutMs;
    std::optional<uint32_t> retries;
    std::optional<uint32_t> segTimeoutMs;
    std::optional<uint32_t> segWindow;
};

/// Runtime parameters read back from a live transport and reapplied after Reset.
struct DeviceTunables {
    uint32_t retries{kDefaultRetries};
    uint32_t segTimeoutMs{kDefaultSegTimeoutMs};
    uint32_t segWindow{kDefaultSegWindow};
    uint32_t timeoutMs{kDefaultTimeoutMs};

    bool operator==(const DeviceTunables&) const = default;
};

/**
 * @brief Resolve overrides against defaults.
 *
 * apduTimeout falls back to the resolved timeout. Missing addresses come from
 * the host's primary IPv4 interface. Fails with ConfigError when an address
 * cannot be resolved or is malformed, when deviceId exceeds 4194303, or when
 * a port is 0.
 */
Result<LocalDeviceConfig> ResolveConfig(const ConfigOverrides& overrides);

/// Overlay overrides on an existing configuration, then validate.
Result<LocalDeviceConfig> MergeConfig(const LocalDeviceConfig& base, const ConfigOverrides& overrides);

/// Every field of config as an override.
[[nodiscard]] ConfigOverrides ToOverrides(const LocalDeviceConfig& config);

Result<void> ValidateConfig(const LocalDeviceConfig& config);

} // namespace BACN::Device
