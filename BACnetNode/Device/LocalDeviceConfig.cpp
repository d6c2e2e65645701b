#include "LocalDeviceConfig.hpp"

#include "../Net/HostInterface.hpp"

namespace BACN::Device {

Result<void> ValidateConfig(const LocalDeviceConfig& config) {
    if (!IsValidDeviceId(config.deviceId)) {
        return BACN_ERROR_CONFIG("device-id must be within 0..4194303");
    }
    if (config.port == 0 || config.destinationPort == 0) {
        return BACN_ERROR_CONFIG("port and destination-port must be non-zero");
    }
    if (!Net::IsValidIPv4(config.localAddress)) {
        return BACN_ERROR_CONFIG("local-address is not a dotted-quad IPv4 address");
    }
    if (!Net::IsValidIPv4(config.broadcastAddress)) {
        return BACN_ERROR_CONFIG("broadcast-address is not a dotted-quad IPv4 address");
    }
    return {};
}

Result<LocalDeviceConfig> ResolveConfig(const ConfigOverrides& overrides) {
    LocalDeviceConfig config;
    config.deviceId = overrides.deviceId.value_or(kDefaultDeviceId);
    config.port = overrides.port.value_or(kDefaultPort);
    config.destinationPort = overrides.destinationPort.value_or(kDefaultDestinationPort);
    config.timeoutMs = overrides.timeoutMs.value_or(kDefaultTimeoutMs);
    config.apduTimeoutMs = overrides.apduTimeoutMs.value_or(config.timeoutMs);
    config.retries = overrides.retries.value_or(kDefaultRetries);
    config.segTimeoutMs = overrides.segTimeoutMs.value_or(kDefaultSegTimeoutMs);
    config.segWindow = overrides.segWindow.value_or(kDefaultSegWindow);

    if (overrides.localAddress && overrides.broadcastAddress) {
        config.localAddress = *overrides.localAddress;
        config.broadcastAddress = *overrides.broadcastAddress;
    } else {
        auto primary = Net::PrimaryInterface();
        if (!primary) {
            return std::unexpected(primary.error());
        }
        config.localAddress = overrides.localAddress.value_or(primary->address);
        config.broadcastAddress = overrides.broadcastAddress.value_or(primary->broadcast);
    }

    TRY(ValidateConfig(config));
    return config;
}

Result<LocalDeviceConfig> MergeConfig(const LocalDeviceConfig& base, const ConfigOverrides& overrides) {
    LocalDeviceConfig config = base;
    if (overrides.deviceId) config.deviceId = *overrides.deviceId;
    if (overrides.broadcastAddress) config.broadcastAddress = *overrides.broadcastAddress;
    if (overrides.port) config.port = *overrides.port;
    if (overrides.destinationPort) config.destinationPort = *overrides.destinationPort;
    if (overrides.localAddress) config.localAddress = *overrides.localAddress;
    if (overrides.timeoutMs) config.timeoutMs = *overrides.timeoutMs;
    // apdu-timeout follows a new timeout unless given explicitly, as in ResolveConfig().
    config.apduTimeoutMs = overrides.apduTimeoutMs.value_or(
        overrides.timeoutMs.value_or(config.apduTimeoutMs));
    if (overrides.retries) config.retries = *overrides.retries;
    if (overrides.segTimeoutMs) config.segTimeoutMs = *overrides.segTimeoutMs;
    if (overrides.segWindow) config.segWindow = *overrides.segWindow;

    TRY(ValidateConfig(config));
    return config;
}

ConfigOverrides ToOverrides(const LocalDeviceConfig& config) {
    ConfigOverrides out;
    out.deviceId = config.deviceId;
    out.broadcastAddress = config.broadcastAddress;
    out.port = config.port;
    out.destinationPort = config.destinationPort;
    out.localAddress = config.localAddress;
    out.timeoutMs = config.timeoutMs;
    out.apduTimeoutMs = config.apduTimeoutMs;
    out.retries = config.retries;
    out.segTimeoutMs = config.segTimeoutMs;
    out.segWindow = config.segWindow;
    return out;
}

} // namespace BACN::Device
