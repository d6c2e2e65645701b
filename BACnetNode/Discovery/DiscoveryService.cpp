#include "DiscoveryService.hpp"

#include <thread>

#include "../Logging/LogConfig.hpp"

namespace BACN::Discovery {

DiscoveryService::DiscoveryService(Device::LocalDeviceManager& node, DiscoveryParams params)
    : node_(node), params_(params) {}

Result<void> DiscoveryService::SendWhoIs(std::optional<InstanceRange> range,
                                         std::optional<uint16_t> destinationPort) {
    auto device = TRY(node_.RequireInitialized());

    Transport::WhoIsRequest request;
    if (range) {
        request.low = range->min.value_or(0);
        request.high = range->max.value_or(kWhoIsUpperBound);
    }
    const uint16_t port = destinationPort.value_or(device->Config().destinationPort);

    if (request.low) {
        BACN_LOG_V2(Discovery, "Who-Is [%u, %u] -> port %u", *request.low, *request.high, port);
    } else {
        BACN_LOG_V2(Discovery, "Who-Is (unrestricted) -> port %u", port);
    }
    return device->Endpoint().SendBroadcast(port, request);
}

Result<void> DiscoveryService::SendWhoHas(const WhoHasTarget& target, std::optional<InstanceRange> range) {
    auto device = TRY(node_.RequireInitialized());

    Transport::WhoHasRequest request;
    request.target = target;
    request.low = range ? range->min.value_or(0) : 0;
    request.high = range ? range->max.value_or(kMaxDeviceInstance) : kMaxDeviceInstance;

    if (const auto* id = std::get_if<ObjectIdentifier>(&target)) {
        BACN_LOG_V2(Discovery, "Who-Has %s [%u, %u]", ToString(*id), request.low, request.high);
    } else {
        BACN_LOG_V2(Discovery, "Who-Has '%s' [%u, %u]", std::get<std::string>(target),
                    request.low, request.high);
    }
    return device->Endpoint().SendGlobalBroadcast(request);
}

Result<std::vector<DeviceId>> DiscoveryService::FindDevicesAndExtendedInfo(std::optional<InstanceRange> range) {
    TRY(SendWhoIs(range));
    std::this_thread::sleep_for(params_.settleInterval);

    auto device = TRY(Refresh());
    auto& endpoint = device->Endpoint();

    for (const auto& info : endpoint.GetRemoteDevices()) {
        if (info.extendedInfo) {
            continue;
        }
        auto extended = endpoint.GetExtendedDeviceInformation(info.deviceId);
        if (!extended) {
            registry_.MarkUnreachable(info.deviceId);
            extended.error().LogAsWarning();
            continue;
        }
        registry_.MarkIdentified(*extended);
    }

    auto ids = registry_.Ids();
    BACN_LOG_V1(Discovery, "Discovery round %u: %zu device(s) known", round_.load(), ids.size());
    return ids;
}

Result<DiscoveryResult> DiscoveryService::DiscoverWithRetry(std::optional<InstanceRange> range,
                                                            std::optional<uint32_t> attempts) {
    const uint32_t limit = attempts.value_or(params_.attempts);
    if (limit == 0) {
        return BACN_ERROR_INVALID("DiscoverWithRetry needs at least one attempt");
    }

    DiscoveryResult result;
    for (uint32_t attempt = 1; attempt <= limit; ++attempt) {
        result.attempts = attempt;
        result.devices = TRY(FindDevicesAndExtendedInfo(range));
        if (!result.devices.empty()) {
            BACN_LOG_V1(Discovery, "Discovered %zu device(s) after %u attempt(s)",
                        result.devices.size(), attempt);
            return result;
        }
        BACN_LOG_V2(Discovery, "Attempt %u/%u: no devices answered", attempt, limit);
    }
    BACN_LOG_WARNING(Discovery, "No remote devices found after %u attempts", limit);
    return result;
}

Result<std::vector<DeviceId>> DiscoveryService::RemoteDevices() {
    TRY(Refresh());
    return registry_.Ids();
}

Result<Transport::RemoteDeviceInfo> DiscoveryService::RemoteDevice(DeviceId id) {
    TRY(Refresh());
    auto record = registry_.Find(id);
    if (!record) {
        return BACN_ERROR_NOT_FOUND("Device is not in the remote device table");
    }
    return record->info;
}

Result<std::vector<std::pair<DeviceId, std::string>>> DiscoveryService::RemoteDevicesAndNames() {
    TRY(Refresh());
    return registry_.Names();
}

Result<std::shared_ptr<Device::LocalDevice>> DiscoveryService::Refresh() {
    auto device = TRY(node_.RequireInitialized());
    {
        std::lock_guard<std::mutex> guard(ownerLock_);
        if (registryOwner_.lock() != device) {
            registry_.Clear();
            registryOwner_ = device;
            round_.store(0);
        }
    }
    const uint32_t round = round_.fetch_add(1) + 1;
    for (const auto& info : device->Endpoint().GetRemoteDevices()) {
        registry_.UpsertFromTable(info, round);
    }
    return device;
}

} // namespace BACN::Discovery
