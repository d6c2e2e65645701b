#include "SimTransport.hpp"

#include "../../Logging/LogConfig.hpp"
#include "SimNetwork.hpp"

namespace BACN::Transport::Sim {

SimTransport::SimTransport(SimNetwork& network, TransportParams params)
    : network_(network), params_(std::move(params)) {
    // The local device object is always served.
    ObjectRecord device;
    device.identifier = DeviceObject(params_.deviceId);
    device.properties[PropertyId::ObjectName] = "bacnode-" + std::to_string(params_.deviceId);
    device.properties[PropertyId::VendorName] = "BACnetNode";
    (void)localObjects_.Add(device);
}

SimTransport::~SimTransport() {
    if (initialized_.load()) {
        auto result = Terminate();
        if (!result) {
            result.error().LogAsWarning();
        }
    }
}

Result<void> SimTransport::Initialize() {
    if (terminated_.load()) {
        return BACN_ERROR_STATE("Transport was terminated");
    }
    if (initialized_.load()) {
        return {};
    }
    const uint16_t port = port_.load();
    if (!network_.Bind(port, this)) {
        BACN_LOG_WARNING(Transport, "Port %u already bound (device %u)", port, params_.deviceId);
        return BACN_ERROR_BIND("Port already bound");
    }
    boundPort_ = port;
    initialized_.store(true);
    BACN_LOG_V2(Transport, "Device %u bound to %s:%u", params_.deviceId, params_.localAddress, port);
    return {};
}

Result<void> SimTransport::Terminate() {
    if (!initialized_.exchange(false)) {
        terminated_.store(true);
        return {};
    }
    network_.Unbind(boundPort_, this);
    terminated_.store(true);
    BACN_LOG_V2(Transport, "Device %u released port %u", params_.deviceId, boundPort_);
    return {};
}

Result<void> SimTransport::SendBroadcast(uint16_t port, const UnconfirmedRequest& request) {
    if (!initialized_.load()) {
        return BACN_ERROR_NOT_INITIALIZED("Transport not initialized");
    }
    network_.Broadcast(params_.deviceId, port, request);
    return {};
}

Result<void> SimTransport::SendGlobalBroadcast(const UnconfirmedRequest& request) {
    if (!initialized_.load()) {
        return BACN_ERROR_NOT_INITIALIZED("Transport not initialized");
    }
    network_.Broadcast(params_.deviceId, std::nullopt, request);
    return {};
}

Result<void> SimTransport::Send(const RemoteDeviceInfo& device, const ConfirmedRequest& request,
                                CompletionCallback callback) {
    if (!initialized_.load()) {
        return BACN_ERROR_NOT_INITIALIZED("Transport not initialized");
    }
    if (!callback) {
        return BACN_ERROR_INVALID("Send requires a completion callback");
    }
    const auto budget = std::chrono::milliseconds(
        static_cast<int64_t>(timeoutMs_.load()) * (static_cast<int64_t>(retries_.load()) + 1));
    BACN_LOG_V4(Transport, "-> %u %s (budget %lld ms)", device.deviceId, Describe(request),
                static_cast<long long>(budget.count()));
    network_.Deliver(params_.deviceId, device, request, budget, std::move(callback));
    return {};
}

std::vector<RemoteDeviceInfo> SimTransport::GetRemoteDevices() const {
    std::lock_guard<std::mutex> guard(lock_);
    std::vector<RemoteDeviceInfo> out;
    out.reserve(remoteDevices_.size());
    for (const auto& [id, info] : remoteDevices_) {
        out.push_back(info);
    }
    return out;
}

std::optional<RemoteDeviceInfo> SimTransport::GetRemoteDevice(DeviceId id) const {
    std::lock_guard<std::mutex> guard(lock_);
    auto it = remoteDevices_.find(id);
    if (it == remoteDevices_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Result<RemoteDeviceInfo> SimTransport::GetExtendedDeviceInformation(DeviceId id) {
    if (!initialized_.load()) {
        return BACN_ERROR_NOT_INITIALIZED("Transport not initialized");
    }
    if (!GetRemoteDevice(id)) {
        return BACN_ERROR_NOT_FOUND("Device not in remote table");
    }
    auto device = network_.ReadDeviceObject(id);
    if (!device) {
        return BACN_ERROR_IO("Device did not answer extended information request");
    }

    std::lock_guard<std::mutex> guard(lock_);
    auto it = remoteDevices_.find(id);
    if (it == remoteDevices_.end()) {
        return BACN_ERROR_NOT_FOUND("Device not in remote table");
    }
    auto& info = it->second;
    if (const auto* name = device->Find(PropertyId::ObjectName); name && name->Is<std::string>()) {
        info.objectName = *name->As<std::string>();
    }
    if (const auto* vendor = device->Find(PropertyId::VendorName); vendor && vendor->Is<std::string>()) {
        info.vendorName = *vendor->As<std::string>();
    }
    if (const auto* services = device->Find(PropertyId::ProtocolServicesSupported)) {
        info.servicesSupported = *services;
    }
    info.extendedInfo = true;
    return info;
}

Result<void> SimTransport::AddObject(const ObjectRecord& record) {
    return localObjects_.Add(record);
}

Result<ObjectRecord> SimTransport::GetObject(const ObjectIdentifier& id) const {
    return localObjects_.Get(id);
}

Result<void> SimTransport::SetProperty(const ObjectIdentifier& id, PropertyId property,
                                       const PropertyValue& value) {
    return localObjects_.SetProperty(id, property, value);
}

Result<void> SimTransport::RemoveObject(const ObjectIdentifier& id) {
    if (id == DeviceObject(params_.deviceId)) {
        return BACN_ERROR_INVALID("The local device object cannot be removed");
    }
    return localObjects_.Remove(id);
}

std::vector<ObjectRecord> SimTransport::GetLocalObjects() const {
    return localObjects_.All();
}

void SimTransport::OnIAm(const RemoteDeviceInfo& info) {
    if (info.deviceId == params_.deviceId) {
        return;
    }
    std::lock_guard<std::mutex> guard(lock_);
    auto [it, inserted] = remoteDevices_.try_emplace(info.deviceId, info);
    if (!inserted) {
        // Keep extended information across repeated I-Am.
        it->second.address = info.address;
        it->second.port = info.port;
        it->second.vendorId = info.vendorId;
        it->second.maxApdu = info.maxApdu;
        it->second.segmentation = info.segmentation;
    }
    BACN_LOG_V3(Transport, "I-Am %u from %s:%u (%s)", info.deviceId, info.address, info.port,
                inserted ? "new" : "refresh");
}

void SimTransport::OnIHave(const IHaveNotice& notice) {
    std::lock_guard<std::mutex> guard(lock_);
    iHave_.push_back(notice);
    BACN_LOG_V3(Transport, "I-Have %s '%s' from %u", ToString(notice.object), notice.objectName,
                notice.from);
}

std::vector<IHaveNotice> SimTransport::ReceivedIHave() const {
    std::lock_guard<std::mutex> guard(lock_);
    return iHave_;
}

} // namespace BACN::Transport::Sim
