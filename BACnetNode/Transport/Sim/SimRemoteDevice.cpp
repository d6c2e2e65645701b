#include "SimRemoteDevice.hpp"

#include <fmt/format.h>

#include "../ProtocolCodes.hpp"

namespace BACN::Transport::Sim {

namespace {

ErrorPdu MakeError(Protocol::ErrorClass errorClass, Protocol::ErrorCode code) {
    return ErrorPdu{static_cast<uint32_t>(errorClass), static_cast<uint32_t>(code)};
}

std::string AddressFor(DeviceId id) {
    return fmt::format("10.{}.{}.{}", (id >> 16) & 0xFF, (id >> 8) & 0xFF, id & 0xFF);
}

} // namespace

SimRemoteDevice::SimRemoteDevice(DeviceId id, std::string name, uint16_t vendorId,
                                 std::string vendorName)
    : id_(id), name_(std::move(name)), vendorId_(vendorId) {
    ObjectRecord device;
    device.identifier = DeviceObject(id_);
    device.properties[PropertyId::ObjectName] = name_;
    device.properties[PropertyId::VendorName] = std::move(vendorName);
    device.properties[PropertyId::VendorIdentifier] = static_cast<uint32_t>(vendorId_);
    device.properties[PropertyId::ModelName] = "sim-device";
    device.properties[PropertyId::SystemStatus] = "operational";
    device.properties[PropertyId::ProtocolVersion] = static_cast<uint32_t>(1);
    device.properties[PropertyId::ProtocolRevision] = static_cast<uint32_t>(14);
    device.properties[PropertyId::MaxApduLengthAccepted] = static_cast<uint32_t>(1476);
    device.properties[PropertyId::SegmentationSupported] = "segmented-both";
    device.properties[PropertyId::ProtocolServicesSupported] = PropertyList{
        "read-property-multiple", "write-property", "create-object",
        "delete-object", "subscribe-cov", "who-is", "who-has"};
    // Table is empty at construction.
    (void)objects_.Add(device);
}

RemoteDeviceInfo SimRemoteDevice::Announce() const {
    RemoteDeviceInfo info;
    info.deviceId = id_;
    info.address = AddressFor(id_);
    info.port = port_;
    info.vendorId = vendorId_;
    return info;
}

Result<ObjectRecord> SimRemoteDevice::GetObject(const ObjectIdentifier& id) const {
    auto record = Resolve(id);
    if (!record) {
        return BACN_ERROR_NOT_FOUND("No such object on simulated device");
    }
    return *record;
}

std::optional<ObjectIdentifier> SimRemoteDevice::FindObjectNamed(const std::string& name) const {
    for (const auto& record : objects_.All()) {
        const auto* value = record.Find(PropertyId::ObjectName);
        if (value != nullptr && value->As<std::string>() != nullptr &&
            *value->As<std::string>() == name) {
            return record.identifier;
        }
    }
    return std::nullopt;
}

void SimRemoteDevice::ScriptFailure(ConfirmedService service, ScriptedFailure failure) {
    std::lock_guard<std::mutex> guard(lock_);
    failures_[service] = failure;
}

void SimRemoteDevice::ClearFailures() {
    std::lock_guard<std::mutex> guard(lock_);
    failures_.clear();
}

std::optional<ScriptedFailure> SimRemoteDevice::FailureFor(ConfirmedService service) const {
    std::lock_guard<std::mutex> guard(lock_);
    auto it = failures_.find(service);
    if (it == failures_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<CovSubscription> SimRemoteDevice::Subscriptions() const {
    std::lock_guard<std::mutex> guard(lock_);
    return subscriptions_;
}

size_t SimRemoteDevice::RequestCount(ConfirmedService service) const {
    std::lock_guard<std::mutex> guard(lock_);
    auto it = requestCounts_.find(service);
    return it != requestCounts_.end() ? it->second : 0;
}

std::optional<Response> SimRemoteDevice::Handle(DeviceId requester, const ConfirmedRequest& request) {
    const auto service = ServiceOf(request);
    {
        std::lock_guard<std::mutex> guard(lock_);
        ++requestCounts_[service];
    }

    if (auto failure = FailureFor(service)) {
        if (std::holds_alternative<Silence>(*failure)) {
            return std::nullopt;
        }
        if (const auto* abort = std::get_if<AbortPdu>(&*failure)) {
            return Response{*abort};
        }
        if (const auto* reject = std::get_if<RejectPdu>(&*failure)) {
            return Response{*reject};
        }
        return Response{std::get<ErrorPdu>(*failure)};
    }

    switch (service) {
        case ConfirmedService::ReadPropertyMultiple:
            return HandleRead(std::get<ReadPropertyMultipleRequest>(request));
        case ConfirmedService::WriteProperty:
            return HandleWrite(std::get<WritePropertyRequest>(request));
        case ConfirmedService::CreateObject:
            return HandleCreate(std::get<CreateObjectRequest>(request));
        case ConfirmedService::DeleteObject:
            return HandleDelete(std::get<DeleteObjectRequest>(request));
        case ConfirmedService::SubscribeCov:
            return HandleSubscribe(requester, std::get<SubscribeCovRequest>(request));
    }
    return Response{RejectPdu{static_cast<uint32_t>(Protocol::RejectReason::UnrecognizedService)}};
}

std::optional<ObjectRecord> SimRemoteDevice::Resolve(const ObjectIdentifier& id) const {
    auto record = objects_.Get(id);
    if (!record) {
        return std::nullopt;
    }
    if (id == DeviceObject(id_)) {
        record->properties[PropertyId::ObjectList] = MakeObjectList(objects_.Identifiers());
    }
    return *record;
}

Response SimRemoteDevice::HandleRead(const ReadPropertyMultipleRequest& request) {
    if (request.properties.empty()) {
        return RejectPdu{static_cast<uint32_t>(Protocol::RejectReason::MissingRequiredParameter)};
    }
    auto record = Resolve(request.object);
    if (!record) {
        return MakeError(Protocol::ErrorClass::Object, Protocol::ErrorCode::UnknownObject);
    }

    PropertyMap out;
    for (const auto property : request.properties) {
        if (property == PropertyId::All) {
            out.insert(record->properties.begin(), record->properties.end());
            continue;
        }
        const auto* value = record->Find(property);
        if (value == nullptr) {
            return MakeError(Protocol::ErrorClass::Property, Protocol::ErrorCode::UnknownProperty);
        }
        out[property] = *value;
    }
    return Ack{std::move(out)};
}

Response SimRemoteDevice::HandleWrite(const WritePropertyRequest& request) {
    auto record = objects_.Get(request.object);
    if (!record) {
        return MakeError(Protocol::ErrorClass::Object, Protocol::ErrorCode::UnknownObject);
    }
    if (IsIdentityProperty(request.property) || request.property == PropertyId::ObjectList) {
        return MakeError(Protocol::ErrorClass::Property, Protocol::ErrorCode::WriteAccessDenied);
    }
    if (record->Find(request.property) == nullptr) {
        return MakeError(Protocol::ErrorClass::Property, Protocol::ErrorCode::UnknownProperty);
    }
    if (!objects_.SetProperty(request.object, request.property, request.value)) {
        return MakeError(Protocol::ErrorClass::Object, Protocol::ErrorCode::UnknownObject);
    }
    return Ack{};
}

Response SimRemoteDevice::HandleCreate(const CreateObjectRequest& request) {
    if (request.object.type == ObjectType::Device) {
        return MakeError(Protocol::ErrorClass::Object, Protocol::ErrorCode::DynamicCreationNotSupported);
    }
    if (objects_.Contains(request.object)) {
        return MakeError(Protocol::ErrorClass::Object, Protocol::ErrorCode::ObjectIdentifierAlreadyExists);
    }
    ObjectRecord record{request.object, request.initialValues};
    if (record.Find(PropertyId::ObjectName) == nullptr) {
        record.properties[PropertyId::ObjectName] =
            fmt::format("{}-{}", ToString(request.object.type), request.object.instance);
    }
    if (!objects_.Add(record)) {
        return MakeError(Protocol::ErrorClass::Object, Protocol::ErrorCode::ObjectIdentifierAlreadyExists);
    }
    return Ack{request.object};
}

Response SimRemoteDevice::HandleDelete(const DeleteObjectRequest& request) {
    if (request.object == DeviceObject(id_)) {
        return MakeError(Protocol::ErrorClass::Object, Protocol::ErrorCode::ObjectDeletionNotPermitted);
    }
    if (!objects_.Remove(request.object)) {
        return MakeError(Protocol::ErrorClass::Object, Protocol::ErrorCode::UnknownObject);
    }
    return Ack{};
}

Response SimRemoteDevice::HandleSubscribe(DeviceId requester, const SubscribeCovRequest& request) {
    if (!objects_.Contains(request.object)) {
        return MakeError(Protocol::ErrorClass::Object, Protocol::ErrorCode::UnknownObject);
    }
    CovSubscription subscription{requester, request.processId, request.object,
                                 request.issueConfirmedNotifications, request.lifetimeSeconds};
    std::lock_guard<std::mutex> guard(lock_);
    for (auto& existing : subscriptions_) {
        if (existing.subscriber == requester && existing.processId == request.processId &&
            existing.object == request.object) {
            existing = subscription;
            return Ack{};
        }
    }
    subscriptions_.push_back(subscription);
    return Ack{};
}

} // namespace BACN::Transport::Sim
