#include "RemoteObjectAccessor.hpp"

#include "../Logging/LogConfig.hpp"

namespace BACN::Remote {

namespace {

RequestOutcome<bool> Acknowledged(const Request::RawOutcome& raw) {
    return Request::Transform<bool>(raw, [](const Transport::AckPayload&) { return true; });
}

} // namespace

RemoteObjectAccessor::RemoteObjectAccessor(Request::RequestBridge& bridge)
    : bridge_(bridge) {}

Result<RequestOutcome<PropertyMap>> RemoteObjectAccessor::ReadProperties(
    DeviceId deviceId, const ObjectIdentifier& object, const std::vector<PropertyId>& properties) {
    Transport::ReadPropertyMultipleRequest request{object, properties};
    auto raw = TRY(bridge_.SendAndWait(deviceId, request));
    return Request::Transform<PropertyMap>(raw, [](const Transport::AckPayload& payload) {
        if (const auto* map = std::get_if<PropertyMap>(&payload)) {
            return *map;
        }
        return PropertyMap{};
    });
}

Result<RequestOutcome<std::vector<ObjectIdentifier>>> RemoteObjectAccessor::ListObjects(DeviceId deviceId) {
    auto read = TRY(ReadProperties(deviceId, DeviceObject(deviceId), {PropertyId::ObjectList}));
    return Request::Transform<std::vector<ObjectIdentifier>>(read, [](const PropertyMap& map) {
        auto it = map.find(PropertyId::ObjectList);
        return it != map.end() ? ObjectListEntries(it->second) : std::vector<ObjectIdentifier>{};
    });
}

Result<RequestOutcome<std::vector<ObjectReadOutcome>>>
RemoteObjectAccessor::ReadAllObjectsFullProperties(DeviceId deviceId) {
    using Outcome = RequestOutcome<std::vector<ObjectReadOutcome>>;

    auto listed = TRY(ListObjects(deviceId));
    const auto* ids = Request::ValueOf(listed);
    if (ids == nullptr) {
        BACN_LOG_V1(Remote, "Device %u: object-list read failed (%s)", deviceId,
                    Request::Describe(listed));
        return Request::Transform<std::vector<ObjectReadOutcome>>(
            listed, [](const std::vector<ObjectIdentifier>&) { return std::vector<ObjectReadOutcome>{}; });
    }

    std::vector<ObjectReadOutcome> objects;
    objects.reserve(ids->size());
    for (const auto& id : *ids) {
        auto read = TRY(ReadProperties(deviceId, id, {PropertyId::All}));
        if (!Request::IsSuccess(read)) {
            BACN_LOG_V2(Remote, "Device %u: %s read failed (%s)", deviceId, ToString(id),
                        Request::Describe(read));
        }
        objects.push_back(ObjectReadOutcome{id, std::move(read)});
    }
    BACN_LOG_V2(Remote, "Device %u: read %zu objects", deviceId, objects.size());
    return Outcome{Request::Success<std::vector<ObjectReadOutcome>>{std::move(objects)}};
}

Result<std::vector<PropertyWriteOutcome>> RemoteObjectAccessor::WriteProperties(DeviceId deviceId,
                                                                                const ObjectRecord& record) {
    std::vector<PropertyWriteOutcome> outcomes;
    for (const auto& [property, value] : record.properties) {
        if (IsStructuralProperty(property)) {
            continue;
        }
        Transport::WritePropertyRequest request;
        request.object = record.identifier;
        request.property = property;
        request.value = value;

        auto raw = TRY(bridge_.SendAndWait(deviceId, request));
        auto outcome = Acknowledged(raw);
        if (!Request::IsSuccess(outcome)) {
            BACN_LOG_V1(Remote, "Device %u: write %s.%s failed (%s)", deviceId,
                        ToString(record.identifier), ToString(property), Request::Describe(outcome));
        }
        outcomes.push_back(PropertyWriteOutcome{property, std::move(outcome)});
    }
    return outcomes;
}

Result<RequestOutcome<ObjectIdentifier>> RemoteObjectAccessor::CreateRemoteObject(DeviceId deviceId,
                                                                                  const ObjectRecord& record) {
    Transport::CreateObjectRequest request;
    request.object = record.identifier;
    for (const auto& [property, value] : record.properties) {
        if (!IsStructuralProperty(property)) {
            request.initialValues.emplace(property, value);
        }
    }

    auto raw = TRY(bridge_.SendAndWait(deviceId, request));
    const auto requested = record.identifier;
    return Request::Transform<ObjectIdentifier>(raw, [requested](const Transport::AckPayload& payload) {
        if (const auto* created = std::get_if<ObjectIdentifier>(&payload)) {
            return *created;
        }
        return requested;
    });
}

Result<RequestOutcome<bool>> RemoteObjectAccessor::DeleteRemoteObject(DeviceId deviceId,
                                                                      const ObjectIdentifier& object) {
    auto raw = TRY(bridge_.SendAndWait(deviceId, Transport::DeleteObjectRequest{object}));
    return Acknowledged(raw);
}

Result<RequestOutcome<bool>> RemoteObjectAccessor::SubscribeCov(DeviceId deviceId,
                                                                const ObjectIdentifier& object,
                                                                const CovOptions& options) {
    Transport::SubscribeCovRequest request;
    request.processId = options.processId;
    request.object = object;
    request.issueConfirmedNotifications = options.issueConfirmedNotifications;
    request.lifetimeSeconds = options.lifetimeSeconds;

    auto raw = TRY(bridge_.SendAndWait(deviceId, request));
    return Acknowledged(raw);
}

} // namespace BACN::Remote
