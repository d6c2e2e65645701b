#pragma once

#include <cstdint>
#include <vector>

#include "../Common/PropertyValue.hpp"
#include "../Request/RequestBridge.hpp"

namespace BACN::Remote {

using Request::RequestOutcome;

struct CovOptions {
    uint32_t processId{1};
    bool issueConfirmedNotifications{false};
    uint32_t lifetimeSeconds{60};
};

struct ObjectReadOutcome {
    ObjectIdentifier object;
    RequestOutcome<PropertyMap> outcome;
};

struct PropertyWriteOutcome {
    PropertyId property{PropertyId::PresentValue};
    RequestOutcome<bool> outcome;
};

/// Properties never sent in WriteProperty / CreateObject.
[[nodiscard]] constexpr bool IsStructuralProperty(PropertyId id) noexcept {
    return IsIdentityProperty(id) || id == PropertyId::ObjectList;
}

/**
 * @brief Object-level operations on remote devices, composed from RequestBridge calls.
 *
 * Every method forwards the bridge's local preconditions (NotInitialized,
 * NotFound) as errors and keeps remote outcomes distinguishable.
 */
class RemoteObjectAccessor {
public:
    explicit RemoteObjectAccessor(Request::RequestBridge& bridge);

    /// One ReadPropertyMultiple. Pass PropertyId::All for every property.
    Result<RequestOutcome<PropertyMap>> ReadProperties(DeviceId deviceId,
                                                       const ObjectIdentifier& object,
                                                       const std::vector<PropertyId>& properties);

    /// object-list of (device, deviceId).
    Result<RequestOutcome<std::vector<ObjectIdentifier>>> ListObjects(DeviceId deviceId);

    /// ListObjects, then one read of every property per object. Per-object outcomes are kept.
    Result<RequestOutcome<std::vector<ObjectReadOutcome>>> ReadAllObjectsFullProperties(DeviceId deviceId);

    /// One WriteProperty per non-structural property, outcomes in property order.
    Result<std::vector<PropertyWriteOutcome>> WriteProperties(DeviceId deviceId, const ObjectRecord& record);

    /// Success carries the identifier of the created object.
    Result<RequestOutcome<ObjectIdentifier>> CreateRemoteObject(DeviceId deviceId, const ObjectRecord& record);

    Result<RequestOutcome<bool>> DeleteRemoteObject(DeviceId deviceId, const ObjectIdentifier& object);

    Result<RequestOutcome<bool>> SubscribeCov(DeviceId deviceId, const ObjectIdentifier& object,
                                              const CovOptions& options = {});

private:
    Request::RequestBridge& bridge_;
};

} // namespace BACN::Remote
