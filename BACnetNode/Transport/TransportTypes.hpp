#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "../Common/BACnetCommon.hpp"
#include "../Common/PropertyValue.hpp"

namespace BACN::Transport {

// ============================================================================
// Remote device table entry
// ============================================================================

struct RemoteDeviceInfo {
    DeviceId deviceId{0};
    std::string address;
    uint16_t port{kDefaultBACnetPort};
    uint16_t vendorId{0};
    uint32_t maxApdu{1476};
    std::string segmentation{"segmented-both"};

    // Populated by GetExtendedDeviceInformation()
    bool extendedInfo{false};
    std::optional<std::string> objectName;
    std::optional<std::string> vendorName;
    std::optional<PropertyValue> servicesSupported;
};

// ============================================================================
// Unconfirmed requests (broadcast)
// ============================================================================

struct WhoIsRequest {
    // Both set, or both empty (unrestricted).
    std::optional<uint32_t> low;
    std::optional<uint32_t> high;
};

struct WhoHasRequest {
    std::variant<ObjectIdentifier, std::string> target;
    uint32_t low{0};
    uint32_t high{kMaxDeviceInstance};
};

using UnconfirmedRequest = std::variant<WhoIsRequest, WhoHasRequest>;

// ============================================================================
// Confirmed requests (unicast, one outcome each)
// ============================================================================

enum class ConfirmedService : uint8_t {
    ReadPropertyMultiple,
    WriteProperty,
    CreateObject,
    DeleteObject,
    SubscribeCov,
};

[[nodiscard]] constexpr const char* ToString(ConfirmedService service) noexcept {
    switch (service) {
        case ConfirmedService::ReadPropertyMultiple: return "read-property-multiple";
        case ConfirmedService::WriteProperty:        return "write-property";
        case ConfirmedService::CreateObject:         return "create-object";
        case ConfirmedService::DeleteObject:         return "delete-object";
        case ConfirmedService::SubscribeCov:         return "subscribe-cov";
    }
    return "unknown-service";
}

struct ReadPropertyMultipleRequest {
    ObjectIdentifier object;
    std::vector<PropertyId> properties;
};

struct WritePropertyRequest {
    ObjectIdentifier object;
    PropertyId property{PropertyId::PresentValue};
    PropertyValue value;
    std::optional<uint8_t> priority;
};

struct CreateObjectRequest {
    ObjectIdentifier object;
    PropertyMap initialValues;
};

struct DeleteObjectRequest {
    ObjectIdentifier object;
};

struct SubscribeCovRequest {
    uint32_t processId{1};
    ObjectIdentifier object;
    bool issueConfirmedNotifications{false};
    uint32_t lifetimeSeconds{60};
};

using ConfirmedRequest = std::variant<ReadPropertyMultipleRequest,
                                      WritePropertyRequest,
                                      CreateObjectRequest,
                                      DeleteObjectRequest,
                                      SubscribeCovRequest>;

// Variant order matches ConfirmedService.
[[nodiscard]] inline ConfirmedService ServiceOf(const ConfirmedRequest& request) noexcept {
    return static_cast<ConfirmedService>(request.index());
}

// ============================================================================
// Responses
// ============================================================================

// Ack service payload: nothing, a property map (RPM), or an identifier (CreateObject).
using AckPayload = std::variant<std::monostate, PropertyMap, ObjectIdentifier>;

struct Ack {
    AckPayload payload;
};

// Reason/class/code are raw wire numbers; decoding happens above the transport.
struct AbortPdu {
    uint32_t reason{0};
};

struct RejectPdu {
    uint32_t reason{0};
};

struct ErrorPdu {
    uint32_t errorClass{0};
    uint32_t errorCode{0};
};

struct TransportException {
    std::string detail;
};

using Response = std::variant<Ack, AbortPdu, RejectPdu, ErrorPdu, TransportException>;

using CompletionCallback = std::function<void(Response response)>;

[[nodiscard]] std::string Describe(const Response& response);
[[nodiscard]] std::string Describe(const ConfirmedRequest& request);

} // namespace BACN::Transport
