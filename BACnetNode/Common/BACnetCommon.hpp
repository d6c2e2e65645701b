#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace BACN {

// ============================================================================
// Device instance space (ASHRAE 135 §12.11.1)
// ============================================================================

using DeviceId = uint32_t;

inline constexpr DeviceId kMaxDeviceInstance = 4194303;   // 2^22 - 1
inline constexpr DeviceId kWildcardInstance = 4194303;
// Upper bound sent when a Who-Is only names a lower limit.
inline constexpr uint32_t kWhoIsUpperBound = 4194304;

[[nodiscard]] constexpr bool IsValidDeviceId(uint64_t id) noexcept {
    return id <= kMaxDeviceInstance;
}

inline constexpr uint16_t kDefaultBACnetPort = 47808;   // 0xBAC0

// ============================================================================
// Object types (subset named; other numeric values are carried through)
// ============================================================================

enum class ObjectType : uint16_t {
    AnalogInput = 0,
    AnalogOutput = 1,
    AnalogValue = 2,
    BinaryInput = 3,
    BinaryOutput = 4,
    BinaryValue = 5,
    Calendar = 6,
    Command = 7,
    Device = 8,
    EventEnrollment = 9,
    File = 10,
    Group = 11,
    Loop = 12,
    MultiStateInput = 13,
    MultiStateOutput = 14,
    NotificationClass = 15,
    Program = 16,
    Schedule = 17,
    Averaging = 18,
    MultiStateValue = 19,
    TrendLog = 20,
    CharacterStringValue = 40,
    PositiveIntegerValue = 48,
};

[[nodiscard]] const char* ToString(ObjectType type) noexcept;
[[nodiscard]] std::optional<ObjectType> ObjectTypeFromString(std::string_view name) noexcept;

// ============================================================================
// Property identifiers (subset named; other numeric values are carried through)
// ============================================================================

enum class PropertyId : uint32_t {
    All = 8,
    ApplicationSoftwareVersion = 12,
    CovIncrement = 22,
    Description = 28,
    EventState = 36,
    FirmwareRevision = 44,
    MaxApduLengthAccepted = 62,
    ModelName = 70,
    ObjectIdentifier = 75,
    ObjectList = 76,
    ObjectName = 77,
    ObjectType = 79,
    OutOfService = 81,
    PresentValue = 85,
    PriorityArray = 87,
    ProtocolObjectTypesSupported = 96,
    ProtocolServicesSupported = 97,
    ProtocolVersion = 98,
    RelinquishDefault = 104,
    SegmentationSupported = 107,
    StatusFlags = 111,
    SystemStatus = 112,
    Units = 117,
    VendorIdentifier = 120,
    VendorName = 121,
    ProtocolRevision = 139,
};

[[nodiscard]] const char* ToString(PropertyId id) noexcept;
[[nodiscard]] std::optional<PropertyId> PropertyIdFromString(std::string_view name) noexcept;

// Properties that identify an object and are never written through a property set.
[[nodiscard]] constexpr bool IsIdentityProperty(PropertyId id) noexcept {
    return id == PropertyId::ObjectIdentifier || id == PropertyId::ObjectType;
}

// ============================================================================
// Object identifier
// ============================================================================

struct ObjectIdentifier {
    ObjectType type{ObjectType::AnalogInput};
    uint32_t instance{0};

    constexpr ObjectIdentifier() = default;
    constexpr ObjectIdentifier(ObjectType t, uint32_t i) noexcept : type(t), instance(i) {}

    constexpr bool operator==(const ObjectIdentifier&) const noexcept = default;
    constexpr auto operator<=>(const ObjectIdentifier& other) const noexcept {
        if (auto c = static_cast<uint16_t>(type) <=> static_cast<uint16_t>(other.type); c != 0) {
            return c;
        }
        return instance <=> other.instance;
    }
};

[[nodiscard]] std::string ToString(const ObjectIdentifier& id);

[[nodiscard]] constexpr ObjectIdentifier DeviceObject(DeviceId id) noexcept {
    return ObjectIdentifier{ObjectType::Device, id};
}

// ============================================================================
// Instance range used by Who-Is / Who-Has
// ============================================================================

struct InstanceRange {
    std::optional<uint32_t> min;
    std::optional<uint32_t> max;

    [[nodiscard]] bool Contains(DeviceId id) const noexcept {
        return (!min || id >= *min) && (!max || id <= *max);
    }
};

} // namespace BACN
