#include "BACnetCommon.hpp"

#include <array>
#include <cstdio>
#include <utility>

namespace BACN {

namespace {

constexpr std::array<std::pair<ObjectType, const char*>, 23> kObjectTypeNames{{
    {ObjectType::AnalogInput, "analog-input"},
    {ObjectType::AnalogOutput, "analog-output"},
    {ObjectType::AnalogValue, "analog-value"},
    {ObjectType::BinaryInput, "binary-input"},
    {ObjectType::BinaryOutput, "binary-output"},
    {ObjectType::BinaryValue, "binary-value"},
    {ObjectType::Calendar, "calendar"},
    {ObjectType::Command, "command"},
    {ObjectType::Device, "device"},
    {ObjectType::EventEnrollment, "event-enrollment"},
    {ObjectType::File, "file"},
    {ObjectType::Group, "group"},
    {ObjectType::Loop, "loop"},
    {ObjectType::MultiStateInput, "multi-state-input"},
    {ObjectType::MultiStateOutput, "multi-state-output"},
    {ObjectType::NotificationClass, "notification-class"},
    {ObjectType::Program, "program"},
    {ObjectType::Schedule, "schedule"},
    {ObjectType::Averaging, "averaging"},
    {ObjectType::MultiStateValue, "multi-state-value"},
    {ObjectType::TrendLog, "trend-log"},
    {ObjectType::CharacterStringValue, "characterstring-value"},
    {ObjectType::PositiveIntegerValue, "positive-integer-value"},
}};

constexpr std::array<std::pair<PropertyId, const char*>, 26> kPropertyNames{{
    {PropertyId::All, "all"},
    {PropertyId::ApplicationSoftwareVersion, "application-software-version"},
    {PropertyId::CovIncrement, "cov-increment"},
    {PropertyId::Description, "description"},
    {PropertyId::EventState, "event-state"},
    {PropertyId::FirmwareRevision, "firmware-revision"},
    {PropertyId::MaxApduLengthAccepted, "max-apdu-length-accepted"},
    {PropertyId::ModelName, "model-name"},
    {PropertyId::ObjectIdentifier, "object-identifier"},
    {PropertyId::ObjectList, "object-list"},
    {PropertyId::ObjectName, "object-name"},
    {PropertyId::ObjectType, "object-type"},
    {PropertyId::OutOfService, "out-of-service"},
    {PropertyId::PresentValue, "present-value"},
    {PropertyId::PriorityArray, "priority-array"},
    {PropertyId::ProtocolObjectTypesSupported, "protocol-object-types-supported"},
    {PropertyId::ProtocolServicesSupported, "protocol-services-supported"},
    {PropertyId::ProtocolVersion, "protocol-version"},
    {PropertyId::RelinquishDefault, "relinquish-default"},
    {PropertyId::SegmentationSupported, "segmentation-supported"},
    {PropertyId::StatusFlags, "status-flags"},
    {PropertyId::SystemStatus, "system-status"},
    {PropertyId::Units, "units"},
    {PropertyId::VendorIdentifier, "vendor-identifier"},
    {PropertyId::VendorName, "vendor-name"},
    {PropertyId::ProtocolRevision, "protocol-revision"},
}};

} // namespace

const char* ToString(ObjectType type) noexcept {
    for (const auto& [value, name] : kObjectTypeNames) {
        if (value == type) {
            return name;
        }
    }
    return "unknown-object-type";
}

std::optional<ObjectType> ObjectTypeFromString(std::string_view name) noexcept {
    for (const auto& [value, text] : kObjectTypeNames) {
        if (name == text) {
            return value;
        }
    }
    return std::nullopt;
}

const char* ToString(PropertyId id) noexcept {
    for (const auto& [value, name] : kPropertyNames) {
        if (value == id) {
            return name;
        }
    }
    return "unknown-property";
}

std::optional<PropertyId> PropertyIdFromString(std::string_view name) noexcept {
    for (const auto& [value, text] : kPropertyNames) {
        if (name == text) {
            return value;
        }
    }
    return std::nullopt;
}

std::string ToString(const ObjectIdentifier& id) {
    char buf[64];
    const char* name = ToString(id.type);
    if (std::string_view(name) == "unknown-object-type") {
        std::snprintf(buf, sizeof(buf), "[%u %u]",
                      static_cast<unsigned>(id.type), static_cast<unsigned>(id.instance));
    } else {
        std::snprintf(buf, sizeof(buf), "[%s %u]", name, static_cast<unsigned>(id.instance));
    }
    return std::string(buf);
}

} // namespace BACN
