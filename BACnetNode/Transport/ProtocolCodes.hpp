#pragma once

#include <cstdint>

namespace BACN::Protocol {

// ============================================================================
// Abort / Reject reasons (ASHRAE 135 §21, BACnetAbortReason / BACnetRejectReason)
// Unknown numeric values are carried through the enum unchanged.
// ============================================================================

enum class AbortReason : uint8_t {
    Other = 0,
    BufferOverflow = 1,
    InvalidApduInThisState = 2,
    PreemptedByHigherPriorityTask = 3,
    SegmentationNotSupported = 4,
    SecurityError = 5,
    InsufficientSecurity = 6,
    WindowSizeOutOfRange = 7,
    ApplicationExceededReplyTime = 8,
    OutOfResources = 9,
    TsmTimeout = 10,
    ApduTooLong = 11,
};

enum class RejectReason : uint8_t {
    Other = 0,
    BufferOverflow = 1,
    InconsistentParameters = 2,
    InvalidParameterDataType = 3,
    InvalidTag = 4,
    MissingRequiredParameter = 5,
    ParameterOutOfRange = 6,
    TooManyArguments = 7,
    UndefinedEnumeration = 8,
    UnrecognizedService = 9,
};

enum class ErrorClass : uint16_t {
    Device = 0,
    Object = 1,
    Property = 2,
    Resources = 3,
    Security = 4,
    Services = 5,
    Vt = 6,
    Communication = 7,
};

enum class ErrorCode : uint16_t {
    Other = 0,
    ConfigurationInProgress = 2,
    DeviceBusy = 3,
    DynamicCreationNotSupported = 4,
    InconsistentParameters = 7,
    InvalidDataType = 9,
    MissingRequiredParameter = 16,
    NoObjectsOfSpecifiedType = 17,
    NoSpaceForObject = 18,
    NoSpaceToWriteProperty = 20,
    ObjectDeletionNotPermitted = 23,
    ObjectIdentifierAlreadyExists = 24,
    OperationalProblem = 25,
    ServiceRequestDenied = 29,
    Timeout = 30,
    UnknownObject = 31,
    UnknownProperty = 32,
    UnsupportedObjectType = 36,
    ValueOutOfRange = 37,
    WriteAccessDenied = 40,
    CovSubscriptionFailed = 43,
    NotCovProperty = 44,
};

// Raw wire values to enums. Values outside the named set are kept as-is.
[[nodiscard]] constexpr AbortReason DecodeAbortReason(uint32_t raw) noexcept {
    return static_cast<AbortReason>(raw & 0xFF);
}
[[nodiscard]] constexpr RejectReason DecodeRejectReason(uint32_t raw) noexcept {
    return static_cast<RejectReason>(raw & 0xFF);
}
[[nodiscard]] constexpr ErrorClass DecodeErrorClass(uint32_t raw) noexcept {
    return static_cast<ErrorClass>(raw & 0xFFFF);
}
[[nodiscard]] constexpr ErrorCode DecodeErrorCode(uint32_t raw) noexcept {
    return static_cast<ErrorCode>(raw & 0xFFFF);
}

[[nodiscard]] const char* ToString(AbortReason reason) noexcept;
[[nodiscard]] const char* ToString(RejectReason reason) noexcept;
[[nodiscard]] const char* ToString(ErrorClass errorClass) noexcept;
[[nodiscard]] const char* ToString(ErrorCode code) noexcept;

} // namespace BACN::Protocol
