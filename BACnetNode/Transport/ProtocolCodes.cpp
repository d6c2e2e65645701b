#include "ProtocolCodes.hpp"

namespace BACN::Protocol {

const char* ToString(AbortReason reason) noexcept {
    switch (reason) {
        case AbortReason::Other:                         return "other";
        case AbortReason::BufferOverflow:                return "buffer-overflow";
        case AbortReason::InvalidApduInThisState:        return "invalid-apdu-in-this-state";
        case AbortReason::PreemptedByHigherPriorityTask: return "preempted-by-higher-priority-task";
        case AbortReason::SegmentationNotSupported:      return "segmentation-not-supported";
        case AbortReason::SecurityError:                 return "security-error";
        case AbortReason::InsufficientSecurity:          return "insufficient-security";
        case AbortReason::WindowSizeOutOfRange:          return "window-size-out-of-range";
        case AbortReason::ApplicationExceededReplyTime:  return "application-exceeded-reply-time";
        case AbortReason::OutOfResources:                return "out-of-resources";
        case AbortReason::TsmTimeout:                    return "tsm-timeout";
        case AbortReason::ApduTooLong:                   return "apdu-too-long";
    }
    return "unknown-abort-reason";
}

const char* ToString(RejectReason reason) noexcept {
    switch (reason) {
        case RejectReason::Other:                    return "other";
        case RejectReason::BufferOverflow:           return "buffer-overflow";
        case RejectReason::InconsistentParameters:   return "inconsistent-parameters";
        case RejectReason::InvalidParameterDataType: return "invalid-parameter-data-type";
        case RejectReason::InvalidTag:               return "invalid-tag";
        case RejectReason::MissingRequiredParameter: return "missing-required-parameter";
        case RejectReason::ParameterOutOfRange:      return "parameter-out-of-range";
        case RejectReason::TooManyArguments:         return "too-many-arguments";
        case RejectReason::UndefinedEnumeration:     return "undefined-enumeration";
        case RejectReason::UnrecognizedService:      return "unrecognized-service";
    }
    return "unknown-reject-reason";
}

const char* ToString(ErrorClass errorClass) noexcept {
    switch (errorClass) {
        case ErrorClass::Device:        return "device";
        case ErrorClass::Object:        return "object";
        case ErrorClass::Property:      return "property";
        case ErrorClass::Resources:     return "resources";
        case ErrorClass::Security:      return "security";
        case ErrorClass::Services:      return "services";
        case ErrorClass::Vt:            return "vt";
        case ErrorClass::Communication: return "communication";
    }
    return "unknown-error-class";
}

const char* ToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Other:                         return "other";
        case ErrorCode::ConfigurationInProgress:       return "configuration-in-progress";
        case ErrorCode::DeviceBusy:                    return "device-busy";
        case ErrorCode::DynamicCreationNotSupported:   return "dynamic-creation-not-supported";
        case ErrorCode::InconsistentParameters:        return "inconsistent-parameters";
        case ErrorCode::InvalidDataType:               return "invalid-data-type";
        case ErrorCode::MissingRequiredParameter:      return "missing-required-parameter";
        case ErrorCode::NoObjectsOfSpecifiedType:      return "no-objects-of-specified-type";
        case ErrorCode::NoSpaceForObject:              return "no-space-for-object";
        case ErrorCode::NoSpaceToWriteProperty:        return "no-space-to-write-property";
        case ErrorCode::ObjectDeletionNotPermitted:    return "object-deletion-not-permitted";
        case ErrorCode::ObjectIdentifierAlreadyExists: return "object-identifier-already-exists";
        case ErrorCode::OperationalProblem:            return "operational-problem";
        case ErrorCode::ServiceRequestDenied:          return "service-request-denied";
        case ErrorCode::Timeout:                       return "timeout";
        case ErrorCode::UnknownObject:                 return "unknown-object";
        case ErrorCode::UnknownProperty:               return "unknown-property";
        case ErrorCode::UnsupportedObjectType:         return "unsupported-object-type";
        case ErrorCode::ValueOutOfRange:               return "value-out-of-range";
        case ErrorCode::WriteAccessDenied:             return "write-access-denied";
        case ErrorCode::CovSubscriptionFailed:         return "cov-subscription-failed";
        case ErrorCode::NotCovProperty:                return "not-cov-property";
    }
    return "unknown-error-code";
}

} // namespace BACN::Protocol
