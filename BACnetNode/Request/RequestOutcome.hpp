#pragma once

#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include <fmt/format.h>

#include "../Transport/ProtocolCodes.hpp"

namespace BACN::Request {

// ============================================================================
// Terminal outcomes of one confirmed request
// ============================================================================

template <typename T>
struct Success {
    T value;
};

struct Abort {
    Protocol::AbortReason reason{Protocol::AbortReason::Other};
};

struct Reject {
    Protocol::RejectReason reason{Protocol::RejectReason::Other};
};

struct RemoteError {
    Protocol::ErrorClass errorClass{Protocol::ErrorClass::Device};
    Protocol::ErrorCode errorCode{Protocol::ErrorCode::Other};
};

struct Timeout {
    std::string detail;
};

template <typename T>
using RequestOutcome = std::variant<Success<T>, Abort, Reject, RemoteError, Timeout>;

enum class OutcomeKind : uint8_t { Success, Abort, Reject, Error, Timeout };

[[nodiscard]] constexpr const char* ToString(OutcomeKind kind) noexcept {
    switch (kind) {
        case OutcomeKind::Success: return "success";
        case OutcomeKind::Abort:   return "abort";
        case OutcomeKind::Reject:  return "reject";
        case OutcomeKind::Error:   return "error";
        case OutcomeKind::Timeout: return "timeout";
    }
    return "unknown";
}

// Variant order matches OutcomeKind.
template <typename T>
[[nodiscard]] OutcomeKind KindOf(const RequestOutcome<T>& outcome) noexcept {
    return static_cast<OutcomeKind>(outcome.index());
}

template <typename T>
[[nodiscard]] bool IsSuccess(const RequestOutcome<T>& outcome) noexcept {
    return std::holds_alternative<Success<T>>(outcome);
}

/// Value of a successful outcome, nullptr otherwise.
template <typename T>
[[nodiscard]] const T* ValueOf(const RequestOutcome<T>& outcome) noexcept {
    const auto* success = std::get_if<Success<T>>(&outcome);
    return success ? &success->value : nullptr;
}

/**
 * @brief Map the success value, carry any failure over unchanged.
 *
 * fn is called with const T& and returns U.
 */
template <typename U, typename T, typename Fn>
[[nodiscard]] RequestOutcome<U> Transform(const RequestOutcome<T>& outcome, Fn&& fn) {
    return std::visit([&fn](const auto& alt) -> RequestOutcome<U> {
        using Alt = std::decay_t<decltype(alt)>;
        if constexpr (std::is_same_v<Alt, Success<T>>) {
            return Success<U>{fn(alt.value)};
        } else {
            return alt;
        }
    }, outcome);
}

template <typename T>
[[nodiscard]] std::string Describe(const RequestOutcome<T>& outcome) {
    return std::visit([](const auto& alt) -> std::string {
        using Alt = std::decay_t<decltype(alt)>;
        if constexpr (std::is_same_v<Alt, Success<T>>) {
            return "success";
        } else if constexpr (std::is_same_v<Alt, Abort>) {
            return fmt::format("abort ({})", Protocol::ToString(alt.reason));
        } else if constexpr (std::is_same_v<Alt, Reject>) {
            return fmt::format("reject ({})", Protocol::ToString(alt.reason));
        } else if constexpr (std::is_same_v<Alt, RemoteError>) {
            return fmt::format("error ({}/{})", Protocol::ToString(alt.errorClass),
                               Protocol::ToString(alt.errorCode));
        } else {
            return fmt::format("timeout ({})", alt.detail);
        }
    }, outcome);
}

} // namespace BACN::Request
