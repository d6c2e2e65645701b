// Error.hpp - C++23 error handling with std::expected
//
// Local failures (bad configuration, port already bound, missing objects,
// missing backup) travel as Result<T>. Remote failures (Abort/Reject/Error/
// Timeout from a peer device) are NOT errors: they are RequestOutcome variants.
//
// Usage:
//   Result<uint16_t> ParsePort(uint32_t raw) {
//       if (raw == 0 || raw > 0xFFFF) {
//           return BACN_ERROR_CONFIG("Port must be in 1..65535");
//       }
//       return static_cast<uint16_t>(raw);
//   }
//
//   // Caller
//   auto port = ParsePort(47808);
//   if (!port) {
//       port.error().Log();  // Logs with file:line:function context
//       return std::unexpected(port.error());
//   }

#pragma once

#include <cstdint>
#include <expected>
#include <string_view>

#include "../Logging/Logging.hpp"

namespace BACN {

// ============================================================================
// Status codes
// ============================================================================

enum class NodeStatus : uint8_t {
    kSuccess = 0,
    kConfigError,      ///< Bad or unresolvable configuration
    kBindError,        ///< Port already bound by another live device
    kNotInitialized,   ///< Operation attempted before Initialize()
    kNotFound,         ///< Object or device absent
    kNoBackup,         ///< Restore requested with nothing saved
    kInvalidArgument,
    kInvalidState,     ///< e.g. Initialize() on a terminated device
    kIOError,
    kParseError,
};

[[nodiscard]] constexpr const char* ToString(NodeStatus status) noexcept {
    switch (status) {
        case NodeStatus::kSuccess:         return "Success";
        case NodeStatus::kConfigError:     return "ConfigError";
        case NodeStatus::kBindError:       return "BindError";
        case NodeStatus::kNotInitialized:  return "NotInitializedError";
        case NodeStatus::kNotFound:        return "NotFoundError";
        case NodeStatus::kNoBackup:        return "NoBackupError";
        case NodeStatus::kInvalidArgument: return "InvalidArgument";
        case NodeStatus::kInvalidState:    return "InvalidState";
        case NodeStatus::kIOError:         return "IOError";
        case NodeStatus::kParseError:      return "ParseError";
    }
    return "Unknown";
}

// ============================================================================
// Source Location
// ============================================================================

/// Compile-time source location tracking via compiler builtins
struct SourceLocation {
    const char* file;
    const char* function;
    int line;

    constexpr SourceLocation(
        const char* f = __builtin_FILE(),
        const char* fn = __builtin_FUNCTION(),
        int l = __builtin_LINE()) noexcept
        : file(f), function(fn), line(l) {}

    /// Extract filename from full path (strips directory)
    [[nodiscard]] constexpr std::string_view FileName() const noexcept {
        std::string_view path(file);
        auto pos = path.find_last_of('/');
        return (pos != std::string_view::npos) ? path.substr(pos + 1) : path;
    }
};

// ============================================================================
// Error Severity
// ============================================================================

enum class ErrorSeverity : uint8_t {
    /// Recoverable error - can retry or continue with degraded functionality
    Recoverable,

    /// Fatal error - cannot continue, must abort operation
    Fatal,

    /// Warning - non-blocking issue, logged but operation continues
    Warning
};

[[nodiscard]] constexpr const char* ToString(ErrorSeverity severity) noexcept {
    switch (severity) {
        case ErrorSeverity::Recoverable: return "RECOVERABLE";
        case ErrorSeverity::Fatal:       return "FATAL";
        case ErrorSeverity::Warning:     return "WARNING";
    }
    return "UNKNOWN";
}

// ============================================================================
// Error Type
// ============================================================================

struct Error {
    NodeStatus status;             ///< Error taxonomy code
    SourceLocation location;       ///< Capture site (file, line, function)
    ErrorSeverity severity;        ///< Error severity level
    const char* message;           ///< Human-readable description (static storage)

    /// Use the BACN_ERROR_* macros instead of calling this directly
    [[nodiscard]] static constexpr Error Make(
        NodeStatus status,
        ErrorSeverity sev,
        const char* msg,
        SourceLocation loc = SourceLocation()) noexcept
    {
        return Error{status, loc, sev, msg};
    }

    [[nodiscard]] constexpr bool Is(NodeStatus s) const noexcept { return status == s; }

    [[nodiscard]] constexpr bool IsRecoverable() const noexcept {
        return severity == ErrorSeverity::Recoverable;
    }

    [[nodiscard]] constexpr bool IsFatal() const noexcept {
        return severity == ErrorSeverity::Fatal;
    }

    /// Log error with full context (file, line, function, message)
    void Log() const noexcept {
        BACN_LOG_ERROR(Node,
                       "[%s] %s:%d in %s() - %s (%s)",
                       ToString(severity),
                       std::string(location.FileName()),
                       location.line,
                       location.function,
                       ToString(status),
                       message);
    }

    /// Log error as warning (for non-fatal errors)
    void LogAsWarning() const noexcept {
        BACN_LOG_WARNING(Node,
                         "[%s] %s:%d in %s() - %s (%s)",
                         ToString(severity),
                         std::string(location.FileName()),
                         location.line,
                         location.function,
                         ToString(status),
                         message);
    }
};

// ============================================================================
// Result Type (std::expected alias)
// ============================================================================

template<typename T>
using Result = std::expected<T, Error>;

// ============================================================================
// Error Creation Macros (with automatic source location)
// ============================================================================

#define BACN_ERROR_RECOVERABLE(status, msg) \
    std::unexpected(::BACN::Error::Make((status), ::BACN::ErrorSeverity::Recoverable, (msg)))

#define BACN_ERROR_FATAL(status, msg) \
    std::unexpected(::BACN::Error::Make((status), ::BACN::ErrorSeverity::Fatal, (msg)))

#define BACN_ERROR_WARNING(status, msg) \
    std::unexpected(::BACN::Error::Make((status), ::BACN::ErrorSeverity::Warning, (msg)))

#define BACN_ERROR_CONFIG(msg) \
    BACN_ERROR_FATAL(::BACN::NodeStatus::kConfigError, (msg))

#define BACN_ERROR_BIND(msg) \
    BACN_ERROR_FATAL(::BACN::NodeStatus::kBindError, (msg))

#define BACN_ERROR_NOT_INITIALIZED(msg) \
    BACN_ERROR_RECOVERABLE(::BACN::NodeStatus::kNotInitialized, (msg))

#define BACN_ERROR_NOT_FOUND(msg) \
    BACN_ERROR_RECOVERABLE(::BACN::NodeStatus::kNotFound, (msg))

#define BACN_ERROR_NO_BACKUP(msg) \
    BACN_ERROR_RECOVERABLE(::BACN::NodeStatus::kNoBackup, (msg))

#define BACN_ERROR_INVALID(msg) \
    BACN_ERROR_FATAL(::BACN::NodeStatus::kInvalidArgument, (msg))

#define BACN_ERROR_STATE(msg) \
    BACN_ERROR_FATAL(::BACN::NodeStatus::kInvalidState, (msg))

#define BACN_ERROR_IO(msg) \
    BACN_ERROR_RECOVERABLE(::BACN::NodeStatus::kIOError, (msg))

#define BACN_ERROR_PARSE(msg) \
    BACN_ERROR_FATAL(::BACN::NodeStatus::kParseError, (msg))

// ============================================================================
// Error Propagation Helpers
// ============================================================================

/// Try macro - propagate error or extract value
///
/// Usage:
///   Result<Foo> CreateFoo() {
///       auto bar = TRY(CreateBar());  // Propagates error if CreateBar() fails
///       return Foo(bar);
///   }
#define TRY(expr) \
    ({ \
        auto&& _result = (expr); \
        if (!_result) { \
            return std::unexpected(_result.error()); \
        } \
        std::move(_result).value(); \
    })

/// Try and log - propagate error with logging
#define TRY_LOG(expr) \
    ({ \
        auto&& _result = (expr); \
        if (!_result) { \
            _result.error().Log(); \
            return std::unexpected(_result.error()); \
        } \
        std::move(_result).value(); \
    })

/// Convert a boolean outcome to Result<void>
[[nodiscard]] inline Result<void> ToResult(bool ok, NodeStatus status, const char* msg,
                                            SourceLocation loc = SourceLocation()) noexcept {
    if (ok) {
        return {};
    }
    return std::unexpected(Error::Make(status, ErrorSeverity::Fatal, msg, loc));
}

/// Collapse Result<T> to its status code (logs error if present)
template<typename T>
[[nodiscard]] NodeStatus ToStatus(const Result<T>& result) noexcept {
    if (result) {
        return NodeStatus::kSuccess;
    }
    result.error().Log();
    return result.error().status;
}

} // namespace BACN
