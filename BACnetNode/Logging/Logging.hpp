#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

#include <fmt/printf.h>
#include <spdlog/spdlog.h>

#ifndef BACN_DEBUG_SIM_NETWORK
#define BACN_DEBUG_SIM_NETWORK 0
#endif

#ifndef BACN_DEBUG_OBJECT_TABLE
#define BACN_DEBUG_OBJECT_TABLE 0
#endif

//
// One spdlog logger per subsystem. The logger name is the category, so every
// line carries a stable prefix that can be filtered on.
//

namespace BACN::Logging {
const std::shared_ptr<spdlog::logger>& Node();
const std::shared_ptr<spdlog::logger>& Device();
const std::shared_ptr<spdlog::logger>& Discovery();
const std::shared_ptr<spdlog::logger>& Request();
const std::shared_ptr<spdlog::logger>& Remote();
const std::shared_ptr<spdlog::logger>& Backup();
const std::shared_ptr<spdlog::logger>& Transport();

// Applies the sink pattern and the global spdlog level. Safe to call repeatedly.
void Configure(spdlog::level::level_enum level);
} // namespace BACN::Logging

// ----- time helpers (header-only) -----
namespace BACN::LogDetail {
inline uint64_t NowNs() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count());
}
struct RlState {
    std::atomic<uint64_t> last_ns{0};
    std::atomic<uint64_t> suppressed{0};
};
} // namespace BACN::LogDetail

// ----- Plain logging (printf-style formats, category-stable logger names) -----
#define BACN_LOG(cat, format, ...) \
    ::BACN::Logging::cat()->info(::fmt::sprintf(format, ##__VA_ARGS__))

#define BACN_LOG_TYPE(cat, level, format, ...) \
    ::BACN::Logging::cat()->log((level), ::fmt::sprintf(format, ##__VA_ARGS__))

// ----- Rate-limited logging -----
// key: per-callsite stable string (e.g. "rpm/timeout"); interval_ms: throttle window
#define BACN_LOG_RL(cat, key, interval_ms, level, format, ...)                                   \
    do {                                                                                        \
        static ::BACN::LogDetail::RlState _s;                                                   \
        const uint64_t _now = ::BACN::LogDetail::NowNs();                                       \
        const uint64_t _intv = (uint64_t)(interval_ms) * 1000000ull;                            \
        uint64_t _last = _s.last_ns.load(std::memory_order_relaxed);                            \
        if (_now - _last >= _intv || _last == 0) {                                              \
            if (_s.last_ns.exchange(_now, std::memory_order_relaxed) != 0) {                    \
                uint64_t _lost = _s.suppressed.exchange(0, std::memory_order_relaxed);          \
                if (_lost) {                                                                    \
                    ::BACN::Logging::cat()->log((level),                                        \
                        ::fmt::sprintf("[%s] (suppressed=%llu prior)", key,                     \
                                       (unsigned long long)_lost));                             \
                }                                                                               \
            }                                                                                   \
            ::BACN::Logging::cat()->log((level),                                                \
                ::fmt::sprintf("[%s] " format, key, ##__VA_ARGS__));                            \
        } else {                                                                                \
            _s.suppressed.fetch_add(1, std::memory_order_relaxed);                              \
        }                                                                                       \
    } while (0)

// Convenience shorthands
#define BACN_LOG_INFO(cat, format, ...)    BACN_LOG_TYPE(cat, spdlog::level::info,     format, ##__VA_ARGS__)
#define BACN_LOG_ERROR(cat, format, ...)   BACN_LOG_TYPE(cat, spdlog::level::err,      format, ##__VA_ARGS__)
#define BACN_LOG_WARNING(cat, format, ...) BACN_LOG_TYPE(cat, spdlog::level::warn,     format, ##__VA_ARGS__)
#define BACN_LOG_DEBUG(cat, format, ...)   BACN_LOG_TYPE(cat, spdlog::level::debug,    format, ##__VA_ARGS__)
#define BACN_LOG_FAULT(cat, format, ...)   BACN_LOG_TYPE(cat, spdlog::level::critical, format, ##__VA_ARGS__)

// ----- Site-aware structured logging -----
#ifndef __FILE_NAME__
#define __FILE_NAME__ __FILE__
#endif

#define BACN_LOG_SITE(cat, format, ...) \
    BACN_LOG(cat, "%s:%d %s | " format, __FILE_NAME__, __LINE__, __func__, ##__VA_ARGS__)

// ----- Correlated logging with device/invoke ids (parseable k=v format) -----
#define BACN_LOG_KV(cat, service, deviceId, invokeId, format, ...) \
    BACN_LOG_SITE(cat, "svc=%s dev=%u invoke=%u " format, service, (unsigned)(deviceId), \
                  (unsigned)(invokeId), ##__VA_ARGS__)

#if BACN_DEBUG_SIM_NETWORK
#define BACN_LOG_SIM(format, ...) BACN_LOG_DEBUG(Transport, format, ##__VA_ARGS__)
#else
#define BACN_LOG_SIM(format, ...)
#endif

#if BACN_DEBUG_OBJECT_TABLE
#define BACN_LOG_OBJECT_TABLE(format, ...) BACN_LOG_DEBUG(Device, format, ##__VA_ARGS__)
#else
#define BACN_LOG_OBJECT_TABLE(format, ...)
#endif

// ============================================================================
// Runtime Verbosity-Aware Logging Macros
// ============================================================================
//
// Usage:
//   BACN_LOG_V0(Request, "Request failed");        // Level 0+ (always logs errors)
//   BACN_LOG_V1(Discovery, "Found %zu devices");   // Level 1+ (compact summaries)
//   BACN_LOG_V2(Device, "State transition");       // Level 2+ (key transitions)
//   BACN_LOG_V3(Request, "Detailed flow");         // Level 3+ (verbose)
//   BACN_LOG_V4(Transport, "Debug dump");          // Level 4+ (full diagnostics)
//
// Verbosity levels come from the "logging" object of the settings document or
// the BACNODE_LOG_LEVEL environment variable (see LogConfig).
//

namespace BACN {
class LogConfig;
}

#define BACN_GET_VERBOSITY(category) \
    (::BACN::LogConfig::Shared().Get##category##Verbosity())

#define BACN_LOG_V0(category, format, ...) \
    do { \
        if (BACN_GET_VERBOSITY(category) >= 0) { \
            BACN_LOG(category, format, ##__VA_ARGS__); \
        } \
    } while (0)

#define BACN_LOG_V1(category, format, ...) \
    do { \
        if (BACN_GET_VERBOSITY(category) >= 1) { \
            BACN_LOG(category, format, ##__VA_ARGS__); \
        } \
    } while (0)

#define BACN_LOG_V2(category, format, ...) \
    do { \
        if (BACN_GET_VERBOSITY(category) >= 2) { \
            BACN_LOG(category, format, ##__VA_ARGS__); \
        } \
    } while (0)

#define BACN_LOG_V3(category, format, ...) \
    do { \
        if (BACN_GET_VERBOSITY(category) >= 3) { \
            BACN_LOG_DEBUG(category, format, ##__VA_ARGS__); \
        } \
    } while (0)

#define BACN_LOG_V4(category, format, ...) \
    do { \
        if (BACN_GET_VERBOSITY(category) >= 4) { \
            BACN_LOG_DEBUG(category, format, ##__VA_ARGS__); \
        } \
    } while (0)
