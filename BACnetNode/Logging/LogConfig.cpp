//
// LogConfig.cpp
// BACnetNode
//
// Runtime logging configuration implementation
//

#include "LogConfig.hpp"
#include "Logging.hpp"

#include <cstdlib>
#include <string>

#include <nlohmann/json.hpp>

namespace BACN {

namespace {
constexpr uint8_t kDefaultVerbosity = 1;
constexpr uint8_t kMaxVerbosity = 4;
} // namespace

// ============================================================================
// Singleton Access
// ============================================================================

LogConfig& LogConfig::Shared() {
    static LogConfig instance;
    return instance;
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

LogConfig::LogConfig()
{
    nodeVerbosity_.store(kDefaultVerbosity);
    deviceVerbosity_.store(kDefaultVerbosity);
    discoveryVerbosity_.store(kDefaultVerbosity);
    requestVerbosity_.store(kDefaultVerbosity);
    remoteVerbosity_.store(kDefaultVerbosity);
    backupVerbosity_.store(kDefaultVerbosity);
    transportVerbosity_.store(kDefaultVerbosity);
    initialized_.store(false);
}

LogConfig::~LogConfig() = default;

// ============================================================================
// Initialization
// ============================================================================

void LogConfig::Initialize(const nlohmann::json& settings) {
    if (initialized_.load()) {
        BACN_LOG(Node, "LogConfig already initialized, skipping");
        return;
    }

    const nlohmann::json empty = nlohmann::json::object();
    const nlohmann::json& logging =
        (settings.is_object() && settings.contains("logging") && settings["logging"].is_object())
            ? settings["logging"]
            : empty;

    nodeVerbosity_.store(ReadLevel(logging, "node", kDefaultVerbosity));
    deviceVerbosity_.store(ReadLevel(logging, "device", kDefaultVerbosity));
    discoveryVerbosity_.store(ReadLevel(logging, "discovery", kDefaultVerbosity));
    requestVerbosity_.store(ReadLevel(logging, "request", kDefaultVerbosity));
    remoteVerbosity_.store(ReadLevel(logging, "remote", kDefaultVerbosity));
    backupVerbosity_.store(ReadLevel(logging, "backup", kDefaultVerbosity));
    transportVerbosity_.store(ReadLevel(logging, "transport", kDefaultVerbosity));

    ApplyEnvironment();

    initialized_.store(true);

    BACN_LOG_INFO(Node,
                  "LogConfig initialized: Node=%u Device=%u Discovery=%u Request=%u Remote=%u Backup=%u Transport=%u",
                  nodeVerbosity_.load(), deviceVerbosity_.load(), discoveryVerbosity_.load(),
                  requestVerbosity_.load(), remoteVerbosity_.load(), backupVerbosity_.load(),
                  transportVerbosity_.load());
}

bool LogConfig::ApplyEnvironment() {
    const char* env = std::getenv("BACNODE_LOG_LEVEL");
    if (env == nullptr || *env == '\0') {
        return false;
    }

    char* end = nullptr;
    const long parsed = std::strtol(env, &end, 10);
    if (end == env || *end != '\0' || parsed < 0) {
        BACN_LOG_WARNING(Node, "Ignoring BACNODE_LOG_LEVEL='%s' (expected 0-%u)", env, kMaxVerbosity);
        return false;
    }

    SetAllVerbosity(static_cast<uint8_t>(parsed > kMaxVerbosity ? kMaxVerbosity : parsed));
    return true;
}

// ============================================================================
// Getters (Thread-Safe)
// ============================================================================

uint8_t LogConfig::GetNodeVerbosity() const {
    return nodeVerbosity_.load(std::memory_order_relaxed);
}

uint8_t LogConfig::GetDeviceVerbosity() const {
    return deviceVerbosity_.load(std::memory_order_relaxed);
}

uint8_t LogConfig::GetDiscoveryVerbosity() const {
    return discoveryVerbosity_.load(std::memory_order_relaxed);
}

uint8_t LogConfig::GetRequestVerbosity() const {
    return requestVerbosity_.load(std::memory_order_relaxed);
}

uint8_t LogConfig::GetRemoteVerbosity() const {
    return remoteVerbosity_.load(std::memory_order_relaxed);
}

uint8_t LogConfig::GetBackupVerbosity() const {
    return backupVerbosity_.load(std::memory_order_relaxed);
}

uint8_t LogConfig::GetTransportVerbosity() const {
    return transportVerbosity_.load(std::memory_order_relaxed);
}

// ============================================================================
// Runtime Setters (Thread-Safe)
// ============================================================================

void LogConfig::SetNodeVerbosity(uint8_t level) {
    level = ClampLevel(level);
    nodeVerbosity_.store(level, std::memory_order_relaxed);
    BACN_LOG_INFO(Node, "Node verbosity changed to %u", level);
}

void LogConfig::SetDeviceVerbosity(uint8_t level) {
    level = ClampLevel(level);
    deviceVerbosity_.store(level, std::memory_order_relaxed);
    BACN_LOG_INFO(Node, "Device verbosity changed to %u", level);
}

void LogConfig::SetDiscoveryVerbosity(uint8_t level) {
    level = ClampLevel(level);
    discoveryVerbosity_.store(level, std::memory_order_relaxed);
    BACN_LOG_INFO(Node, "Discovery verbosity changed to %u", level);
}

void LogConfig::SetRequestVerbosity(uint8_t level) {
    level = ClampLevel(level);
    requestVerbosity_.store(level, std::memory_order_relaxed);
    BACN_LOG_INFO(Node, "Request verbosity changed to %u", level);
}

void LogConfig::SetRemoteVerbosity(uint8_t level) {
    level = ClampLevel(level);
    remoteVerbosity_.store(level, std::memory_order_relaxed);
    BACN_LOG_INFO(Node, "Remote verbosity changed to %u", level);
}

void LogConfig::SetBackupVerbosity(uint8_t level) {
    level = ClampLevel(level);
    backupVerbosity_.store(level, std::memory_order_relaxed);
    BACN_LOG_INFO(Node, "Backup verbosity changed to %u", level);
}

void LogConfig::SetTransportVerbosity(uint8_t level) {
    level = ClampLevel(level);
    transportVerbosity_.store(level, std::memory_order_relaxed);
    BACN_LOG_INFO(Node, "Transport verbosity changed to %u", level);
}

void LogConfig::SetAllVerbosity(uint8_t level) {
    level = ClampLevel(level);
    nodeVerbosity_.store(level, std::memory_order_relaxed);
    deviceVerbosity_.store(level, std::memory_order_relaxed);
    discoveryVerbosity_.store(level, std::memory_order_relaxed);
    requestVerbosity_.store(level, std::memory_order_relaxed);
    remoteVerbosity_.store(level, std::memory_order_relaxed);
    backupVerbosity_.store(level, std::memory_order_relaxed);
    transportVerbosity_.store(level, std::memory_order_relaxed);
    BACN_LOG_INFO(Node, "All verbosity levels changed to %u", level);
}

// ============================================================================
// Private Helpers
// ============================================================================

uint8_t LogConfig::ReadLevel(const nlohmann::json& logging, const char* key, uint8_t defaultValue) {
    auto it = logging.find(key);
    if (it == logging.end()) {
        return defaultValue;
    }
    if (!it->is_number_unsigned()) {
        BACN_LOG_WARNING(Node, "Logging level '%s' is not an unsigned integer, using %u", key, defaultValue);
        return defaultValue;
    }
    const auto value = it->get<uint64_t>();
    return ClampLevel(static_cast<uint8_t>(value > kMaxVerbosity ? kMaxVerbosity : value));
}

uint8_t LogConfig::ClampLevel(uint8_t level) {
    return level > kMaxVerbosity ? kMaxVerbosity : level;
}

} // namespace BACN
