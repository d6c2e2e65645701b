//
// LogConfig.hpp
// BACnetNode
//
// Runtime logging configuration singleton
// Reads verbosity levels from the settings document and supports runtime updates
//

#ifndef BACN_LOGGING_LOGCONFIG_HPP
#define BACN_LOGGING_LOGCONFIG_HPP

#include <stdint.h>
#include <atomic>

#include <nlohmann/json_fwd.hpp>

namespace BACN {

/**
 * @brief Centralized logging configuration manager
 *
 * Reads verbosity settings from the "logging" object of a settings document:
 * - "device" (integer 0-4): LocalDevice lifecycle and object table
 * - "discovery" (integer 0-4): Who-Is/Who-Has and the remote device table
 * - "request" (integer 0-4): RequestBridge round-trips
 * - "remote" (integer 0-4): RemoteObjectAccessor compositions
 * - "backup" (integer 0-4): backup file I/O
 * - "transport" (integer 0-4): transport / simulated network
 * - "node" (integer 0-4): boot and shutdown
 *
 * BACNODE_LOG_LEVEL (0-4) in the environment overrides every category at once.
 *
 * Thread-safe singleton with runtime update support.
 */
class LogConfig {
public:
    /**
     * @brief Get singleton instance
     */
    static LogConfig& Shared();

    /**
     * @brief Initialize from a settings document
     * @param settings Root settings object; only its "logging" member is read
     *
     * Must be called once during boot. Later calls are ignored.
     */
    void Initialize(const nlohmann::json& settings);

    /**
     * @brief Apply BACNODE_LOG_LEVEL if set
     * @return true when the variable was present and valid
     */
    bool ApplyEnvironment();

    // ========================================================================
    // Getters (thread-safe, const)
    // ========================================================================

    uint8_t GetNodeVerbosity() const;
    uint8_t GetDeviceVerbosity() const;

    /**
     * @brief Get Discovery subsystem verbosity level (0-4)
     */
    uint8_t GetDiscoveryVerbosity() const;

    /**
     * @brief Get RequestBridge verbosity level (0-4)
     */
    uint8_t GetRequestVerbosity() const;
    uint8_t GetRemoteVerbosity() const;
    uint8_t GetBackupVerbosity() const;
    uint8_t GetTransportVerbosity() const;

    // ========================================================================
    // Runtime Setters (thread-safe)
    // ========================================================================

    void SetNodeVerbosity(uint8_t level);
    void SetDeviceVerbosity(uint8_t level);
    void SetDiscoveryVerbosity(uint8_t level);
    void SetRequestVerbosity(uint8_t level);
    void SetRemoteVerbosity(uint8_t level);
    void SetBackupVerbosity(uint8_t level);
    void SetTransportVerbosity(uint8_t level);

    /**
     * @brief Set every category to the same level
     */
    void SetAllVerbosity(uint8_t level);

private:
    LogConfig();
    ~LogConfig();

    // Non-copyable
    LogConfig(const LogConfig&) = delete;
    LogConfig& operator=(const LogConfig&) = delete;

    /**
     * @brief Helper to read a uint8 level from the "logging" object
     */
    static uint8_t ReadLevel(const nlohmann::json& logging, const char* key, uint8_t defaultValue);

    /**
     * @brief Clamp verbosity level to valid range [0, 4]
     */
    static uint8_t ClampLevel(uint8_t level);

    std::atomic<uint8_t> nodeVerbosity_;
    std::atomic<uint8_t> deviceVerbosity_;
    std::atomic<uint8_t> discoveryVerbosity_;
    std::atomic<uint8_t> requestVerbosity_;
    std::atomic<uint8_t> remoteVerbosity_;
    std::atomic<uint8_t> backupVerbosity_;
    std::atomic<uint8_t> transportVerbosity_;
    std::atomic<bool> initialized_;
};

} // namespace BACN

#endif // BACN_LOGGING_LOGCONFIG_HPP
