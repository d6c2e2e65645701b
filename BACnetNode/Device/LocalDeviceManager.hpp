#pragma once

#include <memory>
#include <mutex>
#include <vector>

#include "../Transport/ITransport.hpp"
#include "ConfigBackup.hpp"
#include "LocalDevice.hpp"

namespace BACN::Device {

/**
 * @brief Node context: the single current local device and its object table.
 *
 * Every other component receives this by reference. The current device is
 * replaced, never mutated into another device, on Create() and Reset();
 * readers re-fetch Current() instead of caching it across a reset.
 *
 * Concurrent Reset() calls must be serialized by the caller.
 */
class LocalDeviceManager {
public:
    explicit LocalDeviceManager(Transport::ITransportFactory& factory);
    ~LocalDeviceManager();

    LocalDeviceManager(const LocalDeviceManager&) = delete;
    LocalDeviceManager& operator=(const LocalDeviceManager&) = delete;

    // ---- lifecycle ----

    /// New uninitialized device from overrides + defaults. Replaces the current one.
    Result<std::shared_ptr<LocalDevice>> Create(const ConfigOverrides& overrides = {});

    /// Bind the current device. NotInitialized without one, BindError, InvalidState.
    Result<void> Initialize();

    /// Release the port. No-op unless the current device is initialized.
    void Terminate();

    /// Terminate, rebuild from Backup() merged with overrides, reinitialize, replay objects.
    Result<void> Reset(const ConfigOverrides& overrides = {});

    /// Same as Reset() but starting from an arbitrary snapshot (used at boot).
    Result<void> Restore(const ConfigBackup& snapshot, const ConfigOverrides& overrides = {});

    /// Terminate and forget the current device and its configuration.
    void ClearAll();

    // ---- queries ----

    [[nodiscard]] std::shared_ptr<LocalDevice> Current() const;
    [[nodiscard]] Result<LocalDeviceConfig> Config() const;
    [[nodiscard]] bool IsInitialized() const;

    /// Current device if it is initialized, NotInitialized otherwise.
    [[nodiscard]] Result<std::shared_ptr<LocalDevice>> RequireInitialized() const;

    // ---- local object table (the device object itself is not listed) ----

    [[nodiscard]] Result<std::vector<ObjectRecord>> LocalObjects() const;
    [[nodiscard]] Result<ObjectRecord> GetObject(const ObjectIdentifier& id) const;

    /// Upsert by identifier. object-identifier and object-type are never altered.
    Result<ObjectRecord> AddOrUpdateObject(const ObjectRecord& record);

    Result<void> RemoveObject(const ObjectIdentifier& id);
    Result<void> RemoveAllObjects();

    // ---- persistence ----

    [[nodiscard]] Result<ConfigBackup> Backup() const;

private:
    [[nodiscard]] Result<std::shared_ptr<LocalDevice>> RequireDevice() const;
    Result<std::shared_ptr<LocalDevice>> Install(const LocalDeviceConfig& config);

    Transport::ITransportFactory& factory_;

    mutable std::mutex lock_;
    std::shared_ptr<LocalDevice> current_;
};

} // namespace BACN::Device
