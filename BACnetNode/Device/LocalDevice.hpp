#pragma once

#include <cstdint>
#include <memory>
#include <mutex>

#include "../Transport/ITransport.hpp"
#include "LocalDeviceConfig.hpp"

namespace BACN::Device {

enum class DeviceState : uint8_t {
    Uninitialized,  // Transport created, port not bound
    Initialized,    // Port bound, serving traffic
    Terminated      // Port released or bind failed; never reused
};

[[nodiscard]] constexpr const char* ToString(DeviceState state) noexcept {
    switch (state) {
        case DeviceState::Uninitialized: return "Uninitialized";
        case DeviceState::Initialized:   return "Initialized";
        case DeviceState::Terminated:    return "Terminated";
    }
    return "Unknown";
}

constexpr bool IsValidTransition(DeviceState from, DeviceState to) noexcept {
    switch (from) {
        case DeviceState::Uninitialized:
            // bind succeeded, or bind failed
            return to == DeviceState::Initialized || to == DeviceState::Terminated;

        case DeviceState::Initialized:
            return to == DeviceState::Terminated;

        case DeviceState::Terminated:
            return false;
    }
    return false;
}

static_assert(!IsValidTransition(DeviceState::Terminated, DeviceState::Initialized),
              "A terminated device is never reused");
static_assert(IsValidTransition(DeviceState::Uninitialized, DeviceState::Terminated),
              "A failed bind terminates the instance");

/**
 * @brief One live local BACnet endpoint.
 *
 * Owns its transport exclusively. Destroying an initialized device releases
 * its port.
 */
class LocalDevice {
public:
    LocalDevice(LocalDeviceConfig config, std::unique_ptr<Transport::ILocalTransport> transport);
    ~LocalDevice();

    LocalDevice(const LocalDevice&) = delete;
    LocalDevice& operator=(const LocalDevice&) = delete;

    /// Uninitialized -> Initialized. BindError moves the device to Terminated.
    Result<void> Initialize();

    /// Initialized -> Terminated. Any other state is a no-op. Transport errors are logged only.
    void Terminate();

    [[nodiscard]] DeviceState State() const;
    [[nodiscard]] bool IsInitialized() const { return State() == DeviceState::Initialized; }

    [[nodiscard]] const LocalDeviceConfig& Config() const noexcept { return config_; }
    [[nodiscard]] DeviceId Id() const noexcept { return config_.deviceId; }

    /// Tunables as currently held by the transport.
    [[nodiscard]] DeviceTunables Tunables() const;
    void ApplyTunables(const DeviceTunables& tunables);

    [[nodiscard]] Transport::ILocalTransport& Endpoint() noexcept { return *transport_; }
    [[nodiscard]] const Transport::ILocalTransport& Endpoint() const noexcept { return *transport_; }

private:
    bool TransitionTo(DeviceState next);

    const LocalDeviceConfig config_;
    std::unique_ptr<Transport::ILocalTransport> transport_;

    mutable std::mutex lock_;
    DeviceState state_{DeviceState::Uninitialized};
};

} // namespace BACN::Device
