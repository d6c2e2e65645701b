#include "LocalDevice.hpp"

#include "../Logging/LogConfig.hpp"

namespace BACN::Device {

LocalDevice::LocalDevice(LocalDeviceConfig config, std::unique_ptr<Transport::ILocalTransport> transport)
    : config_(std::move(config)), transport_(std::move(transport)) {
    transport_->SetPort(config_.port);
    transport_->SetTimeout(config_.apduTimeoutMs);
    transport_->SetRetries(config_.retries);
    transport_->SetSegTimeout(config_.segTimeoutMs);
    transport_->SetSegWindow(config_.segWindow);
}

LocalDevice::~LocalDevice() {
    Terminate();
}

bool LocalDevice::TransitionTo(DeviceState next) {
    if (!IsValidTransition(state_, next)) {
        BACN_LOG_ERROR(Device, "Device %u: illegal transition %s -> %s",
                       config_.deviceId, ToString(state_), ToString(next));
        return false;
    }
    BACN_LOG_V2(Device, "Device %u: %s -> %s", config_.deviceId, ToString(state_), ToString(next));
    state_ = next;
    return true;
}

Result<void> LocalDevice::Initialize() {
    std::lock_guard<std::mutex> guard(lock_);
    switch (state_) {
        case DeviceState::Initialized:
            return {};
        case DeviceState::Terminated:
            return BACN_ERROR_STATE("Device was terminated and cannot be reinitialized");
        case DeviceState::Uninitialized:
            break;
    }

    auto bound = transport_->Initialize();
    if (!bound) {
        TransitionTo(DeviceState::Terminated);
        BACN_LOG_WARNING(Device, "Device %u: bind on port %u failed (%s)",
                         config_.deviceId, config_.port, ToString(bound.error().status));
        return std::unexpected(bound.error());
    }
    TransitionTo(DeviceState::Initialized);
    BACN_LOG_V1(Device, "Device %u initialized on %s:%u", config_.deviceId,
                config_.localAddress, config_.port);
    return {};
}

void LocalDevice::Terminate() {
    std::lock_guard<std::mutex> guard(lock_);
    if (state_ != DeviceState::Initialized) {
        // Nothing bound: uninitialized or already terminated.
        return;
    }
    auto released = transport_->Terminate();
    if (!released) {
        released.error().LogAsWarning();
    }
    TransitionTo(DeviceState::Terminated);
    BACN_LOG_V1(Device, "Device %u terminated, port %u released", config_.deviceId, config_.port);
}

DeviceState LocalDevice::State() const {
    std::lock_guard<std::mutex> guard(lock_);
    return state_;
}

DeviceTunables LocalDevice::Tunables() const {
    DeviceTunables tunables;
    tunables.retries = transport_->Retries();
    tunables.segTimeoutMs = transport_->SegTimeout();
    tunables.segWindow = transport_->SegWindow();
    tunables.timeoutMs = transport_->Timeout();
    return tunables;
}

void LocalDevice::ApplyTunables(const DeviceTunables& tunables) {
    transport_->SetRetries(tunables.retries);
    transport_->SetSegTimeout(tunables.segTimeoutMs);
    transport_->SetSegWindow(tunables.segWindow);
    transport_->SetTimeout(tunables.timeoutMs);
}

} // namespace BACN::Device
