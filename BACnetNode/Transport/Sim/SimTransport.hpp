#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "../../Common/ObjectTable.hpp"
#include "../ITransport.hpp"

namespace BACN::Transport::Sim {

class SimNetwork;

struct IHaveNotice {
    DeviceId from{0};
    ObjectIdentifier object;
    std::string objectName;
};

/// ILocalTransport endpoint on a SimNetwork.
class SimTransport final : public ILocalTransport {
public:
    SimTransport(SimNetwork& network, TransportParams params);
    ~SimTransport() override;

    void SetPort(uint16_t port) override { port_.store(port); }
    uint16_t Port() const override { return port_.load(); }
    void SetTimeout(uint32_t timeoutMs) override { timeoutMs_.store(timeoutMs); }
    uint32_t Timeout() const override { return timeoutMs_.load(); }
    void SetRetries(uint32_t retries) override { retries_.store(retries); }
    uint32_t Retries() const override { return retries_.load(); }
    void SetSegTimeout(uint32_t segTimeoutMs) override { segTimeoutMs_.store(segTimeoutMs); }
    uint32_t SegTimeout() const override { return segTimeoutMs_.load(); }
    void SetSegWindow(uint32_t segWindow) override { segWindow_.store(segWindow); }
    uint32_t SegWindow() const override { return segWindow_.load(); }

    Result<void> Initialize() override;
    Result<void> Terminate() override;
    bool IsInitialized() const override { return initialized_.load(); }
    DeviceId LocalDeviceId() const override { return params_.deviceId; }

    Result<void> SendBroadcast(uint16_t port, const UnconfirmedRequest& request) override;
    Result<void> SendGlobalBroadcast(const UnconfirmedRequest& request) override;
    Result<void> Send(const RemoteDeviceInfo& device, const ConfirmedRequest& request,
                      CompletionCallback callback) override;

    std::vector<RemoteDeviceInfo> GetRemoteDevices() const override;
    std::optional<RemoteDeviceInfo> GetRemoteDevice(DeviceId id) const override;
    Result<RemoteDeviceInfo> GetExtendedDeviceInformation(DeviceId id) override;

    Result<void> AddObject(const ObjectRecord& record) override;
    Result<ObjectRecord> GetObject(const ObjectIdentifier& id) const override;
    Result<void> SetProperty(const ObjectIdentifier& id, PropertyId property,
                             const PropertyValue& value) override;
    Result<void> RemoveObject(const ObjectIdentifier& id) override;
    std::vector<ObjectRecord> GetLocalObjects() const override;

    // ---- called by SimNetwork on its dispatcher thread ----
    void OnIAm(const RemoteDeviceInfo& info);
    void OnIHave(const IHaveNotice& notice);

    [[nodiscard]] std::vector<IHaveNotice> ReceivedIHave() const;
    [[nodiscard]] const TransportParams& Params() const noexcept { return params_; }

private:
    SimNetwork& network_;
    const TransportParams params_;

    std::atomic<uint16_t> port_{kDefaultBACnetPort};
    std::atomic<uint32_t> timeoutMs_{6000};
    std::atomic<uint32_t> retries_{2};
    std::atomic<uint32_t> segTimeoutMs_{5000};
    std::atomic<uint32_t> segWindow_{5};

    std::atomic<bool> initialized_{false};
    std::atomic<bool> terminated_{false};
    uint16_t boundPort_{0};

    ObjectTable localObjects_;

    mutable std::mutex lock_;
    std::map<DeviceId, RemoteDeviceInfo> remoteDevices_;
    std::vector<IHaveNotice> iHave_;
};

} // namespace BACN::Transport::Sim
