#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include "../../Core/Scheduler.hpp"
#include "../ITransport.hpp"
#include "SimRemoteDevice.hpp"

namespace BACN::Transport::Sim {

class SimTransport;

/**
 * @brief In-process BACnet/IP segment.
 *
 * Enforces the observable behaviour of a real stack:
 *   - one live endpoint per UDP port
 *   - completions and I-Am traffic arrive on the network's own thread
 *   - silent or offline devices cost the caller its full timeout budget
 *
 * Must outlive every SimTransport created against it.
 */
class SimNetwork {
public:
    SimNetwork();
    ~SimNetwork();

    SimNetwork(const SimNetwork&) = delete;
    SimNetwork& operator=(const SimNetwork&) = delete;

    // ---- population ----
    std::shared_ptr<SimRemoteDevice> AddDevice(std::shared_ptr<SimRemoteDevice> device);
    void RemoveDevice(DeviceId id);
    [[nodiscard]] std::shared_ptr<SimRemoteDevice> FindDevice(DeviceId id) const;
    [[nodiscard]] std::vector<std::shared_ptr<SimRemoteDevice>> Devices() const;

    // ---- one-way latency applied to every delivery ----
    void SetLatency(std::chrono::milliseconds latency) noexcept { latencyMs_.store(latency.count()); }
    [[nodiscard]] std::chrono::milliseconds Latency() const noexcept {
        return std::chrono::milliseconds(latencyMs_.load());
    }

    // ---- port registry ----
    [[nodiscard]] bool Bind(uint16_t port, SimTransport* endpoint);
    void Unbind(uint16_t port, const SimTransport* endpoint);
    [[nodiscard]] bool IsPortBound(uint16_t port) const;

    // ---- traffic, called by SimTransport ----
    void Broadcast(DeviceId sender, std::optional<uint16_t> destinationPort,
                   const UnconfirmedRequest& request);
    void Deliver(DeviceId sender, const RemoteDeviceInfo& target, const ConfirmedRequest& request,
                 std::chrono::milliseconds timeoutBudget, CompletionCallback callback);

    // Synchronous object read used by extended device information.
    [[nodiscard]] std::optional<ObjectRecord> ReadDeviceObject(DeviceId id) const;

    /// Waits until every queued delivery, including delayed ones, has run.
    void Flush() { scheduler_.Drain(); }

    [[nodiscard]] size_t BroadcastCount() const noexcept { return broadcasts_.load(); }

    [[nodiscard]] Core::Scheduler& Dispatcher() noexcept { return scheduler_; }

private:
    void DeliverIAm(const RemoteDeviceInfo& info);
    void DeliverIHave(DeviceId from, const ObjectIdentifier& object, const std::string& name);

    mutable std::mutex lock_;
    std::map<DeviceId, std::shared_ptr<SimRemoteDevice>> devices_;
    std::map<uint16_t, SimTransport*> bound_;
    std::atomic<int64_t> latencyMs_{1};
    std::atomic<size_t> broadcasts_{0};

    // Declared last: destroyed (and joined) first.
    Core::Scheduler scheduler_{"sim-network"};
};

/// Creates SimTransport endpoints bound to one SimNetwork.
class SimTransportFactory : public ITransportFactory {
public:
    explicit SimTransportFactory(SimNetwork& network) : network_(network) {}

    [[nodiscard]] std::unique_ptr<ILocalTransport> Create(const TransportParams& params) override;

private:
    SimNetwork& network_;
};

} // namespace BACN::Transport::Sim
