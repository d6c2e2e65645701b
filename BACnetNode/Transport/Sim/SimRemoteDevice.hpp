#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "../../Common/ObjectTable.hpp"
#include "../TransportTypes.hpp"

namespace BACN::Transport::Sim {

// Scripted answer that replaces normal handling of one service.
struct Silence {};
using ScriptedFailure = std::variant<AbortPdu, RejectPdu, ErrorPdu, Silence>;

struct CovSubscription {
    DeviceId subscriber{0};
    uint32_t processId{0};
    ObjectIdentifier object;
    bool issueConfirmedNotifications{false};
    uint32_t lifetimeSeconds{0};
};

/**
 * @brief Simulated remote BACnet device.
 *
 * Owns a device object plus an object table. The device object's object-list
 * is computed on every read, so it always lists the current objects.
 */
class SimRemoteDevice {
public:
    SimRemoteDevice(DeviceId id, std::string name, uint16_t vendorId = 260,
                    std::string vendorName = "BACnetNode Simulator");

    SimRemoteDevice(const SimRemoteDevice&) = delete;
    SimRemoteDevice& operator=(const SimRemoteDevice&) = delete;

    [[nodiscard]] DeviceId Id() const noexcept { return id_; }
    [[nodiscard]] const std::string& Name() const noexcept { return name_; }
    [[nodiscard]] uint16_t Port() const noexcept { return port_; }
    void SetPort(uint16_t port) noexcept { port_ = port; }

    // I-Am payload for this device.
    [[nodiscard]] RemoteDeviceInfo Announce() const;

    void SetOnline(bool online) noexcept { online_.store(online); }
    [[nodiscard]] bool IsOnline() const noexcept { return online_.load(); }

    Result<void> AddObject(const ObjectRecord& record) { return objects_.Add(record); }
    [[nodiscard]] Result<ObjectRecord> GetObject(const ObjectIdentifier& id) const;
    [[nodiscard]] std::optional<ObjectIdentifier> FindObjectNamed(const std::string& name) const;

    void ScriptFailure(ConfirmedService service, ScriptedFailure failure);
    void ClearFailures();
    [[nodiscard]] std::optional<ScriptedFailure> FailureFor(ConfirmedService service) const;

    /// Serve one confirmed request. Returns nullopt when the device stays silent.
    std::optional<Response> Handle(DeviceId requester, const ConfirmedRequest& request);

    [[nodiscard]] std::vector<CovSubscription> Subscriptions() const;
    [[nodiscard]] size_t RequestCount(ConfirmedService service) const;

private:
    Response HandleRead(const ReadPropertyMultipleRequest& request);
    Response HandleWrite(const WritePropertyRequest& request);
    Response HandleCreate(const CreateObjectRequest& request);
    Response HandleDelete(const DeleteObjectRequest& request);
    Response HandleSubscribe(DeviceId requester, const SubscribeCovRequest& request);

    // Record with the computed object-list merged in for the device object.
    [[nodiscard]] std::optional<ObjectRecord> Resolve(const ObjectIdentifier& id) const;

    const DeviceId id_;
    const std::string name_;
    const uint16_t vendorId_;
    uint16_t port_{kDefaultBACnetPort};
    std::atomic<bool> online_{true};

    ObjectTable objects_;

    mutable std::mutex lock_;
    std::map<ConfirmedService, ScriptedFailure> failures_;
    std::vector<CovSubscription> subscriptions_;
    std::map<ConfirmedService, size_t> requestCounts_;
};

} // namespace BACN::Transport::Sim
