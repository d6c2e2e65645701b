#include "SimNetwork.hpp"

#include <fmt/format.h>

#include "SimTransport.hpp"

namespace BACN::Transport::Sim {

SimNetwork::SimNetwork() = default;

SimNetwork::~SimNetwork() {
    scheduler_.Shutdown();
}

std::shared_ptr<SimRemoteDevice> SimNetwork::AddDevice(std::shared_ptr<SimRemoteDevice> device) {
    std::lock_guard<std::mutex> guard(lock_);
    devices_[device->Id()] = device;
    BACN_LOG_SIM("add simulated device %u '%s'", device->Id(), device->Name());
    return device;
}

void SimNetwork::RemoveDevice(DeviceId id) {
    std::lock_guard<std::mutex> guard(lock_);
    devices_.erase(id);
}

std::shared_ptr<SimRemoteDevice> SimNetwork::FindDevice(DeviceId id) const {
    std::lock_guard<std::mutex> guard(lock_);
    auto it = devices_.find(id);
    return it != devices_.end() ? it->second : nullptr;
}

std::vector<std::shared_ptr<SimRemoteDevice>> SimNetwork::Devices() const {
    std::lock_guard<std::mutex> guard(lock_);
    std::vector<std::shared_ptr<SimRemoteDevice>> out;
    out.reserve(devices_.size());
    for (const auto& [id, device] : devices_) {
        out.push_back(device);
    }
    return out;
}

bool SimNetwork::Bind(uint16_t port, SimTransport* endpoint) {
    std::lock_guard<std::mutex> guard(lock_);
    auto [it, inserted] = bound_.try_emplace(port, endpoint);
    return inserted || it->second == endpoint;
}

void SimNetwork::Unbind(uint16_t port, const SimTransport* endpoint) {
    std::lock_guard<std::mutex> guard(lock_);
    auto it = bound_.find(port);
    if (it != bound_.end() && it->second == endpoint) {
        bound_.erase(it);
    }
}

bool SimNetwork::IsPortBound(uint16_t port) const {
    std::lock_guard<std::mutex> guard(lock_);
    return bound_.contains(port);
}

void SimNetwork::Broadcast(DeviceId sender, std::optional<uint16_t> destinationPort,
                           const UnconfirmedRequest& request) {
    broadcasts_.fetch_add(1);
    scheduler_.DispatchAfter(Latency(), [this, sender, destinationPort, request] {
        for (const auto& device : Devices()) {
            if (!device->IsOnline() || device->Id() == sender) {
                continue;
            }
            if (destinationPort && device->Port() != *destinationPort) {
                continue;
            }

            if (const auto* whoIs = std::get_if<WhoIsRequest>(&request)) {
                const bool inRange = !whoIs->low || !whoIs->high ||
                    (device->Id() >= *whoIs->low && device->Id() <= *whoIs->high);
                if (inRange) {
                    DeliverIAm(device->Announce());
                }
                continue;
            }

            const auto& whoHas = std::get<WhoHasRequest>(request);
            if (device->Id() < whoHas.low || device->Id() > whoHas.high) {
                continue;
            }
            std::optional<ObjectIdentifier> found;
            if (const auto* id = std::get_if<ObjectIdentifier>(&whoHas.target)) {
                if (device->GetObject(*id)) {
                    found = *id;
                }
            } else {
                found = device->FindObjectNamed(std::get<std::string>(whoHas.target));
            }
            if (!found) {
                continue;
            }
            std::string name;
            if (auto record = device->GetObject(*found)) {
                if (const auto* value = record->Find(PropertyId::ObjectName)) {
                    if (const auto* text = value->As<std::string>()) {
                        name = *text;
                    }
                }
            }
            DeliverIHave(device->Id(), *found, name);
        }
    });
}

void SimNetwork::DeliverIAm(const RemoteDeviceInfo& info) {
    std::lock_guard<std::mutex> guard(lock_);
    for (const auto& [port, endpoint] : bound_) {
        endpoint->OnIAm(info);
    }
}

void SimNetwork::DeliverIHave(DeviceId from, const ObjectIdentifier& object, const std::string& name) {
    std::lock_guard<std::mutex> guard(lock_);
    for (const auto& [port, endpoint] : bound_) {
        endpoint->OnIHave(IHaveNotice{from, object, name});
    }
}

void SimNetwork::Deliver(DeviceId sender, const RemoteDeviceInfo& target,
                         const ConfirmedRequest& request,
                         std::chrono::milliseconds timeoutBudget,
                         CompletionCallback callback) {
    const DeviceId targetId = target.deviceId;
    scheduler_.DispatchAfter(Latency(), [this, sender, targetId, request, timeoutBudget, callback] {
        auto device = FindDevice(targetId);
        std::optional<Response> response;
        if (device && device->IsOnline()) {
            response = device->Handle(sender, request);
        }

        if (!response) {
            BACN_LOG_SIM("device %u silent, timing out in %lld ms", targetId,
                         static_cast<long long>(timeoutBudget.count()));
            scheduler_.DispatchAfter(timeoutBudget, [targetId, callback] {
                callback(TransportException{fmt::format("no response from device {}", targetId)});
            });
            return;
        }

        BACN_LOG_SIM("device %u -> %s", targetId, Describe(*response));
        scheduler_.DispatchAfter(Latency(), [callback, response = std::move(*response)] {
            callback(response);
        });
    });
}

std::optional<ObjectRecord> SimNetwork::ReadDeviceObject(DeviceId id) const {
    auto device = FindDevice(id);
    if (!device || !device->IsOnline()) {
        return std::nullopt;
    }
    auto record = device->GetObject(DeviceObject(id));
    if (!record) {
        return std::nullopt;
    }
    return *record;
}

std::unique_ptr<ILocalTransport> SimTransportFactory::Create(const TransportParams& params) {
    return std::make_unique<SimTransport>(network_, params);
}

} // namespace BACN::Transport::Sim
