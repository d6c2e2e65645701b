#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "../Transport/TransportTypes.hpp"

namespace BACN::Discovery {

enum class LifeState : uint8_t {
    Announced,    // I-Am seen, extended information not fetched yet
    Identified,   // Extended information fetched
    Unreachable   // Extended information fetch failed
};

[[nodiscard]] constexpr const char* ToString(LifeState state) noexcept {
    switch (state) {
        case LifeState::Announced:   return "Announced";
        case LifeState::Identified:  return "Identified";
        case LifeState::Unreachable: return "Unreachable";
    }
    return "Unknown";
}

struct RemoteDeviceRecord {
    Transport::RemoteDeviceInfo info;
    LifeState state{LifeState::Announced};
    uint32_t lastSeenRound{0};   // Discovery round that last observed the device
};

// Device-id keyed view of everything discovery has learned. Never persisted.
class RemoteDeviceRegistry {
public:
    RemoteDeviceRegistry() = default;
    ~RemoteDeviceRegistry() = default;

    // Create or refresh from a transport table entry. Extended fields already
    // known are kept when the new entry lacks them.
    RemoteDeviceRecord UpsertFromTable(const Transport::RemoteDeviceInfo& info, uint32_t round);

    void MarkIdentified(const Transport::RemoteDeviceInfo& extended);
    void MarkUnreachable(DeviceId id);

    [[nodiscard]] std::optional<RemoteDeviceRecord> Find(DeviceId id) const;
    [[nodiscard]] std::vector<RemoteDeviceRecord> Devices() const;
    [[nodiscard]] std::vector<DeviceId> Ids() const;

    // (device-id, object-name) for every device; the name is empty until identified.
    [[nodiscard]] std::vector<std::pair<DeviceId, std::string>> Names() const;

    [[nodiscard]] size_t Size() const;
    void Clear();

private:
    mutable std::mutex lock_;
    std::map<DeviceId, RemoteDeviceRecord> devices_;
};

} // namespace BACN::Discovery
