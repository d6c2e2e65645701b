#include "RemoteDeviceRegistry.hpp"

#include "../Logging/LogConfig.hpp"
#include "../Logging/Logging.hpp"

namespace BACN::Discovery {

RemoteDeviceRecord RemoteDeviceRegistry::UpsertFromTable(const Transport::RemoteDeviceInfo& info,
                                                         uint32_t round) {
    std::lock_guard<std::mutex> guard(lock_);
    auto [it, inserted] = devices_.try_emplace(info.deviceId);
    auto& record = it->second;

    if (inserted || info.extendedInfo) {
        record.info = info;
    } else {
        // Table entry without extended info must not erase what we already know.
        auto merged = info;
        merged.extendedInfo = record.info.extendedInfo;
        merged.objectName = record.info.objectName;
        merged.vendorName = record.info.vendorName;
        merged.servicesSupported = record.info.servicesSupported;
        record.info = std::move(merged);
    }
    if (info.extendedInfo) {
        record.state = LifeState::Identified;
    }
    record.lastSeenRound = round;

    if (inserted) {
        BACN_LOG_V2(Discovery, "Device upsert: id=%u addr=%s:%u vendor=%u round=%u",
                    info.deviceId, info.address, info.port, info.vendorId, round);
    }
    return record;
}

void RemoteDeviceRegistry::MarkIdentified(const Transport::RemoteDeviceInfo& extended) {
    std::lock_guard<std::mutex> guard(lock_);
    auto& record = devices_[extended.deviceId];
    record.info = extended;
    record.state = LifeState::Identified;
    BACN_LOG_V2(Discovery, "Device identified: id=%u name='%s' vendor='%s'", extended.deviceId,
                extended.objectName.value_or(""), extended.vendorName.value_or(""));
}

void RemoteDeviceRegistry::MarkUnreachable(DeviceId id) {
    std::lock_guard<std::mutex> guard(lock_);
    auto it = devices_.find(id);
    if (it != devices_.end()) {
        it->second.state = LifeState::Unreachable;
        BACN_LOG_V1(Discovery, "Device %u unreachable for extended information", id);
    }
}

std::optional<RemoteDeviceRecord> RemoteDeviceRegistry::Find(DeviceId id) const {
    std::lock_guard<std::mutex> guard(lock_);
    auto it = devices_.find(id);
    if (it == devices_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<RemoteDeviceRecord> RemoteDeviceRegistry::Devices() const {
    std::lock_guard<std::mutex> guard(lock_);
    std::vector<RemoteDeviceRecord> out;
    out.reserve(devices_.size());
    for (const auto& [id, record] : devices_) {
        out.push_back(record);
    }
    return out;
}

std::vector<DeviceId> RemoteDeviceRegistry::Ids() const {
    std::lock_guard<std::mutex> guard(lock_);
    std::vector<DeviceId> out;
    out.reserve(devices_.size());
    for (const auto& [id, record] : devices_) {
        out.push_back(id);
    }
    return out;
}

std::vector<std::pair<DeviceId, std::string>> RemoteDeviceRegistry::Names() const {
    std::lock_guard<std::mutex> guard(lock_);
    std::vector<std::pair<DeviceId, std::string>> out;
    out.reserve(devices_.size());
    for (const auto& [id, record] : devices_) {
        out.emplace_back(id, record.info.objectName.value_or(""));
    }
    return out;
}

size_t RemoteDeviceRegistry::Size() const {
    std::lock_guard<std::mutex> guard(lock_);
    return devices_.size();
}

void RemoteDeviceRegistry::Clear() {
    std::lock_guard<std::mutex> guard(lock_);
    devices_.clear();
}

} // namespace BACN::Discovery
