#pragma once

#include <vector>

#include "../Common/PropertyValue.hpp"
#include "LocalDeviceConfig.hpp"

namespace BACN::Device {

/// Snapshot persisted by BackupRestore and replayed by LocalDeviceManager::Restore().
struct ConfigBackup {
    LocalDeviceConfig config;
    DeviceTunables tunables;
    std::vector<ObjectRecord> objects;

    bool operator==(const ConfigBackup&) const = default;
};

} // namespace BACN::Device
