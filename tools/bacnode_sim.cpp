// bacnode_sim.cpp
// Boots a BACnet node against an in-process network with two simulated
// devices, discovers them, writes and reads back a present-value and saves
// the node backup.
//
// Usage: bacnode-sim [backup-file] [settings.json]

#include <cstdio>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

#include "Backup/BackupRestore.hpp"
#include "Discovery/DiscoveryService.hpp"
#include "Logging/LogConfig.hpp"
#include "Remote/RemoteObjectAccessor.hpp"
#include "Request/RequestBridge.hpp"
#include "Transport/Sim/SimNetwork.hpp"

using namespace BACN;

namespace {

constexpr DeviceId kThermostatId = 1234;
constexpr DeviceId kMeterId = 5678;
const ObjectIdentifier kSetpoint{ObjectType::AnalogValue, 1};

nlohmann::json LoadSettings(const char* path) {
    if (path == nullptr) {
        return nlohmann::json::object();
    }
    std::ifstream in(path);
    if (!in) {
        BACN_LOG_WARNING(Node, "Cannot open settings %s, using defaults", path);
        return nlohmann::json::object();
    }
    auto settings = nlohmann::json::parse(in, nullptr, /*allow_exceptions=*/false);
    if (settings.is_discarded()) {
        BACN_LOG_WARNING(Node, "Settings %s are not valid JSON, using defaults", path);
        return nlohmann::json::object();
    }
    return settings;
}

void Populate(Transport::Sim::SimNetwork& network) {
    auto thermostat = network.AddDevice(
        std::make_shared<Transport::Sim::SimRemoteDevice>(kThermostatId, "thermostat-1234"));
    ObjectRecord setpoint;
    setpoint.identifier = kSetpoint;
    setpoint.properties[PropertyId::ObjectName] = "zone-setpoint";
    setpoint.properties[PropertyId::PresentValue] = 68.0;
    setpoint.properties[PropertyId::Units] = "degrees-fahrenheit";
    if (auto added = thermostat->AddObject(setpoint); !added) {
        added.error().Log();
    }

    auto meter = network.AddDevice(
        std::make_shared<Transport::Sim::SimRemoteDevice>(kMeterId, "meter-5678"));
    ObjectRecord energy;
    energy.identifier = ObjectIdentifier{ObjectType::AnalogInput, 3};
    energy.properties[PropertyId::ObjectName] = "total-energy";
    energy.properties[PropertyId::PresentValue] = 1520.25;
    if (auto added = meter->AddObject(energy); !added) {
        added.error().Log();
    }
}

void LogDiscovery(Discovery::DiscoveryService& discovery) {
    auto names = discovery.RemoteDevicesAndNames();
    if (!names) {
        names.error().Log();
        return;
    }
    for (const auto& [id, name] : *names) {
        BACN_LOG_INFO(Discovery, "  device %u '%s'", id, name);
    }
}

int Run(const std::string& backupFile) {
    Transport::Sim::SimNetwork network;
    Populate(network);
    Transport::Sim::SimTransportFactory factory(network);

    Device::LocalDeviceManager node(factory);
    Discovery::DiscoveryParams discoveryParams;
    discoveryParams.settleInterval = std::chrono::milliseconds(100);
    Discovery::DiscoveryService discovery(node, discoveryParams);
    Request::RequestBridge bridge(node);
    Remote::RemoteObjectAccessor accessor(bridge);

    Backup::BackupParams backupParams;
    backupParams.file = backupFile;
    Backup::BackupRestore backup(node, discovery, backupParams);

    // The simulated segment has no real interfaces behind it.
    Device::ConfigOverrides overrides;
    overrides.localAddress = "192.168.1.10";
    overrides.broadcastAddress = "192.168.1.255";
    overrides.apduTimeoutMs = 1000;
    overrides.retries = 1;

    if (auto booted = backup.Boot(overrides); !booted) {
        BACN_LOG_ERROR(Node, "Boot failed: %s", ToString(booted.error().status));
        return 1;
    }

    auto discovered = backup.WaitForDiscovery();
    if (!discovered || !*discovered) {
        BACN_LOG_ERROR(Node, "Discovery did not complete");
        return 1;
    }
    BACN_LOG_INFO(Node, "Discovered %zu device(s) in %u attempt(s)", (*discovered)->devices.size(),
                  (*discovered)->attempts);
    LogDiscovery(discovery);

    ObjectRecord update;
    update.identifier = kSetpoint;
    update.properties[PropertyId::PresentValue] = 72.5;
    auto writes = accessor.WriteProperties(kThermostatId, update);
    if (!writes) {
        writes.error().Log();
        return 1;
    }
    for (const auto& write : *writes) {
        BACN_LOG_INFO(Remote, "write %s.%s -> %s", ToString(kSetpoint), ToString(write.property),
                      Request::Describe(write.outcome));
    }

    auto read = accessor.ReadProperties(kThermostatId, kSetpoint, {PropertyId::PresentValue});
    if (!read) {
        read.error().Log();
        return 1;
    }
    if (const auto* values = Request::ValueOf(*read)) {
        BACN_LOG_INFO(Remote, "read back %s.present-value = %s", ToString(kSetpoint),
                      ToString(values->at(PropertyId::PresentValue)));
    } else {
        BACN_LOG_WARNING(Remote, "read back failed: %s", Request::Describe(*read));
    }

    auto all = accessor.ReadAllObjectsFullProperties(kMeterId);
    if (all) {
        if (const auto* objects = Request::ValueOf(*all)) {
            for (const auto& object : *objects) {
                BACN_LOG_INFO(Remote, "  %u: %s -> %s", kMeterId, ToString(object.object),
                              Request::Describe(object.outcome));
            }
        }
    } else {
        all.error().LogAsWarning();
    }

    ObjectRecord local;
    local.identifier = ObjectIdentifier{ObjectType::BinaryValue, 1};
    local.properties[PropertyId::ObjectName] = "occupancy";
    local.properties[PropertyId::PresentValue] = true;
    if (auto added = node.AddOrUpdateObject(local); !added) {
        added.error().Log();
        return 1;
    }

    auto saved = backup.Save();
    if (!saved) {
        BACN_LOG_ERROR(Backup, "Backup failed: %s", ToString(saved.error().status));
        return 1;
    }
    BACN_LOG_INFO(Backup, "Saved device %u with %zu object(s) to %s", saved->config.deviceId,
                  saved->objects.size(), backup.Store().Path().string());

    node.Terminate();
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    Logging::Configure(spdlog::level::info);
    LogConfig::Shared().Initialize(LoadSettings(argc > 2 ? argv[2] : nullptr));

    const std::string backupFile = argc > 1 ? argv[1] : Backup::kDefaultBackupFile;
    return Run(backupFile);
}
