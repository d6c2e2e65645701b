#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "../Device/ConfigBackup.hpp"

namespace BACN::Backup {

/*
 * Backup document layout:
 *
 *   {
 *     "config":   {"device-id": 1338, "broadcast-address": "...", "port": 47808, ...},
 *     "tunables": {"retries": 2, "seg-timeout": 5000, "seg-window": 5, "timeout": 10000},
 *     "objects":  [{"object-identifier": ["analog-value", 1],
 *                   "properties": {"present-value": {"real": 72.5}, ...}}]
 *   }
 *
 * Values are single-key objects tagged with their type: null, boolean,
 * unsigned, signed, real, character-string, object-identifier, list.
 * Unknown object types and property ids are written as numbers. Non-finite
 * reals are written as the strings "nan", "inf" and "-inf".
 */

[[nodiscard]] nlohmann::json EncodeValue(const PropertyValue& value);
[[nodiscard]] Result<PropertyValue> DecodeValue(const nlohmann::json& node);

[[nodiscard]] nlohmann::json EncodeObjectIdentifier(const ObjectIdentifier& id);
[[nodiscard]] Result<ObjectIdentifier> DecodeObjectIdentifier(const nlohmann::json& node);

[[nodiscard]] nlohmann::json Encode(const Device::ConfigBackup& backup);
[[nodiscard]] Result<Device::ConfigBackup> Decode(const nlohmann::json& document);

[[nodiscard]] std::string Serialize(const Device::ConfigBackup& backup);
[[nodiscard]] Result<Device::ConfigBackup> Parse(std::string_view text);

} // namespace BACN::Backup
