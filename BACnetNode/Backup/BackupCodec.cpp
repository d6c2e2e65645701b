#include "BackupCodec.hpp"

#include <charconv>
#include <cmath>
#include <limits>
#include <type_traits>

namespace BACN::Backup {

using nlohmann::json;

namespace {

std::string PropertyKey(PropertyId id) {
    const std::string_view name = ToString(id);
    if (name == "unknown-property") {
        return std::to_string(static_cast<uint32_t>(id));
    }
    return std::string(name);
}

std::optional<PropertyId> PropertyFromKey(const std::string& key) {
    if (auto named = PropertyIdFromString(key)) {
        return named;
    }
    uint32_t raw = 0;
    const auto* end = key.data() + key.size();
    auto [ptr, ec] = std::from_chars(key.data(), end, raw);
    if (ec != std::errc{} || ptr != end || key.empty()) {
        return std::nullopt;
    }
    return static_cast<PropertyId>(raw);
}

json EncodeConfig(const Device::LocalDeviceConfig& config) {
    return json{
        {"device-id", config.deviceId},
        {"broadcast-address", config.broadcastAddress},
        {"port", config.port},
        {"destination-port", config.destinationPort},
        {"local-address", config.localAddress},
        {"timeout", config.timeoutMs},
        {"apdu-timeout", config.apduTimeoutMs},
        {"retries", config.retries},
        {"seg-timeout", config.segTimeoutMs},
        {"seg-window", config.segWindow},
    };
}

// Throws nlohmann::json::exception on missing keys or wrong types.
Device::LocalDeviceConfig DecodeConfig(const json& node) {
    Device::LocalDeviceConfig config;
    config.deviceId = node.at("device-id").get<DeviceId>();
    config.broadcastAddress = node.at("broadcast-address").get<std::string>();
    config.port = node.at("port").get<uint16_t>();
    config.destinationPort = node.at("destination-port").get<uint16_t>();
    config.localAddress = node.at("local-address").get<std::string>();
    config.timeoutMs = node.at("timeout").get<uint32_t>();
    config.apduTimeoutMs = node.at("apdu-timeout").get<uint32_t>();
    config.retries = node.at("retries").get<uint32_t>();
    config.segTimeoutMs = node.at("seg-timeout").get<uint32_t>();
    config.segWindow = node.at("seg-window").get<uint32_t>();
    return config;
}

json EncodeTunables(const Device::DeviceTunables& tunables) {
    return json{
        {"retries", tunables.retries},
        {"seg-timeout", tunables.segTimeoutMs},
        {"seg-window", tunables.segWindow},
        {"timeout", tunables.timeoutMs},
    };
}

Device::DeviceTunables DecodeTunables(const json& node) {
    Device::DeviceTunables tunables;
    tunables.retries = node.at("retries").get<uint32_t>();
    tunables.segTimeoutMs = node.at("seg-timeout").get<uint32_t>();
    tunables.segWindow = node.at("seg-window").get<uint32_t>();
    tunables.timeoutMs = node.at("timeout").get<uint32_t>();
    return tunables;
}

// JSON has no NaN or infinity; those reals are written as strings.
json EncodeReal(double value) {
    if (std::isnan(value)) {
        return "nan";
    }
    if (std::isinf(value)) {
        return value > 0 ? "inf" : "-inf";
    }
    return value;
}

std::optional<double> DecodeReal(const json& payload) {
    if (payload.is_number()) {
        return payload.get<double>();
    }
    if (!payload.is_string()) {
        return std::nullopt;
    }
    const auto& text = payload.get_ref<const std::string&>();
    if (text == "nan") {
        return std::numeric_limits<double>::quiet_NaN();
    }
    if (text == "inf") {
        return std::numeric_limits<double>::infinity();
    }
    if (text == "-inf") {
        return -std::numeric_limits<double>::infinity();
    }
    return std::nullopt;
}

} // namespace

// ============================================================================
// Values
// ============================================================================

json EncodeObjectIdentifier(const ObjectIdentifier& id) {
    const std::string_view name = ToString(id.type);
    if (name == "unknown-object-type") {
        return json::array({static_cast<uint32_t>(id.type), id.instance});
    }
    return json::array({std::string(name), id.instance});
}

Result<ObjectIdentifier> DecodeObjectIdentifier(const json& node) {
    if (!node.is_array() || node.size() != 2 || !node[1].is_number_unsigned()) {
        return BACN_ERROR_PARSE("object-identifier must be [type, instance]");
    }
    ObjectIdentifier id;
    id.instance = node[1].get<uint32_t>();
    if (node[0].is_string()) {
        auto type = ObjectTypeFromString(node[0].get<std::string>());
        if (!type) {
            return BACN_ERROR_PARSE("Unknown object type name");
        }
        id.type = *type;
    } else if (node[0].is_number_unsigned()) {
        id.type = static_cast<ObjectType>(node[0].get<uint16_t>());
    } else {
        return BACN_ERROR_PARSE("object type must be a name or a number");
    }
    return id;
}

json EncodeValue(const PropertyValue& value) {
    return std::visit([](const auto& v) -> json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, PropertyValue::Null>) {
            return json{{"null", nullptr}};
        } else if constexpr (std::is_same_v<T, bool>) {
            return json{{"boolean", v}};
        } else if constexpr (std::is_same_v<T, uint64_t>) {
            return json{{"unsigned", v}};
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return json{{"signed", v}};
        } else if constexpr (std::is_same_v<T, double>) {
            return json{{"real", EncodeReal(v)}};
        } else if constexpr (std::is_same_v<T, std::string>) {
            return json{{"character-string", v}};
        } else if constexpr (std::is_same_v<T, ObjectIdentifier>) {
            return json{{"object-identifier", EncodeObjectIdentifier(v)}};
        } else {
            json items = json::array();
            for (const auto& item : v) {
                items.push_back(EncodeValue(item));
            }
            return json{{"list", std::move(items)}};
        }
    }, value.data);
}

Result<PropertyValue> DecodeValue(const json& node) {
    if (!node.is_object() || node.size() != 1) {
        return BACN_ERROR_PARSE("Property value must be a single-key tagged object");
    }
    const auto entry = node.begin();
    const std::string tag = entry.key();
    const json& payload = entry.value();
    try {
        if (tag == "null") {
            return PropertyValue{};
        }
        if (tag == "boolean") {
            return PropertyValue(payload.get<bool>());
        }
        if (tag == "unsigned") {
            return PropertyValue(payload.get<uint64_t>());
        }
        if (tag == "signed") {
            return PropertyValue(payload.get<int64_t>());
        }
        if (tag == "real") {
            auto real = DecodeReal(payload);
            if (!real) {
                return BACN_ERROR_PARSE("real payload must be a number, \"nan\", \"inf\" or \"-inf\"");
            }
            return PropertyValue(*real);
        }
        if (tag == "character-string") {
            return PropertyValue(payload.get<std::string>());
        }
        if (tag == "object-identifier") {
            auto id = TRY(DecodeObjectIdentifier(payload));
            return PropertyValue(id);
        }
        if (tag == "list") {
            if (!payload.is_array()) {
                return BACN_ERROR_PARSE("list payload must be an array");
            }
            PropertyList items;
            items.reserve(payload.size());
            for (const auto& item : payload) {
                items.push_back(TRY(DecodeValue(item)));
            }
            return PropertyValue(std::move(items));
        }
    } catch (const json::exception& e) {
        BACN_LOG_WARNING(Backup, "Bad '%s' value: %s", tag, e.what());
        return BACN_ERROR_PARSE("Property value payload has the wrong type");
    }
    return BACN_ERROR_PARSE("Unknown property value tag");
}

// ============================================================================
// Document
// ============================================================================

json Encode(const Device::ConfigBackup& backup) {
    json objects = json::array();
    for (const auto& record : backup.objects) {
        json properties = json::object();
        for (const auto& [id, value] : record.properties) {
            properties[PropertyKey(id)] = EncodeValue(value);
        }
        objects.push_back(json{
            {"object-identifier", EncodeObjectIdentifier(record.identifier)},
            {"properties", std::move(properties)},
        });
    }
    return json{
        {"config", EncodeConfig(backup.config)},
        {"tunables", EncodeTunables(backup.tunables)},
        {"objects", std::move(objects)},
    };
}

Result<Device::ConfigBackup> Decode(const json& document) {
    if (!document.is_object()) {
        return BACN_ERROR_PARSE("Backup document must be a JSON object");
    }

    Device::ConfigBackup backup;
    try {
        backup.config = DecodeConfig(document.at("config"));
        backup.tunables = DecodeTunables(document.at("tunables"));
    } catch (const json::exception& e) {
        BACN_LOG_WARNING(Backup, "Bad config/tunables section: %s", e.what());
        return BACN_ERROR_PARSE("Backup config or tunables section is malformed");
    }

    const auto objects = document.find("objects");
    if (objects == document.end()) {
        return backup;
    }
    if (!objects->is_array()) {
        return BACN_ERROR_PARSE("objects must be an array");
    }

    for (const auto& entry : *objects) {
        if (!entry.is_object() || !entry.contains("object-identifier")) {
            return BACN_ERROR_PARSE("Object entry needs an object-identifier");
        }
        ObjectRecord record;
        record.identifier = TRY(DecodeObjectIdentifier(entry["object-identifier"]));

        const auto properties = entry.find("properties");
        if (properties != entry.end()) {
            if (!properties->is_object()) {
                return BACN_ERROR_PARSE("properties must be an object");
            }
            for (const auto& [key, value] : properties->items()) {
                auto id = PropertyFromKey(key);
                if (!id) {
                    BACN_LOG_WARNING(Backup, "Unknown property key '%s' in %s", key,
                                     ToString(record.identifier));
                    return BACN_ERROR_PARSE("Unknown property key");
                }
                record.properties[*id] = TRY(DecodeValue(value));
            }
        }
        backup.objects.push_back(std::move(record));
    }
    return backup;
}

std::string Serialize(const Device::ConfigBackup& backup) {
    return Encode(backup).dump(2);
}

Result<Device::ConfigBackup> Parse(std::string_view text) {
    json document = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (document.is_discarded()) {
        return BACN_ERROR_PARSE("Backup file is not valid JSON");
    }
    return Decode(document);
}

} // namespace BACN::Backup
