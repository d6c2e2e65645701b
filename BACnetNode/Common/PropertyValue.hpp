#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

#include "BACnetCommon.hpp"

namespace BACN {

struct PropertyValue;
using PropertyList = std::vector<PropertyValue>;

/**
 * Generic application-layer value. The wire encoding lives in the transport;
 * the node only ever sees these tagged values.
 */
struct PropertyValue {
    using Null = std::monostate;
    using Storage = std::variant<Null, bool, uint64_t, int64_t, double, std::string,
                                 ObjectIdentifier, PropertyList>;

    Storage data;

    PropertyValue() = default;
    PropertyValue(bool v) : data(v) {}
    PropertyValue(uint32_t v) : data(static_cast<uint64_t>(v)) {}
    PropertyValue(uint64_t v) : data(v) {}
    PropertyValue(int32_t v) : data(static_cast<int64_t>(v)) {}
    PropertyValue(int64_t v) : data(v) {}
    PropertyValue(float v) : data(static_cast<double>(v)) {}
    PropertyValue(double v) : data(v) {}
    PropertyValue(const char* v) : data(std::string(v)) {}
    PropertyValue(std::string v) : data(std::move(v)) {}
    PropertyValue(ObjectIdentifier v) : data(v) {}
    PropertyValue(PropertyList v) : data(std::move(v)) {}

    [[nodiscard]] bool IsNull() const noexcept { return std::holds_alternative<Null>(data); }

    template <typename T>
    [[nodiscard]] bool Is() const noexcept { return std::holds_alternative<T>(data); }

    template <typename T>
    [[nodiscard]] const T* As() const noexcept { return std::get_if<T>(&data); }

    bool operator==(const PropertyValue& other) const { return data == other.data; }
};

using PropertyMap = std::map<PropertyId, PropertyValue>;

[[nodiscard]] std::string ToString(const PropertyValue& value);

// ============================================================================
// Object record
// ============================================================================

struct ObjectRecord {
    ObjectIdentifier identifier;
    PropertyMap properties;

    bool operator==(const ObjectRecord&) const = default;

    [[nodiscard]] const PropertyValue* Find(PropertyId id) const {
        auto it = properties.find(id);
        return it != properties.end() ? &it->second : nullptr;
    }
};

/// Object-list property value for a set of identifiers.
[[nodiscard]] PropertyValue MakeObjectList(const std::vector<ObjectIdentifier>& ids);

/// Extract identifiers from an object-list value; non-identifier entries are skipped.
[[nodiscard]] std::vector<ObjectIdentifier> ObjectListEntries(const PropertyValue& value);

} // namespace BACN
