#include "PropertyValue.hpp"

#include <cstdio>
#include <type_traits>

namespace BACN {

std::string ToString(const PropertyValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, PropertyValue::Null>) {
            return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, uint64_t> || std::is_same_v<T, int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%g", v);
            return buf;
        } else if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + v + "\"";
        } else if constexpr (std::is_same_v<T, ObjectIdentifier>) {
            return ToString(v);
        } else {
            std::string out = "(";
            for (size_t i = 0; i < v.size(); ++i) {
                if (i != 0) {
                    out += " ";
                }
                out += ToString(v[i]);
            }
            out += ")";
            return out;
        }
    }, value.data);
}

PropertyValue MakeObjectList(const std::vector<ObjectIdentifier>& ids) {
    PropertyList list;
    list.reserve(ids.size());
    for (const auto& id : ids) {
        list.emplace_back(id);
    }
    return PropertyValue(std::move(list));
}

std::vector<ObjectIdentifier> ObjectListEntries(const PropertyValue& value) {
    std::vector<ObjectIdentifier> out;
    if (const auto* list = value.As<PropertyList>()) {
        out.reserve(list->size());
        for (const auto& entry : *list) {
            if (const auto* id = entry.As<ObjectIdentifier>()) {
                out.push_back(*id);
            }
        }
    } else if (const auto* single = value.As<ObjectIdentifier>()) {
        out.push_back(*single);
    }
    return out;
}

} // namespace BACN
