#include "ObjectTable.hpp"

namespace BACN {

ObjectRecord ObjectTable::Normalize(ObjectRecord record) {
    record.properties[PropertyId::ObjectIdentifier] = PropertyValue(record.identifier);
    record.properties[PropertyId::ObjectType] =
        PropertyValue(static_cast<uint32_t>(record.identifier.type));
    return record;
}

Result<void> ObjectTable::Add(const ObjectRecord& record) {
    std::lock_guard<std::mutex> guard(lock_);
    if (objects_.contains(record.identifier)) {
        return BACN_ERROR_INVALID("Object identifier already exists");
    }
    objects_.emplace(record.identifier, Normalize(record));
    BACN_LOG_OBJECT_TABLE("add %s (%zu properties)", ToString(record.identifier),
                          record.properties.size());
    return {};
}

Result<ObjectRecord> ObjectTable::Get(const ObjectIdentifier& id) const {
    std::lock_guard<std::mutex> guard(lock_);
    auto it = objects_.find(id);
    if (it == objects_.end()) {
        return BACN_ERROR_NOT_FOUND("No such object");
    }
    return it->second;
}

Result<void> ObjectTable::SetProperty(const ObjectIdentifier& id, PropertyId property,
                                      const PropertyValue& value) {
    if (IsIdentityProperty(property)) {
        return BACN_ERROR_INVALID("object-identifier and object-type are immutable");
    }
    std::lock_guard<std::mutex> guard(lock_);
    auto it = objects_.find(id);
    if (it == objects_.end()) {
        return BACN_ERROR_NOT_FOUND("No such object");
    }
    it->second.properties[property] = value;
    BACN_LOG_OBJECT_TABLE("set %s.%s = %s", ToString(id), ToString(property), ToString(value));
    return {};
}

Result<void> ObjectTable::Remove(const ObjectIdentifier& id) {
    std::lock_guard<std::mutex> guard(lock_);
    if (objects_.erase(id) == 0) {
        return BACN_ERROR_NOT_FOUND("No such object");
    }
    BACN_LOG_OBJECT_TABLE("remove %s", ToString(id));
    return {};
}

bool ObjectTable::Contains(const ObjectIdentifier& id) const {
    std::lock_guard<std::mutex> guard(lock_);
    return objects_.contains(id);
}

size_t ObjectTable::Size() const {
    std::lock_guard<std::mutex> guard(lock_);
    return objects_.size();
}

std::vector<ObjectRecord> ObjectTable::All() const {
    std::lock_guard<std::mutex> guard(lock_);
    std::vector<ObjectRecord> out;
    out.reserve(objects_.size());
    for (const auto& [id, record] : objects_) {
        out.push_back(record);
    }
    return out;
}

std::vector<ObjectIdentifier> ObjectTable::Identifiers() const {
    std::lock_guard<std::mutex> guard(lock_);
    std::vector<ObjectIdentifier> out;
    out.reserve(objects_.size());
    for (const auto& [id, record] : objects_) {
        out.push_back(id);
    }
    return out;
}

void ObjectTable::Clear() {
    std::lock_guard<std::mutex> guard(lock_);
    objects_.clear();
}

} // namespace BACN
