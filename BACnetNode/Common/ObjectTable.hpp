#pragma once

#include <map>
#include <mutex>
#include <vector>

#include "../Core/Error.hpp"
#include "PropertyValue.hpp"

namespace BACN {

// Identifier-keyed object store. Stored records always carry object-identifier
// and object-type properties that mirror the key.
class ObjectTable {
public:
    ObjectTable() = default;
    ~ObjectTable() = default;

    ObjectTable(const ObjectTable&) = delete;
    ObjectTable& operator=(const ObjectTable&) = delete;

    // Fails with InvalidArgument if the identifier is already present.
    Result<void> Add(const ObjectRecord& record);

    Result<ObjectRecord> Get(const ObjectIdentifier& id) const;

    // Identity properties are rejected with InvalidArgument.
    Result<void> SetProperty(const ObjectIdentifier& id, PropertyId property, const PropertyValue& value);

    Result<void> Remove(const ObjectIdentifier& id);

    [[nodiscard]] bool Contains(const ObjectIdentifier& id) const;
    [[nodiscard]] size_t Size() const;

    // Ordered by identifier.
    [[nodiscard]] std::vector<ObjectRecord> All() const;
    [[nodiscard]] std::vector<ObjectIdentifier> Identifiers() const;

    void Clear();

    // Copy of record with identity properties overwritten from its identifier.
    [[nodiscard]] static ObjectRecord Normalize(ObjectRecord record);

private:
    mutable std::mutex lock_;
    std::map<ObjectIdentifier, ObjectRecord> objects_;
};

} // namespace BACN
