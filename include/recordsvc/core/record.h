#pragma once

#include <cstdint>
#include <string>

namespace recordsvc {

/// Caller-supplied part of a record. Nothing here is validated.
struct NewRecord {
    std::string  name;
    std::string  contact;
    std::int32_t numeric_attribute = 0;
};

/// A record as held by the RecordStore.
/// `id` and `created_at` are assigned on creation and never change.
struct Record {
    std::int32_t id = 0;
    std::string  name;
    std::string  contact;
    std::int32_t numeric_attribute = 0;
    std::string  created_at;   // ISO-8601 UTC, e.g. 2024-05-01T12:00:00Z
};

inline bool operator==(const Record& a, const Record& b) {
    return a.id == b.id && a.name == b.name && a.contact == b.contact &&
           a.numeric_attribute == b.numeric_attribute &&
           a.created_at == b.created_at;
}

inline bool operator!=(const Record& a, const Record& b) {
    return !(a == b);
}

} // namespace recordsvc
