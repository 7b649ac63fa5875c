#pragma once

#include <recordsvc/core/record.h>
#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace recordsvc {

/// Convert records to JSON and parse create-requests from JSON.
/// Uses nlohmann/json; output keeps field declaration order.
///
/// Example output for a record:
/// {
///   "id": 1,
///   "name": "John Doe",
///   "contact": "john@example.com",
///   "numeric_attribute": 30,
///   "created_at": "2024-05-01T12:00:00Z"
/// }
class JsonSerializer {
public:
    static nlohmann::ordered_json toJsonObject(const Record& record);

    /// If `pretty` is true, output is indented with 2-space indentation.
    static std::string toJson(const Record& record, bool pretty = true);

    /// Serialize a sequence of records as a JSON array.
    static std::string toJson(const std::vector<Record>& records,
                              bool pretty = true);

    /// Read the caller-supplied fields of a record from a JSON object.
    /// Missing keys take their default (empty string / 0); present keys
    /// with the wrong JSON type throw nlohmann::json::type_error.
    static NewRecord fromJsonObject(const nlohmann::json& j);

    /// Parse a seed document: a JSON array of record objects.
    /// Throws nlohmann::json::parse_error on malformed JSON and
    /// std::invalid_argument if the document is not an array of objects.
    static std::vector<NewRecord> parseSeed(const std::string& json);

    /// Read and parse a seed file.
    /// Throws std::runtime_error if the file cannot be opened.
    static std::vector<NewRecord> loadSeedFile(const std::string& path);
};

} // namespace recordsvc
