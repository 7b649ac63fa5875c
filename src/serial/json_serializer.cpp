#include <recordsvc/serial/json_serializer.h>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace recordsvc {

// ═══════════════════════════════════════════════════════════════════════════
// Serialize to JSON (record → nlohmann::json)
// ═══════════════════════════════════════════════════════════════════════════

nlohmann::ordered_json JsonSerializer::toJsonObject(const Record& record) {
    nlohmann::ordered_json j;
    j["id"]                = record.id;
    j["name"]              = record.name;
    j["contact"]           = record.contact;
    j["numeric_attribute"] = record.numeric_attribute;
    j["created_at"]        = record.created_at;
    return j;
}

std::string JsonSerializer::toJson(const Record& record, bool pretty) {
    auto j = toJsonObject(record);
    return pretty ? j.dump(2) + "\n" : j.dump();
}

std::string JsonSerializer::toJson(const std::vector<Record>& records,
                                   bool pretty) {
    auto arr = nlohmann::ordered_json::array();
    for (const auto& r : records) {
        arr.push_back(toJsonObject(r));
    }
    return pretty ? arr.dump(2) + "\n" : arr.dump();
}

// ═══════════════════════════════════════════════════════════════════════════
// Parse JSON (nlohmann::json → create-request)
// ═══════════════════════════════════════════════════════════════════════════

NewRecord JsonSerializer::fromJsonObject(const nlohmann::json& j) {
    NewRecord req;
    req.name              = j.value("name", std::string());
    req.contact           = j.value("contact", std::string());
    req.numeric_attribute = j.value("numeric_attribute", 0);
    return req;
}

std::vector<NewRecord> JsonSerializer::parseSeed(const std::string& json) {
    auto doc = nlohmann::json::parse(json);
    if (!doc.is_array()) {
        throw std::invalid_argument("seed document must be a JSON array");
    }

    std::vector<NewRecord> result;
    result.reserve(doc.size());
    for (const auto& item : doc) {
        if (!item.is_object()) {
            throw std::invalid_argument(
                "seed entry #" + std::to_string(result.size() + 1) +
                " is not a JSON object");
        }
        result.push_back(fromJsonObject(item));
    }
    return result;
}

std::vector<NewRecord> JsonSerializer::loadSeedFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("cannot open seed file: " + path);
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    return parseSeed(buf.str());
}

} // namespace recordsvc
