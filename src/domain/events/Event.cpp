#include "domain/events/Event.hpp"

namespace esc::domain {

Event::Event(Hlc id, std::string type, EventData data, std::string schema_version)
    : id_(std::move(id))
    , type_(std::move(type))
    , data_(std::move(data))
    , schema_version_(std::move(schema_version)) {
    if (type_.empty()) {
        throw std::invalid_argument("Event type must not be empty");
    }
    if (data_.is_null()) {
        data_ = EventData::object();
    }
    if (!data_.is_object()) {
        throw std::invalid_argument("Event data must be a JSON object, got: " +
                                    std::string(data_.type_name()));
    }
    if (schema_version_.empty()) {
        schema_version_ = kDefaultSchemaVersion;
    }
}

Event Event::from_json(const nlohmann::ordered_json& record) {
    if (!record.is_object()) {
        throw std::invalid_argument("Event record must be a JSON object");
    }
    if (!record.contains("id") || !record["id"].is_string()) {
        throw std::invalid_argument("Event record is missing a string \"id\"");
    }
    if (!record.contains("type") || !record["type"].is_string()) {
        throw std::invalid_argument("Event record is missing a string \"type\"");
    }

    EventData data = record.contains("data") ? parse_data(record["data"]) : EventData::object();
    std::string version = parse_version(record.contains("version")
                                            ? record["version"]
                                            : nlohmann::ordered_json());

    return Event(Hlc::parse(record["id"].get<std::string>()),
                 record["type"].get<std::string>(),
                 std::move(data), std::move(version));
}

nlohmann::ordered_json Event::to_json() const {
    nlohmann::ordered_json record;
    record["id"] = id_.to_string();
    record["type"] = type_;
    record["data"] = data_;
    record["version"] = schema_version_;
    return record;
}

EventData Event::parse_data(const nlohmann::ordered_json& raw) {
    if (raw.is_null()) return EventData::object();
    if (raw.is_object()) return raw;
    if (raw.is_string()) {
        auto decoded = EventData::parse(raw.get<std::string>(), nullptr, false);
        if (!decoded.is_discarded() && (decoded.is_object() || decoded.is_string())) {
            return parse_data(decoded);
        }
    }
    throw std::invalid_argument("Event data is not a JSON object: " + raw.dump());
}

std::string Event::parse_version(const nlohmann::ordered_json& raw) {
    if (raw.is_string()) return raw.get<std::string>();
    if (raw.is_number_integer()) return std::to_string(raw.get<int64_t>());
    if (raw.is_number()) return raw.dump();
    return kDefaultSchemaVersion;
}

} // namespace esc::domain
