#pragma once

#include "domain/value_objects/Hlc.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

namespace esc::domain {

// Payload keeps insertion order so a decoded record compares equal to the original
using EventData = nlohmann::ordered_json;

class UnknownEventType : public std::invalid_argument {
public:
    explicit UnknownEventType(const std::string& type)
        : std::invalid_argument("Unknown event type: " + type) {}
};

class Event {
public:
    static constexpr const char* kDefaultSchemaVersion = "1.0.0";

    Event(Hlc id, std::string type, EventData data = EventData::object(),
          std::string schema_version = kDefaultSchemaVersion);

    // Record form: {"id": "...", "type": "...", "data": {...}, "version": "..."}
    static Event from_json(const nlohmann::ordered_json& record);
    nlohmann::ordered_json to_json() const;

    // Decode a payload column/field. JSON text is parsed; anything that is not an
    // object after decoding is rejected.
    static EventData parse_data(const nlohmann::ordered_json& raw);
    static std::string parse_version(const nlohmann::ordered_json& raw);

    std::string data_to_json() const { return data_.dump(); }

    const Hlc& id() const noexcept { return id_; }
    const std::string& type() const noexcept { return type_; }
    const EventData& data() const noexcept { return data_; }
    const std::string& schema_version() const noexcept { return schema_version_; }

    int64_t physical_time() const noexcept { return id_.physical_time(); }
    uint32_t counter() const noexcept { return id_.counter(); }
    const std::string& node_id() const noexcept { return id_.node_id(); }

    bool operator==(const Event&) const = default;

private:
    Hlc id_;
    std::string type_;
    EventData data_;
    std::string schema_version_;
};

// Ascending by id; used wherever a batch must be ordered before dispatch
inline bool event_id_less(const Event& a, const Event& b) {
    return Hlc::compare(a.id(), b.id()) < 0;
}

} // namespace esc::domain
