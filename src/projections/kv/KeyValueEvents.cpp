#include "projections/kv/KeyValueEvents.hpp"

#include <type_traits>

using esc::domain::Event;
using esc::domain::EventData;

namespace esc::projections::kv {

namespace {

std::string require_key(const EventData& data, const std::string& type) {
    if (!data.contains("key") || !data["key"].is_string()) {
        throw std::invalid_argument(type + " event requires a string \"key\"");
    }
    return data["key"].get<std::string>();
}

} // namespace

std::string event_type(const KeyValueEvent& event) {
    return std::holds_alternative<SetKeyValue>(event) ? "SetKeyValue" : "DeleteKeyValue";
}

KeyValueEvent decode(const Event& event) {
    const auto& type = event.type();
    const auto& data = event.data();
    if (type == "SetKeyValue") {
        return SetKeyValue{require_key(data, type),
                           data.contains("value") ? data["value"] : EventData()};
    }
    if (type == "DeleteKeyValue") {
        return DeleteKeyValue{require_key(data, type)};
    }
    throw esc::domain::UnknownEventType(type);
}

Event encode(const KeyValueEvent& event, esc::domain::Hlc id) {
    EventData data = EventData::object();
    std::visit([&data](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        data["key"] = e.key;
        if constexpr (std::is_same_v<T, SetKeyValue>) {
            data["value"] = e.value;
        }
    }, event);
    return Event(std::move(id), event_type(event), std::move(data));
}

} // namespace esc::projections::kv
