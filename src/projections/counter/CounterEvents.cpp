#include "projections/counter/CounterEvents.hpp"

#include <type_traits>

using esc::domain::Event;
using esc::domain::EventData;

namespace esc::projections::counter {

namespace {

std::string key_of(const EventData& data) {
    if (data.contains("key") && data["key"].is_string()) {
        return data["key"].get<std::string>();
    }
    return kDefaultKey;
}

int64_t integer_of(const EventData& data, const char* field, int64_t fallback) {
    if (!data.contains(field)) return fallback;
    if (!data[field].is_number_integer()) {
        throw std::invalid_argument(std::string("Counter field \"") + field +
                                    "\" must be an integer");
    }
    return data[field].get<int64_t>();
}

} // namespace

std::string event_type(const CounterEvent& event) {
    return std::visit([](const auto& e) -> std::string {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, SetValue>) {
            return "SetValue";
        } else if constexpr (std::is_same_v<T, Increment>) {
            return "Increment";
        } else if constexpr (std::is_same_v<T, Decrement>) {
            return "Decrement";
        } else {
            static_assert(std::is_same_v<T, Reset>);
            return "Reset";
        }
    }, event);
}

CounterEvent decode(const Event& event) {
    const auto& type = event.type();
    const auto& data = event.data();
    if (type == "SetValue") return SetValue{key_of(data), integer_of(data, "value", 0)};
    if (type == "Increment") return Increment{key_of(data), integer_of(data, "amount", 1)};
    if (type == "Decrement") return Decrement{key_of(data), integer_of(data, "amount", 1)};
    if (type == "Reset") return Reset{key_of(data)};
    throw esc::domain::UnknownEventType(type);
}

Event encode(const CounterEvent& event, esc::domain::Hlc id) {
    EventData data = EventData::object();
    std::visit([&data](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        data["key"] = e.key;
        if constexpr (std::is_same_v<T, SetValue>) {
            data["value"] = e.value;
        } else if constexpr (std::is_same_v<T, Increment> || std::is_same_v<T, Decrement>) {
            data["amount"] = e.amount;
        }
    }, event);
    return Event(std::move(id), event_type(event), std::move(data));
}

} // namespace esc::projections::counter
