#pragma once

#include "domain/events/Event.hpp"

#include <cstdint>
#include <string>
#include <variant>

namespace esc::projections::counter {

inline constexpr const char* kDefaultKey = "counter";

struct SetValue {
    std::string key;
    int64_t value;
};

struct Increment {
    std::string key;
    int64_t amount;
};

struct Decrement {
    std::string key;
    int64_t amount;
};

struct Reset {
    std::string key;
};

using CounterEvent = std::variant<SetValue, Increment, Decrement, Reset>;

// Wire type names: "SetValue", "Increment", "Decrement", "Reset"
std::string event_type(const CounterEvent& event);

// Throws UnknownEventType for any other type name.
CounterEvent decode(const esc::domain::Event& event);
esc::domain::Event encode(const CounterEvent& event, esc::domain::Hlc id);

} // namespace esc::projections::counter
