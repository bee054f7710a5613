#pragma once

#include "domain/events/Event.hpp"

#include <string>
#include <variant>

namespace esc::projections::kv {

struct SetKeyValue {
    std::string key;
    esc::domain::EventData value;
};

struct DeleteKeyValue {
    std::string key;
};

using KeyValueEvent = std::variant<SetKeyValue, DeleteKeyValue>;

std::string event_type(const KeyValueEvent& event);
KeyValueEvent decode(const esc::domain::Event& event);
esc::domain::Event encode(const KeyValueEvent& event, esc::domain::Hlc id);

} // namespace esc::projections::kv
