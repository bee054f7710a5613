#include "projections/kv/KeyValueProjection.hpp"

#include <type_traits>

using esc::domain::Event;
using esc::domain::EventData;

namespace esc::projections::kv {

KeyValueProjection::KeyValueProjection(
    std::unique_ptr<esc::repositories::IEventRepository> repository,
    esc::domain::ClockGenerator& clock,
    std::string node_id)
    : ViewStore(std::move(repository))
    , clock_(clock)
    , node_id_(std::move(node_id)) {}

void KeyValueProjection::on_event(const Event& event) {
    std::visit([this](auto&& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, SetKeyValue>) {
            state_.insert_or_assign(e.key, std::move(e.value));
        } else {
            static_assert(std::is_same_v<T, DeleteKeyValue>);
            state_.erase(e.key);
        }
    }, decode(event));
}

Event KeyValueProjection::set(const std::string& key, EventData value) {
    return record(SetKeyValue{key, std::move(value)});
}

Event KeyValueProjection::remove(const std::string& key) {
    return record(DeleteKeyValue{key});
}

std::optional<EventData> KeyValueProjection::get(const std::string& key) const {
    auto it = state_.find(key);
    if (it == state_.end()) return std::nullopt;
    return it->second;
}

Event KeyValueProjection::record(const KeyValueEvent& event) {
    auto stamped = encode(event, clock_.now(node_id_));
    event_store().add(stamped);
    return stamped;
}

} // namespace esc::projections::kv
