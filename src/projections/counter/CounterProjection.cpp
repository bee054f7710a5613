#include "projections/counter/CounterProjection.hpp"

#include <limits>
#include <stdexcept>
#include <type_traits>

using esc::domain::Event;

namespace esc::projections::counter {

namespace {

constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
constexpr int64_t kMin = std::numeric_limits<int64_t>::min();

int64_t checked_add(const std::string& key, int64_t value, int64_t amount) {
    if ((amount > 0 && value > kMax - amount) || (amount < 0 && value < kMin - amount)) {
        throw std::overflow_error("Counter \"" + key + "\" overflow");
    }
    return value + amount;
}

int64_t checked_subtract(const std::string& key, int64_t value, int64_t amount) {
    if ((amount < 0 && value > kMax + amount) || (amount > 0 && value < kMin + amount)) {
        throw std::overflow_error("Counter \"" + key + "\" overflow");
    }
    return value - amount;
}

} // namespace

CounterProjection::CounterProjection(
    std::unique_ptr<esc::repositories::IEventRepository> repository,
    esc::domain::ClockGenerator& clock,
    std::string node_id)
    : ViewStore(std::move(repository))
    , clock_(clock)
    , node_id_(std::move(node_id)) {}

void CounterProjection::on_event(const Event& event) {
    apply(decode(event));
}

void CounterProjection::apply(const CounterEvent& event) {
    std::visit([this](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, SetValue>) {
            state_[e.key] = e.value;
        } else if constexpr (std::is_same_v<T, Increment>) {
            state_[e.key] = checked_add(e.key, value(e.key), e.amount);
        } else if constexpr (std::is_same_v<T, Decrement>) {
            state_[e.key] = checked_subtract(e.key, value(e.key), e.amount);
        } else {
            static_assert(std::is_same_v<T, Reset>);
            state_[e.key] = 0;
        }
    }, event);
}

Event CounterProjection::record(const CounterEvent& event) {
    auto stamped = encode(event, clock_.now(node_id_));
    event_store().add(stamped);
    return stamped;
}

Event CounterProjection::increment(const std::string& key, int64_t amount) {
    return record(Increment{key, amount});
}

Event CounterProjection::decrement(const std::string& key, int64_t amount) {
    return record(Decrement{key, amount});
}

Event CounterProjection::set_value(const std::string& key, int64_t value) {
    return record(SetValue{key, value});
}

Event CounterProjection::reset(const std::string& key) {
    return record(Reset{key});
}

int64_t CounterProjection::value(const std::string& key) const {
    auto it = state_.find(key);
    return it == state_.end() ? 0 : it->second;
}

} // namespace esc::projections::counter
