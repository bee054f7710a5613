#pragma once

#include "domain/value_objects/ClockGenerator.hpp"
#include "projections/counter/CounterEvents.hpp"
#include "services/ViewStore.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>

namespace esc::projections::counter {

using Counters = std::map<std::string, int64_t>;

class CounterProjection : public esc::services::ViewStore<Counters> {
public:
    CounterProjection(std::unique_ptr<esc::repositories::IEventRepository> repository,
                      esc::domain::ClockGenerator& clock,
                      std::string node_id);

    void on_event(const esc::domain::Event& event) override;
    void apply(const CounterEvent& event);

    // Producer side: stamp with the next HLC and append to the log
    esc::domain::Event record(const CounterEvent& event);
    esc::domain::Event increment(const std::string& key = kDefaultKey, int64_t amount = 1);
    esc::domain::Event decrement(const std::string& key = kDefaultKey, int64_t amount = 1);
    esc::domain::Event set_value(const std::string& key, int64_t value);
    esc::domain::Event reset(const std::string& key = kDefaultKey);

    int64_t value(const std::string& key = kDefaultKey) const;

private:
    esc::domain::ClockGenerator& clock_;
    std::string node_id_;
};

} // namespace esc::projections::counter
