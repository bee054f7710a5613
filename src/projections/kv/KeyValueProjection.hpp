#pragma once

#include "domain/value_objects/ClockGenerator.hpp"
#include "projections/kv/KeyValueEvents.hpp"
#include "services/ViewStore.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>

namespace esc::projections::kv {

using Entries = std::map<std::string, esc::domain::EventData>;

class KeyValueProjection : public esc::services::ViewStore<Entries> {
public:
    KeyValueProjection(std::unique_ptr<esc::repositories::IEventRepository> repository,
                       esc::domain::ClockGenerator& clock,
                       std::string node_id);

    void on_event(const esc::domain::Event& event) override;

    esc::domain::Event set(const std::string& key, esc::domain::EventData value);
    esc::domain::Event remove(const std::string& key);

    std::optional<esc::domain::EventData> get(const std::string& key) const;
    size_t size() const noexcept { return state_.size(); }

private:
    esc::domain::Event record(const KeyValueEvent& event);

    esc::domain::ClockGenerator& clock_;
    std::string node_id_;
};

} // namespace esc::projections::kv
