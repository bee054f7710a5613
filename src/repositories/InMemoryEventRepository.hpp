#pragma once

#include "repositories/IEventRepository.hpp"

#include <vector>

namespace esc::repositories {

class InMemoryEventRepository : public esc::repositories::IEventRepository {
public:
    void append(const esc::domain::Event& event) override {
        events_.push_back(event);
    }

    void append_all(const std::vector<esc::domain::Event>& events) override {
        events_.insert(events_.end(), events.begin(), events.end());
    }

    std::vector<esc::domain::Event> get_all() const override {
        return events_;
    }

    std::optional<esc::domain::Event> get_by_id(const std::string& id) const override {
        for (const auto& event : events_) {
            if (event.id().to_string() == id) return event;
        }
        return std::nullopt;
    }

    void delete_all() override { events_.clear(); }

    void replace_all(const std::vector<esc::domain::Event>& events) override { events_ = events; }

    void dispose() override {}

    // Test helpers
    size_t event_count() const { return events_.size(); }
    const std::vector<esc::domain::Event>& events() const { return events_; }

private:
    std::vector<esc::domain::Event> events_;
};

} // namespace esc::repositories
