#pragma once

#include "domain/events/Event.hpp"
#include "repositories/IEventRepository.hpp"
#include "services/EventStore.hpp"

#include <memory>
#include <vector>

namespace esc::services {

// Derived, queryable state computed from an event log.
//
// Owns its state value and the event store that drives it. The store calls
// on_event once per dispatched event; the state is always a function of the
// store's contents and can be rebuilt from them at any time.
template <typename State>
class ViewStore {
public:
    explicit ViewStore(std::unique_ptr<esc::repositories::IEventRepository> repository)
        : event_store_(std::move(repository),
                       [this](const esc::domain::Event& event) { on_event(event); }) {}

    virtual ~ViewStore() = default;

    ViewStore(const ViewStore&) = delete;
    ViewStore& operator=(const ViewStore&) = delete;

    virtual void init() {}

    // Releases the event store. Safe to call more than once.
    virtual void dispose() { event_store_.dispose(); }

    virtual void on_event(const esc::domain::Event& event) = 0;

    virtual void on_reset() { state_ = State{}; }

    // Reset, then reduce the log to the prefix ending at event and replay it.
    bool restore_to_event(const esc::domain::Event& event) {
        on_reset();
        return event_store_.restore_to_event(event);
    }

    // Reset, then merge the given events into the log and replay the union.
    size_t merge_events(const std::vector<esc::domain::Event>& events) {
        on_reset();
        return event_store_.merge_events(events);
    }

    // Recompute the state from the stored log, e.g. after a schema change.
    void rebuild() {
        on_reset();
        event_store_.replay_all();
    }

    const State& state() const noexcept { return state_; }

    EventStore& event_store() noexcept { return event_store_; }
    const EventStore& event_store() const noexcept { return event_store_; }

protected:
    State state_{};

private:
    EventStore event_store_;
};

// Disposes a view on every exit path of the enclosing scope.
template <typename View>
class ScopedView {
public:
    explicit ScopedView(View& view) : view_(view) { view_.init(); }
    ~ScopedView() { view_.dispose(); }

    ScopedView(const ScopedView&) = delete;
    ScopedView& operator=(const ScopedView&) = delete;

    View& operator*() const noexcept { return view_; }
    View* operator->() const noexcept { return &view_; }

private:
    View& view_;
};

} // namespace esc::services
