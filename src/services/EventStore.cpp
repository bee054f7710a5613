#include "services/EventStore.hpp"

#include <algorithm>
#include <set>

using namespace esc::domain;

namespace esc::services {

// Marks the store as dispatching for the lifetime of a drain or replay and
// restores the previous state afterwards, unless the store was disposed meanwhile.
class EventStore::DispatchScope {
public:
    explicit DispatchScope(StoreState& state) : state_(state), previous_(state) {
        state_ = StoreState::DISPATCHING;
    }
    ~DispatchScope() {
        if (state_ != StoreState::DISPOSED) state_ = previous_;
    }

    DispatchScope(const DispatchScope&) = delete;
    DispatchScope& operator=(const DispatchScope&) = delete;

private:
    StoreState& state_;
    StoreState previous_;
};

EventStore::EventStore(std::unique_ptr<esc::repositories::IEventRepository> repository,
                       ProcessEvent process_event)
    : repository_(std::move(repository))
    , process_event_(std::move(process_event)) {
    if (!repository_) {
        throw std::invalid_argument("EventStore requires a repository");
    }
}

EventStore::~EventStore() {
    dispose();
}

void EventStore::add(const Event& event) {
    std::lock_guard lock(mutex_);
    ensure_active();

    repository_->append(event);
    queue_.push_back(event);
    drain();
}

void EventStore::add_all(std::vector<Event> events) {
    std::lock_guard lock(mutex_);
    ensure_active();
    if (events.empty()) return;

    std::stable_sort(events.begin(), events.end(), event_id_less);
    repository_->append_all(events);
    for (auto& event : events) {
        queue_.push_back(std::move(event));
    }
    drain();
}

std::vector<Event> EventStore::get_all() const {
    std::lock_guard lock(mutex_);
    ensure_active();
    return repository_->get_all();
}

std::optional<Event> EventStore::get_by_id(const std::string& id) const {
    std::lock_guard lock(mutex_);
    ensure_active();
    return repository_->get_by_id(id);
}

void EventStore::delete_all() {
    std::lock_guard lock(mutex_);
    ensure_active();

    queue_.clear();
    repository_->delete_all();
    snapshots_.publish({});
}

Subscription EventStore::on_event(EventListener listener) {
    std::lock_guard lock(mutex_);
    ensure_active();
    return events_.subscribe(std::move(listener));
}

Subscription EventStore::on_snapshot(SnapshotListener listener) {
    std::lock_guard lock(mutex_);
    ensure_active();
    return snapshots_.subscribe(std::move(listener));
}

EventStore::SnapshotSubscription EventStore::snapshot_and_subscribe(EventListener listener) {
    std::lock_guard lock(mutex_);
    ensure_active();
    SnapshotSubscription result;
    result.history = repository_->get_all();
    result.subscription = events_.subscribe(std::move(listener));
    return result;
}

bool EventStore::restore_to_event(const Event& target) {
    std::lock_guard lock(mutex_);
    ensure_active();

    auto events = repository_->get_all();
    std::vector<Event> prefix;
    bool found = false;
    for (auto& event : events) {
        bool match = event.id() == target.id();
        prefix.push_back(std::move(event));
        if (match) {
            found = true;
            break;
        }
    }

    replace_log(std::move(prefix));
    return found;
}

size_t EventStore::merge_events(const std::vector<Event>& events) {
    std::lock_guard lock(mutex_);
    ensure_active();

    auto stored = repository_->get_all();
    std::set<std::string> seen;
    std::vector<Event> merged;
    merged.reserve(stored.size() + events.size());

    for (auto& event : stored) {
        if (seen.insert(event.id().to_string()).second) {
            merged.push_back(std::move(event));
        }
    }
    size_t existing = merged.size();
    for (const auto& event : events) {
        if (seen.insert(event.id().to_string()).second) {
            merged.push_back(event);
        }
    }
    size_t added = merged.size() - existing;

    replace_log(std::move(merged));
    return added;
}

void EventStore::replay_all() {
    std::lock_guard lock(mutex_);
    ensure_active();
    replay_all(repository_->get_all());
}

void EventStore::replay_all(std::vector<Event> events) {
    std::lock_guard lock(mutex_);
    ensure_active();

    std::stable_sort(events.begin(), events.end(), event_id_less);
    DispatchScope scope(state_);
    for (const auto& event : events) {
        if (process_event_) process_event_(event);
        if (state_ == StoreState::DISPOSED) break;
    }
}

void EventStore::dispose() {
    std::lock_guard lock(mutex_);
    if (state_ == StoreState::DISPOSED) return;

    state_ = StoreState::DISPOSED;
    queue_.clear();
    events_.close();
    snapshots_.close();
    if (repository_) {
        repository_->dispose();
    }
}

StoreState EventStore::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

size_t EventStore::pending_count() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

void EventStore::ensure_active() const {
    if (state_ == StoreState::DISPOSED) {
        throw StoreDisposed();
    }
}

void EventStore::replace_log(std::vector<Event> events) {
    std::stable_sort(events.begin(), events.end(), event_id_less);
    repository_->replace_all(events);

    queue_.clear();
    snapshots_.publish({});
    for (auto& event : events) {
        queue_.push_back(std::move(event));
    }
    drain();
}

void EventStore::drain() {
    DispatchScope scope(state_);
    while (!queue_.empty()) {
        Event event = std::move(queue_.front());
        queue_.pop_front();
        dispatch(event);
    }
}

void EventStore::dispatch(const Event& event) {
    if (process_event_) process_event_(event);
    events_.publish(event);
}

} // namespace esc::services
