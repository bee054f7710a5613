#pragma once

#include "domain/events/Event.hpp"
#include "repositories/IEventRepository.hpp"
#include "services/Broadcast.hpp"

#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace esc::services {

class StoreDisposed : public std::logic_error {
public:
    StoreDisposed() : std::logic_error("Event store has been disposed") {}
};

enum class StoreState { IDLE, DISPATCHING, DISPOSED };

// Append-only event log over a pluggable repository.
//
// Every event is persisted first, then queued, then dispatched in FIFO order:
// process callback, then on_event() listeners. A callback failure propagates to
// the caller and never rolls back the write; events still queued behind the
// failing one are dispatched by the next add.
//
// All operations are serialized by one store-owned mutex, so at most one
// dispatch is in flight. The callback may re-enter the store from the
// dispatching thread.
class EventStore {
public:
    using ProcessEvent = std::function<void(const esc::domain::Event&)>;
    using EventListener = Broadcast<esc::domain::Event>::Listener;
    using SnapshotListener = Broadcast<std::vector<esc::domain::Event>>::Listener;

    struct SnapshotSubscription {
        std::vector<esc::domain::Event> history;
        Subscription subscription;
    };

    EventStore(std::unique_ptr<esc::repositories::IEventRepository> repository,
               ProcessEvent process_event);
    ~EventStore();

    EventStore(const EventStore&) = delete;
    EventStore& operator=(const EventStore&) = delete;

    void add(const esc::domain::Event& event);
    // Sorted ascending by id before anything is persisted or dispatched
    void add_all(std::vector<esc::domain::Event> events);

    std::vector<esc::domain::Event> get_all() const;
    std::optional<esc::domain::Event> get_by_id(const std::string& id) const;

    // Clears the queue and the repository, then publishes an empty snapshot
    void delete_all();

    // New events only. Not a replay channel: use snapshot_and_subscribe for history.
    Subscription on_event(EventListener listener);
    Subscription on_snapshot(SnapshotListener listener);

    // History and a live subscription taken under the same lock, so no event
    // falls between the two.
    SnapshotSubscription snapshot_and_subscribe(EventListener listener);

    // Reduce the log to the prefix ending at target and re-dispatch it.
    // Returns false (and leaves the contents unchanged) if target is not stored.
    // The persisted log is swapped through IEventRepository::replace_all, so on
    // SQLite and in memory a write failure keeps the previous log. The JSONL
    // backend truncates before writing the encoded records.
    bool restore_to_event(const esc::domain::Event& target);

    // Union with the stored events, deduplicated by id (stored copy wins), then
    // re-added in id order. Returns the number of events that were new.
    size_t merge_events(const std::vector<esc::domain::Event>& events);

    // Invoke the process callback for the stored events (or the given ones) in id
    // order without persisting or broadcasting. The caller resets derived state first.
    void replay_all();
    void replay_all(std::vector<esc::domain::Event> events);

    // Idempotent; terminal
    void dispose();

    StoreState state() const;
    size_t pending_count() const;

private:
    class DispatchScope;

    void ensure_active() const;
    // Swap the persisted log for events, then publish an empty snapshot and
    // re-dispatch them in id order
    void replace_log(std::vector<esc::domain::Event> events);
    void drain();
    void dispatch(const esc::domain::Event& event);

    std::unique_ptr<esc::repositories::IEventRepository> repository_;
    ProcessEvent process_event_;
    std::deque<esc::domain::Event> queue_;
    Broadcast<esc::domain::Event> events_;
    Broadcast<std::vector<esc::domain::Event>> snapshots_;
    StoreState state_{StoreState::IDLE};
    mutable std::recursive_mutex mutex_;
};

} // namespace esc::services
