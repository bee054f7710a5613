#pragma once

#include "domain/events/Event.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace esc::repositories {

class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Durable side of an event store. Every backend keeps the same contract;
// durability, cost and batch atomicity differ per implementation.
class IEventRepository {
public:
    virtual void append(const esc::domain::Event& event) = 0;
    virtual void append_all(const std::vector<esc::domain::Event>& events) = 0;

    // Insertion order on every backend
    virtual std::vector<esc::domain::Event> get_all() const = 0;
    virtual std::optional<esc::domain::Event> get_by_id(const std::string& id) const = 0;

    virtual void delete_all() = 0;

    // Swap the whole contents for events. The default clears then appends;
    // backends that can do it atomically override it so a failure leaves the
    // previous contents in place.
    virtual void replace_all(const std::vector<esc::domain::Event>& events) {
        delete_all();
        append_all(events);
    }

    virtual void dispose() = 0;

    virtual ~IEventRepository() = default;
};

} // namespace esc::repositories
