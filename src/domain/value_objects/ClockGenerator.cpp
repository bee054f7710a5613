#include "domain/value_objects/ClockGenerator.hpp"

#include <algorithm>
#include <chrono>
#include <limits>
#include <stdexcept>

namespace esc::domain {

namespace {

uint32_t next_counter(uint32_t counter) {
    if (counter == std::numeric_limits<uint32_t>::max()) {
        throw std::overflow_error("HLC counter overflow");
    }
    return counter + 1;
}

void require_node_id(const std::string& node_id) {
    if (node_id.empty()) {
        throw std::invalid_argument("HLC node id must not be empty");
    }
}

} // namespace

ClockGenerator::ClockGenerator() : clock_(&ClockGenerator::system_time_ms) {}

ClockGenerator::ClockGenerator(PhysicalClock clock) : clock_(std::move(clock)) {
    if (!clock_) {
        throw std::invalid_argument("ClockGenerator requires a physical clock");
    }
}

Hlc ClockGenerator::now(const std::string& node_id) {
    require_node_id(node_id);
    int64_t pt = clock_();

    std::lock_guard lock(mutex_);
    if (pt > last_physical_) {
        last_physical_ = pt;
        last_counter_ = 0;
    } else {
        last_counter_ = next_counter(last_counter_);
    }
    return Hlc(last_physical_, last_counter_, node_id);
}

Hlc ClockGenerator::receive(const Hlc& remote, const std::string& node_id) {
    require_node_id(node_id);
    int64_t pt = clock_();

    std::lock_guard lock(mutex_);
    int64_t physical = std::max({pt, last_physical_, remote.physical_time()});
    bool same_local = physical == last_physical_;
    bool same_remote = physical == remote.physical_time();

    uint32_t counter = 0;
    if (same_local && same_remote) {
        counter = next_counter(std::max(last_counter_, remote.counter()));
    } else if (same_local) {
        counter = next_counter(last_counter_);
    } else if (same_remote) {
        counter = next_counter(remote.counter());
    }

    last_physical_ = physical;
    last_counter_ = counter;
    return Hlc(last_physical_, last_counter_, node_id);
}

int64_t ClockGenerator::last_physical() const {
    std::lock_guard lock(mutex_);
    return last_physical_;
}

uint32_t ClockGenerator::last_counter() const {
    std::lock_guard lock(mutex_);
    return last_counter_;
}

int64_t ClockGenerator::system_time_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace esc::domain
