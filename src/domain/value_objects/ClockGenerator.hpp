#pragma once

#include "domain/value_objects/Hlc.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace esc::domain {

// Issues monotonically increasing HLCs for one producer.
// Holds (last_physical, last_counter) privately; pass it by reference to producers.
class ClockGenerator {
public:
    using PhysicalClock = std::function<int64_t()>;

    ClockGenerator();
    explicit ClockGenerator(PhysicalClock clock);

    // Local send/generate rule. Monotonic even if the physical clock goes backwards.
    Hlc now(const std::string& node_id);

    // Receive rule: fold a remote identifier in before issuing the next local one.
    Hlc receive(const Hlc& remote, const std::string& node_id);

    int64_t last_physical() const;
    uint32_t last_counter() const;

    static int64_t system_time_ms();

private:
    PhysicalClock clock_;
    int64_t last_physical_{0};
    uint32_t last_counter_{0};
    mutable std::mutex mutex_;
};

} // namespace esc::domain
