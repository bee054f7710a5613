#pragma once

#include <compare>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace esc::domain {

class MalformedIdentifier : public std::invalid_argument {
public:
    explicit MalformedIdentifier(const std::string& text)
        : std::invalid_argument("Malformed HLC identifier: \"" + text + "\"") {}
};

// Hybrid logical clock identifier: <physical_time_ms>:<counter>:<node_id>
class Hlc {
public:
    // Throws std::invalid_argument for an empty node id
    Hlc(int64_t physical_time_ms, uint32_t counter, std::string node_id);

    static Hlc parse(const std::string& text);
    std::string to_string() const;

    int64_t physical_time() const noexcept { return physical_time_ms_; }
    uint32_t counter() const noexcept { return counter_; }
    const std::string& node_id() const noexcept { return node_id_; }

    // -1, 0 or 1. Physical time, then counter, then node id.
    static int compare(const Hlc& a, const Hlc& b) noexcept;

    bool operator==(const Hlc&) const = default;
    std::strong_ordering operator<=>(const Hlc& other) const noexcept;

private:
    int64_t physical_time_ms_;
    uint32_t counter_;
    std::string node_id_;
};

} // namespace esc::domain
