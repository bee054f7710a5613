#include "domain/value_objects/Hlc.hpp"

#include <charconv>

namespace esc::domain {

namespace {

template <typename T>
bool parse_number(const std::string& text, size_t begin, size_t end, T& out) {
    if (begin >= end) return false;
    const char* first = text.data() + begin;
    const char* last = text.data() + end;
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr == last;
}

} // namespace

Hlc::Hlc(int64_t physical_time_ms, uint32_t counter, std::string node_id)
    : physical_time_ms_(physical_time_ms)
    , counter_(counter)
    , node_id_(std::move(node_id)) {
    if (node_id_.empty()) {
        throw std::invalid_argument("HLC node id must not be empty");
    }
}

Hlc Hlc::parse(const std::string& text) {
    auto first = text.find(':');
    if (first == std::string::npos) throw MalformedIdentifier(text);
    auto second = text.find(':', first + 1);
    if (second == std::string::npos) throw MalformedIdentifier(text);

    int64_t physical = 0;
    if (!parse_number(text, 0, first, physical)) throw MalformedIdentifier(text);

    // Counter is unsigned; from_chars rejects a leading '-'
    uint32_t counter = 0;
    if (!parse_number(text, first + 1, second, counter)) throw MalformedIdentifier(text);

    // Node id may itself contain ':'; everything after the second separator belongs to it
    std::string node_id = text.substr(second + 1);
    if (node_id.empty()) throw MalformedIdentifier(text);

    return Hlc(physical, counter, std::move(node_id));
}

std::string Hlc::to_string() const {
    return std::to_string(physical_time_ms_) + ":" + std::to_string(counter_) + ":" + node_id_;
}

int Hlc::compare(const Hlc& a, const Hlc& b) noexcept {
    if (a.physical_time_ms_ != b.physical_time_ms_) {
        return a.physical_time_ms_ < b.physical_time_ms_ ? -1 : 1;
    }
    if (a.counter_ != b.counter_) {
        return a.counter_ < b.counter_ ? -1 : 1;
    }
    int cmp = a.node_id_.compare(b.node_id_);
    if (cmp == 0) return 0;
    return cmp < 0 ? -1 : 1;
}

std::strong_ordering Hlc::operator<=>(const Hlc& other) const noexcept {
    int cmp = compare(*this, other);
    if (cmp < 0) return std::strong_ordering::less;
    if (cmp > 0) return std::strong_ordering::greater;
    return std::strong_ordering::equal;
}

} // namespace esc::domain
