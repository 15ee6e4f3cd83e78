#include <dcsim/core/event_queue.hpp>

#include <utility>

namespace dcsim::core {

uint64_t EventQueue::push(Topic topic, TimePoint when, Payload payload) {
    uint64_t sequence = sequence_++;
    EventKey key{when, sequence};
    events_.emplace(key, Event{std::move(topic), when, sequence, std::move(payload)});
    return sequence;
}

std::optional<Event> EventQueue::pop() {
    if (events_.empty()) {
        return std::nullopt;
    }
    auto node = events_.extract(events_.begin());
    return std::move(node.mapped());
}

std::optional<TimePoint> EventQueue::next_time() const noexcept {
    if (events_.empty()) {
        return std::nullopt;
    }
    return events_.begin()->first.time;
}

} // namespace dcsim::core
