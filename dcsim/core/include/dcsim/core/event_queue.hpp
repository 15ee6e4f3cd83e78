#pragma once

#include <dcsim/core/event.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>

namespace dcsim::core {

/// @brief Time-ordered queue of pending events.
///
/// Events are keyed by (timestamp, sequence) where the sequence is a
/// counter assigned at insertion. Extraction always returns the event with
/// the smallest key, so events sharing a timestamp come out in the order
/// they were pushed.
///
/// The queue knows nothing about the clock: rejecting events in the past
/// is the Kernel's job.
///
/// @see EventKey, Kernel::schedule
/// @ingroup core_engine
class EventQueue {
public:
    /// @brief Insert an event, stamping it with the next sequence number.
    /// @return The sequence number assigned to the event.
    uint64_t push(Topic topic, TimePoint when, Payload payload);

    /// @brief Remove and return the earliest event, or std::nullopt if empty.
    [[nodiscard]] std::optional<Event> pop();

    /// @brief Timestamp of the earliest event without removing it.
    [[nodiscard]] std::optional<TimePoint> next_time() const noexcept;

    [[nodiscard]] bool empty() const noexcept { return events_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return events_.size(); }

    /// @brief Total number of events ever pushed.
    [[nodiscard]] uint64_t pushed() const noexcept { return sequence_; }

private:
    uint64_t sequence_{0};
    std::map<EventKey, Event> events_;
};

} // namespace dcsim::core
