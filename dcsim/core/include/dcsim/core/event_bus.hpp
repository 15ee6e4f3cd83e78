#pragma once

#include <dcsim/core/event.hpp>
#include <dcsim/core/fault.hpp>
#include <dcsim/core/subscriber.hpp>
#include <dcsim/core/topic.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace dcsim::core {

/// @brief Identifier returned by EventBus::subscribe().
using SubscriptionId = std::size_t;

/// @brief Topic-keyed registry of subscribers with synchronous dispatch.
///
/// publish() delivers an event to every subscription whose pattern matches
/// the event's topic, in registration order. A subscriber that throws is
/// isolated: the failure is classified (see classify_fault()) and handed
/// to the fault sink, and delivery continues with the next subscriber.
/// KernelFault is the only exception that escapes publish(); anything not
/// derived from std::exception is reported as a SubscriberFault.
///
/// Subscriptions added while an event is being published do not receive
/// that event. Subscriptions removed while publishing stop receiving
/// immediately.
///
/// @see Subscriber, TopicPattern, Kernel
/// @ingroup core_engine
class EventBus {
public:
    /// @brief Callback receiving isolated subscriber failures.
    using FaultSink = std::function<void(const Event& event, const Subscriber& subscriber,
                                         FaultKind kind, const std::string& message)>;

    /// @param sink Receives every failure isolated during publish().
    explicit EventBus(FaultSink sink);

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /// @brief Register a subscriber (not owned; must outlive the bus).
    SubscriptionId subscribe(TopicPattern pattern, Subscriber& subscriber);

    /// @brief Register a callable, wrapped in an owned FunctionSubscriber.
    SubscriptionId subscribe(TopicPattern pattern, std::string name,
                             FunctionSubscriber::Handler handler);

    /// @brief Remove a subscription. Unknown ids are ignored.
    void unsubscribe(SubscriptionId id) noexcept;

    /// @brief Deliver @p event to all matching subscribers.
    /// @return Number of subscribers the event was delivered to.
    /// @throws KernelFault if a subscriber raised one.
    std::size_t publish(const Event& event);

    /// @brief Number of active subscriptions.
    [[nodiscard]] std::size_t subscription_count() const noexcept;

    /// @brief Number of stored entries, including ones awaiting removal.
    [[nodiscard]] std::size_t storage_size() const noexcept { return subscriptions_.size(); }

private:
    struct Subscription {
        SubscriptionId id;
        TopicPattern pattern;
        Subscriber* target;
        std::unique_ptr<Subscriber> owned;
        bool active{true};
    };

    void compact() noexcept;

    FaultSink sink_;
    SubscriptionId next_id_{0};
    int publish_depth_{0};
    std::vector<Subscription> subscriptions_;
};

} // namespace dcsim::core
