#include <dcsim/core/event_bus.hpp>
#include <dcsim/core/error.hpp>

#include <algorithm>
#include <utility>

namespace dcsim::core {

EventBus::EventBus(FaultSink sink)
    : sink_(std::move(sink)) {}

SubscriptionId EventBus::subscribe(TopicPattern pattern, Subscriber& subscriber) {
    SubscriptionId id = next_id_++;
    subscriptions_.push_back(Subscription{id, std::move(pattern), &subscriber, nullptr, true});
    return id;
}

SubscriptionId EventBus::subscribe(TopicPattern pattern, std::string name,
                                   FunctionSubscriber::Handler handler) {
    auto owned = std::make_unique<FunctionSubscriber>(std::move(name), std::move(handler));
    Subscriber* target = owned.get();
    SubscriptionId id = next_id_++;
    subscriptions_.push_back(Subscription{id, std::move(pattern), target, std::move(owned), true});
    return id;
}

void EventBus::unsubscribe(SubscriptionId id) noexcept {
    for (auto& sub : subscriptions_) {
        if (sub.id == id) {
            sub.active = false;
            break;
        }
    }
    // publish() may be iterating: erase once the outermost delivery returns
    if (publish_depth_ == 0) {
        compact();
    }
}

void EventBus::compact() noexcept {
    std::erase_if(subscriptions_, [](const Subscription& sub) { return !sub.active; });
}

std::size_t EventBus::publish(const Event& event) {
    struct DepthGuard {
        EventBus& bus;
        explicit DepthGuard(EventBus& b) : bus(b) { ++bus.publish_depth_; }
        ~DepthGuard() {
            if (--bus.publish_depth_ == 0) {
                bus.compact();
            }
        }
        DepthGuard(const DepthGuard&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;
    } guard(*this);

    std::size_t delivered = 0;
    const std::size_t count = subscriptions_.size();

    for (std::size_t i = 0; i < count; ++i) {
        // Re-index every iteration: a handler may subscribe and grow the vector
        const auto& sub = subscriptions_[i];
        if (!sub.active || !sub.pattern.matches(event.topic)) {
            continue;
        }

        Subscriber* target = sub.target;
        ++delivered;
        try {
            target->handle(event);
        } catch (const KernelFault&) {
            throw;
        } catch (const std::exception& e) {
            sink_(event, *target, classify_fault(e), e.what());
        } catch (...) {
            sink_(event, *target, FaultKind::SubscriberFault, "non-standard exception");
        }
    }
    return delivered;
}

std::size_t EventBus::subscription_count() const noexcept {
    return static_cast<std::size_t>(std::count_if(
        subscriptions_.begin(), subscriptions_.end(),
        [](const Subscription& sub) { return sub.active; }));
}

} // namespace dcsim::core
