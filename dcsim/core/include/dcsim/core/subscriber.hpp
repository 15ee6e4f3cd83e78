#pragma once

#include <dcsim/core/event.hpp>

#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace dcsim::core {

/// @brief Capability interface for anything that reacts to events.
///
/// handle() runs to completion before the next event is dispatched. A
/// handler reports failure by throwing; the EventBus records the failure
/// as a fault against name() and carries on with the other subscribers.
///
/// @see EventBus::subscribe
/// @ingroup core_events
class Subscriber {
public:
    virtual ~Subscriber() = default;

    /// @brief React to a dispatched event.
    /// @throws any exception derived from std::exception on failure.
    virtual void handle(const Event& event) = 0;

    /// @brief Name used when recording faults raised by this subscriber.
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/// @brief Subscriber adapting a callable.
/// @ingroup core_events
class FunctionSubscriber : public Subscriber {
public:
    using Handler = std::function<void(const Event&)>;

    FunctionSubscriber(std::string name, Handler handler)
        : name_(std::move(name))
        , handler_(std::move(handler)) {}

    void handle(const Event& event) override { handler_(event); }

    [[nodiscard]] std::string_view name() const noexcept override { return name_; }

private:
    std::string name_;
    Handler handler_;
};

} // namespace dcsim::core
