#include <dcsim/core/kernel.hpp>
#include <dcsim/core/error.hpp>

#include <tracy/Tracy.hpp>

#include <utility>

namespace dcsim::core {

std::string_view to_string(KernelState state) noexcept {
    switch (state) {
        case KernelState::Idle:
            return "Idle";
        case KernelState::Running:
            return "Running";
        case KernelState::Drained:
            return "Drained";
        case KernelState::Aborted:
            return "Aborted";
    }
    return "Unknown";
}

Kernel::Kernel()
    : bus_([this](const Event& event, const Subscriber& subscriber, FaultKind kind,
                  const std::string& message) {
          record_fault(kind, std::string(event.topic.name()), std::string(subscriber.name()),
                       message);
      }) {}

void Kernel::schedule(Topic topic, TimePoint when, Payload payload) {
    if (when < clock_.now()) {
        throw InvalidTimeError("cannot schedule '" + std::string(topic.name()) + "' at t=" +
                               std::to_string(time_to_seconds(when)) + "s, before now (t=" +
                               std::to_string(time_to_seconds(clock_.now())) + "s)");
    }
    queue_.push(std::move(topic), when, std::move(payload));
}

void Kernel::schedule_after(Topic topic, Duration delay, Payload payload) {
    schedule(std::move(topic), clock_.now() + delay, std::move(payload));
}

SubscriptionId Kernel::subscribe(TopicPattern pattern, Subscriber& subscriber) {
    return bus_.subscribe(std::move(pattern), subscriber);
}

SubscriptionId Kernel::subscribe(TopicPattern pattern, std::string name,
                                 FunctionSubscriber::Handler handler) {
    return bus_.subscribe(std::move(pattern), std::move(name), std::move(handler));
}

void Kernel::unsubscribe(SubscriptionId id) noexcept {
    bus_.unsubscribe(id);
}

RunReport Kernel::run(RunLimits limits) {
    if (state_ == KernelState::Aborted) {
        throw InvalidStateError("kernel was aborted and cannot be resumed");
    }
    if (state_ == KernelState::Running) {
        throw InvalidStateError("kernel is already running");
    }

    // Any exception leaving the loop puts the kernel back where it was
    struct RunGuard {
        KernelState& state;
        const Event*& current;
        KernelState resume;
        ~RunGuard() {
            current = nullptr;
            if (state == KernelState::Running) {
                state = resume;
            }
        }
    } guard{state_, current_event_, state_};

    state_ = KernelState::Running;
    stop_requested_ = false;
    uint64_t dispatched = 0;

    while (!stop_requested_) {
        auto next = queue_.next_time();
        if (!next) {
            break;
        }
        if (limits.end_time && *next > *limits.end_time) {
            break;
        }
        if (limits.max_events && dispatched >= *limits.max_events) {
            abort_run("", "event limit of " + std::to_string(*limits.max_events) +
                              " reached with " + std::to_string(queue_.size()) +
                              " events pending");
            return make_report();
        }

        auto event = queue_.pop();
        clock_.advance_to(event->timestamp);
        try {
            dispatch(*event);
        } catch (const KernelFault& e) {
            current_event_ = nullptr;
            abort_run(std::string(event->topic.name()), e.what());
            return make_report();
        }
        ++dispatched;
    }

    state_ = KernelState::Drained;
    return make_report();
}

RunReport Kernel::make_report() const {
    return RunReport{state_, clock_.now(), events_processed_, faults_};
}

void Kernel::abort_run(std::string topic, std::string message) {
    record_fault(FaultKind::KernelFault, std::move(topic), "kernel", std::move(message));
    state_ = KernelState::Aborted;
}

void Kernel::dispatch(const Event& event) {
    ZoneScoped;

    current_event_ = &event;
    ++events_processed_;
    if (event_log_enabled_) {
        event_log_.push_back(event);
    }

    trace([&](TraceWriter& w) {
        w.type(event.topic.name());
        w.field("seq", event.sequence);
        trace_payload(w, event.payload);
    });

    bus_.publish(event);
    current_event_ = nullptr;
}

void Kernel::report_fault(FaultKind kind, std::string source, std::string message) {
    std::string topic = current_event_ ? std::string(current_event_->topic.name()) : "";
    record_fault(kind, std::move(topic), std::move(source), std::move(message));
}

void Kernel::record_fault(FaultKind kind, std::string topic, std::string source,
                          std::string message) {
    trace([&](TraceWriter& w) {
        w.type("fault");
        w.field("kind", to_string(kind));
        w.field("topic", topic);
        w.field("source", source);
        w.field("message", message);
    });

    // A fault raised while handling sim.log is not re-published
    bool publish = current_event_ != nullptr && current_event_->topic.kind() != TopicKind::SimLog;
    std::string diagnostic = std::string(to_string(kind)) + ": " + message;
    faults_.push_back(Fault{kind, clock_.now(), std::move(topic), source, std::move(message)});

    if (publish) {
        queue_.push(TopicKind::SimLog, clock_.now(), LogMessage{std::move(source), std::move(diagnostic)});
    }
}

} // namespace dcsim::core
