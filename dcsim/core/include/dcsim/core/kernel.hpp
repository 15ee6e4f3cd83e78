#pragma once

#include <dcsim/core/clock.hpp>
#include <dcsim/core/event.hpp>
#include <dcsim/core/event_bus.hpp>
#include <dcsim/core/event_queue.hpp>
#include <dcsim/core/fault.hpp>
#include <dcsim/core/trace_writer.hpp>
#include <dcsim/core/types.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dcsim::core {

/// @brief Lifecycle of the kernel main loop.
/// @ingroup core_engine
enum class KernelState {
    Idle,     ///< No event processed yet.
    Running,  ///< Inside run().
    Drained,  ///< Queue empty, horizon reached or stop requested.
    Aborted   ///< Halted by a KernelFault; cannot be resumed.
};

[[nodiscard]] std::string_view to_string(KernelState state) noexcept;

/// @brief Termination limits for Kernel::run().
///
/// Both limits are optional. Without any, the run goes on until the queue
/// is empty, which never happens if handlers reschedule forever.
///
/// @ingroup core_engine
struct RunLimits {
    /// Events with a timestamp past this horizon stay queued; the run ends
    /// Drained.
    std::optional<TimePoint> end_time;
    /// Safety valve: dispatching more events than this in one run records a
    /// KernelFault and ends the run Aborted.
    std::optional<uint64_t> max_events;
};

/// @brief Outcome of a call to Kernel::run().
/// @ingroup core_engine
struct RunReport {
    KernelState state;
    TimePoint time;             ///< Virtual time when the run ended.
    uint64_t events_processed;  ///< Cumulative over all runs.
    std::vector<Fault> faults;  ///< Every fault recorded so far.
};

/// @brief Discrete-event simulation kernel.
///
/// The Kernel owns the Clock, the EventQueue and the EventBus and drives the
/// main loop: pop the earliest event, advance the clock to its timestamp,
/// publish it on the bus. Subscribers react by mutating entity state and
/// scheduling follow-up events, possibly at later virtual times but never
/// in the past.
///
/// Everything is single-threaded: a handler runs to completion before the
/// next event is popped, so entity state needs no locking.
///
/// @code
/// core::Kernel kernel;
/// kernel.subscribe(core::TopicPattern::parse("vm.*"), "printer",
///                  [](const core::Event& ev) { ... });
/// kernel.schedule(core::TopicKind::VmAllocate, core::time_from_seconds(1.0),
///                 core::VmNotice{vm});
/// auto report = kernel.run({.end_time = core::time_from_seconds(100.0)});
/// @endcode
///
/// @see EventQueue, EventBus, Simulation
/// @ingroup core_engine
class Kernel {
public:
    Kernel();
    ~Kernel() = default;

    Kernel(const Kernel&) = delete;
    Kernel& operator=(const Kernel&) = delete;
    Kernel(Kernel&&) = delete;
    Kernel& operator=(Kernel&&) = delete;

    /// @brief Returns the current virtual time.
    [[nodiscard]] TimePoint now() const noexcept { return clock_.now(); }

    [[nodiscard]] KernelState state() const noexcept { return state_; }

    /// @brief Enqueue an event at an absolute time.
    /// @throws InvalidTimeError if @p when < now(); the queue is left unchanged.
    void schedule(Topic topic, TimePoint when, Payload payload = {});

    /// @brief Enqueue an event @p delay after now().
    /// @throws InvalidTimeError if @p delay is negative.
    void schedule_after(Topic topic, Duration delay, Payload payload = {});

    /// @brief Register a subscriber (not owned).
    SubscriptionId subscribe(TopicPattern pattern, Subscriber& subscriber);

    /// @brief Register a callable under @p name.
    SubscriptionId subscribe(TopicPattern pattern, std::string name,
                             FunctionSubscriber::Handler handler);

    void unsubscribe(SubscriptionId id) noexcept;

    /// @brief Run the main loop until the queue drains or a limit is hit.
    ///
    /// A Drained kernel may be run again after scheduling more events. If an
    /// exception escapes the loop (a throwing trace writer, for instance) the
    /// kernel returns to its state before the call and the event in flight
    /// is dropped.
    ///
    /// @return Terminal state, time and the full fault list.
    /// @throws InvalidStateError if the kernel is Aborted or already running.
    RunReport run(RunLimits limits = {});

    /// @brief End the current run once the event being dispatched completes.
    void request_stop() noexcept { stop_requested_ = true; }

    /// @brief Record a recovered fault without throwing.
    ///
    /// Used by handlers that reject a mutation but keep going. Outside of a
    /// `sim.log` dispatch the fault is also published as a `sim.log`
    /// diagnostic at the current time.
    void report_fault(FaultKind kind, std::string source, std::string message);

    /// @brief Set the trace writer (not owned). Pass nullptr to disable tracing.
    void set_trace_writer(TraceWriter* writer) noexcept { trace_writer_ = writer; }

    /// @brief Invoke a tracing callback only if a trace writer is set.
    /// @tparam F Callable with signature void(TraceWriter&).
    template<typename F>
    void trace(F&& func);

    /// @brief Keep a copy of every dispatched event (enabled by default).
    void set_event_log_enabled(bool enabled) noexcept { event_log_enabled_ = enabled; }

    /// @brief Dispatched events, in dispatch order.
    [[nodiscard]] const std::vector<Event>& event_log() const noexcept { return event_log_; }

    [[nodiscard]] const std::vector<Fault>& faults() const noexcept { return faults_; }

    [[nodiscard]] uint64_t events_processed() const noexcept { return events_processed_; }

    [[nodiscard]] std::size_t pending_events() const noexcept { return queue_.size(); }

    /// @brief Event being dispatched, or nullptr outside dispatch.
    [[nodiscard]] const Event* current_event() const noexcept { return current_event_; }

private:
    void dispatch(const Event& event);
    [[nodiscard]] RunReport make_report() const;
    void abort_run(std::string topic, std::string message);
    void record_fault(FaultKind kind, std::string topic, std::string source,
                      std::string message);

    Clock clock_;
    EventQueue queue_;
    EventBus bus_;
    KernelState state_{KernelState::Idle};
    bool stop_requested_{false};
    bool event_log_enabled_{true};
    uint64_t events_processed_{0};
    const Event* current_event_{nullptr};
    TraceWriter* trace_writer_{nullptr};
    std::vector<Event> event_log_;
    std::vector<Fault> faults_;
};

template<typename F>
void Kernel::trace(F&& func) {
    if (trace_writer_) {
        trace_writer_->begin(clock_.now());
        func(*trace_writer_);
        trace_writer_->end();
    }
}

} // namespace dcsim::core
