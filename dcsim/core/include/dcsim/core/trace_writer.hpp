#pragma once

#include <dcsim/core/types.hpp>

#include <cstdint>
#include <string_view>

namespace dcsim::core {

/// @brief Sink for trace records.
/// @ingroup core
///
/// The Kernel emits one record per dispatched event and one per fault;
/// policies may add decision records of their own. A record is
/// `begin(time)`, one `type(name)`, any number of `field()` calls, then
/// `end()`. The Kernel does not own its writer.
///
/// @see Kernel::set_trace_writer()
class TraceWriter {
public:
    virtual ~TraceWriter() = default;

    virtual void begin(TimePoint time) = 0;

    /// @brief Record type: an event topic, `"fault"`, or a policy tag.
    virtual void type(std::string_view name) = 0;

    virtual void field(std::string_view key, double value) = 0;
    virtual void field(std::string_view key, uint64_t value) = 0;
    virtual void field(std::string_view key, std::string_view value) = 0;

    virtual void end() = 0;

protected:
    TraceWriter() = default;
    TraceWriter(const TraceWriter&) = default;
    TraceWriter& operator=(const TraceWriter&) = default;
    TraceWriter(TraceWriter&&) = default;
    TraceWriter& operator=(TraceWriter&&) = default;
};

} // namespace dcsim::core
