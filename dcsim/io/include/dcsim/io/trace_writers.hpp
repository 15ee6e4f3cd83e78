#pragma once

/// @file trace_writers.hpp
/// @brief Concrete TraceWriter implementations for simulation output.
///
/// All writers implement @ref core::TraceWriter: a no-op writer, a JSON
/// writer streaming an array of records, an in-memory buffer for tests and
/// analysis, and an aligned one-line-per-record textual writer. Times are
/// written in seconds.
///
/// @ingroup io_writers

#include <dcsim/core/trace_writer.hpp>

#include <rapidjson/ostreamwrapper.h>
#include <rapidjson/writer.h>

#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace dcsim::io {

/// @brief Trace writer that discards every record.
/// @ingroup io_writers
class NullTraceWriter : public core::TraceWriter {
public:
    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;
};

/// @brief Trace writer streaming a JSON array of records.
///
/// Each record becomes `{"time": <s>, "type": "...", <fields>...}`. The
/// closing bracket is written by finalize() or by the destructor.
///
/// Non-copyable and non-movable because it holds a reference to the
/// output stream.
///
/// @ingroup io_writers
/// @see MemoryTraceWriter, TextualTraceWriter
class JsonTraceWriter : public core::TraceWriter {
public:
    /// @param output Destination stream (must outlive this writer).
    explicit JsonTraceWriter(std::ostream& output);
    ~JsonTraceWriter() override;

    JsonTraceWriter(const JsonTraceWriter&) = delete;
    JsonTraceWriter& operator=(const JsonTraceWriter&) = delete;
    JsonTraceWriter(JsonTraceWriter&&) = delete;
    JsonTraceWriter& operator=(JsonTraceWriter&&) = delete;

    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

    /// @brief Close the JSON array. Further calls have no effect.
    void finalize();

private:
    void key(std::string_view name);

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    rapidjson::OStreamWrapper stream_;
    rapidjson::Writer<rapidjson::OStreamWrapper> writer_;
    bool finalized_{false};
};

/// @brief Value of a trace field.
using TraceValue = std::variant<double, uint64_t, std::string>;

/// @brief A single trace record stored in memory.
/// @ingroup io_writers
/// @see MemoryTraceWriter
struct TraceRecord {
    double time{0.0};  ///< Virtual time in seconds.
    std::string type;  ///< Topic string, `"fault"`, `"vm_placed"`, ...
    std::map<std::string, TraceValue, std::less<>> fields;

    /// @brief Unsigned field value, if present with that type.
    [[nodiscard]] std::optional<uint64_t> uint_field(std::string_view key) const;

    /// @brief String field value, if present with that type.
    [[nodiscard]] std::optional<std::string> string_field(std::string_view key) const;
};

/// @brief Trace writer buffering every record in memory.
/// @ingroup io_writers
class MemoryTraceWriter : public core::TraceWriter {
public:
    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

    [[nodiscard]] const std::vector<TraceRecord>& records() const noexcept { return records_; }

    /// @brief Records of the given type, in write order.
    [[nodiscard]] std::vector<TraceRecord> records_of(std::string_view type) const;

    void clear() noexcept { records_.clear(); }

private:
    std::vector<TraceRecord> records_;
    TraceRecord current_;
};

/// @brief Human-readable trace writer, one aligned line per record.
///
/// Format: `[    time] (+   delta)            type: key = value, ...`.
/// With colour enabled, fault records are printed in red and `sim.log`
/// records in yellow.
///
/// @ingroup io_writers
class TextualTraceWriter : public core::TraceWriter {
public:
    /// @param output        Destination stream (must outlive this writer).
    /// @param color_enabled Emit ANSI escape codes.
    explicit TextualTraceWriter(std::ostream& output, bool color_enabled = true);

    TextualTraceWriter(const TextualTraceWriter&) = delete;
    TextualTraceWriter& operator=(const TextualTraceWriter&) = delete;
    TextualTraceWriter(TextualTraceWriter&&) = delete;
    TextualTraceWriter& operator=(TextualTraceWriter&&) = delete;

    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

private:
    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    bool color_enabled_;
    double current_time_{0.0};
    std::optional<double> prev_time_;
    std::string current_type_;
    std::vector<std::pair<std::string, std::string>> current_fields_;
};

} // namespace dcsim::io
