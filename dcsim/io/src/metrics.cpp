#include <dcsim/io/metrics.hpp>
#include <dcsim/io/error.hpp>

#include <rapidjson/ostreamwrapper.h>
#include <rapidjson/prettywriter.h>

#include <cmath>
#include <fstream>

namespace dcsim::io {

namespace {

double round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

} // namespace

SimulationMetrics compute_metrics(const core::Simulation& simulation,
                                  const core::RunReport& report) {
    SimulationMetrics m;
    const auto& dc = simulation.datacenter();

    dc.requests().for_each([&](const core::Request& request) {
        if (request.ignored) {
            ++m.ignored;
            return;
        }
        ++m.requests;
        switch (request.status) {
            case core::RequestStatus::Arrived:
                ++m.pending;
                break;
            case core::RequestStatus::Accepted:
                ++m.accepted;
                break;
            case core::RequestStatus::Stopped:
                ++m.accepted;
                ++m.stopped;
                break;
            case core::RequestStatus::Rejected:
                ++m.rejected;
                break;
        }
    });
    if (m.requests > 0) {
        m.accept_rate = round2(static_cast<double>(m.accepted) / static_cast<double>(m.requests));
        m.reject_rate = round2(1.0 - m.accept_rate);
    }

    dc.vms().for_each([&](const core::VirtualMachine& vm) {
        if (vm.status == core::VmStatus::Allocated) {
            ++m.vm_allocations;
        } else if (vm.status == core::VmStatus::Deallocated) {
            ++m.vm_allocations;
            ++m.vm_deallocations;
        }
    });

    for (const auto& event : simulation.kernel().event_log()) {
        if (event.topic.family() == "deployment") {
            ++m.deployment_transitions[std::string(event.topic.name())];
        }
    }

    for (const auto& fault : report.faults) {
        ++m.faults[std::string(core::to_string(fault.kind))];
    }
    m.events_processed = report.events_processed;
    m.end_time = core::time_to_seconds(report.time);
    m.state = report.state;
    return m;
}

void print_report(const SimulationMetrics& metrics, std::string_view name, std::ostream& out) {
    out << name << "@" << metrics.end_time << "> Accept[" << metrics.accepted << " / "
        << metrics.requests << "] = " << metrics.accept_rate << "\n";
    out << name << "@" << metrics.end_time << "> Reject[" << metrics.rejected << " / "
        << metrics.requests << "] = " << metrics.reject_rate << "\n";
}

void write_metrics_json(const SimulationMetrics& metrics, std::ostream& out) {
    rapidjson::OStreamWrapper stream(out);
    rapidjson::PrettyWriter<rapidjson::OStreamWrapper> writer(stream);

    auto write_counts = [&](const char* key, const std::map<std::string, uint64_t>& counts) {
        writer.Key(key);
        writer.StartObject();
        for (const auto& [name, count] : counts) {
            writer.Key(name.c_str(), static_cast<rapidjson::SizeType>(name.size()));
            writer.Uint64(count);
        }
        writer.EndObject();
    };

    writer.StartObject();
    writer.Key("requests");
    writer.Uint64(metrics.requests);
    writer.Key("accepted");
    writer.Uint64(metrics.accepted);
    writer.Key("rejected");
    writer.Uint64(metrics.rejected);
    writer.Key("stopped");
    writer.Uint64(metrics.stopped);
    writer.Key("pending");
    writer.Uint64(metrics.pending);
    writer.Key("ignored");
    writer.Uint64(metrics.ignored);
    writer.Key("accept_rate");
    writer.Double(metrics.accept_rate);
    writer.Key("reject_rate");
    writer.Double(metrics.reject_rate);
    writer.Key("vm_allocations");
    writer.Uint64(metrics.vm_allocations);
    writer.Key("vm_deallocations");
    writer.Uint64(metrics.vm_deallocations);
    write_counts("deployment_transitions", metrics.deployment_transitions);
    write_counts("faults", metrics.faults);
    writer.Key("events_processed");
    writer.Uint64(metrics.events_processed);
    writer.Key("end_time");
    writer.Double(metrics.end_time);
    writer.Key("state");
    const auto state = core::to_string(metrics.state);
    writer.String(state.data(), static_cast<rapidjson::SizeType>(state.size()));
    writer.EndObject();

    stream.Flush();
    out << '\n';
}

void write_metrics_json(const SimulationMetrics& metrics, const std::filesystem::path& path) {
    std::ofstream file(path);
    if (!file) {
        throw LoaderError("cannot open file for writing", path.string());
    }
    write_metrics_json(metrics, file);
}

} // namespace dcsim::io
