#include <dcsim/core/kernel.hpp>
#include <dcsim/core/simulation.hpp>
#include <dcsim/core/types.hpp>

#include <dcsim/algo/control_plane.hpp>
#include <dcsim/algo/error.hpp>
#include <dcsim/algo/policy_factory.hpp>
#include <dcsim/algo/standard_action_interpreter.hpp>

#include <dcsim/io/datacenter_loader.hpp>
#include <dcsim/io/error.hpp>
#include <dcsim/io/metrics.hpp>
#include <dcsim/io/trace_writers.hpp>
#include <dcsim/io/workload_injection.hpp>
#include <dcsim/io/workload_loader.hpp>

#include <cxxopts.hpp>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace {

namespace core = dcsim::core;
namespace algo = dcsim::algo;
namespace io = dcsim::io;

constexpr int kExitAborted = 3;
constexpr int kExitUsage = 64;

struct Config {
    std::string datacenter_file;
    std::string workload_file;
    std::string allocator{"first-fit"};
    std::string admission{"capacity"};
    std::optional<double> end_time;
    std::optional<uint64_t> max_events;
    std::string output_file{"-"};
    std::string format{"null"};
    bool metrics{false};
    std::string name{"dcsim"};
    bool verbose{false};
};

std::string allocator_help() {
    std::string help = "PM allocator: ";
    const auto names = algo::allocator_names();
    for (std::size_t i = 0; i < names.size(); ++i) {
        help += (i > 0 ? "|" : "") + std::string(names[i]);
    }
    return help + " (default: first-fit)";
}

Config parse_args(int argc, char** argv) {
    cxxopts::Options options("dcsim", "Discrete-event data-center simulator");

    options.add_options()
        ("d,datacenter", "Datacenter description (JSON)", cxxopts::value<std::string>())
        ("w,workload", "Requests and actions (JSON)", cxxopts::value<std::string>())
        ("a,allocator", allocator_help(),
            cxxopts::value<std::string>()->default_value("first-fit"))
        ("admission", "Admission policy: capacity|none (default: capacity)",
            cxxopts::value<std::string>()->default_value("capacity"))
        ("e,end-time", "Stop after this virtual time in seconds (default: until drained)",
            cxxopts::value<double>())
        ("max-events", "Abort after dispatching this many events", cxxopts::value<uint64_t>())
        ("o,output", "Trace output (default: stdout)", cxxopts::value<std::string>()->default_value("-"))
        ("format", "Trace format: json|text|null (default: null)",
            cxxopts::value<std::string>()->default_value("null"))
        ("metrics", "Print the report and metrics to stderr")
        ("n,name", "Simulation name used in the report", cxxopts::value<std::string>()->default_value("dcsim"))
        ("v,verbose", "Verbose output")
        ("h,help", "Show help");

    auto result = options.parse(argc, argv);

    if (result.count("help") != 0U) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    if (result.count("datacenter") == 0U) {
        std::cerr << "Error: --datacenter is required" << std::endl;
        std::exit(kExitUsage);
    }

    if (result.count("workload") == 0U) {
        std::cerr << "Error: --workload is required" << std::endl;
        std::exit(kExitUsage);
    }

    Config config;
    config.datacenter_file = result["datacenter"].as<std::string>();
    config.workload_file = result["workload"].as<std::string>();
    config.allocator = result["allocator"].as<std::string>();
    config.admission = result["admission"].as<std::string>();
    if (result.count("end-time") != 0U) {
        config.end_time = result["end-time"].as<double>();
    }
    if (result.count("max-events") != 0U) {
        config.max_events = result["max-events"].as<uint64_t>();
    }
    config.output_file = result["output"].as<std::string>();
    config.format = result["format"].as<std::string>();
    config.metrics = result.count("metrics") != 0U;
    config.name = result["name"].as<std::string>();
    config.verbose = result.count("verbose") != 0U;

    if (config.format != "json" && config.format != "text" && config.format != "null") {
        std::cerr << "Error: unknown trace format '" << config.format << "'" << std::endl;
        std::exit(kExitUsage);
    }
    if (config.end_time && !core::is_valid_input_seconds(*config.end_time)) {
        std::cerr << "Error: --end-time must be between 0 and "
                  << static_cast<uint64_t>(core::max_input_seconds) << " seconds" << std::endl;
        std::exit(kExitUsage);
    }

    return config;
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        auto config = parse_args(argc, argv);

        if (config.verbose) {
            std::cerr << "Loading datacenter from: " << config.datacenter_file << std::endl;
            std::cerr << "Loading workload from: " << config.workload_file << std::endl;
        }

        // 1. Create the simulation and its PM pool
        core::Simulation sim;
        io::apply_datacenter(sim, io::load_datacenter(config.datacenter_file));

        // 2. Install policies
        sim.set_allocator(algo::make_allocator(config.allocator));
        sim.set_admission_policy(algo::make_admission_policy(config.admission));
        auto control_plane = std::make_unique<algo::ControlPlane>(sim);
        sim.set_action_interpreter(
            std::make_unique<algo::StandardActionInterpreter>(control_plane.get()));

        // 3. Load and schedule the workload
        auto workload = io::load_workload(config.workload_file);
        io::inject_workload(sim, workload);

        if (config.verbose) {
            std::cerr << sim.datacenter().pms().size() << " hosts, " << workload.requests.size()
                      << " requests, " << workload.actions.size() << " actions" << std::endl;
            sim.kernel().subscribe(core::TopicKind::SimLog, "cli-log", [](const core::Event& ev) {
                const auto& log = core::payload_as<core::LogMessage>(ev);
                std::cerr << "[" << core::time_to_seconds(ev.timestamp) << "] " << log.source
                          << ": " << log.message << std::endl;
            });
        }

        // 4. Setup trace writer
        std::unique_ptr<core::TraceWriter> writer;
        std::ofstream outfile;
        std::ostream* out = &std::cout;
        if (config.format != "null" && config.output_file != "-") {
            outfile.open(config.output_file);
            if (!outfile) {
                std::cerr << "Error: cannot open output file: " << config.output_file << std::endl;
                return 1;
            }
            out = &outfile;
        }
        if (config.format == "json") {
            writer = std::make_unique<io::JsonTraceWriter>(*out);
        } else if (config.format == "text") {
            writer = std::make_unique<io::TextualTraceWriter>(*out, out == &std::cout);
        } else {
            writer = std::make_unique<io::NullTraceWriter>();
        }
        sim.kernel().set_trace_writer(writer.get());

        if (config.verbose) {
            std::cerr << "Starting simulation..." << std::endl;
        }

        // 5. Run
        core::RunLimits limits;
        if (config.end_time) {
            limits.end_time = core::time_from_seconds(*config.end_time);
        }
        limits.max_events = config.max_events;
        auto report = sim.run(limits);

        // 6. Finalize output
        if (auto* json = dynamic_cast<io::JsonTraceWriter*>(writer.get())) {
            json->finalize();
        }
        sim.kernel().set_trace_writer(nullptr);

        if (config.verbose) {
            std::cerr << "Simulation " << core::to_string(report.state)
                      << " at time: " << core::time_to_seconds(report.time) << "s after "
                      << report.events_processed << " events, " << report.faults.size()
                      << " faults" << std::endl;
        }

        if (config.metrics) {
            auto metrics = io::compute_metrics(sim, report);
            io::print_report(metrics, config.name, std::cerr);
            io::write_metrics_json(metrics, std::cerr);
        }

        if (report.state == core::KernelState::Aborted) {
            std::cerr << "Run aborted: " << report.faults.back().message << std::endl;
            return kExitAborted;
        }
        return 0;
    }
    catch (const io::LoaderError& e) {
        std::cerr << "Config error: " << e.what() << std::endl;
        return 1;
    }
    catch (const algo::UnknownPolicyError& e) {
        std::cerr << "Invalid args: " << e.what() << std::endl;
        return kExitUsage;
    }
    catch (const cxxopts::exceptions::exception& e) {
        std::cerr << "Invalid args: " << e.what() << std::endl;
        return kExitUsage;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
