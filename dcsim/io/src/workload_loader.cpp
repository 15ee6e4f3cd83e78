#include <dcsim/io/workload_loader.hpp>
#include <dcsim/io/error.hpp>

#include "json_fields.hpp"

#include <cstdint>
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace dcsim::io {

namespace {

using namespace detail;

core::Resources parse_demand(const rapidjson::Value& obj, const std::string& ctx) {
    core::Resources demand;
    demand.cpu = get_uint64(obj, "cpu", ctx);
    demand.ram = get_uint64(obj, "ram", ctx);
    demand.gpu = get_uint64_or(obj, "gpu", 0, ctx);
    return demand;
}

void check_upper_bound(double seconds, const char* name, const std::string& ctx) {
    if (seconds > core::max_input_seconds) {
        throw LoaderError(std::string("field '") + name + "' must not exceed " +
                              std::to_string(static_cast<uint64_t>(core::max_input_seconds)) +
                              " seconds",
                          ctx);
    }
}

core::TimePoint parse_instant(const rapidjson::Value& obj, const char* name,
                              const std::string& ctx) {
    double seconds = get_double(obj, name, ctx);
    if (seconds < 0.0) {
        throw LoaderError(std::string("field '") + name + "' must not be negative", ctx);
    }
    check_upper_bound(seconds, name, ctx);
    return core::time_from_seconds(seconds);
}

core::WorkloadKind parse_workload_kind(const std::string& text, const std::string& ctx) {
    if (text == "app") {
        return core::WorkloadKind::App;
    }
    if (text == "container") {
        return core::WorkloadKind::Container;
    }
    if (text == "controller") {
        return core::WorkloadKind::Controller;
    }
    throw LoaderError("unknown workload kind '" + text + "'", ctx);
}

WorkloadSpec parse_workload(const rapidjson::Value& obj, const std::string& ctx) {
    if (!obj.IsObject()) {
        throw LoaderError("workload must be an object", ctx);
    }

    WorkloadSpec spec;
    spec.kind = parse_workload_kind(get_string(obj, "kind", ctx), ctx);
    spec.name = get_string(obj, "name", ctx);
    spec.demand = parse_demand(obj, ctx);

    if (obj.HasMember("run_for")) {
        double run_for = get_double(obj, "run_for", ctx);
        if (run_for <= 0.0) {
            throw LoaderError("field 'run_for' must be positive", ctx);
        }
        check_upper_bound(run_for, "run_for", ctx);
        spec.run_for = core::duration_from_seconds(run_for);
    }

    if (obj.HasMember("nodes")) {
        if (spec.kind != core::WorkloadKind::Controller) {
            throw LoaderError("only controllers have nodes", ctx);
        }
        const auto& nodes = get_array(obj, "nodes", ctx);
        for (rapidjson::SizeType idx = 0; idx < nodes.Size(); ++idx) {
            if (!nodes[idx].IsString()) {
                throw LoaderError("node must be a request name", element_path(ctx, "nodes", idx));
            }
            spec.nodes.emplace_back(nodes[idx].GetString(), nodes[idx].GetStringLength());
        }
    }
    return spec;
}

RequestSpec parse_request(const rapidjson::Value& obj, const std::string& ctx) {
    if (!obj.IsObject()) {
        throw LoaderError("request must be an object", ctx);
    }

    RequestSpec spec;
    spec.name = get_string(obj, "name", ctx);
    spec.arrival = parse_instant(obj, "arrival", ctx);
    spec.demand = parse_demand(obj, ctx);
    spec.required = get_bool_or(obj, "required", false, ctx);
    spec.ignored = get_bool_or(obj, "ignored", false, ctx);
    spec.release_when_idle = get_bool_or(obj, "release_when_idle", false, ctx);

    if (obj.HasMember("workloads")) {
        const auto& workloads = get_array(obj, "workloads", ctx);
        for (rapidjson::SizeType idx = 0; idx < workloads.Size(); ++idx) {
            spec.workloads.push_back(
                parse_workload(workloads[idx], element_path(ctx, "workloads", idx)));
        }
    }
    return spec;
}

StepSpec parse_step(const rapidjson::Value& obj, const std::string& ctx) {
    if (!obj.IsObject()) {
        throw LoaderError("step must be an object", ctx);
    }

    StepSpec step;
    const std::string kind = get_string(obj, "kind", ctx);
    try {
        step.kind = parse_step_kind(kind);
    } catch (const LoaderError& e) {
        throw LoaderError(e.what(), ctx);
    }

    double delay = get_double_or(obj, "delay", 0.0, ctx);
    if (delay < 0.0) {
        throw LoaderError("field 'delay' must not be negative", ctx);
    }
    check_upper_bound(delay, "delay", ctx);
    step.delay = core::duration_from_seconds(delay);

    switch (step.kind) {
        case StepKind::Apply: {
            step.deployment = get_string(obj, "deployment", ctx);
            if (obj.HasMember("controller")) {
                step.controller = get_string(obj, "controller", ctx);
            }
            step.replicas = get_uint64(obj, "replicas", ctx);
            const auto& containers = get_array(obj, "containers", ctx);
            for (rapidjson::SizeType idx = 0; idx < containers.Size(); ++idx) {
                const auto& c = containers[idx];
                std::string cctx = element_path(ctx, "containers", idx);
                if (!c.IsObject()) {
                    throw LoaderError("container must be an object", cctx);
                }
                step.containers.push_back(
                    core::ContainerSpec{get_string(c, "name", cctx), parse_demand(c, cctx)});
            }
            if (step.containers.empty()) {
                throw LoaderError("a deployment needs at least one container", ctx);
            }
            break;
        }
        case StepKind::Scale:
            step.deployment = get_string(obj, "deployment", ctx);
            step.replicas = get_uint64(obj, "replicas", ctx);
            break;
        case StepKind::Delete:
            step.deployment = get_string(obj, "deployment", ctx);
            break;
        case StepKind::StopRequest:
            step.request = get_string(obj, "request", ctx);
            break;
        case StepKind::Start:
        case StepKind::Stop:
            step.workload = get_string(obj, "workload", ctx);
            break;
        case StepKind::Log:
            step.message = get_string(obj, "message", ctx);
            break;
    }
    return step;
}

ActionSpec parse_action(const rapidjson::Value& obj, const std::string& ctx) {
    if (!obj.IsObject()) {
        throw LoaderError("action must be an object", ctx);
    }

    ActionSpec spec;
    spec.name = get_string(obj, "name", ctx);
    spec.arrival = parse_instant(obj, "arrival", ctx);
    const auto& steps = get_array(obj, "steps", ctx);
    for (rapidjson::SizeType idx = 0; idx < steps.Size(); ++idx) {
        spec.steps.push_back(parse_step(steps[idx], element_path(ctx, "steps", idx)));
    }
    return spec;
}

} // namespace

StepKind parse_step_kind(std::string_view text) {
    if (text == "apply") {
        return StepKind::Apply;
    }
    if (text == "scale") {
        return StepKind::Scale;
    }
    if (text == "delete") {
        return StepKind::Delete;
    }
    if (text == "stop_request") {
        return StepKind::StopRequest;
    }
    if (text == "start") {
        return StepKind::Start;
    }
    if (text == "stop") {
        return StepKind::Stop;
    }
    if (text == "log") {
        return StepKind::Log;
    }
    throw LoaderError("unknown step kind '" + std::string(text) + "'");
}

WorkloadData load_workload(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return load_workload_from_string(oss.str());
}

WorkloadData load_workload_from_string(std::string_view json) {
    rapidjson::Document doc;
    parse_document(doc, json, "workload");

    WorkloadData result;
    std::unordered_set<std::string> request_names;
    std::unordered_set<std::string> workload_names;

    if (doc.HasMember("requests")) {
        const auto& requests = get_array(doc, "requests", "workload");
        for (rapidjson::SizeType idx = 0; idx < requests.Size(); ++idx) {
            std::string ctx = element_path("", "requests", idx);
            auto spec = parse_request(requests[idx], ctx);
            if (!request_names.insert(spec.name).second) {
                throw LoaderError("duplicate request name '" + spec.name + "'", ctx);
            }
            for (const auto& w : spec.workloads) {
                if (!workload_names.insert(w.name).second) {
                    throw LoaderError("duplicate workload name '" + w.name + "'", ctx);
                }
            }
            result.requests.push_back(std::move(spec));
        }
    }

    if (doc.HasMember("actions")) {
        const auto& actions = get_array(doc, "actions", "workload");
        for (rapidjson::SizeType idx = 0; idx < actions.Size(); ++idx) {
            result.actions.push_back(parse_action(actions[idx], element_path("", "actions", idx)));
        }
    }

    return result;
}

} // namespace dcsim::io
