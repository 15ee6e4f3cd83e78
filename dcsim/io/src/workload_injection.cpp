#include <dcsim/io/workload_injection.hpp>
#include <dcsim/io/error.hpp>

#include <utility>

namespace dcsim::io {

namespace {

template<typename Map>
const auto& resolve(const Map& map, const std::string& name, const char* what,
                    const std::string& context) {
    auto it = map.find(name);
    if (it == map.end()) {
        throw LoaderError(std::string("unknown ") + what + " '" + name + "'", context);
    }
    return it->second;
}

core::StepCommand make_command(const StepSpec& step, const InjectedWorkload& ids,
                               const WorkloadData& data, const std::string& ctx) {
    switch (step.kind) {
        case StepKind::Apply: {
            core::ApplyDeployment apply;
            apply.deployment = resolve(ids.deployments, step.deployment, "deployment", ctx);
            apply.name = step.deployment;
            apply.replicas = step.replicas;
            apply.containers = step.containers;
            if (!step.controller.empty()) {
                apply.controller = resolve(ids.workloads, step.controller, "controller", ctx);
                bool is_controller = false;
                for (const auto& request : data.requests) {
                    for (const auto& w : request.workloads) {
                        if (w.name == step.controller) {
                            is_controller = w.kind == core::WorkloadKind::Controller;
                        }
                    }
                }
                if (!is_controller) {
                    throw LoaderError("workload '" + step.controller + "' is not a controller", ctx);
                }
            }
            return apply;
        }
        case StepKind::Scale:
            return core::ScaleDeployment{
                resolve(ids.deployments, step.deployment, "deployment", ctx), step.replicas};
        case StepKind::Delete:
            return core::DeleteDeployment{
                resolve(ids.deployments, step.deployment, "deployment", ctx)};
        case StepKind::StopRequest:
            return core::StopRequest{resolve(ids.requests, step.request, "request", ctx).request};
        case StepKind::Start:
            return core::StartWorkload{resolve(ids.workloads, step.workload, "workload", ctx)};
        case StepKind::Stop:
            return core::StopWorkload{resolve(ids.workloads, step.workload, "workload", ctx)};
        case StepKind::Log:
            return core::LogNote{step.message};
    }
    throw LoaderError("unhandled step kind", ctx);
}

} // namespace

InjectedWorkload inject_workload(core::Simulation& simulation, const WorkloadData& data) {
    InjectedWorkload ids;

    // Reserve everything first so that references may point forward
    for (const auto& request : data.requests) {
        if (ids.requests.contains(request.name)) {
            throw LoaderError("duplicate request name '" + request.name + "'", "workload");
        }
        auto handle = simulation.reserve_request(request.workloads.size());
        for (std::size_t i = 0; i < request.workloads.size(); ++i) {
            if (!ids.workloads.emplace(request.workloads[i].name, handle.workloads[i]).second) {
                throw LoaderError("duplicate workload name '" + request.workloads[i].name + "'",
                                  "workload");
            }
        }
        ids.requests.emplace(request.name, std::move(handle));
    }
    for (const auto& action : data.actions) {
        for (const auto& step : action.steps) {
            if (step.kind == StepKind::Apply && !ids.deployments.contains(step.deployment)) {
                ids.deployments.emplace(step.deployment, simulation.reserve_deployment());
            }
        }
    }

    // Resolve every reference before anything is scheduled
    std::vector<core::RequestArrival> arrivals;
    for (std::size_t r = 0; r < data.requests.size(); ++r) {
        const auto& request = data.requests[r];
        const auto& handle = ids.requests.at(request.name);
        std::string ctx = "requests[" + std::to_string(r) + "]";

        core::RequestArrival arrival;
        arrival.request = handle.request;
        arrival.vm = handle.vm;
        arrival.name = request.name;
        arrival.demand = request.demand;
        arrival.required = request.required;
        arrival.ignored = request.ignored;
        arrival.release_when_idle = request.release_when_idle;

        for (std::size_t i = 0; i < request.workloads.size(); ++i) {
            const auto& spec = request.workloads[i];
            core::WorkloadLaunch launch;
            launch.workload = handle.workloads[i];
            launch.kind = spec.kind;
            launch.name = spec.name;
            launch.demand = spec.demand;
            launch.run_for = spec.run_for;
            for (const auto& node : spec.nodes) {
                launch.nodes.push_back(
                    resolve(ids.requests, node, "request", ctx + ".workloads[" + std::to_string(i) + "]").vm);
            }
            arrival.launches.push_back(std::move(launch));
        }

        arrivals.push_back(std::move(arrival));
    }

    std::vector<std::vector<core::ActionStep>> scripts;
    for (std::size_t a = 0; a < data.actions.size(); ++a) {
        const auto& action = data.actions[a];
        std::vector<core::ActionStep> steps;
        for (std::size_t s = 0; s < action.steps.size(); ++s) {
            std::string ctx = "actions[" + std::to_string(a) + "].steps[" + std::to_string(s) + "]";
            const auto& step = action.steps[s];
            steps.push_back(core::ActionStep{step.delay, make_command(step, ids, data, ctx)});
        }
        scripts.push_back(std::move(steps));
    }

    for (std::size_t r = 0; r < arrivals.size(); ++r) {
        simulation.submit_request(data.requests[r].arrival, std::move(arrivals[r]));
    }
    for (std::size_t a = 0; a < scripts.size(); ++a) {
        const auto& action = data.actions[a];
        ids.actions.push_back(
            simulation.submit_action(action.arrival, action.name, std::move(scripts[a])));
    }

    return ids;
}

} // namespace dcsim::io
