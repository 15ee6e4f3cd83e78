#include <dcsim/core/lifecycle.hpp>
#include <dcsim/core/error.hpp>
#include <dcsim/core/simulation.hpp>

namespace dcsim::core {

void ActionRunner::handle(const Event& event) {
    if (event.topic.kind() != TopicKind::ActionExecute) {
        return;
    }

    auto& kernel = sim_.kernel();
    const auto& ref = payload_as<ActionStepRef>(event);
    auto& action = sim_.datacenter().actions().at(ref.action);
    if (ref.step >= action.steps.size()) {
        throw OutOfRangeError("action '" + action.name + "' has no step " +
                              std::to_string(ref.step));
    }

    action.executed = ref.step + 1;
    if (action.executed < action.steps.size()) {
        kernel.schedule(TopicKind::ActionExecute,
                        kernel.now() + action.steps[action.executed].delay,
                        ActionStepRef{action.id, action.executed});
    }

    auto* interpreter = sim_.action_interpreter();
    if (interpreter == nullptr) {
        throw InvalidStateError("no action interpreter installed; step " +
                                std::to_string(ref.step) + " of action '" + action.name +
                                "' ignored");
    }
    interpreter->execute(action, ref.step, sim_);
}

} // namespace dcsim::core
