#include <dcsim/core/topic.hpp>
#include <dcsim/core/error.hpp>

#include <array>
#include <utility>

namespace dcsim::core {

namespace {

struct CatalogEntry {
    TopicKind kind;
    std::string_view name;
};

constexpr std::array<CatalogEntry, 19> kCatalog{{
    {TopicKind::RequestArrive, "request.arrive"},
    {TopicKind::RequestAccept, "request.accept"},
    {TopicKind::RequestReject, "request.reject"},
    {TopicKind::RequestStop, "request.stop"},
    {TopicKind::ActionExecute, "action.execute"},
    {TopicKind::AppStart, "app.start"},
    {TopicKind::AppStop, "app.stop"},
    {TopicKind::ContainerStart, "container.start"},
    {TopicKind::ContainerStop, "container.stop"},
    {TopicKind::ControllerStart, "controller.start"},
    {TopicKind::ControllerStop, "controller.stop"},
    {TopicKind::DeploymentRun, "deployment.run"},
    {TopicKind::DeploymentPend, "deployment.pend"},
    {TopicKind::DeploymentDegrade, "deployment.degrade"},
    {TopicKind::DeploymentScale, "deployment.scale"},
    {TopicKind::DeploymentStop, "deployment.stop"},
    {TopicKind::VmAllocate, "vm.allocate"},
    {TopicKind::VmDeallocate, "vm.deallocate"},
    {TopicKind::SimLog, "sim.log"},
}};

void validate_topic_text(std::string_view text) {
    if (text.empty()) {
        throw InvalidArgumentError("topic must not be empty");
    }
    if (text.find('*') != std::string_view::npos) {
        throw InvalidArgumentError("topic '" + std::string(text) + "' must not contain '*'");
    }
}

std::string_view family_of(std::string_view name) noexcept {
    auto dot = name.find('.');
    return dot == std::string_view::npos ? name : name.substr(0, dot);
}

} // namespace

std::string_view to_string(TopicKind kind) noexcept {
    for (const auto& entry : kCatalog) {
        if (entry.kind == kind) {
            return entry.name;
        }
    }
    return "named";
}

Topic::Topic(TopicKind kind)
    : kind_(kind) {
    if (kind == TopicKind::Named) {
        throw InvalidArgumentError("named topics must be built with Topic::named()");
    }
}

Topic::Topic(TopicKind kind, std::string custom)
    : kind_(kind)
    , custom_(std::move(custom)) {}

Topic Topic::named(std::string_view name) {
    validate_topic_text(name);
    for (const auto& entry : kCatalog) {
        if (entry.name == name) {
            return Topic{entry.kind};
        }
    }
    return Topic{TopicKind::Named, std::string(name)};
}

std::string_view Topic::name() const noexcept {
    if (kind_ == TopicKind::Named) {
        return custom_;
    }
    return to_string(kind_);
}

std::string_view Topic::family() const noexcept {
    return family_of(name());
}

Topic parse_topic(std::string_view text) {
    return Topic::named(text);
}

// =============================================================================
// TopicPattern
// =============================================================================

TopicPattern::TopicPattern(Form form, Topic exact, std::string family)
    : form_(form)
    , exact_(std::move(exact))
    , family_(std::move(family)) {}

TopicPattern::TopicPattern(Topic topic)
    : TopicPattern(Form::Exact, std::move(topic), {}) {}

TopicPattern::TopicPattern(TopicKind kind)
    : TopicPattern(Topic{kind}) {}

TopicPattern TopicPattern::any() {
    return TopicPattern{Form::Any, Topic{TopicKind::SimLog}, {}};
}

TopicPattern TopicPattern::family(std::string_view family) {
    if (family.empty() || family.find_first_of(".*") != std::string_view::npos) {
        throw InvalidArgumentError("invalid topic family '" + std::string(family) + "'");
    }
    return TopicPattern{Form::Family, Topic{TopicKind::SimLog}, std::string(family)};
}

TopicPattern TopicPattern::parse(std::string_view text) {
    if (text.empty()) {
        throw InvalidArgumentError("topic pattern must not be empty");
    }
    if (text == "*") {
        return any();
    }
    constexpr std::string_view wildcard_suffix = ".*";
    if (text.size() > wildcard_suffix.size() && text.ends_with(wildcard_suffix)) {
        return family(text.substr(0, text.size() - wildcard_suffix.size()));
    }
    if (text == wildcard_suffix) {
        throw InvalidArgumentError("topic pattern '.*' has an empty family");
    }
    return TopicPattern{parse_topic(text)};
}

bool TopicPattern::matches(const Topic& topic) const noexcept {
    switch (form_) {
        case Form::Any:
            return true;
        case Form::Family:
            return topic.family() == family_;
        case Form::Exact:
            return topic == exact_;
    }
    return false;
}

std::string TopicPattern::str() const {
    switch (form_) {
        case Form::Any:
            return "*";
        case Form::Family:
            return family_ + ".*";
        case Form::Exact:
            return std::string(exact_.name());
    }
    return {};
}

} // namespace dcsim::core
