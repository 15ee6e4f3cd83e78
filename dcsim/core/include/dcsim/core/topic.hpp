#pragma once

#include <string>
#include <string_view>

namespace dcsim::core {

/// @brief Closed set of topics known to the kernel.
///
/// One tag per row of the topic catalog. Custom topics use TopicKind::Named
/// and carry their own string.
///
/// @see Topic, to_string(TopicKind)
/// @ingroup core_events
enum class TopicKind {
    RequestArrive,
    RequestAccept,
    RequestReject,
    RequestStop,
    ActionExecute,
    AppStart,
    AppStop,
    ContainerStart,
    ContainerStop,
    ControllerStart,
    ControllerStop,
    DeploymentRun,
    DeploymentPend,
    DeploymentDegrade,
    DeploymentScale,
    DeploymentStop,
    VmAllocate,
    VmDeallocate,
    SimLog,
    Named
};

/// @brief Returns the catalog string of a topic kind (e.g. `"vm.allocate"`).
///
/// Returns `"named"` for TopicKind::Named; use Topic::name() for the
/// custom string.
[[nodiscard]] std::string_view to_string(TopicKind kind) noexcept;

/// @brief Identifier of an event category.
///
/// Either one of the catalog tags or a custom named topic. Two topics are
/// equal when their kinds are equal and, for named topics, their strings
/// are equal.
///
/// @see parse_topic, TopicPattern
/// @ingroup core_events
class Topic {
public:
    /// @brief Construct a catalog topic.
    /// @throws InvalidArgumentError if @p kind is TopicKind::Named.
    Topic(TopicKind kind);  // NOLINT(google-explicit-constructor)

    /// @brief Construct a custom topic.
    ///
    /// Catalog strings are folded to their tag, so
    /// `Topic::named("vm.allocate") == TopicKind::VmAllocate`.
    /// @throws InvalidArgumentError if @p name is empty or contains `*`.
    static Topic named(std::string_view name);

    [[nodiscard]] TopicKind kind() const noexcept { return kind_; }

    /// @brief Full topic string (catalog string or custom name).
    [[nodiscard]] std::string_view name() const noexcept;

    /// @brief Part of the name before the first `.`, or the whole name.
    [[nodiscard]] std::string_view family() const noexcept;

    bool operator==(const Topic& rhs) const noexcept = default;

private:
    Topic(TopicKind kind, std::string custom);

    TopicKind kind_;
    std::string custom_;
};

/// @brief Map a topic string to a Topic.
///
/// Catalog strings map to their tag; anything else becomes a named topic.
/// @throws InvalidArgumentError if @p text is empty or contains `*`.
[[nodiscard]] Topic parse_topic(std::string_view text);

/// @brief Subscription filter matched against event topics.
///
/// Three forms are accepted:
///   - exact topic: `"vm.allocate"`, `"my.custom"`
///   - family wildcard: `"deployment.*"` matches every topic whose family
///     (the part before the first `.`) is `deployment`
///   - global wildcard: `"*"` matches every topic
///
/// @see EventBus::subscribe
/// @ingroup core_events
class TopicPattern {
public:
    /// @brief Pattern matching exactly @p topic.
    TopicPattern(Topic topic);  // NOLINT(google-explicit-constructor)

    /// @brief Pattern matching exactly the catalog topic @p kind.
    TopicPattern(TopicKind kind);  // NOLINT(google-explicit-constructor)

    /// @brief Parse a pattern string.
    /// @throws InvalidArgumentError on an empty pattern, an empty family
    ///         before `.*`, or a `*` in any other position.
    static TopicPattern parse(std::string_view text);

    /// @brief Pattern matching every topic.
    static TopicPattern any();

    /// @brief Pattern matching every topic of @p family.
    static TopicPattern family(std::string_view family);

    [[nodiscard]] bool matches(const Topic& topic) const noexcept;

    /// @brief Pattern in its textual form.
    [[nodiscard]] std::string str() const;

private:
    enum class Form { Exact, Family, Any };

    TopicPattern(Form form, Topic exact, std::string family);

    Form form_;
    Topic exact_;
    std::string family_;
};

} // namespace dcsim::core
