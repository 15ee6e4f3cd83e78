#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace dcsim::algo {

/// @brief Exception thrown when a policy is requested by an unknown name.
/// @ingroup algo
///
/// Raised by make_allocator() and make_admission_policy() for names that
/// match no built-in policy.
class UnknownPolicyError : public std::invalid_argument {
public:
    /// @param family Kind of policy looked up (e.g. `"allocator"`).
    /// @param name   The name that matched nothing.
    UnknownPolicyError(std::string_view family, std::string_view name)
        : std::invalid_argument("unknown " + std::string(family) + " '" + std::string(name) + "'")
        , name_(name) {}

    /// @brief The name that was looked up.
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
};

} // namespace dcsim::algo
