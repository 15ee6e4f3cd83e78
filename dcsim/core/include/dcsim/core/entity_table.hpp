#pragma once

#include <dcsim/core/error.hpp>
#include <dcsim/core/types.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dcsim::core {

/// @brief Flat arena of entities addressed by a strong id.
///
/// Ids are dense indices handed out by reserve(). A reserved slot stays
/// empty until the entity is actually created by an event handler, which
/// lets drivers refer to entities (e.g. in an action step) before they
/// exist. Entities are never removed during a run, so terminal entities
/// remain queryable for reporting.
///
/// @tparam T  Entity type.
/// @tparam Id EntityId specialisation used as key.
/// @ingroup core_entities
template<typename T, typename Id>
class EntityTable {
public:
    explicit EntityTable(std::string_view kind)
        : kind_(kind) {}

    /// @brief Reserve the next id without creating the entity.
    Id reserve() {
        slots_.emplace_back(std::nullopt);
        return Id{slots_.size() - 1};
    }

    /// @brief Create the entity in a reserved slot.
    /// @throws OutOfRangeError if @p id was never reserved.
    /// @throws InvariantViolation if the entity already exists.
    T& emplace(Id id, T value) {
        check_range(id);
        auto& slot = slots_[id.value];
        if (slot) {
            throw InvariantViolation(kind_ + " " + std::to_string(id.value) + " already exists");
        }
        slot.emplace(std::move(value));
        return *slot;
    }

    /// @brief Reserve an id and create the entity at once.
    T& add(T value) {
        Id id = reserve();
        return emplace(id, std::move(value));
    }

    [[nodiscard]] bool contains(Id id) const noexcept {
        return id.value < slots_.size() && slots_[id.value].has_value();
    }

    /// @throws OutOfRangeError if the entity does not exist.
    [[nodiscard]] T& at(Id id) {
        check_exists(id);
        return *slots_[id.value];
    }

    /// @throws OutOfRangeError if the entity does not exist.
    [[nodiscard]] const T& at(Id id) const {
        check_exists(id);
        return *slots_[id.value];
    }

    /// @brief Returns the entity or nullptr.
    [[nodiscard]] const T* find(Id id) const noexcept {
        return contains(id) ? &*slots_[id.value] : nullptr;
    }

    /// @brief Number of reserved ids (created or not).
    [[nodiscard]] std::size_t capacity() const noexcept { return slots_.size(); }

    /// @brief Number of created entities.
    [[nodiscard]] std::size_t size() const noexcept {
        std::size_t count = 0;
        for (const auto& slot : slots_) {
            if (slot) {
                ++count;
            }
        }
        return count;
    }

    /// @brief Visit every created entity in id order.
    template<typename F>
    void for_each(F&& func) const {
        for (const auto& slot : slots_) {
            if (slot) {
                func(*slot);
            }
        }
    }

private:
    void check_range(Id id) const {
        if (id.value >= slots_.size()) {
            throw OutOfRangeError(kind_ + " id " + std::to_string(id.value) + " was never reserved");
        }
    }

    void check_exists(Id id) const {
        check_range(id);
        if (!slots_[id.value]) {
            throw OutOfRangeError(kind_ + " " + std::to_string(id.value) + " has not been created");
        }
    }

    std::string kind_;
    std::vector<std::optional<T>> slots_;
};

} // namespace dcsim::core
