#pragma once

#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "implementation.hpp"

namespace swhid::conformance {

/**
 * \brief Explicit list of the implementations taking part in one run.
 *
 * Built once at startup and handed to the engine; registration order is the reporting order.
 */
class Registry {
public:
    Registry() = default;
    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;
    Registry(Registry&&) = default;
    Registry& operator=(Registry&&) = default;

    /// Throws std::runtime_error when an implementation with the same name is already present.
    void add(std::unique_ptr<Implementation> implementation);

    /// Keeps only the named implementations; throws when a name is not registered.
    void retain(const std::set<std::string>& names);

    [[nodiscard]] const Implementation* find(std::string_view name) const noexcept;

    [[nodiscard]] const std::vector<std::unique_ptr<Implementation>>& implementations() const noexcept {
        return implementations_;
    }

    [[nodiscard]] std::size_t size() const noexcept { return implementations_.size(); }
    [[nodiscard]] bool empty() const noexcept { return implementations_.empty(); }

private:
    std::vector<std::unique_ptr<Implementation>> implementations_;
};

}  // namespace swhid::conformance
