#include "swhid_conformance/registry.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace swhid::conformance {

void Registry::add(std::unique_ptr<Implementation> implementation) {
    if (!implementation) {
        throw std::runtime_error("Cannot register a null implementation");
    }
    const auto& name = implementation->info().name;
    if (name.empty()) {
        throw std::runtime_error("Cannot register an implementation without a name");
    }
    if (find(name) != nullptr) {
        throw std::runtime_error("Duplicate implementation name: " + name);
    }
    implementations_.push_back(std::move(implementation));
}

void Registry::retain(const std::set<std::string>& names) {
    for (const auto& name : names) {
        if (find(name) == nullptr) {
            throw std::runtime_error("Unknown implementation: " + name);
        }
    }
    implementations_.erase(std::remove_if(implementations_.begin(), implementations_.end(),
                                          [&](const std::unique_ptr<Implementation>& impl) {
                                              return names.count(impl->info().name) == 0;
                                          }),
                           implementations_.end());
}

const Implementation* Registry::find(std::string_view name) const noexcept {
    for (const auto& impl : implementations_) {
        if (impl->info().name == name) return impl.get();
    }
    return nullptr;
}

}  // namespace swhid::conformance
