/**
 * @file test_registry.cpp
 * @brief Unit tests for the explicit implementation registry
 * 
 * @author SWHID conformance contributors
 * @date 2026
 * @copyright MIT License
 */

// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 SWHID conformance contributors

#include <catch2/catch_test_macros.hpp>

#include "swhid_conformance/registry.hpp"

#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>

using namespace swhid::conformance;

namespace {

class Fixed : public Implementation {
public:
    explicit Fixed(std::string name) { info_.name = std::move(name); }

    const ImplementationInfo& info() const noexcept override { return info_; }
    const CapabilityDescriptor& capabilities() const noexcept override { return caps_; }
    bool available(std::string&) const override { return true; }
    RawOutcome compute(const ComputeRequest&, const SandboxLimits&, std::string&) const override {
        return outcome::Success{"swh:1:cnt:3b18e512dba79e4c8300dd08aeb37f8e728b8dad\n", {}, {}};
    }

private:
    ImplementationInfo info_;
    CapabilityDescriptor caps_;
};

Registry three() {
    Registry registry;
    registry.add(std::make_unique<Fixed>("alpha"));
    registry.add(std::make_unique<Fixed>("beta"));
    registry.add(std::make_unique<Fixed>("gamma"));
    return registry;
}

}  // namespace

TEST_CASE("Registry keeps registration order", "[registry]") {
    const auto registry = three();
    REQUIRE(registry.size() == 3);
    REQUIRE(registry.implementations()[0]->info().name == "alpha");
    REQUIRE(registry.implementations()[2]->info().name == "gamma");
    REQUIRE(registry.find("beta") != nullptr);
    REQUIRE(registry.find("delta") == nullptr);
}

TEST_CASE("Registry rejects bad registrations", "[registry]") {
    auto registry = three();
    REQUIRE_THROWS_AS(registry.add(std::make_unique<Fixed>("beta")), std::runtime_error);
    REQUIRE_THROWS_AS(registry.add(std::make_unique<Fixed>("")), std::runtime_error);
    REQUIRE_THROWS_AS(registry.add(nullptr), std::runtime_error);
    REQUIRE(registry.size() == 3);
}

TEST_CASE("Registry filtering by name", "[registry]") {
    auto registry = three();

    SECTION("Retain a subset") {
        registry.retain({"gamma", "alpha"});
        REQUIRE(registry.size() == 2);
        REQUIRE(registry.implementations()[0]->info().name == "alpha");
        REQUIRE(registry.find("beta") == nullptr);
    }

    SECTION("Unknown names are a configuration error") {
        REQUIRE_THROWS_AS(registry.retain({"alpha", "omega"}), std::runtime_error);
        REQUIRE(registry.size() == 3);
    }
}
