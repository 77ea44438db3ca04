#include <doctest/doctest.h>
#include <stackreg/registry.hpp>

#include "../test_helpers.hpp"

using namespace stackreg;
using stackreg::testing::make_stack;

TEST_CASE("registry keeps registration order") {
    auto registry = StackRegistry::create({
        make_stack("myapp-bootstrap-stack"),
        make_stack("api-stack"),
        make_stack("web-stack"),
    });
    REQUIRE(registry.isOk());

    const auto& r = registry.value();
    CHECK(r.size() == 3);
    CHECK(r.names() == std::vector<std::string>{"myapp-bootstrap-stack", "api-stack", "web-stack"});

    std::vector<std::string> iterated;
    for (const auto& stack : r) iterated.push_back(stack.name);
    CHECK(iterated == r.names());
}

TEST_CASE("registry lookup by name") {
    auto r = stackreg::testing::make_registry({make_stack("api-stack")});
    REQUIRE(r.find("api-stack") != nullptr);
    CHECK(r.find("api-stack")->description == "api-stack stack");
    CHECK(r.find("missing") == nullptr);
    CHECK(r.contains("api-stack"));
    CHECK_FALSE(r.contains("missing"));
}

TEST_CASE("registry rejects duplicate names") {
    auto registry = StackRegistry::create({make_stack("api-stack"), make_stack("api-stack")});
    REQUIRE(registry.isErr());
    CHECK(registry.error().code() == ErrorCode::INVALID_REGISTRY);
    CHECK(registry.error().message() == "duplicate stack name: api-stack");
}

TEST_CASE("registry rejects malformed descriptors") {
    SUBCASE("empty name") {
        auto registry = StackRegistry::create({make_stack("")});
        REQUIRE(registry.isErr());
        CHECK(registry.error().code() == ErrorCode::INVALID_REGISTRY);
    }

    SUBCASE("missing constructor") {
        auto stack = make_stack("api-stack");
        stack.constructor = nullptr;
        auto registry = StackRegistry::create({stack});
        REQUIRE(registry.isErr());
        CHECK(registry.error().message() == "stack has no constructor: api-stack");
    }

    SUBCASE("props that are not an object") {
        auto stack = make_stack("api-stack");
        stack.props = nlohmann::json::array();
        auto registry = StackRegistry::create({stack});
        REQUIRE(registry.isErr());
        CHECK(registry.error().code() == ErrorCode::INVALID_REGISTRY);
    }
}

TEST_CASE("registry rejects stage ids that shadow another stack") {
    auto staged = make_stack("api");
    staged.stages = std::vector<std::string>{"dev", "prod"};

    auto registry = StackRegistry::create({staged, make_stack("api-prod")});
    REQUIRE(registry.isErr());
    CHECK(registry.error().code() == ErrorCode::INVALID_REGISTRY);
    CHECK(registry.error().message().find("api-prod") != std::string::npos);
}

TEST_CASE("invalid stages cannot collide") {
    auto staged = make_stack("api");
    staged.stages = std::vector<std::string>{"dev", "has space"};

    auto registry = StackRegistry::create({staged, make_stack("api-has space")});
    CHECK(registry.isOk());
}

TEST_CASE("is_bootstrap_stack recognizes the bootstrap convention") {
    CHECK(is_bootstrap_stack("bootstrap"));
    CHECK(is_bootstrap_stack("myapp-bootstrap-stack"));
    CHECK_FALSE(is_bootstrap_stack("-bootstrap-stack"));
    CHECK_FALSE(is_bootstrap_stack("myapp-api-stack"));
    CHECK_FALSE(is_bootstrap_stack("bootstrap-stack-api"));
}
