#include <doctest/doctest.h>
#include <stackreg/stage_expansion.hpp>

#include "../test_helpers.hpp"

using namespace stackreg;
using stackreg::testing::make_stack;

TEST_CASE("is_valid_stage_name accepts identifiers") {
    CHECK(is_valid_stage_name("dev"));
    CHECK(is_valid_stage_name("prod_eu-1"));
    CHECK_FALSE(is_valid_stage_name(""));
    CHECK_FALSE(is_valid_stage_name("has space"));
    CHECK_FALSE(is_valid_stage_name("a/b"));
}

TEST_CASE("stages expand to one instance each") {
    auto stack = make_stack("web");
    stack.props = {{"bucket", "assets"}};
    stack.stages = std::vector<std::string>{"dev", "prod"};

    WarningCollector warnings;
    auto instances = expand_stack(stack, UniversalProps{"us-east-1"}, warnings);
    REQUIRE(instances.size() == 2);
    CHECK(instances[0].id == "web-dev");
    CHECK(instances[0].stage == std::optional<std::string>("dev"));
    CHECK(instances[1].id == "web-prod");
    for (const auto& instance : instances) {
        CHECK(instance.stack_name == "web");
        CHECK(instance.props["region"] == "us-east-1");
        CHECK(instance.props["bucket"] == "assets");
    }
    CHECK(warnings.get_warnings().empty());
}

TEST_CASE("no stages yields a single instance named after the stack") {
    WarningCollector warnings;
    auto instances = expand_stack(make_stack("web"), UniversalProps{"eu-west-1"}, warnings);
    REQUIRE(instances.size() == 1);
    CHECK(instances[0].id == "web");
    CHECK_FALSE(instances[0].stage.has_value());

    auto empty = make_stack("web");
    empty.stages = std::vector<std::string>{};
    CHECK(expand_stack(empty, UniversalProps{"eu-west-1"}, warnings).size() == 1);
}

TEST_CASE("invalid stages are skipped and reported") {
    auto stack = make_stack("web");
    stack.stages = std::vector<std::string>{"", "dev", "bad stage"};

    WarningCollector warnings;
    auto instances = expand_stack(stack, UniversalProps{"us-east-1"}, warnings);
    REQUIRE(instances.size() == 1);
    CHECK(instances[0].id == "web-dev");
    CHECK(warnings.get_warnings(Warning::stage_invalid).size() == 2);
}

TEST_CASE("only invalid stages fall back to the default instance") {
    auto stack = make_stack("web");
    stack.stages = std::vector<std::string>{"bad stage"};

    WarningCollector warnings;
    auto instances = expand_stack(stack, UniversalProps{"us-east-1"}, warnings);
    REQUIRE(instances.size() == 1);
    CHECK(instances[0].id == "web");
}

TEST_CASE("bootstrap stacks never expand") {
    auto stack = make_stack("myapp-bootstrap-stack");
    stack.stages = std::vector<std::string>{"dev", "prod"};

    WarningCollector warnings;
    auto instances = expand_stack(stack, UniversalProps{"us-east-1"}, warnings);
    REQUIRE(instances.size() == 1);
    CHECK(instances[0].id == "myapp-bootstrap-stack");
}

TEST_CASE("stack props override the universal region") {
    auto merged = merge_props(UniversalProps{"us-east-1"}, {{"region", "eu-central-1"}, {"x", 1}});
    CHECK(merged["region"] == "eu-central-1");
    CHECK(merged["x"] == 1);

    auto plain = merge_props(UniversalProps{"us-east-1"}, StackProps::object());
    CHECK(plain == StackProps{{"region", "us-east-1"}});
}
