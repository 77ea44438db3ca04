#include <doctest/doctest.h>
#include <stackreg/result.hpp>

using namespace stackreg;

TEST_CASE("error_code_to_string names every code") {
    CHECK(std::string(error_code_to_string(ErrorCode::CONFIGURATION_ERROR)) == "CONFIGURATION_ERROR");
    CHECK(std::string(error_code_to_string(ErrorCode::UNKNOWN_STACK)) == "UNKNOWN_STACK");
    CHECK(std::string(error_code_to_string(ErrorCode::MISSING_OUTPUT)) == "MISSING_OUTPUT");
    CHECK(std::string(error_code_to_string(ErrorCode::VALIDATION_ERROR)) == "VALIDATION_ERROR");
    CHECK(std::string(error_code_to_string(ErrorCode::INVALID_REGISTRY)) == "INVALID_REGISTRY");
}

TEST_CASE("Result holds a value or an error") {
    auto ok = Result<int>::ok(42);
    CHECK(ok.isOk());
    CHECK_FALSE(ok.isErr());
    CHECK(ok.value() == 42);

    auto err = Result<int>::err(Error(ErrorCode::MISSING_OUTPUT, "gone"));
    CHECK(err.isErr());
    CHECK(err.error().code() == ErrorCode::MISSING_OUTPUT);
    CHECK(err.valueOr(7) == 7);
}

TEST_CASE("Result map and flatMap propagate errors") {
    auto doubled = Result<int>::ok(21).map([](int v) { return v * 2; });
    CHECK(doubled.value() == 42);

    auto failed = Result<int>::err(Error(ErrorCode::IO_ERROR, "disk"))
                      .map([](int v) { return v * 2; });
    CHECK(failed.isErr());
    CHECK(failed.error().message() == "disk");

    auto chained = Result<int>::ok(1).flatMap([](int) {
        return Result<std::string>::err(Error(ErrorCode::UNKNOWN_STACK, "nope"));
    });
    CHECK(chained.isErr());
    CHECK(chained.error().code() == ErrorCode::UNKNOWN_STACK);
}

TEST_CASE("Error keeps its cause chain") {
    Error root(ErrorCode::SCHEMA_VIOLATION, "$.a: required");
    Error top(ErrorCode::VALIDATION_ERROR, "Failed to parse output for stack: a");
    top.withCause(root);

    REQUIRE(top.cause() != nullptr);
    CHECK(top.cause()->code() == ErrorCode::SCHEMA_VIOLATION);
    CHECK(top.hasCause(ErrorCode::SCHEMA_VIOLATION));
    CHECK(top.hasCause(ErrorCode::VALIDATION_ERROR));
    CHECK_FALSE(top.hasCause(ErrorCode::JSON_PARSE_ERROR));
    CHECK(top.describe() ==
          "Failed to parse output for stack: a\n  caused by: $.a: required");
}

TEST_CASE("Error withContext prefixes the message") {
    Error e(ErrorCode::IO_ERROR, "permission denied");
    e.withContext("/tmp/out.json");
    CHECK(e.message() == "/tmp/out.json: permission denied");
    CHECK(e.toString() == e.message());
}

TEST_CASE("Result<void> reports success and failure") {
    auto ok = Result<void>::ok();
    CHECK(ok.isOk());
    auto err = Result<void>::err(Error(ErrorCode::CONFIGURATION_ERROR, "bad"));
    CHECK(err.isErr());
    CHECK(err.error().message() == "bad");
}
