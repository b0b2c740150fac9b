// nitro_core Error and Result tests

#include <catch2/catch_test_macros.hpp>
#include <nitro/core/error.hpp>
#include <string>
#include <vector>

using namespace nitro_core;

// =============================================================================
// Error Tests
// =============================================================================

TEST_CASE("Error construction", "[core][error]") {
    SECTION("from string") {
        Error err("Test error");
        REQUIRE(err.message() == "Test error");
        REQUIRE(err.code() == ErrorCode::Unknown);
    }

    SECTION("from code and message") {
        Error err(ErrorCode::InvalidArgument, "Bad argument");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.message() == "Bad argument");
    }

    SECTION("with context") {
        Error err = Error("Base error").with_context("key", "value");
        auto* ctx = err.get_context("key");
        REQUIRE(ctx != nullptr);
        REQUIRE(*ctx == "value");
        REQUIRE(err.get_context("missing") == nullptr);
    }
}

TEST_CASE("Error factory methods", "[core][error]") {
    SECTION("ConfigError::missing_field") {
        Error err = ConfigError::missing_field("id");
        REQUIRE(err.code() == ErrorCode::ParseError);
        REQUIRE(err.is<ConfigError>());
        REQUIRE(err.as<ConfigError>()->field == "id");
    }

    SECTION("ConfigError::unknown_feature") {
        Error err = ConfigError::unknown_feature("sodium", "shaders");
        REQUIRE(err.code() == ErrorCode::ValidationError);
        REQUIRE(err.as<ConfigError>()->package_id == "sodium");
        REQUIRE(err.message().find("shaders") != std::string::npos);
    }

    SECTION("ConfigError::invalid_package_id") {
        Error err = ConfigError::invalid_package_id("Bad_ID");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.message().find("Bad_ID") != std::string::npos);
    }

    SECTION("PackageError::not_found") {
        Error err = PackageError::not_found("sodium");
        REQUIRE(err.code() == ErrorCode::NotFound);
        REQUIRE(err.is<PackageError>());
        REQUIRE_FALSE(err.is<ConfigError>());
        REQUIRE(err.message().find("sodium") != std::string::npos);
    }

    SECTION("PackageError::preload_failed") {
        Error err = PackageError::preload_failed("connection reset");
        REQUIRE(err.code() == ErrorCode::IOError);
        REQUIRE(err.as<PackageError>()->reason == "connection reset");
    }

    SECTION("PackageError::eval_failed") {
        Error err = PackageError::eval_failed("iris", "script error");
        REQUIRE(err.code() == ErrorCode::InvalidState);
        REQUIRE(err.as<PackageError>()->package_id == "iris");
    }
}

TEST_CASE("Error chain formatting", "[core][error]") {
    SECTION("generic message") {
        Error err(ErrorCode::NotSupported, "Nope");
        REQUIRE(build_error_chain(err) == "[NotSupported] Nope");
    }

    SECTION("typed error includes kind") {
        Error err = ConfigError::unknown_feature("sodium", "shaders");
        auto chain = build_error_chain(err);
        REQUIRE(chain.find("[ValidationError]") == 0);
        REQUIRE(chain.find("[ConfigError:UnknownFeature]") != std::string::npos);
        REQUIRE(chain.find("(package: sodium)") != std::string::npos);
    }

    SECTION("context entries are appended") {
        Error err = Error(ErrorCode::IOError, "Read failed").with_context("file", "packages.json");
        REQUIRE(build_error_chain(err) == "[IOError] Read failed (file: packages.json)");
    }
}

// =============================================================================
// Result<T> Tests
// =============================================================================

TEST_CASE("Result construction", "[core][result]") {
    SECTION("Ok with value") {
        Result<int> r = Ok(42);
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
        REQUIRE(r.value() == 42);
    }

    SECTION("Ok void") {
        Result<void> r = Ok();
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
    }

    SECTION("Err with message") {
        Result<int> r = Err<int>(Error("Something failed"));
        REQUIRE(r.is_err());
        REQUIRE(r.error().message() == "Something failed");
    }

    SECTION("Err with typed error") {
        Result<int> r = Err<int>(PackageError::not_found("sodium"));
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::NotFound);
    }
}

TEST_CASE("Result value access", "[core][result]") {
    SECTION("value_or on Ok") {
        Result<int> r = Ok(42);
        REQUIRE(r.value_or(0) == 42);
    }

    SECTION("value_or on Err") {
        Result<int> r = Err<int>(Error("error"));
        REQUIRE(r.value_or(0) == 0);
    }

    SECTION("unwrap on Ok") {
        Result<int> r = Ok(42);
        REQUIRE(r.unwrap() == 42);
    }

    SECTION("unwrap on Err throws") {
        Result<int> r = Err<int>(Error("error"));
        REQUIRE_THROWS_AS(r.unwrap(), std::runtime_error);

        Result<void> v = Err(Error("error"));
        REQUIRE_THROWS_AS(v.unwrap(), std::runtime_error);
    }

    SECTION("move value out") {
        Result<std::string> r = Ok(std::string("hello"));
        std::string s = std::move(r).value();
        REQUIRE(s == "hello");
    }
}

TEST_CASE("Result map operations", "[core][result]") {
    SECTION("map on Ok") {
        Result<int> r = Ok(21);
        auto r2 = r.map([](int x) { return x * 2; });
        REQUIRE(r2.is_ok());
        REQUIRE(r2.value() == 42);
    }

    SECTION("map on Err") {
        Result<int> r = Err<int>(Error("error"));
        auto r2 = r.map([](int x) { return x * 2; });
        REQUIRE(r2.is_err());
    }

    SECTION("and_then on Ok") {
        Result<int> r = Ok(42);
        auto r2 = r.and_then([](int x) -> Result<std::string> {
            return Ok(std::to_string(x));
        });
        REQUIRE(r2.is_ok());
        REQUIRE(r2.value() == "42");
    }

    SECTION("or_else on Err") {
        Result<int> r = Err<int>(Error("error"));
        auto r2 = r.or_else([](const Error& /*e*/) -> Result<int> {
            return Ok(0);
        });
        REQUIRE(r2.is_ok());
        REQUIRE(r2.value() == 0);
    }
}

TEST_CASE("Result with custom error type", "[core][result]") {
    struct Failure {
        int code = 0;
    };

    Result<std::vector<int>, Failure> ok(std::vector<int>{1, 2, 3});
    REQUIRE(ok.is_ok());
    REQUIRE(ok->size() == 3);

    Result<void, Failure> err(Failure{7});
    REQUIRE(err.is_err());
    REQUIRE(err.error().code == 7);
}
