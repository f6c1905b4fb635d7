// relic_core Error and Result tests

#include <catch2/catch.hpp>
#include <relic/core/error.hpp>
#include <string>

using namespace relic_core;

// =============================================================================
// Error Tests
// =============================================================================

TEST_CASE("Error construction", "[core][error]") {
    SECTION("from string") {
        Error err("Test error");
        REQUIRE(err.message() == "Test error");
        REQUIRE(err.code() == ErrorCode::Unknown);
        REQUIRE_FALSE(err.asset_kind().has_value());
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
    SECTION("AssetError::io") {
        Error err = AssetError::io("textures/a.png", "no such file");
        REQUIRE(err.code() == ErrorCode::IOError);
        REQUIRE(err.asset_kind() == AssetError::Kind::IoError);
        REQUIRE(err.message().find("textures/a.png") != std::string::npos);
    }

    SECTION("AssetError::loader_not_found") {
        Error err = AssetError::loader_not_found("model.xyz", "xyz");
        REQUIRE(err.code() == ErrorCode::NotSupported);
        REQUIRE(err.asset_kind() == AssetError::Kind::LoaderNotFound);
    }

    SECTION("AssetError::dependency_failed") {
        Error err = AssetError::dependency_failed("scene.json", "mesh.gltf");
        REQUIRE(err.code() == ErrorCode::DependencyMissing);
        REQUIRE(err.message().find("mesh.gltf") != std::string::npos);
    }

    SECTION("AssetError::cyclic_dependency") {
        Error err = AssetError::cyclic_dependency("a.txt", "b.txt");
        REQUIRE(err.code() == ErrorCode::CyclicDependency);
        REQUIRE(err.asset_kind() == AssetError::Kind::CyclicDependency);
    }

    SECTION("AssetError::duplicate_id") {
        Error err = AssetError::duplicate_id("mesh.gltf#tex", 42);
        REQUIRE(err.code() == ErrorCode::AlreadyExists);
        REQUIRE(err.message().find("42") != std::string::npos);
    }

    SECTION("AssetError::cancelled") {
        Error err = AssetError::cancelled("big.bin");
        REQUIRE(err.code() == ErrorCode::Cancelled);
    }

    SECTION("AssetError::type_mismatch") {
        Error err = AssetError::type_mismatch("a.txt", "Texture", "TextAsset");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.message().find("Texture") != std::string::npos);
        REQUIRE(err.message().find("TextAsset") != std::string::npos);
    }

    SECTION("MetaError::malformed") {
        Error err = MetaError::malformed("a.png.meta", "not an object");
        REQUIRE(err.code() == ErrorCode::ParseError);
        REQUIRE(err.is<MetaError>());
        REQUIRE_FALSE(err.asset_kind().has_value());
        REQUIRE(err.as<MetaError>()->meta_path == "a.png.meta");
    }

    SECTION("MetaError::unsupported_version") {
        Error err = MetaError::unsupported_version("a.png.meta", 7);
        REQUIRE(err.code() == ErrorCode::IncompatibleVersion);
        REQUIRE(err.message().find("7") != std::string::npos);
    }

    SECTION("MetaError::write_failed") {
        Error err = MetaError::write_failed("a.png.meta", "disk full");
        REQUIRE(err.code() == ErrorCode::IOError);
    }
}

TEST_CASE("Error type checking", "[core][error]") {
    Error asset_err = AssetError::not_found("missing.png");
    Error generic_err("generic");

    REQUIRE(asset_err.is<AssetError>());
    REQUIRE_FALSE(asset_err.is<MetaError>());
    REQUIRE(asset_err.as<AssetError>() != nullptr);
    REQUIRE(asset_err.as<AssetError>()->path == "missing.png");

    REQUIRE(generic_err.is<std::string>());
    REQUIRE(generic_err.as<AssetError>() == nullptr);
}

// =============================================================================
// Result Tests
// =============================================================================

TEST_CASE("Result with value", "[core][result]") {
    Result<int> result = Ok(42);

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
    REQUIRE(result);
    REQUIRE(result.value() == 42);
    REQUIRE(*result == 42);
    REQUIRE(result.value_or(0) == 42);
}

TEST_CASE("Result with error", "[core][result]") {
    Result<int> result = Err<int>(Error("Failed"));

    REQUIRE_FALSE(result.is_ok());
    REQUIRE(result.is_err());
    REQUIRE_FALSE(result);
    REQUIRE(result.error().message() == "Failed");
    REQUIRE(result.value_or(7) == 7);
    REQUIRE_THROWS(result.unwrap());
}

TEST_CASE("Result<void>", "[core][result]") {
    SECTION("ok") {
        Result<void> result = Ok();
        REQUIRE(result.is_ok());
        REQUIRE_NOTHROW(result.unwrap());
    }

    SECTION("error") {
        Result<void> result = Err(AssetError::cancelled("x"));
        REQUIRE(result.is_err());
        REQUIRE(result.error().asset_kind() == AssetError::Kind::Cancelled);
        REQUIRE_THROWS(result.unwrap());
    }
}

TEST_CASE("Result map and and_then", "[core][result]") {
    SECTION("map on success") {
        Result<int> result = Ok(21);
        auto mapped = result.map([](int x) { return x * 2; });
        REQUIRE(mapped.value() == 42);
    }

    SECTION("map on error") {
        Result<int> result = Err<int>(Error("Failed"));
        auto mapped = result.map([](int x) { return x * 2; });
        REQUIRE(mapped.is_err());
    }

    SECTION("and_then chains") {
        Result<int> result = Ok(10);
        auto chained = result.and_then([](int x) -> Result<std::string> {
            return Ok(std::to_string(x));
        });
        REQUIRE(chained.value() == "10");
    }
}

// =============================================================================
// Error Utilities
// =============================================================================

TEST_CASE("build_error_chain includes kind and context", "[core][error]") {
    Error err = AssetError::io("a.bin", "denied");
    err.with_context("source", "default");

    std::string chain = build_error_chain(err);
    REQUIRE(chain.find("[IOError]") != std::string::npos);
    REQUIRE(chain.find("IoError") != std::string::npos);
    REQUIRE(chain.find("source: default") != std::string::npos);
}

TEST_CASE("Error statistics", "[core][error]") {
    debug::reset_error_stats();
    REQUIRE(debug::total_error_count() == 0);

    debug::record_error(AssetError::not_found("a"));
    debug::record_error(MetaError::malformed("a.meta", "bad"));
    debug::record_error(Error("plain"));

    REQUIRE(debug::total_error_count() == 3);
    REQUIRE(debug::error_stats_summary().find("Meta: 1") != std::string::npos);

    debug::reset_error_stats();
    REQUIRE(debug::total_error_count() == 0);
}
