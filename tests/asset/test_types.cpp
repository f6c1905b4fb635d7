/// @file test_types.cpp
/// @brief Tests for relic_asset core types

#include <catch2/catch.hpp>
#include <relic/asset/types.hpp>
#include <set>
#include <string>

using namespace relic_asset;

namespace {

struct Texture {};
struct Mesh {};

} // anonymous namespace

// =============================================================================
// LoadState Tests
// =============================================================================

TEST_CASE("LoadState: names and terminal states", "[asset][types]") {
    REQUIRE(std::string(load_state_name(LoadState::Requested)) == "Requested");
    REQUIRE(std::string(load_state_name(LoadState::WaitingOnDependencies)) == "WaitingOnDependencies");
    REQUIRE(std::string(load_state_name(LoadState::Unloaded)) == "Unloaded");

    REQUIRE_FALSE(is_terminal(LoadState::Requested));
    REQUIRE_FALSE(is_terminal(LoadState::Loading));
    REQUIRE_FALSE(is_terminal(LoadState::WaitingOnDependencies));
    REQUIRE(is_terminal(LoadState::Loaded));
    REQUIRE(is_terminal(LoadState::Failed));
    REQUIRE(is_terminal(LoadState::Unloaded));
}

TEST_CASE("LoadOptions: policies", "[asset][types]") {
    REQUIRE_FALSE(LoadOptions{}.policy.has_value());
    REQUIRE(LoadOptions::best_effort().policy == DependencyPolicy::BestEffort);
    REQUIRE(LoadOptions::fail_fast().policy == DependencyPolicy::FailFast);
    REQUIRE(std::string(dependency_policy_name(DependencyPolicy::BestEffort)) == "best_effort");
}

// =============================================================================
// AssetPath Tests
// =============================================================================

TEST_CASE("AssetPath: parsing", "[asset][types]") {
    SECTION("plain path") {
        AssetPath path("textures/player.png");
        REQUIRE(path.source().is_default());
        REQUIRE(path.path() == "textures/player.png");
        REQUIRE_FALSE(path.has_label());
        REQUIRE(path.to_string() == "textures/player.png");
    }

    SECTION("named source and label") {
        AssetPath path("remote://models/ship.gltf#hull");
        REQUIRE(path.source().name == "remote");
        REQUIRE(path.path() == "models/ship.gltf");
        REQUIRE(path.label() == std::optional<std::string>("hull"));
        REQUIRE(path.to_string() == "remote://models/ship.gltf#hull");
    }

    SECTION("empty label is kept apart from no label") {
        AssetPath with_empty("a.txt#");
        AssetPath without("a.txt");
        REQUIRE(with_empty.has_label());
        REQUIRE(with_empty != without);
        REQUIRE(with_empty.hash() != without.hash());
    }
}

TEST_CASE("AssetPath: normalization", "[asset][types]") {
    REQUIRE(AssetPath::normalize("a/./b/../c.png") == "a/c.png");
    REQUIRE(AssetPath::normalize("/root//file.txt") == "root/file.txt");
    REQUIRE(AssetPath::normalize("dir\\sub\\file.txt") == "dir/sub/file.txt");
    REQUIRE(AssetPath::normalize("../../escape.txt") == "escape.txt");

    REQUIRE(AssetPath("a/../b.txt") == AssetPath("b.txt"));
}

TEST_CASE("AssetPath: components", "[asset][types]") {
    AssetPath path("models/Ship.GLTF#hull");
    REQUIRE(path.extension() == "gltf");
    REQUIRE(path.filename() == "Ship.GLTF");
    REQUIRE(path.stem() == "Ship");
    REQUIRE(path.directory() == "models");
    REQUIRE(path.source_path() == AssetPath("models/Ship.GLTF"));
    REQUIRE(path.source_path().with_label("deck").to_string() == "models/Ship.GLTF#deck");

    REQUIRE(AssetPath("noext").extension().empty());
    REQUIRE(AssetPath("file.txt").directory().empty());
}

TEST_CASE("AssetPath: resolve references", "[asset][types]") {
    AssetPath base("models/ship.gltf");

    REQUIRE(base.resolve("hull.png") == AssetPath("models/hull.png"));
    REQUIRE(base.resolve("../textures/hull.png") == AssetPath("textures/hull.png"));
    REQUIRE(base.resolve("/shared/noise.png") == AssetPath("shared/noise.png"));
    REQUIRE(base.resolve("#hull") == AssetPath("models/ship.gltf#hull"));
    REQUIRE(base.resolve("cdn://noise.png") == AssetPath("cdn://noise.png"));
    REQUIRE(base.resolve("parts.gltf#wing") == AssetPath("models/parts.gltf#wing"));

    AssetPath named("pack://models/ship.gltf");
    REQUIRE(named.resolve("hull.png").source().name == "pack");
}

TEST_CASE("AssetPath: ordering and hashing", "[asset][types]") {
    std::set<AssetPath> paths{AssetPath("b.txt"), AssetPath("a.txt"), AssetPath("a.txt#x")};
    REQUIRE(paths.size() == 3);
    REQUIRE(*paths.begin() == AssetPath("a.txt"));

    REQUIRE(AssetPath("a.txt").hash() == AssetPath("./a.txt").hash());
    REQUIRE(AssetPath("a.txt").hash() != AssetPath("src://a.txt").hash());
    REQUIRE(std::hash<AssetPath>{}(AssetPath("a.txt")) == std::hash<AssetPath>{}(AssetPath("a.txt")));
}

// =============================================================================
// AssetId Tests
// =============================================================================

TEST_CASE("AssetId: path-derived ids", "[asset][types]") {
    auto a = AssetId::from_path<Texture>(AssetPath("a.png"));
    auto again = AssetId::from_path<Texture>(AssetPath("./a.png"));
    auto other_type = AssetId::from_path<Mesh>(AssetPath("a.png"));

    REQUIRE(a.is_valid());
    REQUIRE_FALSE(a.is_generated());
    REQUIRE(a == again);
    REQUIRE(a != other_type);
    REQUIRE(a.raw() == other_type.raw());
    REQUIRE(a.is<Texture>());
    REQUIRE_FALSE(a.is<Mesh>());
}

TEST_CASE("AssetId: generated ids never collide with path ids", "[asset][types]") {
    auto g1 = AssetId::generate<Texture>();
    auto g2 = AssetId::generate<Texture>();

    REQUIRE(g1.is_generated());
    REQUIRE(g1 != g2);
    REQUIRE((g1.raw() & AssetId::GENERATED_BIT) != 0);

    auto path_id = AssetId::from_path<Texture>(AssetPath("x.png"));
    REQUIRE((path_id.raw() & AssetId::GENERATED_BIT) == 0);
}

TEST_CASE("AssetId: invalid", "[asset][types]") {
    AssetId id;
    REQUIRE_FALSE(id.is_valid());
    REQUIRE(id == AssetId::invalid());
}

// =============================================================================
// LoadStatus / AssetEvent Tests
// =============================================================================

TEST_CASE("LoadStatus: defaults", "[asset][types]") {
    LoadStatus status;
    REQUIRE(status.state == LoadState::Unloaded);
    REQUIRE_FALSE(status.is_loaded());
    REQUIRE_FALSE(status.error.has_value());
}

TEST_CASE("AssetEvent: factories", "[asset][types]") {
    auto id = AssetId::from_path<Texture>(AssetPath("a.png"));

    auto modified = AssetEvent::modified(id, AssetPath("a.png"), 3);
    REQUIRE(modified.kind == AssetEventKind::Modified);
    REQUIRE(modified.generation == 3);

    auto failed = AssetEvent::load_failed(id, AssetPath("a.png"), AssetError::Kind::IoError, "gone");
    REQUIRE(failed.kind == AssetEventKind::LoadFailed);
    REQUIRE(failed.error_kind == AssetError::Kind::IoError);
    REQUIRE(failed.error == "gone");

    REQUIRE(std::string(asset_event_kind_name(AssetEventKind::Removed)) == "Removed");
}
