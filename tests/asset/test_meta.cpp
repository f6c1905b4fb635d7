/// @file test_meta.cpp
/// @brief Tests for relic_asset metadata records

#include <catch2/catch.hpp>
#include <relic/asset/meta.hpp>
#include <memory>
#include <string>

using namespace relic_asset;

namespace {

AssetSourceMeta sample_meta() {
    AssetSourceMeta meta;
    meta.source = "models/ship.gltf";
    meta.fingerprint = 0xdeadbeefULL;
    meta.loader = "ShipLoader";

    ProducedAsset main;
    main.asset_id = 0x1234;
    main.type = "Ship";
    main.dependencies = {"textures/hull.png"};
    meta.produced.push_back(main);

    ProducedAsset hull;
    hull.asset_id = 0x5678;
    hull.label = "hull";
    hull.type = "Mesh";
    meta.produced.push_back(hull);

    DerivedArtifact artifact;
    artifact.label = "hull";
    artifact.artifact = ".imported/abc.bin";
    artifact.serializer = "relic.bytes";
    meta.derived.push_back(artifact);
    return meta;
}

} // anonymous namespace

// =============================================================================
// AssetSourceMeta Tests
// =============================================================================

TEST_CASE("AssetSourceMeta: JSON layout", "[asset][meta]") {
    auto j = sample_meta().to_json();

    REQUIRE(j["version"] == 1);
    REQUIRE(j["source"] == "models/ship.gltf");
    REQUIRE(j["fingerprint"] == "00000000deadbeef");
    REQUIRE(j["produced"].size() == 2);
    REQUIRE(j["produced"][0]["label"].is_null());
    REQUIRE(j["produced"][1]["label"] == "hull");
    REQUIRE(j["derived"][0]["artifact"] == ".imported/abc.bin");

    auto parsed = AssetSourceMeta::from_json(j, "ship.gltf.meta");
    REQUIRE(parsed);
    REQUIRE(parsed.value().fingerprint == 0xdeadbeefULL);
    REQUIRE(parsed.value().produced[0].dependencies == std::vector<std::string>{"textures/hull.png"});

    const auto* hull = parsed.value().find_produced(std::string("hull"));
    REQUIRE(hull != nullptr);
    REQUIRE(hull->asset_id == 0x5678);
    REQUIRE(parsed.value().find_produced(std::nullopt)->type == "Ship");
    REQUIRE(parsed.value().find_produced(std::string("deck")) == nullptr);
}

TEST_CASE("AssetSourceMeta: malformed records", "[asset][meta]") {
    SECTION("not JSON") {
        auto result = AssetSourceMeta::parse(to_bytes("{not json"), "a.meta");
        REQUIRE(result.is_err());
        REQUIRE(result.error().is<MetaError>());
        REQUIRE(result.error().as<MetaError>()->kind == MetaError::Kind::Malformed);
        REQUIRE(result.error().code() == relic_core::ErrorCode::ParseError);
    }

    SECTION("missing fingerprint") {
        auto j = sample_meta().to_json();
        j.erase("fingerprint");
        auto result = AssetSourceMeta::from_json(j, "a.meta");
        REQUIRE(result.error().as<MetaError>()->kind == MetaError::Kind::Malformed);
    }

    SECTION("bad hex id") {
        auto j = sample_meta().to_json();
        j["produced"][0]["asset_id"] = "zz";
        REQUIRE(AssetSourceMeta::from_json(j, "a.meta").is_err());
    }

    SECTION("unsupported version") {
        auto j = sample_meta().to_json();
        j["version"] = 7;
        auto result = AssetSourceMeta::from_json(j, "a.meta");
        REQUIRE(result.error().as<MetaError>()->kind == MetaError::Kind::UnsupportedVersion);
        REQUIRE(result.error().code() == relic_core::ErrorCode::IncompatibleVersion);
    }
}

// =============================================================================
// MetadataStore Tests
// =============================================================================

TEST_CASE("MetadataStore: record locations", "[asset][meta]") {
    REQUIRE(MetadataStore::meta_path(AssetPath("models/ship.gltf")) == "models/ship.gltf.meta");
    REQUIRE(MetadataStore::meta_path(AssetPath("models/ship.gltf#hull")) == "models/ship.gltf.meta");
    REQUIRE(MetadataStore::meta_path(AssetPath("pack://ship.gltf")) == "pack/ship.gltf.meta");
}

TEST_CASE("MetadataStore: fingerprint follows content", "[asset][meta]") {
    REQUIRE(MetadataStore::fingerprint(to_bytes("abc")) == MetadataStore::fingerprint(to_bytes("abc")));
    REQUIRE(MetadataStore::fingerprint(to_bytes("abc")) != MetadataStore::fingerprint(to_bytes("abd")));
}

TEST_CASE("MetadataStore: write and read", "[asset][meta]") {
    auto io = std::make_shared<MemoryAssetIo>();
    MetadataStore store(io);

    auto none = store.read(AssetPath("models/ship.gltf"));
    REQUIRE(none);
    REQUIRE_FALSE(none.value().has_value());

    REQUIRE(store.write(sample_meta()));
    REQUIRE(io->exists("models/ship.gltf.meta"));
    REQUIRE_FALSE(io->exists("models/ship.gltf.meta.tmp"));
    REQUIRE(store.cached_count() == 1);

    store.clear_cache();
    auto read = store.read(AssetPath("models/ship.gltf"));
    REQUIRE(read);
    REQUIRE(read.value()->loader == "ShipLoader");
    REQUIRE(store.is_up_to_date(AssetPath("models/ship.gltf"), 0xdeadbeefULL));
    REQUIRE_FALSE(store.is_up_to_date(AssetPath("models/ship.gltf"), 1));

    REQUIRE(store.remove(AssetPath("models/ship.gltf")));
    REQUIRE_FALSE(io->exists("models/ship.gltf.meta"));
    REQUIRE(store.remove(AssetPath("models/ship.gltf")));
}

TEST_CASE("MetadataStore: failed replace keeps the old record", "[asset][meta]") {
    auto io = std::make_shared<MemoryAssetIo>();
    MetadataStore store(io);
    REQUIRE(store.write(sample_meta()));
    auto before = io->text("models/ship.gltf.meta");

    auto changed = sample_meta();
    changed.fingerprint = 42;

    SECTION("rename fails") {
        io->set_fail_renames(true);
        auto result = store.write(changed);
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<MetaError>()->kind == MetaError::Kind::WriteFailed);
        REQUIRE_FALSE(io->exists("models/ship.gltf.meta.tmp"));
    }

    SECTION("write fails") {
        io->set_fail_writes(true);
        REQUIRE(store.write(changed).is_err());
    }

    REQUIRE(io->text("models/ship.gltf.meta") == before);
    store.clear_cache();
    REQUIRE(store.read(AssetPath("models/ship.gltf")).value()->fingerprint == 0xdeadbeefULL);
}

TEST_CASE("MetadataStore: get_or_import reuses matching records", "[asset][meta]") {
    auto io = std::make_shared<MemoryAssetIo>();
    io->insert_text("data/config.txt", "v1");
    MetadataStore store(io);

    int imports = 0;
    MetadataStore::Importer importer = [&imports](const Bytes&) -> Result<AssetSourceMeta> {
        ++imports;
        AssetSourceMeta meta;
        meta.loader = "TextAsset";
        return relic_core::Ok(meta);
    };

    auto first = store.get_or_import(AssetPath("data/config.txt"), *io, importer);
    REQUIRE(first);
    REQUIRE(first.value().imported);
    REQUIRE(first.value().meta.source == "data/config.txt");
    REQUIRE(first.value().meta.fingerprint == MetadataStore::fingerprint(to_bytes("v1")));

    auto second = store.get_or_import(AssetPath("data/config.txt"), *io, importer);
    REQUIRE(second);
    REQUIRE_FALSE(second.value().imported);
    REQUIRE(imports == 1);

    io->insert_text("data/config.txt", "v2");
    auto third = store.get_or_import(AssetPath("data/config.txt"), *io, importer);
    REQUIRE(third.value().imported);
    REQUIRE(imports == 2);

    auto missing = store.get_or_import(AssetPath("data/none.txt"), *io, importer);
    REQUIRE(missing.error().asset_kind() == AssetError::Kind::IoError);
}

TEST_CASE("MetadataStore: load_folder", "[asset][meta]") {
    auto io = std::make_shared<MemoryAssetIo>();
    {
        MetadataStore writer(io);
        auto meta = sample_meta();
        REQUIRE(writer.write(meta));
        meta.source = "models/parts/wing.gltf";
        REQUIRE(writer.write(meta));
    }
    io->insert_text("models/broken.gltf.meta", "{");
    io->insert_text("models/ship.gltf", "source");

    MetadataStore store(io);
    auto count = store.load_folder("models");
    REQUIRE(count);
    REQUIRE(count.value() == 2);
    REQUIRE(store.cached_count() == 2);

    REQUIRE(store.load_folder("nowhere").error().asset_kind() == AssetError::Kind::NotFound);
}
