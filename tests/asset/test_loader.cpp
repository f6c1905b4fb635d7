/// @file test_loader.cpp
/// @brief Tests for relic_asset loaders, serializers and derivers

#include <catch2/catch.hpp>
#include <relic/asset/loader.hpp>
#include <string>
#include <vector>

using namespace relic_asset;

namespace {

// Test asset type
struct Shader {
    std::string source;
};

class ShaderLoader : public AssetLoader<Shader> {
public:
    std::vector<std::string> extensions() const override {
        return {"glsl", "vert"};
    }

    LoadResult<Shader> load(LoadContext& ctx) override {
        if (ctx.data().empty()) {
            return relic_core::Err<std::unique_ptr<Shader>>(
                AssetError::deserialize(ctx.path().to_string(), "empty shader"));
        }
        return relic_core::Ok(std::make_unique<Shader>(Shader{ctx.data_as_string()}));
    }

    std::string type_name() const override {
        return "ShaderLoader";
    }
};

/// Second loader for the same extension, different value type
struct ShaderText {
    std::string text;
};

class ShaderTextLoader : public AssetLoader<ShaderText> {
public:
    std::vector<std::string> extensions() const override {
        return {"GLSL"};
    }

    LoadResult<ShaderText> load(LoadContext& ctx) override {
        return relic_core::Ok(std::make_unique<ShaderText>(ShaderText{ctx.data_as_string()}));
    }
};

class ShaderSerializer : public AssetSerializer<Shader> {
public:
    std::string type_tag() const override { return "test.shader"; }
    std::string extension() const override { return "glsl"; }

    Result<Bytes> serialize(const Shader& value) const override {
        return relic_core::Ok(to_bytes(value.source));
    }
};

class StripCommentsDeriver : public Deriver<Shader> {
public:
    std::string name() const override { return "strip_comments"; }

    Result<std::unique_ptr<Shader>> derive(std::unique_ptr<Shader> source, const AssetPath&) override {
        auto pos = source->source.find("//");
        if (pos != std::string::npos) {
            source->source = source->source.substr(0, pos);
        }
        return relic_core::Ok(std::move(source));
    }
};

/// Records nested requests instead of loading anything
class RecordingNestedLoader : public NestedLoader {
public:
    UntypedHandle request_nested(const AssetPath& path, std::type_index type) override {
        requests.emplace_back(path, type);
        return UntypedHandle(HandleData::create(AssetId::from_path(path, type), path, nullptr));
    }

    Result<Bytes> read_nested(const AssetPath& path) override {
        reads.push_back(path);
        return relic_core::Ok(to_bytes("shared"));
    }

    std::vector<std::pair<AssetPath, std::type_index>> requests;
    std::vector<AssetPath> reads;
};

} // anonymous namespace

// =============================================================================
// LoadContext Tests
// =============================================================================

TEST_CASE("LoadContext: data access", "[asset][loader]") {
    Bytes data = to_bytes("void main() {}");
    AssetPath path("shaders/basic.GLSL");
    LoadContext ctx(data, path);

    REQUIRE(ctx.data() == data);
    REQUIRE(ctx.data_as_string() == "void main() {}");
    REQUIRE(ctx.path() == path);
    REQUIRE(ctx.extension() == "glsl");
    REQUIRE(ctx.size() == data.size());
    REQUIRE_FALSE(ctx.is_cancelled());
}

TEST_CASE("LoadContext: cancellation token", "[asset][loader]") {
    Bytes data;
    AssetPath path("a.glsl");
    relic_core::CancellationToken token;
    LoadContext ctx(data, path, nullptr, token);

    token.cancel();
    REQUIRE(ctx.is_cancelled());
}

TEST_CASE("LoadContext: dependencies go through the nested loader", "[asset][loader]") {
    Bytes data;
    AssetPath path("materials/metal.mat");
    RecordingNestedLoader nested;
    LoadContext ctx(data, path, &nested);

    auto handle = ctx.load<Shader>(path.resolve("lit.glsl"));
    ctx.add_dependency(path.resolve("noise.bin"), false);

    REQUIRE(handle.is_valid());
    REQUIRE(handle.path() == AssetPath("materials/lit.glsl"));
    REQUIRE(nested.requests.size() == 2);
    REQUIRE(nested.requests[0].second == std::type_index(typeid(Shader)));
    REQUIRE(nested.requests[1].second == std::type_index(typeid(void)));

    REQUIRE(ctx.dependencies().size() == 2);
    REQUIRE(ctx.dependencies()[0].required);
    REQUIRE_FALSE(ctx.dependencies()[1].required);

    auto bytes = ctx.read_asset_bytes(AssetPath("shared.bin#ignored"));
    REQUIRE(bytes);
    REQUIRE(nested.reads.back() == AssetPath("shared.bin"));
}

TEST_CASE("LoadContext: without a nested loader", "[asset][loader]") {
    Bytes data;
    AssetPath path("a.mat");
    LoadContext ctx(data, path);

    auto handle = ctx.load<Shader>(AssetPath("b.glsl"));
    REQUIRE_FALSE(handle.is_valid());
    REQUIRE(ctx.dependencies().size() == 1);
    REQUIRE(ctx.dependencies()[0].path == AssetPath("b.glsl"));

    REQUIRE(ctx.read_asset_bytes(AssetPath("c.bin")).is_err());
}

TEST_CASE("LoadContext: labeled assets", "[asset][loader]") {
    Bytes data;
    AssetPath path("models/ship.gltf");
    LoadContext ctx(data, path);

    REQUIRE(ctx.add_labeled_asset("hull", Shader{"hull"}));
    REQUIRE(ctx.add_labeled_asset("deck", Shader{"deck"}, {AssetPath("models/deck.png")}));
    REQUIRE(ctx.labeled_assets().size() == 2);
    REQUIRE(ctx.labeled_assets()[1].dependencies.size() == 1);
    REQUIRE_FALSE(ctx.error().has_value());

    SECTION("duplicate label is an error") {
        auto dup = ctx.add_labeled_asset("hull", Shader{"again"});
        REQUIRE(dup.is_err());
        REQUIRE(dup.error().asset_kind() == AssetError::Kind::DuplicateAssetId);
        REQUIRE(ctx.error().has_value());
        REQUIRE(ctx.labeled_assets().size() == 2);
    }
}

// =============================================================================
// LoaderRegistry Tests
// =============================================================================

TEST_CASE("LoaderRegistry: registration and lookup", "[asset][loader]") {
    LoaderRegistry registry;
    registry.register_loader(std::make_unique<ShaderLoader>());

    REQUIRE(registry.len() == 1);
    REQUIRE(registry.supports_extension("glsl"));
    REQUIRE(registry.supports_extension(".VERT"));
    REQUIRE_FALSE(registry.supports_extension("png"));

    auto* loader = registry.find("glsl", std::type_index(typeid(Shader)));
    REQUIRE(loader != nullptr);
    REQUIRE(loader->type_name() == "ShaderLoader");
    REQUIRE(registry.find_first("png") == nullptr);

    auto exts = get_extensions_for_type(registry, std::type_index(typeid(Shader)));
    REQUIRE(exts == std::vector<std::string>{"glsl", "vert"});
}

TEST_CASE("LoaderRegistry: newest loader wins an extension", "[asset][loader]") {
    LoaderRegistry registry;
    registry.register_loader(std::make_unique<ShaderLoader>());
    registry.register_loader(std::make_unique<ShaderTextLoader>());

    REQUIRE(registry.find_first("glsl")->type_id() == std::type_index(typeid(ShaderText)));
    REQUIRE(registry.find("glsl", std::type_index(typeid(Shader)))->type_id() ==
            std::type_index(typeid(Shader)));
    REQUIRE(registry.find_by_extension("glsl").size() == 2);
    REQUIRE(registry.find_by_type(std::type_index(typeid(Shader))).size() == 1);
}

TEST_CASE("ErasedLoader: typed adapter", "[asset][loader]") {
    TypedErasedLoader<Shader> erased(std::make_unique<ShaderLoader>());
    AssetPath path("a.glsl");

    SECTION("success") {
        Bytes data = to_bytes("code");
        LoadContext ctx(data, path);
        auto result = erased.load_erased(ctx);
        REQUIRE(result);
        REQUIRE(result.value().peek<Shader>()->source == "code");
        REQUIRE(result.value().make_store != nullptr);
    }

    SECTION("loader error is forwarded") {
        Bytes data;
        LoadContext ctx(data, path);
        auto result = erased.load_erased(ctx);
        REQUIRE(result.is_err());
        REQUIRE(result.error().asset_kind() == AssetError::Kind::DeserializeError);
    }
}

TEST_CASE("normalize_extension", "[asset][loader]") {
    REQUIRE(normalize_extension(".PNG") == "png");
    REQUIRE(normalize_extension("Gltf") == "gltf");
    REQUIRE(normalize_extension("") == "");
}

// =============================================================================
// Built-in Loaders
// =============================================================================

TEST_CASE("Built-in loaders", "[asset][loader]") {
    Bytes data = to_bytes("plain text");
    AssetPath path("notes.txt");
    LoadContext ctx(data, path);

    SECTION("bytes") {
        BytesLoader loader;
        auto result = loader.load(ctx);
        REQUIRE(result);
        REQUIRE(result.value()->data == data);
    }

    SECTION("text") {
        TextLoader loader;
        auto result = loader.load(ctx);
        REQUIRE(result);
        REQUIRE(result.value()->text == "plain text");
        REQUIRE(loader.type_name() == "TextAsset");
    }
}

// =============================================================================
// Serializer / Deriver Registries
// =============================================================================

TEST_CASE("SerializerRegistry", "[asset][loader]") {
    SerializerRegistry registry;
    registry.register_serializer(std::make_unique<ShaderSerializer>());

    auto* serializer = registry.find(std::type_index(typeid(Shader)));
    REQUIRE(serializer != nullptr);
    REQUIRE(serializer->type_tag() == "test.shader");
    REQUIRE(registry.find_by_tag("test.shader") == serializer);
    REQUIRE(registry.find(std::type_index(typeid(ShaderText))) == nullptr);

    Shader shader{"void main() {}"};
    auto bytes = serializer->serialize_erased(&shader);
    REQUIRE(bytes);
    REQUIRE(to_string(bytes.value()) == "void main() {}");
}

TEST_CASE("DeriverRegistry", "[asset][loader]") {
    DeriverRegistry registry;
    registry.register_deriver(std::make_unique<StripCommentsDeriver>());
    REQUIRE(registry.len() == 1);

    SECTION("matching type is derived") {
        auto derived = registry.apply(
            ErasedAsset::from(std::make_unique<Shader>(Shader{"code // note"})), AssetPath("a.glsl"));
        REQUIRE(derived);
        REQUIRE(derived.value().peek<Shader>()->source == "code ");
    }

    SECTION("other types pass through") {
        auto passed = registry.apply(
            ErasedAsset::from(std::make_unique<ShaderText>(ShaderText{"// kept"})), AssetPath("a.glsl"));
        REQUIRE(passed);
        REQUIRE(passed.value().peek<ShaderText>()->text == "// kept");
    }
}

TEST_CASE("Loader statistics", "[asset][loader]") {
    reset_loader_statistics();
    record_loader_operation(true, 128);
    record_loader_operation(false);

    std::string stats = format_loader_statistics();
    REQUIRE(stats.find("Total loads: 2") != std::string::npos);
    REQUIRE(stats.find("Bytes processed: 128") != std::string::npos);
    reset_loader_statistics();
}
