#pragma once

/// @file test_loaders.hpp
/// @brief Small asset formats shared by the server and hot reload tests

#include <relic/asset/server.hpp>
#include <atomic>
#include <initializer_list>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace relic_test {

using namespace relic_asset;

struct Texture {
    std::string pixels;
};

/// "corrupt" fails to parse, "throw" makes the loader throw
class TextureLoader : public AssetLoader<Texture> {
public:
    explicit TextureLoader(std::shared_ptr<std::atomic<int>> parses = nullptr)
        : m_parses(std::move(parses)) {}

    std::vector<std::string> extensions() const override {
        return {"png"};
    }

    LoadResult<Texture> load(LoadContext& ctx) override {
        if (m_parses) {
            ++*m_parses;
        }
        std::string text = ctx.data_as_string();
        if (text == "corrupt") {
            return relic_core::Err<std::unique_ptr<Texture>>(
                AssetError::deserialize(ctx.path().to_string(), "bad pixel data"));
        }
        if (text == "throw") {
            throw std::runtime_error("decoder crashed");
        }
        return relic_core::Ok(std::make_unique<Texture>(Texture{text}));
    }

    std::string type_name() const override {
        return "TextureLoader";
    }

private:
    std::shared_ptr<std::atomic<int>> m_parses;
};

/// Whitespace separated directives:
///   dep <path>    required texture
///   opt <path>    optional dependency of any type
///   model <path>  required model
///   sub <label>   labeled texture
struct Model {
    std::string body;
    std::vector<Handle<Texture>> textures;
};

class ModelLoader : public AssetLoader<Model> {
public:
    std::vector<std::string> extensions() const override {
        return {"model", "gltf"};
    }

    LoadResult<Model> load(LoadContext& ctx) override {
        auto model = std::make_unique<Model>();
        model->body = ctx.data_as_string();

        std::istringstream in(model->body);
        std::string kind;
        std::string arg;
        while (in >> kind >> arg) {
            if (kind == "dep") {
                model->textures.push_back(ctx.load<Texture>(ctx.path().resolve(arg)));
            } else if (kind == "opt") {
                ctx.add_dependency(ctx.path().resolve(arg), false);
            } else if (kind == "model") {
                (void)ctx.load<Model>(ctx.path().resolve(arg));
            } else if (kind == "sub") {
                auto added = ctx.add_labeled_asset(arg, Texture{arg});
                if (!added) {
                    return relic_core::Err<std::unique_ptr<Model>>(added.error());
                }
            } else {
                return relic_core::Err<std::unique_ptr<Model>>(
                    AssetError::deserialize(ctx.path().to_string(), "unknown directive '" + kind + "'"));
            }
        }
        return relic_core::Ok(std::move(model));
    }

    std::string type_name() const override {
        return "ModelLoader";
    }
};

/// Single-threaded server without file watching or metadata
inline AssetServerConfig inline_config() {
    return AssetServerConfig{}
        .with_worker_threads(0)
        .with_hot_reload(false)
        .with_metadata(false);
}

inline std::shared_ptr<MemoryAssetIo> make_io(
    std::initializer_list<std::pair<const char*, const char*>> files)
{
    auto io = std::make_shared<MemoryAssetIo>();
    for (const auto& [path, text] : files) {
        io->insert_text(path, text);
    }
    return io;
}

inline void register_test_loaders(AssetServer& server,
                                  std::shared_ptr<std::atomic<int>> parses = nullptr) {
    server.register_loader(std::make_unique<TextureLoader>(std::move(parses)));
    server.register_loader(std::make_unique<ModelLoader>());
}

/// Events of one kind, in emission order
inline std::vector<AssetEvent> events_of(const std::vector<AssetEvent>& events, AssetEventKind kind) {
    std::vector<AssetEvent> out;
    for (const auto& event : events) {
        if (event.kind == kind) {
            out.push_back(event);
        }
    }
    return out;
}

} // namespace relic_test
