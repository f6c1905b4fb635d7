/// @file types.cpp
/// @brief AssetPath parsing and AssetId derivation

#include <relic/asset/types.hpp>

#include <algorithm>
#include <cctype>
#include <vector>

namespace relic_asset {

namespace {

constexpr const char* SOURCE_SEPARATOR = "://";

relic_core::IdGenerator& generated_ids() {
    static relic_core::IdGenerator generator(1);
    return generator;
}

/// Split "path#label" into its parts
std::pair<std::string, std::optional<std::string>> split_label(const std::string& text) {
    auto pos = text.find('#');
    if (pos == std::string::npos) {
        return {text, std::nullopt};
    }
    return {text.substr(0, pos), text.substr(pos + 1)};
}

} // anonymous namespace

// =============================================================================
// AssetPath
// =============================================================================

AssetPath::AssetPath(const std::string& text) {
    std::string rest = text;
    auto sep = rest.find(SOURCE_SEPARATOR);
    if (sep != std::string::npos) {
        m_source = SourceId(rest.substr(0, sep));
        rest = rest.substr(sep + 3);
    }

    auto [path, label] = split_label(rest);
    m_path = normalize(path);
    m_label = std::move(label);
    rehash();
}

AssetPath::AssetPath(SourceId source, std::string path, std::optional<std::string> label)
    : m_source(std::move(source))
    , m_path(normalize(path))
    , m_label(std::move(label))
{
    rehash();
}

std::string AssetPath::normalize(const std::string& path) {
    std::vector<std::string> segments;
    std::string segment;

    auto flush = [&]() {
        if (segment.empty() || segment == ".") {
            // skip
        } else if (segment == "..") {
            if (!segments.empty()) {
                segments.pop_back();
            }
        } else {
            segments.push_back(segment);
        }
        segment.clear();
    };

    for (char c : path) {
        if (c == '/' || c == '\\') {
            flush();
        } else {
            segment.push_back(c);
        }
    }
    flush();

    std::string result;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) result.push_back('/');
        result += segments[i];
    }
    return result;
}

void AssetPath::rehash() noexcept {
    using namespace relic_core::detail;
    std::uint64_t h = fnv1a_hash(m_source.name);
    h = hash_combine(h, m_path);
    if (m_label) {
        // '#' marker keeps "a" and "a#" apart
        h = hash_combine(h, "#");
        h = hash_combine(h, *m_label);
    }
    m_hash = h;
}

std::string AssetPath::extension() const {
    std::string name = filename();
    auto pos = name.rfind('.');
    if (pos == std::string::npos || pos + 1 == name.size()) return "";
    std::string ext = name.substr(pos + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string AssetPath::filename() const {
    auto pos = m_path.rfind('/');
    if (pos == std::string::npos) return m_path;
    return m_path.substr(pos + 1);
}

std::string AssetPath::directory() const {
    auto pos = m_path.rfind('/');
    if (pos == std::string::npos) return "";
    return m_path.substr(0, pos);
}

std::string AssetPath::stem() const {
    std::string name = filename();
    auto pos = name.rfind('.');
    if (pos == std::string::npos) return name;
    return name.substr(0, pos);
}

AssetPath AssetPath::resolve(const std::string& reference) const {
    if (!reference.empty() && reference[0] == '#') {
        return with_label(reference.substr(1));
    }
    if (reference.find(SOURCE_SEPARATOR) != std::string::npos) {
        return AssetPath(reference);
    }

    auto [path, label] = split_label(reference);
    if (!path.empty() && (path[0] == '/' || path[0] == '\\')) {
        return AssetPath(m_source, path, std::move(label));
    }

    std::string dir = directory();
    std::string joined = dir.empty() ? path : dir + "/" + path;
    return AssetPath(m_source, joined, std::move(label));
}

std::string AssetPath::to_string() const {
    std::string result = m_source.prefix() + m_path;
    if (m_label) {
        result += "#" + *m_label;
    }
    return result;
}

// =============================================================================
// AssetId
// =============================================================================

AssetId AssetId::from_path(const AssetPath& path, std::type_index t) noexcept {
    std::uint64_t raw = path.hash() & ~GENERATED_BIT;
    if (raw == 0) {
        raw = 1;
    }
    return AssetId{raw, t};
}

AssetId AssetId::generate(std::type_index t) noexcept {
    return AssetId{GENERATED_BIT | generated_ids().next(), t};
}

} // namespace relic_asset
