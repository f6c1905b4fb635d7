/// @file io.cpp
/// @brief Filesystem and in-memory byte sources

#include <relic/asset/io.hpp>
#include <relic/core/log.hpp>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <system_error>

namespace relic_asset {

namespace {

/// Files the server writes next to sources, never reported as changes
bool is_bookkeeping_file(const std::string& path) {
    auto ends_with = [&](const std::string& suffix) {
        return path.size() >= suffix.size() &&
               path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0;
    };
    return ends_with(".meta") || ends_with(".tmp");
}

} // anonymous namespace

// =============================================================================
// FileModificationTracker
// =============================================================================

bool FileModificationTracker::update(const std::filesystem::path& path) {
    std::error_code ec;
    auto write_time = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return false;
    }

    std::lock_guard lock(m_mutex);
    auto it = m_modification_times.find(path);
    if (it == m_modification_times.end()) {
        m_modification_times[path] = write_time;
        return true;  // New file
    }

    if (it->second != write_time) {
        it->second = write_time;
        return true;  // Modified
    }

    return false;  // Unchanged
}

bool FileModificationTracker::is_modified(const std::filesystem::path& path) const {
    std::error_code ec;
    auto write_time = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return false;
    }

    std::lock_guard lock(m_mutex);
    auto it = m_modification_times.find(path);
    if (it == m_modification_times.end()) {
        return true;  // New file
    }

    return it->second != write_time;
}

void FileModificationTracker::remove(const std::filesystem::path& path) {
    std::lock_guard lock(m_mutex);
    m_modification_times.erase(path);
}

std::vector<std::filesystem::path> FileModificationTracker::tracked() const {
    std::lock_guard lock(m_mutex);
    std::vector<std::filesystem::path> out;
    out.reserve(m_modification_times.size());
    for (const auto& [path, time] : m_modification_times) {
        out.push_back(path);
    }
    return out;
}

std::size_t FileModificationTracker::size() const {
    std::lock_guard lock(m_mutex);
    return m_modification_times.size();
}

// =============================================================================
// FileAssetIo
// =============================================================================

FileAssetIo::FileAssetIo(std::filesystem::path root)
    : m_root(std::move(root)) {}

std::filesystem::path FileAssetIo::full_path(const std::string& path) const {
    return m_root / std::filesystem::path(path);
}

std::string FileAssetIo::relative(const std::filesystem::path& full) const {
    std::error_code ec;
    auto rel = std::filesystem::relative(full, m_root, ec);
    if (ec) {
        return full.generic_string();
    }
    return rel.generic_string();
}

Result<Bytes> FileAssetIo::read(const std::string& path) {
    auto full = full_path(path);
    std::ifstream file(full, std::ios::binary);
    if (!file) {
        return relic_core::Err<Bytes>(AssetError::io(path, "cannot open " + full.string()));
    }

    Bytes bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return relic_core::Err<Bytes>(AssetError::io(path, "read failed"));
    }
    return relic_core::Ok(std::move(bytes));
}

Result<void> FileAssetIo::write(const std::string& path, const Bytes& bytes) {
    auto full = full_path(path);
    std::error_code ec;
    if (full.has_parent_path()) {
        std::filesystem::create_directories(full.parent_path(), ec);
        if (ec) {
            return relic_core::Err(AssetError::io(path, ec.message()));
        }
    }

    std::ofstream file(full, std::ios::binary | std::ios::trunc);
    if (!file) {
        return relic_core::Err(AssetError::io(path, "cannot open for writing"));
    }
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!file) {
        return relic_core::Err(AssetError::io(path, "write failed"));
    }
    return relic_core::Ok();
}

Result<void> FileAssetIo::rename(const std::string& from, const std::string& to) {
    std::error_code ec;
    std::filesystem::rename(full_path(from), full_path(to), ec);
    if (ec) {
        return relic_core::Err(AssetError::io(from, "rename to '" + to + "' failed: " + ec.message()));
    }
    return relic_core::Ok();
}

Result<void> FileAssetIo::remove(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::remove(full_path(path), ec)) {
        return relic_core::Err(AssetError::io(path, ec ? ec.message() : "no such file"));
    }
    return relic_core::Ok();
}

bool FileAssetIo::exists(const std::string& path) const {
    std::error_code ec;
    return std::filesystem::exists(full_path(path), ec);
}

bool FileAssetIo::is_directory(const std::string& path) const {
    std::error_code ec;
    return std::filesystem::is_directory(full_path(path), ec);
}

Result<std::vector<std::string>> FileAssetIo::read_directory(const std::string& dir) const {
    std::error_code ec;
    std::filesystem::directory_iterator it(full_path(dir), ec);
    if (ec) {
        return relic_core::Err<std::vector<std::string>>(AssetError::io(dir, ec.message()));
    }

    std::vector<std::string> entries;
    for (const auto& entry : it) {
        entries.push_back(relative(entry.path()));
    }
    std::sort(entries.begin(), entries.end());
    return relic_core::Ok(std::move(entries));
}

void FileAssetIo::watch_for_changes() {
    if (m_watching.exchange(true)) {
        return;
    }

    std::error_code ec;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(m_root, ec)) {
        if (entry.is_regular_file() && !is_bookkeeping_file(entry.path().string())) {
            m_tracker.update(entry.path());
        }
    }
    relic_core::io_logger()->debug("Watching {} ({} files)", m_root.string(), m_tracker.size());
}

std::vector<std::string> FileAssetIo::poll_changes() {
    std::vector<std::string> changed;
    if (!m_watching.load()) {
        return changed;
    }

    std::set<std::filesystem::path> present;
    std::error_code ec;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(m_root, ec)) {
        if (!entry.is_regular_file() || is_bookkeeping_file(entry.path().string())) {
            continue;
        }
        present.insert(entry.path());
        if (m_tracker.update(entry.path())) {
            changed.push_back(relative(entry.path()));
        }
    }

    // Deleted files
    for (const auto& path : m_tracker.tracked()) {
        if (present.find(path) == present.end()) {
            m_tracker.remove(path);
            changed.push_back(relative(path));
        }
    }

    if (!changed.empty()) {
        relic_core::io_logger()->debug("{} changed file(s) under {}", changed.size(), m_root.string());
    }
    return changed;
}

// =============================================================================
// MemoryAssetIo
// =============================================================================

void MemoryAssetIo::insert(const std::string& path, Bytes bytes) {
    std::string key = AssetPath::normalize(path);
    std::lock_guard lock(m_mutex);
    m_files[key] = std::move(bytes);
    record_change(key);
}

void MemoryAssetIo::insert_text(const std::string& path, const std::string& text) {
    insert(path, to_bytes(text));
}

std::optional<std::string> MemoryAssetIo::text(const std::string& path) const {
    std::lock_guard lock(m_mutex);
    auto it = m_files.find(AssetPath::normalize(path));
    if (it == m_files.end()) {
        return std::nullopt;
    }
    return to_string(it->second);
}

std::size_t MemoryAssetIo::read_count(const std::string& path) const {
    std::lock_guard lock(m_mutex);
    auto it = m_reads.find(AssetPath::normalize(path));
    return it != m_reads.end() ? it->second : 0;
}

std::size_t MemoryAssetIo::total_reads() const {
    std::lock_guard lock(m_mutex);
    return m_total_reads;
}

std::size_t MemoryAssetIo::file_count() const {
    std::lock_guard lock(m_mutex);
    return m_files.size();
}

Result<Bytes> MemoryAssetIo::read(const std::string& path) {
    std::string key = AssetPath::normalize(path);
    std::lock_guard lock(m_mutex);
    ++m_reads[key];
    ++m_total_reads;

    auto it = m_files.find(key);
    if (it == m_files.end()) {
        return relic_core::Err<Bytes>(AssetError::io(key, "no such file"));
    }
    return relic_core::Ok(it->second);
}

Result<void> MemoryAssetIo::write(const std::string& path, const Bytes& bytes) {
    if (m_fail_writes.load()) {
        return relic_core::Err(AssetError::io(path, "write rejected"));
    }
    std::string key = AssetPath::normalize(path);
    std::lock_guard lock(m_mutex);
    m_files[key] = bytes;
    record_change(key);
    return relic_core::Ok();
}

Result<void> MemoryAssetIo::rename(const std::string& from, const std::string& to) {
    if (m_fail_renames.load()) {
        return relic_core::Err(AssetError::io(from, "rename rejected"));
    }
    std::string src = AssetPath::normalize(from);
    std::string dst = AssetPath::normalize(to);
    std::lock_guard lock(m_mutex);
    auto it = m_files.find(src);
    if (it == m_files.end()) {
        return relic_core::Err(AssetError::io(src, "no such file"));
    }
    Bytes bytes = std::move(it->second);
    m_files.erase(it);
    m_files[dst] = std::move(bytes);
    record_change(dst);
    return relic_core::Ok();
}

Result<void> MemoryAssetIo::remove(const std::string& path) {
    std::string key = AssetPath::normalize(path);
    std::lock_guard lock(m_mutex);
    if (m_files.erase(key) == 0) {
        return relic_core::Err(AssetError::io(key, "no such file"));
    }
    record_change(key);
    return relic_core::Ok();
}

bool MemoryAssetIo::exists(const std::string& path) const {
    std::string key = AssetPath::normalize(path);
    {
        std::lock_guard lock(m_mutex);
        if (m_files.find(key) != m_files.end()) {
            return true;
        }
    }
    return is_directory(key);
}

bool MemoryAssetIo::is_directory(const std::string& path) const {
    std::string prefix = AssetPath::normalize(path);
    if (!prefix.empty()) {
        prefix += "/";
    }
    std::lock_guard lock(m_mutex);
    auto it = m_files.lower_bound(prefix);
    return it != m_files.end() && it->first.compare(0, prefix.size(), prefix) == 0;
}

Result<std::vector<std::string>> MemoryAssetIo::read_directory(const std::string& dir) const {
    if (!is_directory(dir)) {
        return relic_core::Err<std::vector<std::string>>(AssetError::io(dir, "not a directory"));
    }

    std::string prefix = AssetPath::normalize(dir);
    if (!prefix.empty()) {
        prefix += "/";
    }

    std::set<std::string> children;
    std::lock_guard lock(m_mutex);
    for (auto it = m_files.lower_bound(prefix); it != m_files.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) {
            break;
        }
        auto rest = it->first.substr(prefix.size());
        auto slash = rest.find('/');
        children.insert(prefix + (slash == std::string::npos ? rest : rest.substr(0, slash)));
    }
    return relic_core::Ok(std::vector<std::string>(children.begin(), children.end()));
}

void MemoryAssetIo::watch_for_changes() {
    std::lock_guard lock(m_mutex);
    m_watching = true;
}

std::vector<std::string> MemoryAssetIo::poll_changes() {
    std::lock_guard lock(m_mutex);
    std::vector<std::string> out(m_changes.begin(), m_changes.end());
    m_changes.clear();
    return out;
}

void MemoryAssetIo::record_change(const std::string& path) {
    // m_mutex held
    if (m_watching && !is_bookkeeping_file(path)) {
        m_changes.insert(path);
    }
}

} // namespace relic_asset
