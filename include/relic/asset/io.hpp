#pragma once

/// @file io.hpp
/// @brief Byte sources for relic_asset

#include "fwd.hpp"
#include "types.hpp"
#include <relic/core/error.hpp>
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace relic_asset {

using Bytes = std::vector<std::uint8_t>;

// =============================================================================
// AssetIo
// =============================================================================

/// Read/write capability over one byte source.
///
/// Paths are source-relative with forward slashes, as produced by
/// AssetPath::path(). Implementations must be safe to call from any thread.
class AssetIo {
public:
    virtual ~AssetIo() = default;

    /// Read all bytes of a file
    [[nodiscard]] virtual Result<Bytes> read(const std::string& path) = 0;

    /// Create or replace a file
    [[nodiscard]] virtual Result<void> write(const std::string& path, const Bytes& bytes) = 0;

    /// Rename a file, replacing the target
    [[nodiscard]] virtual Result<void> rename(const std::string& from, const std::string& to) = 0;

    /// Delete a file
    [[nodiscard]] virtual Result<void> remove(const std::string& path) = 0;

    /// Check if a file or directory exists
    [[nodiscard]] virtual bool exists(const std::string& path) const = 0;

    /// Check if a path is a directory
    [[nodiscard]] virtual bool is_directory(const std::string& path) const = 0;

    /// Direct children of a directory, as source-relative paths
    [[nodiscard]] virtual Result<std::vector<std::string>> read_directory(const std::string& dir) const = 0;

    /// Start recording change notifications
    virtual void watch_for_changes() {}

    /// Paths changed since the last poll
    [[nodiscard]] virtual std::vector<std::string> poll_changes() { return {}; }
};

// =============================================================================
// FileModificationTracker
// =============================================================================

/// Tracks file modification times for change detection
class FileModificationTracker {
public:
    /// Record the current write time; true if new or modified
    bool update(const std::filesystem::path& path);

    /// Check if file was modified since the last update
    [[nodiscard]] bool is_modified(const std::filesystem::path& path) const;

    /// Remove tracked file
    void remove(const std::filesystem::path& path);

    /// Tracked paths
    [[nodiscard]] std::vector<std::filesystem::path> tracked() const;

    /// Get tracked file count
    [[nodiscard]] std::size_t size() const;

private:
    std::map<std::filesystem::path, std::filesystem::file_time_type> m_modification_times;
    mutable std::mutex m_mutex;
};

// =============================================================================
// FileAssetIo
// =============================================================================

/// Filesystem-backed byte source rooted at a directory.
/// Change detection polls modification times on poll_changes().
class FileAssetIo : public AssetIo {
public:
    explicit FileAssetIo(std::filesystem::path root);

    [[nodiscard]] Result<Bytes> read(const std::string& path) override;
    [[nodiscard]] Result<void> write(const std::string& path, const Bytes& bytes) override;
    [[nodiscard]] Result<void> rename(const std::string& from, const std::string& to) override;
    [[nodiscard]] Result<void> remove(const std::string& path) override;
    [[nodiscard]] bool exists(const std::string& path) const override;
    [[nodiscard]] bool is_directory(const std::string& path) const override;
    [[nodiscard]] Result<std::vector<std::string>> read_directory(const std::string& dir) const override;

    void watch_for_changes() override;
    [[nodiscard]] std::vector<std::string> poll_changes() override;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return m_root; }

private:
    [[nodiscard]] std::filesystem::path full_path(const std::string& path) const;
    [[nodiscard]] std::string relative(const std::filesystem::path& full) const;

    std::filesystem::path m_root;
    std::atomic<bool> m_watching{false};
    FileModificationTracker m_tracker;
};

// =============================================================================
// MemoryAssetIo
// =============================================================================

/// In-memory byte source with read accounting and failure injection
class MemoryAssetIo : public AssetIo {
public:
    MemoryAssetIo() = default;

    /// Create or replace a file (records a change when watching)
    void insert(const std::string& path, Bytes bytes);
    void insert_text(const std::string& path, const std::string& text);

    /// Text content of a file, if present
    [[nodiscard]] std::optional<std::string> text(const std::string& path) const;

    /// Number of read() calls for a path
    [[nodiscard]] std::size_t read_count(const std::string& path) const;

    /// Number of read() calls overall
    [[nodiscard]] std::size_t total_reads() const;

    /// Make subsequent write() calls fail with IoError
    void set_fail_writes(bool fail) { m_fail_writes.store(fail); }

    /// Make subsequent rename() calls fail with IoError
    void set_fail_renames(bool fail) { m_fail_renames.store(fail); }

    /// Number of files
    [[nodiscard]] std::size_t file_count() const;

    [[nodiscard]] Result<Bytes> read(const std::string& path) override;
    [[nodiscard]] Result<void> write(const std::string& path, const Bytes& bytes) override;
    [[nodiscard]] Result<void> rename(const std::string& from, const std::string& to) override;
    [[nodiscard]] Result<void> remove(const std::string& path) override;
    [[nodiscard]] bool exists(const std::string& path) const override;
    [[nodiscard]] bool is_directory(const std::string& path) const override;
    [[nodiscard]] Result<std::vector<std::string>> read_directory(const std::string& dir) const override;

    void watch_for_changes() override;
    [[nodiscard]] std::vector<std::string> poll_changes() override;

private:
    void record_change(const std::string& path);

    std::map<std::string, Bytes> m_files;
    std::map<std::string, std::size_t> m_reads;
    std::size_t m_total_reads = 0;
    bool m_watching = false;
    std::set<std::string> m_changes;
    std::atomic<bool> m_fail_writes{false};
    std::atomic<bool> m_fail_renames{false};
    mutable std::mutex m_mutex;
};

/// Bytes of a string
[[nodiscard]] inline Bytes to_bytes(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

/// String of bytes
[[nodiscard]] inline std::string to_string(const Bytes& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

} // namespace relic_asset
