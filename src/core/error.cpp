/// @file error.cpp
/// @brief Error handling implementation for relic_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Explicit template instantiations for common Result types
/// - Error formatting utilities
/// - Error statistics

#include <relic/core/error.hpp>
#include <atomic>
#include <sstream>
#include <vector>

namespace relic_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

std::string format_asset_error(const AssetError& err) {
    std::ostringstream oss;
    oss << "[AssetError:" << asset_error_kind_name(err.kind) << "] " << err.message;
    if (!err.path.empty() && err.message.find(err.path) == std::string::npos) {
        oss << " (path: " << err.path << ")";
    }
    return oss.str();
}

std::string format_meta_error(const MetaError& err) {
    std::ostringstream oss;
    oss << "[MetaError] " << err.message;
    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, AssetError>) {
            oss << detail::format_asset_error(err);
        } else if constexpr (std::is_same_v<T, MetaError>) {
            oss << detail::format_meta_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << "\n  " << key << ": " << value;
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::uint64_t, Error>;
template class Result<std::string, Error>;
template class Result<std::vector<std::uint8_t>, Error>;

// =============================================================================
// Error Statistics
// =============================================================================

namespace debug {

struct ErrorStats {
    std::atomic<std::uint64_t> total_errors{0};
    std::atomic<std::uint64_t> asset_errors{0};
    std::atomic<std::uint64_t> meta_errors{0};
    std::atomic<std::uint64_t> generic_errors{0};
};

static ErrorStats s_error_stats;

void record_error(const Error& error) {
    s_error_stats.total_errors.fetch_add(1, std::memory_order_relaxed);

    if (error.is<AssetError>()) {
        s_error_stats.asset_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<MetaError>()) {
        s_error_stats.meta_errors.fetch_add(1, std::memory_order_relaxed);
    } else {
        s_error_stats.generic_errors.fetch_add(1, std::memory_order_relaxed);
    }
}

std::uint64_t total_error_count() {
    return s_error_stats.total_errors.load(std::memory_order_relaxed);
}

void reset_error_stats() {
    s_error_stats.total_errors.store(0, std::memory_order_relaxed);
    s_error_stats.asset_errors.store(0, std::memory_order_relaxed);
    s_error_stats.meta_errors.store(0, std::memory_order_relaxed);
    s_error_stats.generic_errors.store(0, std::memory_order_relaxed);
}

std::string error_stats_summary() {
    std::ostringstream oss;
    oss << "Error Statistics:\n"
        << "  Total: " << s_error_stats.total_errors.load() << "\n"
        << "  Asset: " << s_error_stats.asset_errors.load() << "\n"
        << "  Meta: " << s_error_stats.meta_errors.load() << "\n"
        << "  Generic: " << s_error_stats.generic_errors.load() << "\n";
    return oss.str();
}

} // namespace debug

} // namespace relic_core
