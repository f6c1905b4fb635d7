#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for relic_core module

#include <cstdint>

namespace relic_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct AssetError;
struct MetaError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Tasks
// =============================================================================

class CancellationToken;
class TaskPool;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

} // namespace relic_core
