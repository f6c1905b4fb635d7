/// @file handle.cpp
/// @brief relic_asset handle implementation
///
/// Provides non-template utilities for the handle system.
/// Core handle functionality is template-based in the header.

#include <relic/asset/handle.hpp>
#include <relic/core/log.hpp>

#include <sstream>

namespace relic_asset {

namespace {

relic_core::IdGenerator& incarnations() {
    static relic_core::IdGenerator generator(1);
    return generator;
}

} // anonymous namespace

// =============================================================================
// HandleData
// =============================================================================

std::shared_ptr<HandleData> HandleData::create(
    const AssetId& id, const AssetPath& path, const std::shared_ptr<DropQueue>& queue)
{
    auto data = std::make_shared<HandleData>();
    data->id = id;
    data->path = path;
    data->incarnation = incarnations().next();
    data->drop_queue = queue;
    return data;
}

void HandleData::release_strong() noexcept {
    if (strong_count.fetch_sub(1, std::memory_order_acq_rel) != 1) {
        return;
    }
    // Removal is deferred to the owner's synchronization point
    if (auto queue = drop_queue.lock()) {
        queue->push(id);
    }
}

// =============================================================================
// Debug Utilities
// =============================================================================

namespace debug {

std::string format_handle_data(const HandleData& data) {
    std::ostringstream oss;
    oss << "HandleData {\n";
    oss << "  id: " << relic_core::to_hex(data.id.raw()) << "\n";
    oss << "  path: \"" << data.path.to_string() << "\"\n";
    oss << "  incarnation: " << data.incarnation << "\n";
    oss << "  strong_count: " << data.use_count() << "\n";
    oss << "  generation: " << data.get_generation() << "\n";
    oss << "  state: " << load_state_name(data.get_state()) << "\n";
    oss << "}";
    return oss.str();
}

} // namespace debug

} // namespace relic_asset
