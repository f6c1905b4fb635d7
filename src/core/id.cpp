/// @file id.cpp
/// @brief Hex encoding for hashes and ids

#include <relic/core/id.hpp>
#include <iomanip>
#include <sstream>

namespace relic_core {

std::string to_hex(std::uint64_t value) {
    std::ostringstream oss;
    oss << std::hex << std::setw(16) << std::setfill('0') << value;
    return oss.str();
}

Result<std::uint64_t> from_hex(const std::string& text) {
    if (text.empty() || text.size() > 16) {
        return Err<std::uint64_t>(Error(ErrorCode::ParseError, "Invalid hex value: '" + text + "'"));
    }

    std::uint64_t value = 0;
    for (char c : text) {
        value <<= 4;
        if (c >= '0' && c <= '9') {
            value |= static_cast<std::uint64_t>(c - '0');
        } else if (c >= 'a' && c <= 'f') {
            value |= static_cast<std::uint64_t>(c - 'a' + 10);
        } else if (c >= 'A' && c <= 'F') {
            value |= static_cast<std::uint64_t>(c - 'A' + 10);
        } else {
            return Err<std::uint64_t>(Error(ErrorCode::ParseError, "Invalid hex value: '" + text + "'"));
        }
    }
    return Ok(value);
}

} // namespace relic_core
