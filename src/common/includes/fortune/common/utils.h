#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace fortune::common {

/**
 * Write uint32_t to buffer in big-endian format (platform-independent)
 * @param buffer Output buffer (must have at least 4 bytes available)
 * @param value Value to write
 */
inline void
put_uint32_be(uint8_t* buffer, uint32_t value)
{
    buffer[0] = static_cast<uint8_t>((value >> 24) & 0xFF);
    buffer[1] = static_cast<uint8_t>((value >> 16) & 0xFF);
    buffer[2] = static_cast<uint8_t>((value >> 8) & 0xFF);
    buffer[3] = static_cast<uint8_t>(value & 0xFF);
}

/**
 * Read uint32_t from buffer in big-endian format (platform-independent)
 * @param buffer Input buffer (must have at least 4 bytes available)
 * @return The uint32_t value
 */
inline uint32_t
get_uint32_be(const uint8_t* buffer)
{
    return (static_cast<uint32_t>(buffer[0]) << 24) |
        (static_cast<uint32_t>(buffer[1]) << 16) |
        (static_cast<uint32_t>(buffer[2]) << 8) |
        static_cast<uint32_t>(buffer[3]);
}

/**
 * Apply ROT13 to ASCII letters, leaving every other byte untouched
 * @param text Input bytes
 * @return Rotated copy
 */
std::string
rot13(std::string_view text);

/**
 * Format a percentage with two decimals, e.g. 12.5 -> "12.50%"
 */
std::string
format_percentage(double percent);

}  // namespace fortune::common
