/**
 * @file HexEncoding.hpp
 * @brief Lowercase hex helpers shared by the fixed-size value objects.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace parasitereg::domain::registry {

std::string EncodeHex(const std::uint8_t* data, std::size_t size);

/**
 * @brief Decodes exactly `size` bytes from `hex` into `out`.
 * @return False when the length is wrong or a non-hex character is found.
 */
bool DecodeHex(const std::string& hex, std::uint8_t* out, std::size_t size);

} // namespace parasitereg::domain::registry
