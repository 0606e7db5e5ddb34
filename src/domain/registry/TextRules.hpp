/**
 * @file TextRules.hpp
 * @brief Encoding and length rules for caller-supplied text fields.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "RegistryError.hpp"

namespace parasitereg::domain::registry {

/** @brief True if `text` is well-formed UTF-8. */
bool IsWellFormedUtf8(const std::string& text);

/** @brief Number of Unicode code points in well-formed UTF-8 `text`. */
std::size_t CodePointCount(const std::string& text);

/**
 * @brief InvalidInput if `text` is not UTF-8 or has more than `maxChars` code points.
 * @param field Name used in the error message. The text itself is never echoed back.
 */
std::optional<RegistryError> CheckTextField(const char* field, const std::string& text, std::size_t maxChars);

} // namespace parasitereg::domain::registry
