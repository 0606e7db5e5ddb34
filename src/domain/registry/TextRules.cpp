/**
 * @file TextRules.cpp
 * @brief Implementation of the text field rules on top of ICU.
 */

#include "domain/registry/TextRules.hpp"

#include <unicode/stringpiece.h>
#include <unicode/unistr.h>

namespace parasitereg::domain::registry {

namespace {

icu::UnicodeString FromUtf8(const std::string& text) {
    return icu::UnicodeString::fromUTF8(icu::StringPiece(text.data(), static_cast<int32_t>(text.size())));
}

} // namespace

bool IsWellFormedUtf8(const std::string& text) {
    // ICU substitutes U+FFFD for ill-formed sequences, so only valid input survives the round trip.
    std::string round;
    FromUtf8(text).toUTF8String(round);
    return round == text;
}

std::size_t CodePointCount(const std::string& text) {
    return static_cast<std::size_t>(FromUtf8(text).countChar32());
}

std::optional<RegistryError> CheckTextField(const char* field, const std::string& text, std::size_t maxChars) {
    if (!IsWellFormedUtf8(text)) {
        return RegistryError{ErrorKind::InvalidInput, std::string(field) + " is not valid UTF-8."};
    }
    if (CodePointCount(text) > maxChars) {
        return RegistryError{ErrorKind::InvalidInput,
            std::string(field) + " exceeds " + std::to_string(maxChars) + " characters."};
    }
    return std::nullopt;
}

} // namespace parasitereg::domain::registry
