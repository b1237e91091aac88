#pragma once

#include "validation/validation_export.hpp"
#include <string>
#include <string_view>

namespace pwguard::validation::unicode {

/**
 * @brief Decode UTF-8 text into code points
 *
 * Malformed sequences decode to U+FFFD instead of failing.
 */
PWGUARD_VALIDATION_EXPORT std::u32string decodeUtf8(std::string_view text);

// Unicode uppercase property, not limited to ASCII
PWGUARD_VALIDATION_EXPORT bool isUppercase(char32_t codePoint);

// General category Nd
PWGUARD_VALIDATION_EXPORT bool isDecimalDigit(char32_t codePoint);

} // namespace pwguard::validation::unicode
