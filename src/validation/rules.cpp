#include "rules.hpp"
#include "unicodetext.hpp"
#include <algorithm>
#include <utility>

namespace pwguard::validation {

const char* const SpecialCharacterRule::DEFAULT_SPECIAL_CHARACTERS =
    "!@#$%^&*(),.?\":{}|<>-_+=[]\\;'`~";

MinLengthRule::MinLengthRule(int minLength)
    : minLength_(minLength) {
}

std::optional<PasswordError> MinLengthRule::validate(std::string_view password) const {
    if (minLength_ <= 0) {
        return std::nullopt;
    }

    const auto length = unicode::decodeUtf8(password).size();
    if (length >= static_cast<size_t>(minLength_)) {
        return std::nullopt;
    }
    return PasswordError::tooShort();
}

std::optional<PasswordError> UppercaseRule::validate(std::string_view password) const {
    const auto codePoints = unicode::decodeUtf8(password);
    if (std::any_of(codePoints.begin(), codePoints.end(), unicode::isUppercase)) {
        return std::nullopt;
    }
    return PasswordError::missingUppercase();
}

std::optional<PasswordError> DigitRule::validate(std::string_view password) const {
    const auto codePoints = unicode::decodeUtf8(password);
    if (std::any_of(codePoints.begin(), codePoints.end(), unicode::isDecimalDigit)) {
        return std::nullopt;
    }
    return PasswordError::missingDigit();
}

SpecialCharacterRule::SpecialCharacterRule(std::string specialChars)
    : specialChars_(std::move(specialChars)),
      codePoints_(unicode::decodeUtf8(specialChars_)) {
}

std::optional<PasswordError> SpecialCharacterRule::validate(std::string_view password) const {
    const auto codePoints = unicode::decodeUtf8(password);
    const bool found = std::any_of(codePoints.begin(), codePoints.end(),
                                   [this](char32_t c) {
                                       return codePoints_.find(c) != std::u32string::npos;
                                   });
    if (found) {
        return std::nullopt;
    }
    return PasswordError::missingSpecialChar();
}

} // namespace pwguard::validation
