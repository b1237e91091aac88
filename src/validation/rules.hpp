#pragma once

#include "validation/validation_export.hpp"
#include "passwordrule.hpp"
#include <string>

namespace pwguard::validation {

/**
 * @brief Requires a minimum number of code points
 */
class PWGUARD_VALIDATION_EXPORT MinLengthRule : public PasswordRule {
public:
    static constexpr int DEFAULT_MIN_LENGTH = 8;

    /**
     * @brief Constructor
     * @param minLength Minimum length in code points, values <= 0 accept everything
     */
    explicit MinLengthRule(int minLength = DEFAULT_MIN_LENGTH);

    std::optional<PasswordError> validate(std::string_view password) const override;

    int minLength() const { return minLength_; }

private:
    int minLength_;
};

/**
 * @brief Requires at least one uppercase letter (Unicode aware)
 */
class PWGUARD_VALIDATION_EXPORT UppercaseRule : public PasswordRule {
public:
    std::optional<PasswordError> validate(std::string_view password) const override;
};

/**
 * @brief Requires at least one decimal digit (Unicode aware)
 */
class PWGUARD_VALIDATION_EXPORT DigitRule : public PasswordRule {
public:
    std::optional<PasswordError> validate(std::string_view password) const override;
};

/**
 * @brief Requires at least one character from a configurable set
 *
 * Membership is an exact code point match without case folding.
 */
class PWGUARD_VALIDATION_EXPORT SpecialCharacterRule : public PasswordRule {
public:
    static const char* const DEFAULT_SPECIAL_CHARACTERS;

    /**
     * @brief Constructor
     * @param specialChars UTF-8 set of accepted characters
     */
    explicit SpecialCharacterRule(std::string specialChars = DEFAULT_SPECIAL_CHARACTERS);

    std::optional<PasswordError> validate(std::string_view password) const override;

    /**
     * @brief Configured character set as UTF-8
     */
    const std::string& specialCharacters() const { return specialChars_; }

private:
    std::string specialChars_;
    std::u32string codePoints_;
};

} // namespace pwguard::validation
