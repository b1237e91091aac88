#pragma once

#include "validation/validation_export.hpp"
#include <string>

namespace pwguard::validation {

/**
 * @brief A single password validation failure
 *
 * Built-in kinds carry no payload. Custom errors carry the message
 * produced by a caller-supplied rule.
 */
class PWGUARD_VALIDATION_EXPORT PasswordError {
public:
    enum class Kind {
        TooShort,
        MissingUppercase,
        MissingDigit,
        MissingSpecialChar,
        Custom
    };

    static PasswordError tooShort();
    static PasswordError missingUppercase();
    static PasswordError missingDigit();
    static PasswordError missingSpecialChar();

    /**
     * @brief Create a custom error
     * @param message Text reported verbatim as the description
     */
    static PasswordError custom(std::string message);

    Kind kind() const { return kind_; }

    /**
     * @brief Message carried by a custom error, empty for built-in kinds
     */
    const std::string& message() const { return message_; }

    /**
     * @brief Human-readable description of the failure
     */
    std::string description() const;

    bool operator==(const PasswordError& other) const;
    bool operator!=(const PasswordError& other) const { return !(*this == other); }

private:
    PasswordError(Kind kind, std::string message);

    Kind kind_;
    std::string message_;
};

/**
 * @brief Stable identifier for an error kind, e.g. "missing_digit"
 */
PWGUARD_VALIDATION_EXPORT const char* toString(PasswordError::Kind kind);

} // namespace pwguard::validation
