#include "passworderror.hpp"
#include <utility>

namespace pwguard::validation {

namespace {
// The length message is fixed and does not follow the configured minimum
constexpr const char* TOO_SHORT_DESCRIPTION = "Password must be at least 8 characters long";
constexpr const char* MISSING_UPPERCASE_DESCRIPTION = "Password must include an uppercase letter";
constexpr const char* MISSING_DIGIT_DESCRIPTION = "Password must include a number";
constexpr const char* MISSING_SPECIAL_DESCRIPTION = "Password must include a special character";
} // namespace

PasswordError::PasswordError(Kind kind, std::string message)
    : kind_(kind), message_(std::move(message)) {
}

PasswordError PasswordError::tooShort() {
    return PasswordError(Kind::TooShort, std::string());
}

PasswordError PasswordError::missingUppercase() {
    return PasswordError(Kind::MissingUppercase, std::string());
}

PasswordError PasswordError::missingDigit() {
    return PasswordError(Kind::MissingDigit, std::string());
}

PasswordError PasswordError::missingSpecialChar() {
    return PasswordError(Kind::MissingSpecialChar, std::string());
}

PasswordError PasswordError::custom(std::string message) {
    return PasswordError(Kind::Custom, std::move(message));
}

std::string PasswordError::description() const {
    switch (kind_) {
        case Kind::TooShort:
            return TOO_SHORT_DESCRIPTION;
        case Kind::MissingUppercase:
            return MISSING_UPPERCASE_DESCRIPTION;
        case Kind::MissingDigit:
            return MISSING_DIGIT_DESCRIPTION;
        case Kind::MissingSpecialChar:
            return MISSING_SPECIAL_DESCRIPTION;
        case Kind::Custom:
            return message_;
    }
    return message_;
}

bool PasswordError::operator==(const PasswordError& other) const {
    return kind_ == other.kind_ && message_ == other.message_;
}

const char* toString(PasswordError::Kind kind) {
    switch (kind) {
        case PasswordError::Kind::TooShort:           return "too_short";
        case PasswordError::Kind::MissingUppercase:   return "missing_uppercase";
        case PasswordError::Kind::MissingDigit:       return "missing_digit";
        case PasswordError::Kind::MissingSpecialChar: return "missing_special_char";
        case PasswordError::Kind::Custom:             return "custom";
    }
    return "unknown";
}

} // namespace pwguard::validation
