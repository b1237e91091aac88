#pragma once

#include "validation/validation_export.hpp"
#include "passworderror.hpp"
#include <string>
#include <vector>

namespace pwguard::validation {

/**
 * @brief Password validation result
 *
 * Holds every error reported by a validator, in rule order.
 * A result is valid exactly when it carries no errors.
 */
class PWGUARD_VALIDATION_EXPORT ValidationResult {
public:
    static ValidationResult success();

    /**
     * @brief Create a failed result
     * @param errors Errors in rule order, must not be empty
     * @throws std::invalid_argument if errors is empty
     */
    static ValidationResult failure(std::vector<PasswordError> errors);

    bool isValid() const { return errors_.empty(); }
    const std::vector<PasswordError>& errors() const { return errors_; }

    /**
     * @brief Descriptions of all errors, in rule order
     */
    std::vector<std::string> descriptions() const;

    bool operator==(const ValidationResult& other) const { return errors_ == other.errors_; }
    bool operator!=(const ValidationResult& other) const { return !(*this == other); }

private:
    explicit ValidationResult(std::vector<PasswordError> errors);

    std::vector<PasswordError> errors_;
};

} // namespace pwguard::validation
