#pragma once

#include "validation/validation_export.hpp"
#include "passworderror.hpp"
#include <optional>
#include <string_view>

namespace pwguard::validation {

/**
 * @brief A single password requirement
 *
 * Implementations are configured at construction and must not change
 * state in validate(), so one instance can serve any number of
 * validators and threads.
 */
class PWGUARD_VALIDATION_EXPORT PasswordRule {
public:
    virtual ~PasswordRule() = default;

    /**
     * @brief Check a password against this rule
     * @param password UTF-8 encoded password
     * @return Error if the password breaks the rule, nullopt otherwise
     */
    virtual std::optional<PasswordError> validate(std::string_view password) const = 0;
};

} // namespace pwguard::validation
