#pragma once

#include "validation/validation_export.hpp"
#include "passwordrule.hpp"
#include "validationresult.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pwguard::validation {

/**
 * @brief Password validation service
 *
 * Runs an ordered, fixed list of rules against a password and reports
 * every failure, not just the first one. Instances are immutable and
 * may be shared between threads.
 */
class PWGUARD_VALIDATION_EXPORT PasswordValidator {
public:
    using RulePtr = std::shared_ptr<const PasswordRule>;

    /**
     * @brief Fluent rule accumulator
     *
     * Each configuration call appends one rule and returns the builder.
     * Not meant for concurrent use.
     */
    class PWGUARD_VALIDATION_EXPORT Builder {
    public:
        Builder& minLength(int length);
        Builder& requireUppercase();
        Builder& requireDigit();

        /**
         * @brief Require a special character
         * @param specialChars Accepted set, default set if not provided
         */
        Builder& requireSpecialCharacter(std::optional<std::string> specialChars = std::nullopt);

        /**
         * @brief Append a caller-supplied rule
         * @throws std::invalid_argument if rule is null
         */
        Builder& addRule(RulePtr rule);

        /**
         * @brief Create a validator from the rules added so far
         *
         * The validator keeps its own copy of the rule list, so later
         * builder calls do not affect it.
         */
        PasswordValidator build() const;

        size_t ruleCount() const { return rules_.size(); }

    private:
        std::vector<RulePtr> rules_;
    };

    static Builder builder();

    /**
     * @brief Validator with minimum length 8, uppercase, digit and
     *        default special character requirements
     */
    static PasswordValidator defaultRules();

    /**
     * @brief Validate a password against all rules
     * @param password UTF-8 encoded password
     * @return ValidationResult with every error, in rule order
     */
    ValidationResult validate(std::string_view password) const;

    size_t ruleCount() const { return rules_.size(); }

private:
    explicit PasswordValidator(std::vector<RulePtr> rules);

    std::vector<RulePtr> rules_;
};

} // namespace pwguard::validation
