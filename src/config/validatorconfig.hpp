#pragma once

#include "config/config_export.hpp"
#include "validation/passwordvalidator.hpp"
#include "validation/rules.hpp"
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace pwguard::config {

/**
 * @brief Raised when a validator configuration cannot be read or parsed
 */
class PWGUARD_CONFIG_EXPORT ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class RuleType {
    MinLength,
    Uppercase,
    Digit,
    SpecialCharacter
};

/**
 * @brief One built-in rule entry
 */
struct PWGUARD_CONFIG_EXPORT RuleConfig {
    RuleType type = RuleType::MinLength;
    int minLength = validation::MinLengthRule::DEFAULT_MIN_LENGTH;  // MinLength only
    std::optional<std::string> specialCharacters;                   // SpecialCharacter only

    bool operator==(const RuleConfig& other) const;
    bool operator!=(const RuleConfig& other) const { return !(*this == other); }
};

/**
 * @brief Serializable description of a validator's built-in rules
 *
 * JSON shape:
 * @code
 * { "rules": [ { "type": "min_length", "length": 12 },
 *              { "type": "special_character", "characters": "!@#" } ] }
 * @endcode
 */
class PWGUARD_CONFIG_EXPORT ValidatorConfig {
public:
    ValidatorConfig() = default;
    explicit ValidatorConfig(std::vector<RuleConfig> rules);

    /**
     * @brief Configuration equivalent to PasswordValidator::defaultRules()
     */
    static ValidatorConfig defaults();

    /**
     * @brief Parse a configuration document
     * @throws ConfigError on a malformed document
     */
    static ValidatorConfig fromJson(const nlohmann::json& document);

    /**
     * @brief Parse configuration text
     * @throws ConfigError on invalid JSON or a malformed document
     */
    static ValidatorConfig fromString(std::string_view text);

    /**
     * @brief Load configuration from a JSON file
     * @throws ConfigError if the file cannot be read or parsed
     */
    static ValidatorConfig fromFile(const std::filesystem::path& path);

    nlohmann::json toJson() const;

    /**
     * @brief Builder holding the configured rules in order
     *
     * Custom rules can still be appended before build().
     */
    validation::PasswordValidator::Builder toBuilder() const;

    const std::vector<RuleConfig>& rules() const { return rules_; }

    bool operator==(const ValidatorConfig& other) const { return rules_ == other.rules_; }
    bool operator!=(const ValidatorConfig& other) const { return !(*this == other); }

private:
    std::vector<RuleConfig> rules_;
};

PWGUARD_CONFIG_EXPORT const char* toString(RuleType type);

} // namespace pwguard::config
