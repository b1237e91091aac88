#include "validatorconfig.hpp"
#include <cstdint>
#include <fstream>
#include <iostream>
#include <limits>
#include <utility>

namespace pwguard::config {

namespace {
constexpr const char* KEY_RULES = "rules";
constexpr const char* KEY_TYPE = "type";
constexpr const char* KEY_LENGTH = "length";
constexpr const char* KEY_CHARACTERS = "characters";

std::optional<RuleType> parseRuleType(const std::string& name) {
    if (name == "min_length") return RuleType::MinLength;
    if (name == "uppercase") return RuleType::Uppercase;
    if (name == "digit") return RuleType::Digit;
    if (name == "special_character") return RuleType::SpecialCharacter;
    return std::nullopt;
}

std::string entryName(size_t index) {
    return "rules[" + std::to_string(index) + "]";
}

int parseLength(const nlohmann::json& value, size_t index) {
    // get<std::int64_t>() would wrap unsigned values above INT64_MAX
    if (value.is_number_unsigned() &&
        value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
        throw ConfigError(entryName(index) + ".length is out of range");
    }

    const auto length = value.get<std::int64_t>();
    if (length < std::numeric_limits<int>::min() || length > std::numeric_limits<int>::max()) {
        throw ConfigError(entryName(index) + ".length is out of range");
    }
    return static_cast<int>(length);
}

RuleConfig parseRule(const nlohmann::json& entry, size_t index) {
    if (!entry.is_object()) {
        throw ConfigError(entryName(index) + " must be an object");
    }

    auto typeIt = entry.find(KEY_TYPE);
    if (typeIt == entry.end() || !typeIt->is_string()) {
        throw ConfigError(entryName(index) + " needs a string \"type\"");
    }

    const auto typeName = typeIt->get<std::string>();
    auto type = parseRuleType(typeName);
    if (!type) {
        throw ConfigError(entryName(index) + " has unknown rule type \"" + typeName + "\"");
    }

    RuleConfig rule;
    rule.type = *type;

    for (auto it = entry.begin(); it != entry.end(); ++it) {
        const auto& key = it.key();
        if (key == KEY_TYPE) {
            continue;
        }

        if (rule.type == RuleType::MinLength && key == KEY_LENGTH) {
            if (!it->is_number_integer()) {
                throw ConfigError(entryName(index) + ".length must be an integer");
            }
            rule.minLength = parseLength(*it, index);
        } else if (rule.type == RuleType::SpecialCharacter && key == KEY_CHARACTERS) {
            if (!it->is_string()) {
                throw ConfigError(entryName(index) + ".characters must be a string");
            }
            rule.specialCharacters = it->get<std::string>();
        } else {
            std::cerr << "Ignoring unknown option \"" << key << "\" in "
                      << entryName(index) << " (" << typeName << ")" << std::endl;
        }
    }

    return rule;
}

} // namespace

bool RuleConfig::operator==(const RuleConfig& other) const {
    return type == other.type &&
           minLength == other.minLength &&
           specialCharacters == other.specialCharacters;
}

ValidatorConfig::ValidatorConfig(std::vector<RuleConfig> rules)
    : rules_(std::move(rules)) {
}

ValidatorConfig ValidatorConfig::defaults() {
    RuleConfig length;
    length.type = RuleType::MinLength;

    RuleConfig uppercase;
    uppercase.type = RuleType::Uppercase;

    RuleConfig digit;
    digit.type = RuleType::Digit;

    RuleConfig special;
    special.type = RuleType::SpecialCharacter;

    return ValidatorConfig({length, uppercase, digit, special});
}

ValidatorConfig ValidatorConfig::fromJson(const nlohmann::json& document) {
    if (!document.is_object()) {
        throw ConfigError("Validator configuration must be a JSON object");
    }

    auto rulesIt = document.find(KEY_RULES);
    if (rulesIt == document.end() || !rulesIt->is_array()) {
        throw ConfigError("Validator configuration needs a \"rules\" array");
    }

    std::vector<RuleConfig> rules;
    rules.reserve(rulesIt->size());
    for (size_t i = 0; i < rulesIt->size(); ++i) {
        rules.push_back(parseRule((*rulesIt)[i], i));
    }
    return ValidatorConfig(std::move(rules));
}

ValidatorConfig ValidatorConfig::fromString(std::string_view text) {
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(text.begin(), text.end());
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(std::string("Invalid validator configuration: ") + e.what());
    }
    return fromJson(document);
}

ValidatorConfig ValidatorConfig::fromFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Failed to open validator configuration: " + path.string());
    }

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Invalid validator configuration " + path.string() + ": " + e.what());
    }
    return fromJson(document);
}

nlohmann::json ValidatorConfig::toJson() const {
    nlohmann::json rules = nlohmann::json::array();
    for (const auto& rule : rules_) {
        nlohmann::json entry;
        entry[KEY_TYPE] = toString(rule.type);
        if (rule.type == RuleType::MinLength) {
            entry[KEY_LENGTH] = rule.minLength;
        } else if (rule.type == RuleType::SpecialCharacter && rule.specialCharacters) {
            entry[KEY_CHARACTERS] = *rule.specialCharacters;
        }
        rules.push_back(entry);
    }

    nlohmann::json document;
    document[KEY_RULES] = rules;
    return document;
}

validation::PasswordValidator::Builder ValidatorConfig::toBuilder() const {
    auto builder = validation::PasswordValidator::builder();
    for (const auto& rule : rules_) {
        switch (rule.type) {
            case RuleType::MinLength:
                builder.minLength(rule.minLength);
                break;
            case RuleType::Uppercase:
                builder.requireUppercase();
                break;
            case RuleType::Digit:
                builder.requireDigit();
                break;
            case RuleType::SpecialCharacter:
                builder.requireSpecialCharacter(rule.specialCharacters);
                break;
        }
    }
    return builder;
}

const char* toString(RuleType type) {
    switch (type) {
        case RuleType::MinLength:        return "min_length";
        case RuleType::Uppercase:        return "uppercase";
        case RuleType::Digit:            return "digit";
        case RuleType::SpecialCharacter: return "special_character";
    }
    return "unknown";
}

} // namespace pwguard::config
