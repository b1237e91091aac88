#include "passwordvalidator.hpp"
#include "rules.hpp"
#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace pwguard::validation {

PasswordValidator::Builder& PasswordValidator::Builder::minLength(int length) {
    rules_.push_back(std::make_shared<MinLengthRule>(length));
    return *this;
}

PasswordValidator::Builder& PasswordValidator::Builder::requireUppercase() {
    rules_.push_back(std::make_shared<UppercaseRule>());
    return *this;
}

PasswordValidator::Builder& PasswordValidator::Builder::requireDigit() {
    rules_.push_back(std::make_shared<DigitRule>());
    return *this;
}

PasswordValidator::Builder& PasswordValidator::Builder::requireSpecialCharacter(
    std::optional<std::string> specialChars) {
    if (specialChars) {
        rules_.push_back(std::make_shared<SpecialCharacterRule>(std::move(*specialChars)));
    } else {
        rules_.push_back(std::make_shared<SpecialCharacterRule>());
    }
    return *this;
}

PasswordValidator::Builder& PasswordValidator::Builder::addRule(RulePtr rule) {
    if (!rule) {
        throw std::invalid_argument("Cannot add a null password rule");
    }
    rules_.push_back(std::move(rule));
    return *this;
}

PasswordValidator PasswordValidator::Builder::build() const {
    return PasswordValidator(rules_);
}

PasswordValidator::PasswordValidator(std::vector<RulePtr> rules)
    : rules_(std::move(rules)) {
}

PasswordValidator::Builder PasswordValidator::builder() {
    return Builder();
}

PasswordValidator PasswordValidator::defaultRules() {
    return builder()
        .minLength(MinLengthRule::DEFAULT_MIN_LENGTH)
        .requireUppercase()
        .requireDigit()
        .requireSpecialCharacter()
        .build();
}

ValidationResult PasswordValidator::validate(std::string_view password) const {
    std::vector<PasswordError> errors;

    // Every rule runs, earlier failures do not stop evaluation
    for (size_t i = 0; i < rules_.size(); ++i) {
        try {
            if (auto error = rules_[i]->validate(password)) {
                errors.push_back(std::move(*error));
            }
        } catch (const std::exception& e) {
            std::cerr << "Password rule #" << i << " threw during validation: "
                      << e.what() << std::endl;
            throw;
        } catch (...) {
            std::cerr << "Password rule #" << i
                      << " threw a non-standard exception during validation" << std::endl;
            throw;
        }
    }

    if (errors.empty()) {
        return ValidationResult::success();
    }
    return ValidationResult::failure(std::move(errors));
}

} // namespace pwguard::validation
