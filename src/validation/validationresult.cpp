#include "validationresult.hpp"
#include <stdexcept>
#include <utility>

namespace pwguard::validation {

ValidationResult::ValidationResult(std::vector<PasswordError> errors)
    : errors_(std::move(errors)) {
}

ValidationResult ValidationResult::success() {
    return ValidationResult(std::vector<PasswordError>());
}

ValidationResult ValidationResult::failure(std::vector<PasswordError> errors) {
    if (errors.empty()) {
        throw std::invalid_argument("A failed validation result needs at least one error");
    }
    return ValidationResult(std::move(errors));
}

std::vector<std::string> ValidationResult::descriptions() const {
    std::vector<std::string> result;
    result.reserve(errors_.size());
    for (const auto& error : errors_) {
        result.push_back(error.description());
    }
    return result;
}

} // namespace pwguard::validation
