/**
 * @file errors.hpp
 * @brief Exception types raised by the valuation engine
 *
 * ValidationError signals malformed inputs detected before any calculation
 * begins. DomainError signals a numerically meaningless request detected at
 * calculation time, most commonly a discount rate that does not exceed the
 * terminal growth rate.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace valuation {

/**
 * @class ValidationError
 * @brief Malformed FinancialInputBundle, ScenarioAssumptions or configuration
 */
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& message)
        : std::invalid_argument(message) {}
};

/**
 * @class DomainError
 * @brief Inputs that are well formed but outside the model's valid domain
 */
class DomainError : public std::domain_error {
public:
    explicit DomainError(const std::string& message)
        : std::domain_error(message) {}
};

} // namespace valuation
