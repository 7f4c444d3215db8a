/**
 * @file ValidationReport.hpp
 * @brief Errors and warnings collected by a validation run.
 */

#pragma once

#include <string>
#include <vector>

namespace dnagraph::domain {

/**
 * @struct ValidationReport
 * @brief Errors block a mutation, warnings are advisory.
 */
struct ValidationReport {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    bool ok() const { return errors.empty(); }

    void addError(std::string message) { errors.push_back(std::move(message)); }
    void addWarning(std::string message) { warnings.push_back(std::move(message)); }

    void merge(const ValidationReport& other) {
        errors.insert(errors.end(), other.errors.begin(), other.errors.end());
        warnings.insert(warnings.end(), other.warnings.begin(), other.warnings.end());
    }
};

} // namespace dnagraph::domain
