/**
 * @file LintConfig.hpp
 * @brief Configuration of the body-text lint layer.
 */

#pragma once

#include <regex>
#include <set>
#include <string>
#include <vector>

namespace dnagraph::domain {

/**
 * @struct DeletedArtifact
 * @brief A pattern whose presence in a body means it mentions something that no longer exists.
 */
struct DeletedArtifact {
    std::regex pattern;
    std::string label;
};

/**
 * @struct LintConfig
 * @brief Explicitly constructed lint settings passed into the validator.
 */
struct LintConfig {
    std::string flaggedTerm;                 ///< Empty disables the terminology scan.
    std::vector<std::regex> termExemptions;  ///< A line matching any of these is exempt.
    std::set<std::string> termExemptIds;     ///< Decisions skipped by the terminology scan.
    std::vector<DeletedArtifact> deletedArtifacts;
    std::vector<std::string> stalePrefixes{"INF", "CTX"}; ///< Retired ID families.
};

} // namespace dnagraph::domain
