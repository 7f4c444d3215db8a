/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the project lint configuration (.dna/config.json).
 *
 * Keeps JSON parsing of settings in one place; the validator only ever sees
 * the resulting LintConfig.
 */

#pragma once

#include <string>

#include "domain/LintConfig.hpp"

namespace dnagraph::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads .dna/config.json under the project root.
     * @param projectRoot Path to the project root.
     * @return The configuration; defaults when the file is missing or unreadable.
     *
     * Invalid regular expressions are logged and skipped individually, the
     * rest of the file still applies.
     */
    static domain::LintConfig LoadLintConfig(const std::string& projectRoot);

    /** @brief Same as LoadLintConfig, from already read JSON text. */
    static domain::LintConfig ParseLintConfig(const std::string& jsonText);
};

} // namespace dnagraph::infrastructure
