/**
 * @file DecisionService.hpp
 * @brief Service orchestrating load, validation, mutation and derived documents.
 */

#pragma once

#include "application/CascadeService.hpp"
#include "application/FrontierService.hpp"
#include "application/MutationValidator.hpp"
#include "domain/DecisionGraph.hpp"
#include "domain/DecisionRepository.hpp"
#include "domain/LintConfig.hpp"
#include "domain/ValidationReport.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace dnagraph::application {

/**
 * @struct SetOutcome
 * @brief Result of a single-field update. Values are display text.
 */
struct SetOutcome {
    domain::ValidationReport report;
    std::string oldValue;
    std::string newValue;
};

/**
 * @struct EditOutcome
 * @brief Result of a body edit and the validation delta it caused.
 *
 * report holds precondition failures (nothing written). When written is
 * true the edit is on disk even if newErrors is non-empty.
 */
struct EditOutcome {
    domain::ValidationReport report;
    bool written = false;
    size_t charsRemoved = 0;
    size_t charsAdded = 0;
    std::vector<std::string> resolvedWarnings;
    std::vector<std::string> newWarnings;
    std::vector<std::string> newErrors;

    bool ok() const { return report.ok() && newErrors.empty(); }
};

struct SearchHit {
    std::string id;
    std::string title;
    std::optional<int> level;
    std::string state;
    domain::Scope scope = domain::Scope::Project;
    std::vector<std::string> matchedSections;
};

struct IndexResult {
    bool ok = true;
    bool constitutionWritten = false;
    size_t constitutionCount = 0;
    size_t projectCount = 0;
};

struct HealthResult {
    bool ok = true;
    size_t totalDecisions = 0;
    size_t flaggedItems = 0;
    std::string content;
};

enum class ManifestTarget {
    Human,
    Agent
};

/**
 * @class DecisionService
 * @brief One call = one fresh load of the graph plus one operation on it.
 *
 * Every operation may throw domain::IdCollisionError from the load.
 */
class DecisionService {
public:
    DecisionService(std::unique_ptr<domain::DecisionRepository> repo, domain::LintConfig config);

    /** @brief Loads both partitions into a fresh graph. */
    domain::DecisionGraph LoadGraph();

    domain::ValidationReport Validate();
    domain::ValidationReport Validate(const domain::DecisionGraph& graph) const;

    /** @throws domain::NodeNotFoundError */
    CascadeResult Cascade(const std::string& id, bool reverse);

    FrontierReport Frontier(int topN = FrontierService::kDefaultTopN);

    /**
     * @brief Pre-validates and, when error-free, writes a new decision.
     */
    CreateOutcome Create(const std::string& id, const NewDecision& input, domain::Scope scope);

    /**
     * @brief Pre-validates and, when error-free, rewrites one frontmatter field.
     */
    SetOutcome Set(const std::string& id, const std::string& field, const FieldValue& value);

    /**
     * @brief Replaces a unique occurrence of oldText in a body and reports the validation delta.
     *
     * The write happens before the post-edit validation; new errors are
     * reported but do not roll the edit back.
     */
    EditOutcome Edit(const std::string& id, const std::string& oldText, const std::string& newText);

    /** @brief Case-insensitive OR search over titles and bodies, by ID. */
    std::vector<SearchHit> Search(const std::vector<std::string>& terms);

    /** @brief Regenerates INDEX.md of each partition. */
    IndexResult RebuildIndex();

    /** @brief Regenerates HEALTH.md at the project root, keeping its Manual Flags section. */
    HealthResult RebuildHealth();

    /** @brief Deterministic skeleton for contract compilation. */
    nlohmann::json CompileManifest(ManifestTarget target);

    static const std::vector<std::string>& SearchSections();

    /** @brief Markdown table of one partition's decisions. */
    static std::string RenderIndex(const domain::DecisionGraph& graph, domain::Scope scope, const std::string& title);

    /** @brief Text under "## Manual Flags" up to the next "## " heading, trimmed. */
    static std::string ExtractManualFlags(const std::string& healthContent);

private:
    std::unique_ptr<domain::DecisionRepository> m_repo;
    domain::LintConfig m_config;
};

} // namespace dnagraph::application
