/**
 * @file MutationValidator.hpp
 * @brief Pre-validation of node creation and single-field updates.
 */

#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "domain/Decision.hpp"
#include "domain/DecisionGraph.hpp"
#include "domain/ValidationReport.hpp"

namespace dnagraph::application {

/**
 * @struct NewDecision
 * @brief User-supplied attributes of a decision about to be created.
 */
struct NewDecision {
    std::string title;
    int level = 0;
    std::string state = "suggested";
    std::string stakes; ///< Empty when not given.
    std::vector<std::string> dependsOn;
};

/**
 * @struct CreateOutcome
 * @brief Result of a create pre-validation. decision is set only when report.ok().
 */
struct CreateOutcome {
    domain::ValidationReport report;
    std::optional<domain::Decision> decision;
};

/** @brief Proposed value of a single-field update. */
using FieldValue = std::variant<std::string, int, std::vector<std::string>>;

/** @brief Body given to every newly created decision. */
extern const char* const kScaffoldBody;

/**
 * @class MutationValidator
 * @brief Checks a proposed mutation against the current graph without touching it.
 *
 * A mutation may proceed only when the returned report has no errors.
 */
class MutationValidator {
public:
    /**
     * @brief Pre-validates the creation of a new node.
     * @param id Proposed ID (must match DEC-NNN).
     * @param input Attributes of the new node.
     * @param graph Current graph.
     * @param targetScope Partition the node will be written to.
     */
    static CreateOutcome ValidateForCreate(const std::string& id, const NewDecision& input,
                                           const domain::DecisionGraph& graph, domain::Scope targetScope);

    /**
     * @brief Pre-validates an update of one field of an existing node.
     * @param field One of state, depends_on, level, stakes, title.
     */
    static domain::ValidationReport ValidateForSet(const std::string& id, const std::string& field,
                                                   const FieldValue& value, const domain::DecisionGraph& graph);

    /** @brief Whether the text has the DEC-NNN shape. */
    static bool IsWellFormedId(const std::string& id);

private:
    static void CheckDependencies(const std::string& id, std::optional<int> level,
                                  const std::vector<std::string>& deps, const domain::DecisionGraph& graph,
                                  domain::Scope scope, domain::ValidationReport& report);

    /**
     * @brief Dependencies of proposed from which the node itself is reachable once its edges are replaced.
     */
    static std::vector<std::string> FindCyclicDependencies(const std::string& id,
                                                           const std::vector<std::string>& proposed,
                                                           const domain::DecisionGraph& graph);
};

} // namespace dnagraph::application
