/**
 * @file GraphValidator.hpp
 * @brief Whole-graph structural, semantic and body-text validation.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/DecisionGraph.hpp"
#include "domain/LintConfig.hpp"
#include "domain/ValidationReport.hpp"

namespace dnagraph::application {

/**
 * @class GraphValidator
 * @brief Runs the full battery of checks over a loaded graph.
 *
 * Every check always runs; nothing short-circuits, so one run surfaces the
 * complete defect list. Findings are emitted in ID order.
 */
class GraphValidator {
public:
    GraphValidator() = default;
    explicit GraphValidator(domain::LintConfig config) : m_config(std::move(config)) {}

    /**
     * @brief Validate a graph.
     * @param graph Loaded decision graph.
     * @return Errors (blocking) and warnings (advisory).
     */
    domain::ValidationReport Validate(const domain::DecisionGraph& graph) const;

    /** @brief The four headings every body must carry. */
    static const std::vector<std::string>& RequiredSections();

    /**
     * @brief Cycle detection over forward edges (self edges excluded).
     * @return One "Cycle detected: ..." message per DFS root that closes a cycle.
     */
    static std::vector<std::string> FindCycles(const domain::DecisionGraph& graph);

private:
    void CheckFields(const domain::DecisionGraph& graph, domain::ValidationReport& report) const;
    void CheckOrphans(const domain::DecisionGraph& graph, const domain::DecisionGraph::Adjacency& reverse,
                      domain::ValidationReport& report) const;
    void CheckLevelOrdering(const domain::DecisionGraph& graph, domain::ValidationReport& report) const;
    void CheckIronRule(const domain::DecisionGraph& graph, domain::ValidationReport& report) const;
    void CheckStateHealth(const domain::DecisionGraph& graph, domain::ValidationReport& report) const;
    void LintBodies(const domain::DecisionGraph& graph, domain::ValidationReport& report) const;
    void CheckMissingDeps(const domain::DecisionGraph& graph, const domain::DecisionGraph::Adjacency& reverse,
                          domain::ValidationReport& report) const;

    domain::LintConfig m_config;
};

/**
 * @brief Level-inversion warning text shared by the validators.
 */
std::string LevelInversionMessage(const std::string& id, int level, const std::string& depId, int depLevel);

/**
 * @brief Iron-rule error text shared by the validators.
 */
std::string IronRuleMessage(const std::string& id, const std::string& depId);

} // namespace dnagraph::application
