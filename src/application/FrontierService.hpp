/**
 * @file FrontierService.hpp
 * @brief Frontier analysis: what can be decided next, what blocks it, what weighs most.
 */

#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "domain/DecisionGraph.hpp"

namespace dnagraph::application {

/**
 * @struct FrontierEntry
 * @brief A suggested decision, either committable or blocked.
 */
struct FrontierEntry {
    std::string id;
    std::string title;
    std::optional<int> level;
    std::string stakes;
    domain::Scope scope = domain::Scope::Project;
    size_t downstreamWeight = 0;
    std::vector<std::string> downstreamIds;
    std::vector<std::string> blockers;     ///< Non-committed dependencies (blocked only).
    std::vector<std::string> criticalPath; ///< Deepest unresolved ancestor first (blocked only).
};

struct LevelGap {
    int level = 0;
    std::string name;
    int committed = 0;
    int suggested = 0;
    int superseded = 0;
    int total = 0;
    std::vector<std::string> flags;
};

/**
 * @struct WeightEntry
 * @brief A node ranked by how many decisions transitively depend on it.
 */
struct WeightEntry {
    std::string id;
    std::string title;
    std::optional<int> level;
    std::string state;
    std::string stakes;
    domain::Scope scope = domain::Scope::Project;
    size_t downstreamWeight = 0;
    std::vector<std::string> directDependents;
};

struct FrontierSummary {
    size_t totalDecisions = 0;
    size_t suggested = 0;
    size_t committableCount = 0;
    size_t blockedCount = 0;
    size_t levelGapCount = 0;
};

struct FrontierReport {
    std::vector<FrontierEntry> committable;
    std::vector<FrontierEntry> blocked;
    std::vector<LevelGap> levelGaps;
    std::vector<WeightEntry> highWeight;
    FrontierSummary summary;
    int topN = 10;
};

/**
 * @class FrontierService
 * @brief Partitions suggested decisions and ranks the graph by downstream weight.
 */
class FrontierService {
public:
    static constexpr int kDefaultTopN = 10;

    static FrontierReport Analyze(const domain::DecisionGraph& graph, int topN = kDefaultTopN);

    /**
     * @brief For every node, the set of nodes that transitively depend on it.
     *
     * Dependents are resolved before the nodes they depend on so each set is
     * built once from its dependents' sets. Nodes on or above a cycle are
     * resolved by a breadth-first walk that stops at already resolved nodes.
     */
    static std::map<std::string, std::set<std::string>> TransitiveDownstream(const domain::DecisionGraph& graph);

    /**
     * @brief Chain of uncommitted upstream decisions to resolve before target can be committed.
     * @return Deepest unresolved ancestor first, target excluded.
     */
    static std::vector<std::string> CriticalPath(const domain::DecisionGraph& graph, const std::string& target);
};

} // namespace dnagraph::application
