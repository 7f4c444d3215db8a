/**
 * @file CascadeService.hpp
 * @brief Wave-ordered propagation of a change through the decision graph.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/DecisionGraph.hpp"

namespace dnagraph::application {

enum class Direction {
    Downstream, ///< Follow dependents.
    Upstream    ///< Follow dependencies.
};

/**
 * @struct CascadeEffect
 * @brief One affected node, the neighbor that led to it and whether the edge crosses partitions.
 */
struct CascadeEffect {
    std::string node;
    std::string currentState;
    std::string reason;
    bool crossScope = false;
};

struct CascadeWave {
    int number = 0;
    std::vector<CascadeEffect> effects;
};

struct CascadeResult {
    std::string startId;
    Direction direction = Direction::Downstream;
    std::vector<CascadeWave> waves;
    size_t totalAffected = 0;  ///< Node/wave occurrences.
    size_t uniqueAffected = 0; ///< Distinct nodes.

    size_t waveCount() const { return waves.size(); }
    bool empty() const { return waves.empty(); }
};

/**
 * @class CascadeService
 * @brief Breadth-first expansion in discrete waves from a start node.
 *
 * Wave 1 holds the direct neighbors of the start node; wave k+1 every
 * unvisited neighbor of wave k. A node appears once, in the earliest wave it
 * is reachable in. Parents and their neighbors are expanded in ID order, so
 * the result is deterministic for an unchanged graph.
 */
class CascadeService {
public:
    /**
     * @brief Computes the cascade.
     * @throws domain::NodeNotFoundError when startId is not in the graph.
     */
    static CascadeResult Compute(const domain::DecisionGraph& graph, const std::string& startId,
                                 Direction direction);
};

} // namespace dnagraph::application
