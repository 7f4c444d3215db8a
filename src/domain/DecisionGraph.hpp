/**
 * @file DecisionGraph.hpp
 * @brief Identity-keyed graph of decisions built from the two partitions.
 */

#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

#include "domain/Decision.hpp"

namespace dnagraph::domain {

/**
 * @class DecisionGraph
 * @brief Immutable-after-load mapping ID -> Decision, iterated in ID order.
 *
 * Edges are never stored: forward edges are a node's normalized dependency
 * list, reverse edges (dependents) are derived on demand.
 */
class DecisionGraph {
public:
    using NodeMap = std::map<std::string, Decision>;
    using Adjacency = std::map<std::string, std::vector<std::string>>;

    DecisionGraph() = default;

    /**
     * @brief Builds the graph from both partitions.
     *
     * Constitution records are loaded first, then project records; each
     * partition in ID order. Records without an id are skipped.
     * @throws IdCollisionError when an ID is loaded twice.
     */
    static DecisionGraph Load(const std::vector<DecisionRecord>& constitution,
                              const std::vector<DecisionRecord>& project);

    /**
     * @brief Adds a node. @throws IdCollisionError if the ID is already present.
     */
    void add(Decision decision);

    const NodeMap& nodes() const { return m_nodes; }
    size_t size() const { return m_nodes.size(); }
    bool empty() const { return m_nodes.empty(); }

    bool contains(const std::string& id) const { return m_nodes.count(id) > 0; }

    /** @brief Returns nullptr when the ID is unknown. */
    const Decision* find(const std::string& id) const;

    /** @brief Node by ID. @throws NodeNotFoundError */
    const Decision& at(const std::string& id) const;

    /** @brief IDs (ascending) of nodes whose dependency list contains id. Linear scan. */
    std::vector<std::string> getDependents(const std::string& id) const;

    /** @brief Flat dependency IDs of a node. */
    static const std::vector<std::string>& GetDepsList(const Decision& node) { return node.deps; }

    /** @brief Forward edges restricted to existing targets. */
    Adjacency forwardAdjacency() const;

    /** @brief Reverse edges (dependency -> sorted dependents), existing nodes only. */
    Adjacency reverseAdjacency() const;

    std::set<std::string> ids() const;

private:
    NodeMap m_nodes;
};

} // namespace dnagraph::domain
