/**
 * @file DecisionGraph.cpp
 * @brief Implementation of DecisionGraph loading and edge views.
 */

#include "domain/DecisionGraph.hpp"
#include "domain/GraphErrors.hpp"

#include <algorithm>
#include <iostream>

namespace dnagraph::domain {

namespace {

std::vector<Decision> ToSortedNodes(const std::vector<DecisionRecord>& records, Scope scope) {
    std::vector<Decision> nodes;
    nodes.reserve(records.size());
    for (const auto& record : records) {
        Decision d = Decision::FromRecord(record, scope);
        if (d.id.empty()) {
            std::cerr << "[DecisionGraph] Skipping record without id: " << record.source << std::endl;
            continue;
        }
        nodes.push_back(std::move(d));
    }
    std::stable_sort(nodes.begin(), nodes.end(),
                     [](const Decision& a, const Decision& b) { return a.id < b.id; });
    return nodes;
}

} // namespace

DecisionGraph DecisionGraph::Load(const std::vector<DecisionRecord>& constitution,
                                  const std::vector<DecisionRecord>& project) {
    DecisionGraph graph;
    for (auto& d : ToSortedNodes(constitution, Scope::Constitution)) {
        graph.add(std::move(d));
    }
    for (auto& d : ToSortedNodes(project, Scope::Project)) {
        graph.add(std::move(d));
    }
    return graph;
}

void DecisionGraph::add(Decision decision) {
    auto it = m_nodes.find(decision.id);
    if (it != m_nodes.end()) {
        throw IdCollisionError(decision.id, it->second.scope, decision.scope);
    }
    std::string id = decision.id;
    m_nodes.emplace(std::move(id), std::move(decision));
}

const Decision* DecisionGraph::find(const std::string& id) const {
    auto it = m_nodes.find(id);
    return it == m_nodes.end() ? nullptr : &it->second;
}

const Decision& DecisionGraph::at(const std::string& id) const {
    auto it = m_nodes.find(id);
    if (it == m_nodes.end()) throw NodeNotFoundError(id);
    return it->second;
}

std::vector<std::string> DecisionGraph::getDependents(const std::string& id) const {
    std::vector<std::string> dependents;
    for (const auto& [nid, node] : m_nodes) {
        const auto& deps = GetDepsList(node);
        if (std::find(deps.begin(), deps.end(), id) != deps.end()) {
            dependents.push_back(nid);
        }
    }
    return dependents;
}

DecisionGraph::Adjacency DecisionGraph::forwardAdjacency() const {
    Adjacency adj;
    for (const auto& [nid, node] : m_nodes) {
        auto& out = adj[nid];
        for (const auto& dep : GetDepsList(node)) {
            if (contains(dep)) out.push_back(dep);
        }
    }
    return adj;
}

DecisionGraph::Adjacency DecisionGraph::reverseAdjacency() const {
    Adjacency adj;
    for (const auto& [nid, node] : m_nodes) {
        adj[nid];
        for (const auto& dep : GetDepsList(node)) {
            if (!contains(dep)) continue;
            auto& in = adj[dep];
            // Nodes are visited in ID order, so each list stays sorted.
            if (in.empty() || in.back() != nid) in.push_back(nid);
        }
    }
    return adj;
}

std::set<std::string> DecisionGraph::ids() const {
    std::set<std::string> result;
    for (const auto& entry : m_nodes) result.insert(entry.first);
    return result;
}

} // namespace dnagraph::domain
