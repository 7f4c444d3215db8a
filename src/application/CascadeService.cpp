/**
 * @file CascadeService.cpp
 * @brief Implementation of CascadeService.
 */

#include "application/CascadeService.hpp"

#include <algorithm>
#include <set>

namespace dnagraph::application {

using domain::Decision;
using domain::DecisionGraph;

namespace {

std::string StateOrUnknown(const Decision& node) {
    return node.stateText.empty() ? std::string("unknown") : node.stateText;
}

std::vector<std::string> Neighbors(const DecisionGraph& graph, const DecisionGraph::Adjacency& reverse,
                                   const Decision& node, Direction direction) {
    if (direction == Direction::Downstream) {
        auto it = reverse.find(node.id);
        return it == reverse.end() ? std::vector<std::string>{} : it->second;
    }
    std::vector<std::string> deps;
    for (const auto& dep : DecisionGraph::GetDepsList(node)) {
        if (graph.contains(dep)) deps.push_back(dep);
    }
    std::sort(deps.begin(), deps.end());
    deps.erase(std::unique(deps.begin(), deps.end()), deps.end());
    return deps;
}

} // namespace

CascadeResult CascadeService::Compute(const DecisionGraph& graph, const std::string& startId,
                                      Direction direction) {
    const Decision& start = graph.at(startId);

    CascadeResult result;
    result.startId = start.id;
    result.direction = direction;

    const auto reverse = graph.reverseAdjacency();
    std::set<std::string> visited{start.id};
    std::vector<std::string> frontier{start.id};
    int waveNumber = 0;

    while (!frontier.empty()) {
        ++waveNumber;
        CascadeWave wave;
        wave.number = waveNumber;
        std::vector<std::string> next;

        for (const auto& parentId : frontier) {
            const Decision& parent = graph.at(parentId);
            for (const auto& childId : Neighbors(graph, reverse, parent, direction)) {
                if (!visited.insert(childId).second) continue;
                const Decision& child = graph.at(childId);

                CascadeEffect effect;
                effect.node = childId;
                effect.currentState = StateOrUnknown(child);
                effect.reason = direction == Direction::Downstream ? "depends on " + parentId
                                                                   : parentId + " depends on this";
                effect.crossScope = parent.scope != child.scope;
                wave.effects.push_back(std::move(effect));
                next.push_back(childId);
            }
        }

        if (wave.effects.empty()) break;
        result.waves.push_back(std::move(wave));
        std::sort(next.begin(), next.end());
        frontier = std::move(next);
    }

    result.totalAffected = 0;
    for (const auto& wave : result.waves) result.totalAffected += wave.effects.size();
    result.uniqueAffected = visited.size() - 1;
    return result;
}

} // namespace dnagraph::application
