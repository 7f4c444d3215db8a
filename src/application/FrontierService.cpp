/**
 * @file FrontierService.cpp
 * @brief Implementation of FrontierService.
 */

#include "application/FrontierService.hpp"

#include <algorithm>
#include <deque>
#include <queue>

namespace dnagraph::application {

using domain::Decision;
using domain::DecisionGraph;

namespace {

constexpr int kMissingLevelRank = 99;

std::vector<std::string> UncommittedDeps(const DecisionGraph& graph, const Decision& node) {
    std::vector<std::string> result;
    for (const auto& dep : DecisionGraph::GetDepsList(node)) {
        const Decision* upstream = graph.find(dep);
        if (upstream && !upstream->isCommitted()) result.push_back(dep);
    }
    return result;
}

std::set<std::string> DistinctExistingDeps(const DecisionGraph& graph, const Decision& node) {
    std::set<std::string> deps;
    for (const auto& dep : DecisionGraph::GetDepsList(node)) {
        if (graph.contains(dep)) deps.insert(dep);
    }
    return deps;
}

} // namespace

std::map<std::string, std::set<std::string>> FrontierService::TransitiveDownstream(const DecisionGraph& graph) {
    const auto reverse = graph.reverseAdjacency();
    std::map<std::string, std::set<std::string>> resolved;

    std::map<std::string, size_t> pending;
    std::queue<std::string> ready;
    for (const auto& [nid, dependents] : reverse) {
        pending[nid] = dependents.size();
        if (dependents.empty()) ready.push(nid);
    }

    while (!ready.empty()) {
        std::string nid = ready.front();
        ready.pop();

        std::set<std::string> downstream;
        for (const auto& dependent : reverse.at(nid)) {
            downstream.insert(dependent);
            const auto& inherited = resolved.at(dependent);
            downstream.insert(inherited.begin(), inherited.end());
        }
        resolved[nid] = std::move(downstream);

        for (const auto& dep : DistinctExistingDeps(graph, graph.at(nid))) {
            if (--pending[dep] == 0) ready.push(dep);
        }
    }

    // Whatever is left sits on or above a cycle.
    for (const auto& entry : graph.nodes()) {
        const std::string& nid = entry.first;
        if (resolved.count(nid)) continue;

        std::set<std::string> visited;
        const auto& direct = reverse.at(nid);
        std::deque<std::string> queue(direct.begin(), direct.end());
        while (!queue.empty()) {
            std::string current = queue.front();
            queue.pop_front();
            if (!visited.insert(current).second) continue;

            auto memo = resolved.find(current);
            if (memo != resolved.end()) {
                visited.insert(memo->second.begin(), memo->second.end());
                continue;
            }
            for (const auto& dependent : reverse.at(current)) {
                if (!visited.count(dependent)) queue.push_back(dependent);
            }
        }
        resolved[nid] = std::move(visited);
    }
    return resolved;
}

std::vector<std::string> FrontierService::CriticalPath(const DecisionGraph& graph, const std::string& target) {
    const Decision& targetNode = graph.at(target);

    std::set<std::string> visited{target};
    std::map<std::string, int> depth{{target, 0}};
    std::map<std::string, std::string> parent;
    std::vector<std::string> discovered;
    std::deque<std::string> queue{target};

    while (!queue.empty()) {
        std::string current = queue.front();
        queue.pop_front();
        for (const auto& dep : UncommittedDeps(graph, graph.at(current))) {
            if (!visited.insert(dep).second) continue;
            depth[dep] = depth[current] + 1;
            parent[dep] = current;
            discovered.push_back(dep);
            queue.push_back(dep);
        }
    }

    if (discovered.empty()) {
        return UncommittedDeps(graph, targetNode);
    }

    std::string deepest = discovered.front();
    for (const auto& nid : discovered) {
        if (depth[nid] > depth[deepest]) deepest = nid;
    }

    std::vector<std::string> path;
    for (std::string current = deepest; current != target; current = parent.at(current)) {
        path.push_back(current);
    }
    return path;
}

FrontierReport FrontierService::Analyze(const DecisionGraph& graph, int topN) {
    FrontierReport report;
    report.topN = topN;

    const auto downstream = TransitiveDownstream(graph);

    for (const auto& [nid, node] : graph.nodes()) {
        if (node.stateText != "suggested") continue;

        const auto& weightSet = downstream.at(nid);
        FrontierEntry entry;
        entry.id = nid;
        entry.title = node.title;
        entry.level = node.level();
        entry.stakes = node.stakesText;
        entry.scope = node.scope;
        entry.downstreamWeight = weightSet.size();
        entry.downstreamIds.assign(weightSet.begin(), weightSet.end());

        auto blockers = UncommittedDeps(graph, node);
        if (blockers.empty()) {
            report.committable.push_back(std::move(entry));
        } else {
            entry.blockers = std::move(blockers);
            entry.criticalPath = CriticalPath(graph, nid);
            report.blocked.push_back(std::move(entry));
        }
    }

    std::stable_sort(report.committable.begin(), report.committable.end(),
                     [](const FrontierEntry& a, const FrontierEntry& b) {
                         if (a.downstreamWeight != b.downstreamWeight) return a.downstreamWeight > b.downstreamWeight;
                         return a.level.value_or(kMissingLevelRank) < b.level.value_or(kMissingLevelRank);
                     });
    std::stable_sort(report.blocked.begin(), report.blocked.end(),
                     [](const FrontierEntry& a, const FrontierEntry& b) {
                         if (a.criticalPath.size() != b.criticalPath.size()) {
                             return a.criticalPath.size() < b.criticalPath.size();
                         }
                         return a.downstreamWeight > b.downstreamWeight;
                     });

    for (int lvl = domain::kMinLevel; lvl <= domain::kMaxLevel; ++lvl) {
        LevelGap gap;
        gap.level = lvl;
        gap.name = domain::LevelName(lvl);
        for (const auto& [nid, node] : graph.nodes()) {
            if (node.level() != lvl) continue;
            if (node.stateText == "committed") {
                ++gap.committed;
            } else if (node.stateText == "suggested") {
                ++gap.suggested;
            } else if (node.stateText == "superseded") {
                ++gap.superseded;
            }
        }
        gap.total = gap.committed + gap.suggested + gap.superseded;
        if (gap.suggested > gap.committed) gap.flags.push_back("more suggested than committed");
        if (gap.committed == 0 && gap.total > 0) gap.flags.push_back("no committed decisions at this level");
        report.levelGaps.push_back(std::move(gap));
    }

    const auto reverse = graph.reverseAdjacency();
    for (const auto& [nid, node] : graph.nodes()) {
        WeightEntry entry;
        entry.id = nid;
        entry.title = node.title;
        entry.level = node.level();
        entry.state = node.stateText.empty() ? std::string("unknown") : node.stateText;
        entry.stakes = node.stakesText;
        entry.scope = node.scope;
        entry.downstreamWeight = downstream.at(nid).size();
        entry.directDependents = reverse.at(nid);
        report.highWeight.push_back(std::move(entry));
    }
    std::stable_sort(report.highWeight.begin(), report.highWeight.end(),
                     [](const WeightEntry& a, const WeightEntry& b) {
                         return a.downstreamWeight > b.downstreamWeight;
                     });
    if (topN >= 0 && report.highWeight.size() > static_cast<size_t>(topN)) {
        report.highWeight.resize(static_cast<size_t>(topN));
    }

    report.summary.totalDecisions = graph.size();
    for (const auto& entry : graph.nodes()) {
        if (entry.second.stateText == "suggested") ++report.summary.suggested;
    }
    report.summary.committableCount = report.committable.size();
    report.summary.blockedCount = report.blocked.size();
    report.summary.levelGapCount = static_cast<size_t>(
        std::count_if(report.levelGaps.begin(), report.levelGaps.end(),
                      [](const LevelGap& gap) { return !gap.flags.empty(); }));
    return report;
}

} // namespace dnagraph::application
