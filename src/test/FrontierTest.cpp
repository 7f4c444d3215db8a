#include <cassert>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include "application/FrontierService.hpp"
#include "domain/DecisionGraph.hpp"

using namespace dnagraph::domain;
using namespace dnagraph::application;

namespace {

Decision MakeNode(const std::string& id, int level, DecisionState state, const std::vector<std::string>& deps = {}) {
    Decision d(id, "Title " + id, level, state);
    d.setDependencies(deps);
    return d;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Frontier Test..." << std::endl;

    // Critical path: A(committed) -> B -> C -> D
    {
        DecisionGraph graph;
        graph.add(MakeNode("DEC-001", 1, DecisionState::Committed));
        graph.add(MakeNode("DEC-002", 2, DecisionState::Suggested, {"DEC-001"}));
        graph.add(MakeNode("DEC-003", 3, DecisionState::Suggested, {"DEC-002"}));
        graph.add(MakeNode("DEC-004", 4, DecisionState::Suggested, {"DEC-003"}));

        auto path = FrontierService::CriticalPath(graph, "DEC-004");
        assert((path == std::vector<std::string>{"DEC-002", "DEC-003"}));
        assert(FrontierService::CriticalPath(graph, "DEC-002").empty());

        auto report = FrontierService::Analyze(graph);
        assert(report.committable.size() == 1);
        assert(report.committable[0].id == "DEC-002");
        assert(report.committable[0].downstreamWeight == 2);
        assert(report.blocked.size() == 2);
        assert(report.blocked[0].id == "DEC-003");
        assert(report.blocked[0].blockers == std::vector<std::string>{"DEC-002"});
        assert(report.blocked[1].criticalPath.size() == 2);
    }

    // Every suggested node is in exactly one of committable / blocked
    {
        DecisionGraph graph;
        graph.add(MakeNode("DEC-001", 1, DecisionState::Committed));
        graph.add(MakeNode("DEC-002", 1, DecisionState::Superseded));
        graph.add(MakeNode("DEC-003", 2, DecisionState::Suggested, {"DEC-001"}));
        graph.add(MakeNode("DEC-004", 2, DecisionState::Suggested, {"DEC-002"}));
        graph.add(MakeNode("DEC-005", 3, DecisionState::Suggested, {"DEC-003", "DEC-004"}));
        graph.add(MakeNode("DEC-006", 3, DecisionState::Suggested, {"DEC-404"}));

        auto report = FrontierService::Analyze(graph);
        std::set<std::string> seen;
        for (const auto& e : report.committable) assert(seen.insert(e.id).second);
        for (const auto& e : report.blocked) assert(seen.insert(e.id).second);
        assert((seen == std::set<std::string>{"DEC-003", "DEC-004", "DEC-005", "DEC-006"}));
        assert(report.summary.suggested == 4);
        assert(report.summary.committableCount + report.summary.blockedCount == 4);
    }

    // Level gaps
    {
        DecisionGraph graph;
        graph.add(MakeNode("DEC-001", 1, DecisionState::Committed));
        graph.add(MakeNode("DEC-002", 2, DecisionState::Suggested, {"DEC-001"}));
        graph.add(MakeNode("DEC-003", 2, DecisionState::Suggested, {"DEC-001"}));

        auto report = FrontierService::Analyze(graph);
        assert(report.levelGaps.size() == 4);
        const auto& identity = report.levelGaps[0];
        assert(identity.name == "Identity");
        assert(identity.committed == 1 && identity.flags.empty());
        const auto& direction = report.levelGaps[1];
        assert(direction.suggested == 2 && direction.total == 2);
        assert(direction.flags.size() == 2);
        assert(report.levelGaps[2].total == 0 && report.levelGaps[2].flags.empty());
        assert(report.summary.levelGapCount == 1);
    }

    // Weights and top-N
    {
        DecisionGraph graph;
        graph.add(MakeNode("DEC-001", 1, DecisionState::Committed));
        graph.add(MakeNode("DEC-002", 2, DecisionState::Committed, {"DEC-001"}));
        graph.add(MakeNode("DEC-003", 3, DecisionState::Suggested, {"DEC-002"}));
        graph.add(MakeNode("DEC-004", 3, DecisionState::Suggested, {"DEC-001"}));

        auto downstream = FrontierService::TransitiveDownstream(graph);
        assert((downstream.at("DEC-001") == std::set<std::string>{"DEC-002", "DEC-003", "DEC-004"}));
        assert(downstream.at("DEC-003").empty());

        auto report = FrontierService::Analyze(graph, 2);
        assert(report.highWeight.size() == 2);
        assert(report.highWeight[0].id == "DEC-001");
        assert(report.highWeight[0].downstreamWeight == 3);
        assert((report.highWeight[0].directDependents == std::vector<std::string>{"DEC-002", "DEC-004"}));
        assert(report.highWeight[1].id == "DEC-002");
    }

    // Cycles do not stop the weight computation
    {
        DecisionGraph graph;
        graph.add(MakeNode("DEC-001", 2, DecisionState::Suggested, {"DEC-002"}));
        graph.add(MakeNode("DEC-002", 2, DecisionState::Suggested, {"DEC-001"}));
        graph.add(MakeNode("DEC-003", 3, DecisionState::Suggested, {"DEC-002"}));
        auto downstream = FrontierService::TransitiveDownstream(graph);
        assert(downstream.at("DEC-001").count("DEC-003") == 1);
        assert(downstream.size() == 3);
    }

    std::cout << "[PASS] Frontier Test Successful!" << std::endl;
    return 0;
}
