#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "application/MutationValidator.hpp"
#include "domain/DecisionGraph.hpp"

using namespace dnagraph::domain;
using namespace dnagraph::application;

namespace {

Decision MakeNode(const std::string& id, int level, DecisionState state,
                  const std::vector<std::string>& deps = {}, Scope scope = Scope::Project) {
    Decision d(id, "Title " + id, level, state);
    d.setDependencies(deps);
    d.scope = scope;
    d.source = id + ".md";
    return d;
}

bool HasError(const ValidationReport& report, const std::string& needle) {
    return std::any_of(report.errors.begin(), report.errors.end(),
                       [&needle](const std::string& e) { return e.find(needle) != std::string::npos; });
}

DecisionGraph ChainGraph() {
    DecisionGraph graph;
    graph.add(MakeNode("DEC-001", 1, DecisionState::Committed));
    graph.add(MakeNode("DEC-002", 2, DecisionState::Suggested, {"DEC-001"}));
    graph.add(MakeNode("DEC-003", 3, DecisionState::Superseded, {"DEC-002"}));
    graph.add(MakeNode("DEC-100", 1, DecisionState::Committed, {}, Scope::Constitution));
    return graph;
}

} // namespace

int main() {
    std::cout << "[Test] Starting MutationValidator Test..." << std::endl;

    // Transition lattice, every pair
    {
        const std::vector<DecisionState> states = {DecisionState::Suggested, DecisionState::Committed,
                                                   DecisionState::Superseded};
        for (auto from : states) {
            for (auto to : states) {
                DecisionGraph graph;
                graph.add(MakeNode("DEC-001", 1, from));
                auto report = MutationValidator::ValidateForSet("DEC-001", "state", StateToString(to), graph);
                bool legal = from == to ||
                             (from == DecisionState::Suggested && to != DecisionState::Suggested) ||
                             (from == DecisionState::Committed && to == DecisionState::Superseded);
                assert(report.ok() == legal);
                if (!legal) {
                    assert(HasError(report, "Illegal state transition: " + StateToString(from) + " -> " +
                                                StateToString(to)));
                }
            }
        }
        DecisionGraph graph;
        graph.add(MakeNode("DEC-001", 1, DecisionState::Suggested));
        assert(!MutationValidator::ValidateForSet("DEC-001", "state", std::string("done"), graph).ok());
    }

    // Commit requires committed upstreams
    {
        DecisionGraph graph = ChainGraph();
        graph.add(MakeNode("DEC-004", 3, DecisionState::Suggested, {"DEC-002"}));
        auto report = MutationValidator::ValidateForSet("DEC-004", "state", std::string("committed"), graph);
        assert(HasError(report, "cannot commit - upstream DEC-002 is 'suggested'"));
        assert(MutationValidator::ValidateForSet("DEC-002", "state", std::string("committed"), graph).ok());
    }

    // Unknown node, unknown field, wrong value type
    {
        DecisionGraph graph = ChainGraph();
        assert(HasError(MutationValidator::ValidateForSet("DEC-404", "state", std::string("committed"), graph),
                        "DEC-404: not found in graph"));
        assert(HasError(MutationValidator::ValidateForSet("DEC-002", "color", std::string("red"), graph),
                        "Unknown field: color"));
        assert(HasError(MutationValidator::ValidateForSet("DEC-002", "level", std::string("two"), graph),
                        "level expects an integer"));
        assert(HasError(MutationValidator::ValidateForSet("DEC-002", "depends_on", std::string("DEC-001"), graph),
                        "depends_on expects a list of IDs"));
    }

    // Cycle on set
    {
        DecisionGraph graph = ChainGraph();
        auto report = MutationValidator::ValidateForSet(
            "DEC-001", "depends_on", std::vector<std::string>{"DEC-002"}, graph);
        assert(HasError(report, "DEC-001: this change would create a cycle through DEC-002"));

        auto self = MutationValidator::ValidateForSet("DEC-001", "depends_on", std::vector<std::string>{"DEC-001"}, graph);
        assert(HasError(self, "self-dependency"));

        auto empty = MutationValidator::ValidateForSet("DEC-002", "depends_on", std::vector<std::string>{}, graph);
        assert(empty.ok());
    }

    // Reordering or pruning the dependencies of a node with dependents is never a cycle
    {
        DecisionGraph graph = ChainGraph();
        graph.add(MakeNode("DEC-004", 1, DecisionState::Committed));
        graph.add(MakeNode("DEC-005", 2, DecisionState::Suggested, {"DEC-001", "DEC-004"}));
        graph.add(MakeNode("DEC-006", 3, DecisionState::Suggested, {"DEC-005"}));
        assert(graph.getDependents("DEC-005") == std::vector<std::string>{"DEC-006"});

        auto reordered = MutationValidator::ValidateForSet(
            "DEC-005", "depends_on", std::vector<std::string>{"DEC-004", "DEC-001"}, graph);
        assert(reordered.ok());
        auto pruned = MutationValidator::ValidateForSet("DEC-005", "depends_on", std::vector<std::string>{"DEC-001"}, graph);
        assert(pruned.ok());
    }

    // Iron rule on set
    {
        DecisionGraph graph = ChainGraph();
        auto report = MutationValidator::ValidateForSet(
            "DEC-100", "depends_on", std::vector<std::string>{"DEC-001"}, graph);
        assert(HasError(report, "iron rule violation"));
    }

    // Level, stakes, title
    {
        DecisionGraph graph = ChainGraph();
        assert(!MutationValidator::ValidateForSet("DEC-002", "level", 9, graph).ok());
        auto inverted = MutationValidator::ValidateForSet("DEC-003", "level", 1, graph);
        assert(inverted.ok());
        assert(inverted.warnings.size() == 1);
        assert(!MutationValidator::ValidateForSet("DEC-002", "stakes", std::string("urgent"), graph).ok());
        assert(MutationValidator::ValidateForSet("DEC-002", "stakes", std::string("high"), graph).ok());
        assert(HasError(MutationValidator::ValidateForSet("DEC-002", "title", std::string("   "), graph),
                        "title cannot be empty"));
    }

    // Create
    {
        DecisionGraph graph = ChainGraph();

        NewDecision ok;
        ok.title = "  Adopt the graph  ";
        ok.level = 3;
        ok.dependsOn = {"DEC-002"};
        auto created = MutationValidator::ValidateForCreate("DEC-010", ok, graph, Scope::Project);
        assert(created.report.ok());
        assert(created.decision);
        assert(created.decision->title == "Adopt the graph");
        assert(created.decision->stateText == "suggested");
        assert(created.decision->body == kScaffoldBody);
        assert(!created.decision->date.empty());

        NewDecision bad;
        bad.level = 7;
        bad.state = "committed";
        bad.stakes = "huge";
        auto rejected = MutationValidator::ValidateForCreate("DEC-1", bad, graph, Scope::Project);
        assert(!rejected.decision);
        assert(HasError(rejected.report, "ID must match DEC-NNN"));
        assert(HasError(rejected.report, "title cannot be empty"));
        assert(HasError(rejected.report, "invalid level '7'"));
        assert(HasError(rejected.report, "invalid stakes 'huge'"));

        NewDecision duplicate = ok;
        auto collision = MutationValidator::ValidateForCreate("DEC-002", duplicate, graph, Scope::Project);
        assert(HasError(collision.report, "DEC-002: ID already exists at DEC-002.md"));

        NewDecision premature = ok;
        premature.state = "committed";
        auto blocked = MutationValidator::ValidateForCreate("DEC-011", premature, graph, Scope::Project);
        assert(HasError(blocked.report, "cannot create as committed - upstream DEC-002 is 'suggested'"));

        NewDecision constitutional = ok;
        constitutional.level = 1;
        auto iron = MutationValidator::ValidateForCreate("DEC-101", constitutional, graph, Scope::Constitution);
        assert(HasError(iron.report, "iron rule violation"));
    }

    // A node that existing edges already point at closes a cycle when it is created
    {
        DecisionGraph graph;
        graph.add(MakeNode("DEC-001", 2, DecisionState::Suggested, {"DEC-005"}));
        NewDecision input;
        input.title = "Late arrival";
        input.level = 2;
        input.dependsOn = {"DEC-001"};
        auto outcome = MutationValidator::ValidateForCreate("DEC-005", input, graph, Scope::Project);
        assert(HasError(outcome.report, "adding this node would create a cycle through DEC-001"));
    }

    assert(MutationValidator::IsWellFormedId("DEC-042"));
    assert(!MutationValidator::IsWellFormedId("DEC-42"));
    assert(!MutationValidator::IsWellFormedId("dec-042"));

    std::cout << "[PASS] MutationValidator Test Successful!" << std::endl;
    return 0;
}
