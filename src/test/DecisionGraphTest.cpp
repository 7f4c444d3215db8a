#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "domain/DecisionGraph.hpp"
#include "domain/GraphErrors.hpp"

using namespace dnagraph::domain;

namespace {

DecisionRecord MakeRecord(const std::string& id, nlohmann::json deps = nlohmann::json::array()) {
    DecisionRecord record;
    record.fields = {{"id", id}, {"title", "Title " + id}, {"level", 2}, {"state", "suggested"}, {"depends_on", deps}};
    record.body = "## Decision\n";
    record.source = id + ".md";
    return record;
}

} // namespace

int main() {
    std::cout << "[Test] Starting DecisionGraph Test..." << std::endl;

    // Load order and scope tagging
    {
        std::vector<DecisionRecord> constitution = {MakeRecord("DEC-900")};
        std::vector<DecisionRecord> project = {MakeRecord("DEC-002", {"DEC-001"}), MakeRecord("DEC-001")};
        DecisionGraph graph = DecisionGraph::Load(constitution, project);

        assert(graph.size() == 3);
        assert(graph.at("DEC-900").scope == Scope::Constitution);
        assert(graph.at("DEC-001").scope == Scope::Project);
        assert(graph.nodes().begin()->first == "DEC-001");
        assert(graph.getDependents("DEC-001") == std::vector<std::string>{"DEC-002"});
        assert(graph.getDependents("DEC-002").empty());
    }

    // Structured and plain dependency entries normalize to the same IDs
    {
        nlohmann::json deps = nlohmann::json::array();
        deps.push_back("DEC-001");
        deps.push_back({{"id", "DEC-002"}, {"note", "only the id matters"}});
        deps.push_back(42);
        std::vector<DecisionRecord> project = {MakeRecord("DEC-001"), MakeRecord("DEC-002"), MakeRecord("DEC-003", deps)};
        DecisionGraph graph = DecisionGraph::Load({}, project);

        const auto& list = DecisionGraph::GetDepsList(graph.at("DEC-003"));
        assert((list == std::vector<std::string>{"DEC-001", "DEC-002"}));
        assert(graph.at("DEC-003").dependsOn.size() == 2);
    }

    // Records without an id are skipped, a string depends_on becomes one entry
    {
        DecisionRecord noId;
        noId.fields = {{"title", "orphan document"}};
        DecisionRecord single = MakeRecord("DEC-004");
        single.fields["depends_on"] = "DEC-001";
        DecisionGraph graph = DecisionGraph::Load({}, {noId, MakeRecord("DEC-001"), single});
        assert(graph.size() == 2);
        assert(DecisionGraph::GetDepsList(graph.at("DEC-004")) == std::vector<std::string>{"DEC-001"});
    }

    // Collision across partitions is fatal
    {
        bool thrown = false;
        try {
            DecisionGraph::Load({MakeRecord("DEC-001")}, {MakeRecord("DEC-001")});
        } catch (const IdCollisionError& e) {
            thrown = true;
            assert(e.id() == "DEC-001");
            assert(std::string(e.what()).find("constitution and project") != std::string::npos);
        }
        assert(thrown && "Duplicate ID must throw IdCollisionError.");
    }

    // Unknown lookups
    {
        DecisionGraph graph = DecisionGraph::Load({}, {MakeRecord("DEC-001")});
        assert(graph.find("DEC-404") == nullptr);
        bool thrown = false;
        try {
            graph.at("DEC-404");
        } catch (const NodeNotFoundError& e) {
            thrown = true;
            assert(e.id() == "DEC-404");
        }
        assert(thrown);
    }

    // Levels keep their raw text
    {
        DecisionRecord bad = MakeRecord("DEC-005");
        bad.fields["level"] = "high";
        DecisionGraph graph = DecisionGraph::Load({}, {bad});
        assert(graph.at("DEC-005").levelText == "high");
        assert(!graph.at("DEC-005").level());
    }

    // Whole-number float levels read as integers
    {
        DecisionRecord whole = MakeRecord("DEC-006");
        whole.fields["level"] = 2.0;
        DecisionRecord fraction = MakeRecord("DEC-007");
        fraction.fields["level"] = 2.5;
        DecisionGraph graph = DecisionGraph::Load({}, {whole, fraction});
        assert(graph.at("DEC-006").level() == 2);
        assert(graph.at("DEC-006").toFields()["level"] == 2);
        assert(!graph.at("DEC-007").level());
    }

    std::cout << "[PASS] DecisionGraph Test Successful!" << std::endl;
    return 0;
}
