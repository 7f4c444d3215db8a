#include <algorithm>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "application/DecisionService.hpp"
#include "application/ReportRenderer.hpp"
#include "domain/GraphErrors.hpp"
#include "infrastructure/DecisionRepositoryFs.hpp"
#include "infrastructure/FrontmatterCodec.hpp"

using namespace dnagraph;
using application::DecisionService;

namespace fs = std::filesystem;

namespace {

const char* kBody =
    "\n## Decision\nKeep records as markdown.\n\n## Reasoning\nDiffable.\n\n"
    "## Assumptions\nGit is available.\n\n## Tradeoffs\nNo schema.\n";

void WriteFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

std::string ReadFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

std::string Record(const std::string& id, int level, const std::string& state, const std::string& deps) {
    return "---\nid: " + id + "\ntitle: Record " + id + "\ndate: 2026-01-01\nlevel: " + std::to_string(level) +
           "\nstate: " + state + "\ndepends_on: " + deps + "\n---\n" + kBody;
}

DecisionService MakeService(const fs::path& root) {
    return DecisionService(std::make_unique<infrastructure::DecisionRepositoryFs>(root.string()), domain::LintConfig{});
}

bool Contains(const std::vector<std::string>& items, const std::string& needle) {
    return std::any_of(items.begin(), items.end(),
                       [&needle](const std::string& s) { return s.find(needle) != std::string::npos; });
}

} // namespace

int main() {
    std::cout << "[Test] Starting DecisionService Filesystem Test..." << std::endl;

    fs::path root = "test_project_root_dna";
    fs::remove_all(root);

    WriteFile(root / "constitution" / "DEC-100.md", Record("DEC-100", 1, "committed", "[]"));
    WriteFile(root / "dna" / "DEC-001.md", Record("DEC-001", 1, "committed", "[DEC-100]"));
    WriteFile(root / "dna" / "DEC-002.md", Record("DEC-002", 2, "suggested", "\n  - DEC-001"));
    WriteFile(root / "dna" / "README.md", "not a record");

    // Load and validate
    {
        DecisionService service = MakeService(root);
        auto graph = service.LoadGraph();
        assert(graph.size() == 3);
        assert(graph.at("DEC-100").scope == domain::Scope::Constitution);
        auto report = service.Validate();
        assert(report.errors.empty());
        assert(report.warnings.empty());
    }

    // A cyclic depends_on is rejected and nothing is written
    {
        DecisionService service = MakeService(root);
        std::string before = ReadFile(root / "dna" / "DEC-001.md");
        auto outcome = service.Set("DEC-001", "depends_on", std::vector<std::string>{"DEC-002"});
        assert(!outcome.report.ok());
        assert(Contains(outcome.report.errors, "cycle through DEC-002"));
        assert(ReadFile(root / "dna" / "DEC-001.md") == before);
    }

    // Legal set persists and reports old and new values
    {
        DecisionService service = MakeService(root);
        auto outcome = service.Set("DEC-002", "stakes", std::string("high"));
        assert(outcome.report.ok());
        assert(outcome.oldValue == "(unset)");
        assert(outcome.newValue == "high");
        auto doc = infrastructure::FrontmatterCodec::Parse(ReadFile(root / "dna" / "DEC-002.md"));
        assert(doc && doc->fields["stakes"] == "high");
        assert(doc->body == kBody);

        auto missing = service.Set("DEC-404", "state", std::string("committed"));
        assert(Contains(missing.report.errors, "DEC-404: not found in graph"));
    }

    // Create writes a scaffolded record
    {
        DecisionService service = MakeService(root);
        application::NewDecision input;
        input.title = "Index every partition";
        input.level = 3;
        input.dependsOn = {"DEC-002"};
        auto outcome = service.Create("DEC-003", input, domain::Scope::Project);
        assert(outcome.report.ok());
        assert(fs::exists(root / "dna" / "DEC-003.md"));

        auto graph = service.LoadGraph();
        assert(graph.size() == 4);
        assert(graph.at("DEC-003").title == "Index every partition");
        assert(graph.getDependents("DEC-002") == std::vector<std::string>{"DEC-003"});

        auto again = service.Create("DEC-003", input, domain::Scope::Project);
        assert(!again.report.ok());
    }

    // Edit reports the validation delta
    {
        DecisionService service = MakeService(root);
        auto outcome = service.Edit("DEC-002", "Diffable.", "Diffable, see DEC-099.");
        assert(outcome.written);
        assert(outcome.charsRemoved == 9);
        assert(outcome.newErrors.empty());
        assert(outcome.newWarnings.size() == 1);
        assert(Contains(outcome.newWarnings, "[broken-ref]"));
        assert(ReadFile(root / "dna" / "DEC-002.md").find("see DEC-099") != std::string::npos);

        auto revert = service.Edit("DEC-002", "Diffable, see DEC-099.", "Diffable.");
        assert(revert.ok());
        assert(revert.resolvedWarnings.size() == 1);

        auto absent = service.Edit("DEC-002", "no such text", "x");
        assert(!absent.written);
        assert(Contains(absent.report.errors, "old text not found in body of DEC-002"));

        auto ambiguous = service.Edit("DEC-002", "## ", "### ");
        assert(!ambiguous.written);
        assert(Contains(ambiguous.report.errors, "must be unique"));

        auto empty = service.Edit("DEC-002", "", "prefix ");
        assert(!empty.written);
        assert(Contains(empty.report.errors, "DEC-002: old text must not be empty"));
    }

    // Records stored under another file name are written back in place
    {
        WriteFile(root / "dna" / "DEC-005-notes.md", Record("DEC-005", 4, "suggested", "[DEC-003]"));
        DecisionService service = MakeService(root);
        auto outcome = service.Set("DEC-005", "title", std::string("Renamed: with colon"));
        assert(outcome.report.ok());
        assert(!fs::exists(root / "dna" / "DEC-005.md"));
        auto doc = infrastructure::FrontmatterCodec::Parse(ReadFile(root / "dna" / "DEC-005-notes.md"));
        assert(doc && doc->fields["title"] == "Renamed: with colon");
    }

    // Search
    {
        DecisionService service = MakeService(root);
        auto hits = service.Search({"DIFFABLE", "nothing-matches-this"});
        assert(hits.size() == 4);
        assert(hits[0].id == "DEC-001");
        assert(std::find(hits[0].matchedSections.begin(), hits[0].matchedSections.end(), "Reasoning") !=
               hits[0].matchedSections.end());
        auto json = application::ReportRenderer::SearchJson({"DIFFABLE"}, hits);
        assert(json["results"][0]["level"].is_number_integer());
        assert(json["results"][0]["level"] == 1);
        assert(json["results"][1]["level"] == 2);
        auto titled = service.Search({"renamed"});
        assert(titled.size() == 1 && titled[0].matchedSections.front() == "title");
    }

    // Index and health
    {
        DecisionService service = MakeService(root);
        auto index = service.RebuildIndex();
        assert(index.ok && index.constitutionWritten);
        assert(index.constitutionCount == 1 && index.projectCount == 4);
        std::string dnaIndex = ReadFile(root / "dna" / "INDEX.md");
        assert(dnaIndex.find("**Total:** 4 decisions") != std::string::npos);
        assert(dnaIndex.find("Renamed: with colon") != std::string::npos);

        WriteFile(root / "HEALTH.md", "# System Health\n\n## Manual Flags\n\n- Revisit DEC-002 after launch\n\n## Last Session\n\nold\n");
        auto health = service.RebuildHealth();
        assert(health.ok);
        assert(health.totalDecisions == 5);
        std::string written = ReadFile(root / "HEALTH.md");
        assert(written.find("## Manual Flags\n\n- Revisit DEC-002 after launch\n") != std::string::npos);
        assert(written.find("decisions at `suggested`") != std::string::npos);
        assert(DecisionService::ExtractManualFlags(written) == "- Revisit DEC-002 after launch");
    }

    // Manifest
    {
        DecisionService service = MakeService(root);
        auto human = service.CompileManifest(application::ManifestTarget::Human);
        assert(human["counts"]["total"] == 5);
        assert(human["counts"]["committed"] == 2);
        assert(human["levels"]["1"]["committed"].size() == 2);
        auto agent = service.CompileManifest(application::ManifestTarget::Agent);
        assert(agent["constitution"].size() == 1);
        assert(agent["high_stakes"].size() == 1);
        assert(agent["all_suggested"].size() == 3);
    }

    // Cascade through the service
    {
        DecisionService service = MakeService(root);
        auto result = service.Cascade("DEC-100", false);
        assert(result.uniqueAffected == 4);
        assert(result.waves[0].effects[0].crossScope);
    }

    // An ID present in both partitions aborts every operation
    {
        WriteFile(root / "constitution" / "DEC-001.md", Record("DEC-001", 1, "committed", "[]"));
        DecisionService service = MakeService(root);
        bool thrown = false;
        try {
            service.Validate();
        } catch (const domain::IdCollisionError&) {
            thrown = true;
        }
        assert(thrown && "Collision across partitions must throw.");
    }

    fs::remove_all(root);

    // Create never replaces a file that holds another record
    {
        fs::path occupied = "test_project_root_dna_occupied";
        fs::remove_all(occupied);
        WriteFile(occupied / "dna" / "DEC-001.md", Record("DEC-001", 1, "committed", "[]"));
        WriteFile(occupied / "dna" / "DEC-005.md", Record("DEC-007", 2, "suggested", "[DEC-001]"));
        std::string before = ReadFile(occupied / "dna" / "DEC-005.md");

        DecisionService service = MakeService(occupied);
        application::NewDecision input;
        input.title = "Shadowed by a renamed file";
        input.level = 2;
        input.dependsOn = {"DEC-001"};
        auto outcome = service.Create("DEC-005", input, domain::Scope::Project);
        assert(!outcome.report.ok());
        assert(Contains(outcome.report.errors, "DEC-005: target file already holds DEC-007"));
        assert(ReadFile(occupied / "dna" / "DEC-005.md") == before);
        assert(service.LoadGraph().find("DEC-007") != nullptr);

        auto elsewhere = service.Create("DEC-006", input, domain::Scope::Project);
        assert(elsewhere.report.ok());
        assert(fs::exists(occupied / "dna" / "DEC-006.md"));

        fs::remove_all(occupied);
    }

    std::cout << "[PASS] DecisionService Filesystem Test Successful!" << std::endl;
    return 0;
}
