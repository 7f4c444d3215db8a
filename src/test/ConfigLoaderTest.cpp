#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <regex>

#include "infrastructure/ConfigLoader.hpp"

using dnagraph::infrastructure::ConfigLoader;

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;

    // Full configuration, with one bad regex skipped
    {
        auto config = ConfigLoader::ParseLintConfig(R"({
            "terminology": {
                "flagged_term": "client",
                "exemptions": ["client-side", "([unclosed"],
                "exempt_ids": ["DEC-001", "DEC-009"]
            },
            "deleted_artifacts": [
                {"pattern": "old_loader\\.py", "label": "old loader"},
                {"pattern": "tools/gen"},
                {"pattern": ""},
                {"label": "no pattern"}
            ],
            "stale_prefixes": ["INF"]
        })");

        assert(config.flaggedTerm == "client");
        assert(config.termExemptions.size() == 1);
        assert(std::regex_search("runs client-side", config.termExemptions[0]));
        assert(config.termExemptIds.count("DEC-009") == 1);
        assert(config.deletedArtifacts.size() == 2);
        assert(config.deletedArtifacts[0].label == "old loader");
        assert(config.deletedArtifacts[1].label == "tools/gen");
        assert(config.stalePrefixes.size() == 1 && config.stalePrefixes[0] == "INF");
    }

    // Malformed JSON falls back to defaults
    {
        auto config = ConfigLoader::ParseLintConfig("{ not json");
        assert(config.flaggedTerm.empty());
        assert(config.deletedArtifacts.empty());
        assert(config.stalePrefixes.size() == 2);
    }

    // Reading from a project root
    {
        std::filesystem::path root = "test_project_root_config";
        std::filesystem::remove_all(root);

        auto missing = ConfigLoader::LoadLintConfig(root.string());
        assert(missing.flaggedTerm.empty());

        std::filesystem::create_directories(root / ".dna");
        {
            std::ofstream out(root / ".dna" / "config.json");
            out << R"({"terminology": {"flagged_term": "vendor"}, "stale_prefixes": []})";
        }
        auto loaded = ConfigLoader::LoadLintConfig(root.string());
        assert(loaded.flaggedTerm == "vendor");
        assert(loaded.stalePrefixes.empty());

        std::filesystem::remove_all(root);
    }

    std::cout << "[PASS] ConfigLoader Test Successful!" << std::endl;
    return 0;
}
