/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>
#include <sstream>

namespace dnagraph::infrastructure {

namespace {

std::vector<std::string> StringList(const nlohmann::json& value) {
    std::vector<std::string> out;
    if (!value.is_array()) return out;
    for (const auto& item : value) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

bool CompileInto(const std::string& pattern, std::regex& out) {
    try {
        out = std::regex(pattern);
        return true;
    } catch (const std::regex_error& e) {
        std::cerr << "[ConfigLoader] Skipping invalid pattern '" << pattern << "': " << e.what() << std::endl;
        return false;
    }
}

} // namespace

domain::LintConfig ConfigLoader::LoadLintConfig(const std::string& projectRoot) {
    std::filesystem::path configPath = std::filesystem::path(projectRoot) / ".dna" / "config.json";
    if (!std::filesystem::exists(configPath)) {
        return domain::LintConfig{};
    }

    std::ifstream f(configPath);
    if (!f.is_open()) {
        std::cerr << "[ConfigLoader] Cannot open " << configPath << std::endl;
        return domain::LintConfig{};
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    return ParseLintConfig(buffer.str());
}

domain::LintConfig ConfigLoader::ParseLintConfig(const std::string& jsonText) {
    domain::LintConfig config;

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(jsonText);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading config.json: " << e.what() << std::endl;
        return config;
    }
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] config.json is not an object, ignoring" << std::endl;
        return config;
    }

    if (j.contains("terminology") && j["terminology"].is_object()) {
        const auto& term = j["terminology"];
        if (term.contains("flagged_term") && term["flagged_term"].is_string()) {
            config.flaggedTerm = term["flagged_term"].get<std::string>();
        }
        if (term.contains("exemptions")) {
            for (const auto& pattern : StringList(term["exemptions"])) {
                std::regex re;
                if (CompileInto(pattern, re)) config.termExemptions.push_back(std::move(re));
            }
        }
        if (term.contains("exempt_ids")) {
            for (const auto& id : StringList(term["exempt_ids"])) config.termExemptIds.insert(id);
        }
    }

    if (j.contains("deleted_artifacts") && j["deleted_artifacts"].is_array()) {
        for (const auto& entry : j["deleted_artifacts"]) {
            if (!entry.is_object() || !entry.contains("pattern") || !entry["pattern"].is_string()) continue;
            std::string pattern = entry["pattern"].get<std::string>();
            if (pattern.empty()) continue;

            domain::DeletedArtifact artifact;
            if (!CompileInto(pattern, artifact.pattern)) continue;
            artifact.label = (entry.contains("label") && entry["label"].is_string())
                                 ? entry["label"].get<std::string>()
                                 : pattern;
            config.deletedArtifacts.push_back(std::move(artifact));
        }
    }

    if (j.contains("stale_prefixes") && j["stale_prefixes"].is_array()) {
        config.stalePrefixes = StringList(j["stale_prefixes"]);
    }

    return config;
}

} // namespace dnagraph::infrastructure
