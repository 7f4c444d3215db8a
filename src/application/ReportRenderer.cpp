/**
 * @file ReportRenderer.cpp
 * @brief Implementation of ReportRenderer.
 */

#include "application/ReportRenderer.hpp"
#include "application/TextUtils.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace dnagraph::application {

namespace {

std::string LevelTag(const std::optional<int>& level) {
    return level ? "L" + std::to_string(*level) : std::string("L?");
}

nlohmann::json LevelJson(const std::optional<int>& level) {
    return level ? nlohmann::json(*level) : nlohmann::json(nullptr);
}

nlohmann::json OptionalText(const std::string& text) {
    return text.empty() ? nlohmann::json(nullptr) : nlohmann::json(text);
}

std::string OrDash(const std::string& text) {
    return text.empty() ? std::string("-") : text;
}

std::string PathText(const FrontierEntry& entry) {
    if (entry.criticalPath.empty()) return "-";
    return Join(entry.criticalPath, " -> ") + " -> " + entry.id;
}

nlohmann::json EntryJson(const FrontierEntry& entry, bool blocked) {
    nlohmann::json j;
    j["id"] = entry.id;
    j["title"] = entry.title;
    j["level"] = LevelJson(entry.level);
    j["stakes"] = OptionalText(entry.stakes);
    j["scope"] = domain::ScopeToString(entry.scope);
    j["downstream_weight"] = entry.downstreamWeight;
    j["downstream_ids"] = entry.downstreamIds;
    if (blocked) {
        j["blockers"] = entry.blockers;
        j["critical_path"] = entry.criticalPath;
        j["critical_path_length"] = entry.criticalPath.size();
    }
    return j;
}

std::string ManifestLine(const nlohmann::json& d, bool stateTag) {
    std::string line = "  - " + d.value("id", std::string()) + ": " + d.value("title", std::string());
    if (stateTag) {
        line += " [" + d.value("state", std::string("unknown")) + "]";
    } else if (d.contains("stakes") && d["stakes"].is_string()) {
        line += " [" + d["stakes"].get<std::string>() + "]";
    }
    return line + "\n";
}

} // namespace

std::string ReportRenderer::ValidationText(const domain::ValidationReport& report, size_t decisionCount) {
    std::stringstream ss;
    auto errors = report.errors;
    auto warnings = report.warnings;
    std::sort(errors.begin(), errors.end());
    std::sort(warnings.begin(), warnings.end());

    if (!errors.empty()) {
        ss << "ERRORS (" << errors.size() << "):\n";
        for (const auto& e : errors) ss << "  " << e << "\n";
    }
    if (!warnings.empty()) {
        ss << "\nWARNINGS (" << warnings.size() << "):\n";
        for (const auto& w : warnings) ss << "  " << w << "\n";
    }
    if (errors.empty() && warnings.empty()) {
        ss << "Validation passed: " << decisionCount << " decisions, 0 errors, 0 warnings.\n";
    }
    return ss.str();
}

nlohmann::json ReportRenderer::CascadeJson(const CascadeResult& result) {
    nlohmann::json j;
    j["start_node"] = result.startId;
    j["direction"] = result.direction == Direction::Upstream ? "upstream" : "downstream";
    nlohmann::json waves = nlohmann::json::array();
    for (const auto& wave : result.waves) {
        nlohmann::json effects = nlohmann::json::array();
        for (const auto& effect : wave.effects) {
            nlohmann::json e;
            e["node"] = effect.node;
            e["current_state"] = effect.currentState;
            e["reason"] = effect.reason;
            if (effect.crossScope) e["cross_scope"] = true;
            effects.push_back(e);
        }
        waves.push_back({{"wave", wave.number}, {"effects", effects}});
    }
    j["waves"] = waves;
    j["summary"] = {
        {"total_affected", result.totalAffected},
        {"unique_affected", result.uniqueAffected},
        {"wave_count", result.waveCount()},
    };
    return j;
}

std::string ReportRenderer::CascadeMarkdown(const CascadeResult& result, const domain::DecisionGraph& graph) {
    const bool upstream = result.direction == Direction::Upstream;
    const domain::Decision* start = graph.find(result.startId);
    std::string startTitle = (start && !start->title.empty()) ? start->title : "(no title)";

    std::stringstream ss;
    ss << "### " << (upstream ? "Upstream: " : "Cascade: ") << result.startId << " - " << startTitle << "\n\n";
    if (result.empty()) {
        ss << (upstream ? "No upstream dependencies.\n" : "No downstream dependents.\n");
        return ss.str();
    }

    if (upstream) {
        ss << "**" << result.uniqueAffected << " upstream decisions** across " << result.waveCount() << " wave(s).\n\n";
    } else {
        ss << "**" << result.totalAffected << " decisions** need review across " << result.waveCount()
           << " wave(s).\n\n";
    }
    for (const auto& wave : result.waves) {
        ss << "#### Wave " << wave.number << "\n\n";
        ss << "| Node | Title | State | Reason |\n";
        ss << "|------|-------|-------|--------|\n";
        for (const auto& effect : wave.effects) {
            const domain::Decision* node = graph.find(effect.node);
            ss << "| " << effect.node << " | " << (node ? node->title : std::string("?")) << " | "
               << effect.currentState << " | " << effect.reason << (effect.crossScope ? " [cross-scope]" : "")
               << " |\n";
        }
        ss << "\n";
    }
    return ss.str();
}

std::string ReportRenderer::CascadeTable(const CascadeResult& result) {
    const bool upstream = result.direction == Direction::Upstream;
    std::stringstream ss;
    if (result.empty()) {
        ss << (upstream ? "No upstream dependencies for " : "No downstream dependents for ") << result.startId << ".\n";
        return ss.str();
    }

    for (const auto& wave : result.waves) {
        ss << "\n=== Wave " << wave.number << " ===\n";
        ss << std::left << std::setw(13) << "Node" << std::setw(15) << "State" << "Reason\n";
        ss << std::string(60, '-') << "\n";
        for (const auto& effect : wave.effects) {
            ss << std::left << std::setw(12) << effect.node << " " << std::setw(14) << effect.currentState << " "
               << effect.reason << (effect.crossScope ? " [cross-scope]" : "") << "\n";
        }
    }
    if (upstream) {
        ss << "\nTotal: " << result.uniqueAffected << " upstream decisions across " << result.waveCount()
           << " wave(s).\n";
    } else {
        ss << "\nTotal: " << result.totalAffected << " decisions need review across " << result.waveCount()
           << " wave(s).\n";
    }
    return ss.str();
}

nlohmann::json ReportRenderer::FrontierJson(const FrontierReport& report) {
    nlohmann::json committable = nlohmann::json::array();
    for (const auto& entry : report.committable) committable.push_back(EntryJson(entry, false));
    nlohmann::json blocked = nlohmann::json::array();
    for (const auto& entry : report.blocked) blocked.push_back(EntryJson(entry, true));

    nlohmann::json gaps = nlohmann::json::array();
    for (const auto& gap : report.levelGaps) {
        gaps.push_back({
            {"level", gap.level},
            {"level_name", gap.name},
            {"committed", gap.committed},
            {"suggested", gap.suggested},
            {"superseded", gap.superseded},
            {"total", gap.total},
            {"flags", gap.flags},
        });
    }

    nlohmann::json weights = nlohmann::json::array();
    for (const auto& w : report.highWeight) {
        weights.push_back({
            {"id", w.id},
            {"title", w.title},
            {"level", LevelJson(w.level)},
            {"state", w.state},
            {"stakes", OptionalText(w.stakes)},
            {"scope", domain::ScopeToString(w.scope)},
            {"downstream_weight", w.downstreamWeight},
            {"direct_dependents", w.directDependents},
        });
    }

    nlohmann::json j;
    j["frontier"] = {
        {"committable_now", committable},
        {"blocked", blocked},
        {"level_gaps", gaps},
        {"high_weight", weights},
    };
    j["summary"] = {
        {"total_decisions", report.summary.totalDecisions},
        {"suggested", report.summary.suggested},
        {"committable_count", report.summary.committableCount},
        {"blocked_count", report.summary.blockedCount},
        {"level_gap_count", report.summary.levelGapCount},
    };
    return j;
}

std::string ReportRenderer::FrontierMarkdown(const FrontierReport& report) {
    const auto& s = report.summary;
    std::stringstream ss;
    ss << "# Decision Frontier\n\n";
    ss << "**" << s.totalDecisions << " decisions** - " << s.suggested << " suggested, " << s.committableCount
       << " committable, " << s.blockedCount << " blocked\n\n";

    ss << "## Committable Now\n\n";
    if (report.committable.empty()) {
        ss << "None - all suggested decisions have uncommitted upstream.\n";
    } else {
        ss << "| ID | Title | Level | Stakes | Downstream |\n";
        ss << "|----|-------|-------|--------|------------|\n";
        for (const auto& c : report.committable) {
            ss << "| " << c.id << " | " << c.title << " | " << LevelTag(c.level) << " | " << OrDash(c.stakes) << " | "
               << c.downstreamWeight << " |\n";
        }
    }
    ss << "\n## Blocked\n\n";
    if (report.blocked.empty()) {
        ss << "None - all suggested decisions are committable.\n";
    } else {
        ss << "| ID | Title | Level | Blockers | Critical Path |\n";
        ss << "|----|-------|-------|----------|---------------|\n";
        for (const auto& b : report.blocked) {
            ss << "| " << b.id << " | " << b.title << " | " << LevelTag(b.level) << " | " << Join(b.blockers, ", ")
               << " | " << PathText(b) << " |\n";
        }
    }

    ss << "\n## Level Gaps\n\n";
    ss << "| Level | Name | Committed | Suggested | Flags |\n";
    ss << "|-------|------|-----------|-----------|-------|\n";
    for (const auto& gap : report.levelGaps) {
        ss << "| L" << gap.level << " | " << gap.name << " | " << gap.committed << " | " << gap.suggested << " | "
           << OrDash(Join(gap.flags, ", ")) << " |\n";
    }

    ss << "\n## High-Weight Nodes (top " << report.topN << ")\n\n";
    ss << "| ID | Title | Level | State | Downstream |\n";
    ss << "|----|-------|-------|-------|------------|\n";
    for (const auto& w : report.highWeight) {
        ss << "| " << w.id << " | " << w.title << " | " << LevelTag(w.level) << " | " << w.state << " | "
           << w.downstreamWeight << " |\n";
    }
    return ss.str();
}

std::string ReportRenderer::FrontierTable(const FrontierReport& report) {
    const auto& s = report.summary;
    std::stringstream ss;
    ss << std::left;
    ss << "Decision Frontier - " << s.totalDecisions << " decisions, " << s.suggested << " suggested, "
       << s.committableCount << " committable, " << s.blockedCount << " blocked\n";

    ss << "\n=== Committable Now (" << report.committable.size() << ") ===\n";
    if (report.committable.empty()) {
        ss << "  None - all suggested decisions have uncommitted upstream.\n";
    } else {
        ss << std::setw(13) << "ID" << std::setw(8) << "Level" << std::setw(9) << "Stakes" << std::setw(9) << "Weight"
           << "Title\n";
        ss << std::string(70, '-') << "\n";
        for (const auto& c : report.committable) {
            ss << std::setw(13) << c.id << std::setw(8) << LevelTag(c.level) << std::setw(9) << OrDash(c.stakes)
               << std::setw(9) << c.downstreamWeight << c.title << "\n";
        }
    }

    ss << "\n=== Blocked (" << report.blocked.size() << ") ===\n";
    if (report.blocked.empty()) {
        ss << "  None - all suggested decisions are committable.\n";
    } else {
        ss << std::setw(13) << "ID" << std::setw(8) << "Level" << std::setw(11) << "Path Len" << std::setw(26)
           << "Blockers" << "Critical Path\n";
        ss << std::string(90, '-') << "\n";
        for (const auto& b : report.blocked) {
            ss << std::setw(13) << b.id << std::setw(8) << LevelTag(b.level) << std::setw(11) << b.criticalPath.size()
               << std::setw(26) << Join(b.blockers, ", ") << PathText(b) << "\n";
        }
    }

    ss << "\n=== Level Gaps ===\n";
    ss << std::setw(9) << "Level" << std::setw(13) << "Name" << std::setw(12) << "Committed" << std::setw(12)
       << "Suggested" << "Flags\n";
    ss << std::string(60, '-') << "\n";
    for (const auto& gap : report.levelGaps) {
        ss << std::setw(9) << ("L" + std::to_string(gap.level)) << std::setw(13) << gap.name << std::setw(12)
           << gap.committed << std::setw(12) << gap.suggested << OrDash(Join(gap.flags, ", ")) << "\n";
    }

    ss << "\n=== High-Weight Nodes (top " << report.topN << ") ===\n";
    if (!report.highWeight.empty()) {
        ss << std::setw(13) << "ID" << std::setw(8) << "Level" << std::setw(13) << "State" << std::setw(9) << "Weight"
           << "Title\n";
        ss << std::string(70, '-') << "\n";
        for (const auto& w : report.highWeight) {
            ss << std::setw(13) << w.id << std::setw(8) << LevelTag(w.level) << std::setw(13) << w.state
               << std::setw(9) << w.downstreamWeight << w.title << "\n";
        }
    }
    return ss.str();
}

nlohmann::json ReportRenderer::SearchJson(const std::vector<std::string>& terms, const std::vector<SearchHit>& hits) {
    nlohmann::json results = nlohmann::json::array();
    for (const auto& hit : hits) {
        results.push_back({
            {"id", hit.id},
            {"title", hit.title},
            {"level", LevelJson(hit.level)},
            {"state", hit.state},
            {"scope", domain::ScopeToString(hit.scope)},
            {"matched_sections", hit.matchedSections},
        });
    }
    std::vector<std::string> query;
    for (const auto& term : terms) query.push_back(ToLower(term));
    return {{"query", query}, {"count", hits.size()}, {"results", results}};
}

std::string ReportRenderer::SearchTable(const std::vector<std::string>& terms, const std::vector<SearchHit>& hits) {
    std::vector<std::string> query;
    for (const auto& term : terms) query.push_back(ToLower(term));

    std::stringstream ss;
    if (hits.empty()) {
        ss << "No decisions match: " << Join(query, " ") << "\n";
        return ss.str();
    }
    ss << "Found " << hits.size() << " decision(s) matching: " << Join(query, " ") << "\n\n";
    ss << std::left << std::setw(13) << "ID" << std::setw(8) << "Level" << std::setw(13) << "State" << std::setw(31)
       << "Sections" << "Title\n";
    ss << std::string(90, '-') << "\n";
    for (const auto& hit : hits) {
        ss << std::setw(13) << hit.id << std::setw(8) << LevelTag(hit.level) << std::setw(13) << hit.state
           << std::setw(31) << OrDash(Join(hit.matchedSections, ", ")) << hit.title << "\n";
    }
    return ss.str();
}

std::string ReportRenderer::ManifestText(const nlohmann::json& manifest) {
    std::stringstream ss;
    const auto& counts = manifest.at("counts");

    if (manifest.value("target", std::string()) == "human") {
        ss << "# Compile Manifest - Human Contract\n\n";
        for (const auto& [lvl, entry] : manifest.at("levels").items()) {
            ss << "## " << entry.value("name", std::string()) << " (Level " << lvl << ")\n\n";
            for (const auto& d : entry.at("committed")) ss << ManifestLine(d, false);
            if (entry.contains("suggested")) {
                ss << "  Suggested:\n";
                for (const auto& d : entry.at("suggested")) ss << ManifestLine(d, false);
            }
            ss << "\n";
        }
    } else {
        ss << "# Compile Manifest - Agent Contract\n\n";
        ss << "## Constitution (" << manifest.at("constitution").size() << " decisions)\n";
        for (const auto& d : manifest.at("constitution")) ss << ManifestLine(d, true);
        ss << "\n## High Stakes (" << manifest.at("high_stakes").size() << " decisions)\n";
        for (const auto& d : manifest.at("high_stakes")) ss << ManifestLine(d, true);
        ss << "\n## All Committed (" << manifest.at("all_committed").size() << " decisions)\n";
        for (const auto& d : manifest.at("all_committed")) ss << ManifestLine(d, false);
        ss << "\n";
        if (!manifest.at("all_suggested").empty()) {
            ss << "## All Suggested (" << manifest.at("all_suggested").size() << " decisions)\n";
            for (const auto& d : manifest.at("all_suggested")) ss << ManifestLine(d, false);
            ss << "\n";
        }
    }
    ss << "Total: " << counts.value("total", 0) << " decisions (" << counts.value("committed", 0) << " committed, "
       << counts.value("suggested", 0) << " suggested)\n";
    return ss.str();
}

std::string ReportRenderer::EditText(const std::string& id, const EditOutcome& outcome) {
    std::stringstream ss;
    ss << id << ": body edited (" << outcome.charsRemoved << " chars -> " << outcome.charsAdded << " chars)\n";
    if (!outcome.resolvedWarnings.empty()) {
        ss << "  Resolved " << outcome.resolvedWarnings.size() << " warning(s):\n";
        for (const auto& w : outcome.resolvedWarnings) ss << "    - " << w << "\n";
    }
    if (!outcome.newWarnings.empty()) {
        ss << "  Introduced " << outcome.newWarnings.size() << " new warning(s):\n";
        for (const auto& w : outcome.newWarnings) ss << "    + " << w << "\n";
    }
    if (!outcome.newErrors.empty()) {
        ss << "  INTRODUCED " << outcome.newErrors.size() << " new ERROR(s):\n";
        for (const auto& e : outcome.newErrors) ss << "    ! " << e << "\n";
    }
    if (outcome.newWarnings.empty() && outcome.newErrors.empty()) {
        ss << "  No new issues introduced.\n";
    }
    return ss.str();
}

} // namespace dnagraph::application
