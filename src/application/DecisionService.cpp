/**
 * @file DecisionService.cpp
 * @brief Implementation of DecisionService.
 */

#include "application/DecisionService.hpp"
#include "application/GraphValidator.hpp"
#include "application/TextUtils.hpp"
#include "domain/GraphErrors.hpp"

#include <algorithm>
#include <iterator>
#include <map>
#include <set>
#include <sstream>

namespace dnagraph::application {

using domain::Decision;
using domain::DecisionGraph;
using domain::Scope;
using domain::ValidationReport;

namespace {

std::string DisplayValue(const nlohmann::json& value) {
    if (value.is_null()) return "(unset)";
    if (value.is_string()) return value.get<std::string>();
    if (value.is_array()) {
        std::vector<std::string> items;
        for (const auto& item : value) {
            if (item.is_string()) {
                items.push_back(item.get<std::string>());
            } else if (item.is_object() && item.contains("id") && item["id"].is_string()) {
                items.push_back(item["id"].get<std::string>());
            } else {
                items.push_back(item.dump());
            }
        }
        return items.empty() ? std::string("[]") : Join(items, ", ");
    }
    return value.dump();
}

nlohmann::json ToJson(const FieldValue& value) {
    return std::visit([](const auto& v) { return nlohmann::json(v); }, value);
}

std::vector<std::string> SortedDifference(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    std::set<std::string> left(a.begin(), a.end());
    std::set<std::string> right(b.begin(), b.end());
    std::vector<std::string> out;
    std::set_difference(left.begin(), left.end(), right.begin(), right.end(), std::back_inserter(out));
    return out;
}

std::string StateOrUnknown(const Decision& node) {
    return node.stateText.empty() ? std::string("unknown") : node.stateText;
}

std::string StateSummary(const std::vector<const Decision*>& nodes) {
    std::map<std::string, size_t> states;
    for (const auto* node : nodes) ++states[StateOrUnknown(*node)];
    if (states.empty()) return "-";

    std::vector<std::string> parts;
    for (const auto& [state, count] : states) {
        parts.push_back(count == nodes.size() ? "all `" + state + "`" : std::to_string(count) + " `" + state + "`");
    }
    return Join(parts, ", ");
}

// "2" for level 2 or 2.0, the raw text for an invalid level, "?" when missing.
std::string LevelText(const Decision& node) {
    if (auto level = node.level()) return std::to_string(*level);
    return node.levelText.empty() ? std::string("?") : node.levelText;
}

std::string LevelSummary(const std::vector<const Decision*>& nodes) {
    std::map<std::string, size_t> levels;
    for (const auto* node : nodes) ++levels[LevelText(*node)];
    std::vector<std::string> parts;
    for (const auto& [level, count] : levels) parts.push_back("L" + level + ": " + std::to_string(count));
    return Join(parts, ", ");
}

nlohmann::json NodeSummary(const Decision& node) {
    nlohmann::json summary;
    summary["id"] = node.id;
    summary["title"] = node.title;
    if (auto level = node.level()) {
        summary["level"] = *level;
    } else if (node.levelText.empty()) {
        summary["level"] = nullptr;
    } else {
        summary["level"] = node.levelText;
    }
    summary["state"] = StateOrUnknown(node);
    summary["stakes"] = node.stakesText.empty() ? nlohmann::json(nullptr) : nlohmann::json(node.stakesText);
    return summary;
}

} // namespace

DecisionService::DecisionService(std::unique_ptr<domain::DecisionRepository> repo, domain::LintConfig config)
    : m_repo(std::move(repo)), m_config(std::move(config)) {}

const std::vector<std::string>& DecisionService::SearchSections() {
    static const std::vector<std::string> sections = {"Decision", "Reasoning", "Assumptions", "Tradeoffs", "Detail"};
    return sections;
}

DecisionGraph DecisionService::LoadGraph() {
    std::vector<domain::DecisionRecord> constitution;
    if (m_repo->hasPartition(Scope::Constitution)) {
        constitution = m_repo->fetchPartition(Scope::Constitution);
    }
    return DecisionGraph::Load(constitution, m_repo->fetchPartition(Scope::Project));
}

ValidationReport DecisionService::Validate() {
    return Validate(LoadGraph());
}

ValidationReport DecisionService::Validate(const DecisionGraph& graph) const {
    return GraphValidator(m_config).Validate(graph);
}

CascadeResult DecisionService::Cascade(const std::string& id, bool reverse) {
    return CascadeService::Compute(LoadGraph(), id, reverse ? Direction::Upstream : Direction::Downstream);
}

FrontierReport DecisionService::Frontier(int topN) {
    return FrontierService::Analyze(LoadGraph(), topN);
}

CreateOutcome DecisionService::Create(const std::string& id, const NewDecision& input, Scope scope) {
    DecisionGraph graph = LoadGraph();
    CreateOutcome outcome = MutationValidator::ValidateForCreate(id, input, graph, scope);
    if (!outcome.report.ok() || !outcome.decision) return outcome;

    if (auto occupant = m_repo->occupantOf(scope, id)) {
        outcome.report.addError(id + ": target file already holds " +
                                (occupant->empty() ? std::string("another document") : *occupant));
        return outcome;
    }

    const Decision& decision = *outcome.decision;
    if (!m_repo->saveRecord(scope, id, decision.toFields(), decision.body)) {
        outcome.report.addError(id + ": failed to write record");
    }
    return outcome;
}

SetOutcome DecisionService::Set(const std::string& id, const std::string& field, const FieldValue& value) {
    SetOutcome outcome;
    DecisionGraph graph = LoadGraph();
    outcome.report = MutationValidator::ValidateForSet(id, field, value, graph);
    if (!outcome.report.ok()) return outcome;

    const Decision& node = graph.at(id);
    auto record = m_repo->readRecord(node.scope, id);
    if (!record) {
        outcome.report.addError(id + ": could not read record from " + node.source);
        return outcome;
    }

    nlohmann::json fields = record->fields.is_object() ? record->fields : nlohmann::json::object();
    outcome.oldValue = DisplayValue(fields.contains(field) ? fields[field] : nlohmann::json(nullptr));
    fields[field] = ToJson(value);
    outcome.newValue = DisplayValue(fields[field]);

    if (!m_repo->saveRecord(node.scope, id, fields, record->body)) {
        outcome.report.addError(id + ": failed to write record");
    }
    return outcome;
}

EditOutcome DecisionService::Edit(const std::string& id, const std::string& oldText, const std::string& newText) {
    EditOutcome outcome;
    if (oldText.empty()) {
        outcome.report.addError(id + ": old text must not be empty");
        return outcome;
    }
    DecisionGraph before = LoadGraph();

    const Decision* node = before.find(id);
    if (!node) {
        outcome.report.addError(id + ": not found in graph");
        return outcome;
    }
    auto record = m_repo->readRecord(node->scope, id);
    if (!record) {
        outcome.report.addError(id + ": could not read record from " + node->source);
        return outcome;
    }

    size_t matches = CountOccurrences(record->body, oldText);
    if (matches == 0) {
        outcome.report.addError("old text not found in body of " + id);
        return outcome;
    }
    if (matches > 1) {
        outcome.report.addError("old text matches " + std::to_string(matches) + " locations in " + id +
                                " body - must be unique");
        return outcome;
    }

    GraphValidator validator(m_config);
    ValidationReport pre = validator.Validate(before);

    std::string body = record->body;
    body.replace(body.find(oldText), oldText.size(), newText);
    if (!m_repo->saveRecord(node->scope, id, record->fields, body)) {
        outcome.report.addError(id + ": failed to write record");
        return outcome;
    }
    outcome.written = true;
    outcome.charsRemoved = oldText.size();
    outcome.charsAdded = newText.size();

    ValidationReport post = validator.Validate(LoadGraph());
    outcome.newWarnings = SortedDifference(post.warnings, pre.warnings);
    outcome.resolvedWarnings = SortedDifference(pre.warnings, post.warnings);
    outcome.newErrors = SortedDifference(post.errors, pre.errors);
    return outcome;
}

std::vector<SearchHit> DecisionService::Search(const std::vector<std::string>& terms) {
    std::vector<std::string> lowered;
    for (const auto& term : terms) lowered.push_back(ToLower(term));

    auto containsAny = [&lowered](const std::string& haystack) {
        return std::any_of(lowered.begin(), lowered.end(),
                           [&haystack](const std::string& t) { return haystack.find(t) != std::string::npos; });
    };

    std::vector<SearchHit> hits;
    DecisionGraph graph = LoadGraph();
    for (const auto& [nid, node] : graph.nodes()) {
        std::string title = ToLower(node.title);
        if (!containsAny(title) && !containsAny(ToLower(node.body))) continue;

        SearchHit hit;
        hit.id = nid;
        hit.title = node.title;
        hit.level = node.level();
        hit.state = StateOrUnknown(node);
        hit.scope = node.scope;
        if (containsAny(title)) hit.matchedSections.push_back("title");
        for (const auto& section : SearchSections()) {
            if (!HasHeading(node.body, section)) continue;
            if (containsAny(ToLower(ExtractSection(node.body, section)))) hit.matchedSections.push_back(section);
        }
        hits.push_back(std::move(hit));
    }
    return hits;
}

std::string DecisionService::RenderIndex(const DecisionGraph& graph, Scope scope, const std::string& title) {
    std::vector<const Decision*> subset;
    for (const auto& entry : graph.nodes()) {
        if (entry.second.scope == scope) subset.push_back(&entry.second);
    }

    std::stringstream ss;
    ss << "# " << title << "\n\n";
    ss << "Derived index. Regenerate via `dna-graph index`. Do not edit directly.\n\n";
    ss << "**Total:** " << subset.size() << " decisions\n\n";
    ss << "| ID | Title | Level | State | Stakes | Depends On |\n";
    ss << "|----|-------|-------|-------|--------|------------|\n";
    for (const auto* node : subset) {
        std::string escaped;
        for (char c : node->title) {
            if (c == '|') escaped += '\\';
            escaped += c;
        }
        const auto& deps = DecisionGraph::GetDepsList(*node);
        ss << "| " << node->id << " | " << escaped << " | " << LevelText(*node) << " | " << node->stateText
           << " | " << node->stakesText << " | " << (deps.empty() ? std::string("-") : Join(deps, ", ")) << " |\n";
    }
    return ss.str();
}

IndexResult DecisionService::RebuildIndex() {
    IndexResult result;
    DecisionGraph graph = LoadGraph();
    for (const auto& entry : graph.nodes()) {
        if (entry.second.scope == Scope::Constitution) {
            ++result.constitutionCount;
        } else {
            ++result.projectCount;
        }
    }

    if (m_repo->hasPartition(Scope::Constitution) && result.constitutionCount > 0) {
        result.constitutionWritten = m_repo->writeDocument(
            Scope::Constitution, "INDEX.md", RenderIndex(graph, Scope::Constitution, "Constitution Index"));
        result.ok = result.constitutionWritten;
    }
    if (!m_repo->writeDocument(Scope::Project, "INDEX.md", RenderIndex(graph, Scope::Project, "DNA Index"))) {
        result.ok = false;
    }
    return result;
}

std::string DecisionService::ExtractManualFlags(const std::string& healthContent) {
    std::string collected;
    bool inside = false;
    for (const auto& line : SplitLines(healthContent)) {
        if (StartsWith(line, "## ")) {
            if (inside) break;
            inside = TrimRight(line) == "## Manual Flags";
            continue;
        }
        if (inside) collected += line + "\n";
    }
    return Trim(collected);
}

HealthResult DecisionService::RebuildHealth() {
    HealthResult result;
    DecisionGraph graph = LoadGraph();

    std::vector<const Decision*> constitution;
    std::vector<const Decision*> project;
    for (const auto& entry : graph.nodes()) {
        (entry.second.scope == Scope::Constitution ? constitution : project).push_back(&entry.second);
    }

    const std::string today = Today();
    std::stringstream ss;
    ss << "# System Health\n\n";
    ss << "Last updated: " << today << "\n\n";
    ss << "## Node Counts\n\n";
    if (!constitution.empty()) {
        ss << "### Constitution\n";
        ss << "- Decisions: " << constitution.size() << " - " << StateSummary(constitution) << "\n";
        ss << "- Levels: " << LevelSummary(constitution) << "\n\n";
        ss << "### DNA\n";
    }
    ss << "- Decisions: " << project.size() << " - " << StateSummary(project) << "\n";
    ss << "- Levels: " << LevelSummary(project) << "\n";
    ss << "- **Total: " << graph.size() << " decisions**\n\n";

    std::vector<std::string> flagged;
    for (const char* state : {"suggested", "superseded"}) {
        std::vector<std::string> ids;
        for (const auto& [nid, node] : graph.nodes()) {
            if (node.stateText == state) ids.push_back(nid);
        }
        if (!ids.empty()) {
            flagged.push_back(std::to_string(ids.size()) + " decisions at `" + state + "` (" + Join(ids, ", ") + ")");
        }
    }
    ValidationReport report = Validate(graph);
    if (!report.errors.empty()) {
        flagged.push_back(std::to_string(report.errors.size()) +
                          " validation error(s) - run `dna-graph validate` for details");
    }

    ss << "## Flagged Items\n\n";
    if (flagged.empty()) {
        ss << "- No issues found.\n";
    } else {
        for (const auto& item : flagged) ss << "- " << item << "\n";
    }
    ss << "\n";

    if (auto existing = m_repo->readRootDocument("HEALTH.md")) {
        std::string manual = ExtractManualFlags(*existing);
        if (!manual.empty()) {
            ss << "## Manual Flags\n\n" << manual << "\n\n";
        }
    }

    ss << "## Last Session\n\n";
    ss << today << " - Health regenerated by dna-graph\n";

    result.content = ss.str();
    result.totalDecisions = graph.size();
    result.flaggedItems = flagged.size();
    result.ok = m_repo->writeRootDocument("HEALTH.md", result.content);
    return result;
}

nlohmann::json DecisionService::CompileManifest(ManifestTarget target) {
    DecisionGraph graph = LoadGraph();

    std::map<std::string, int> byLevel;
    std::map<std::string, int> byState;
    for (const auto& [nid, node] : graph.nodes()) {
        ++byLevel[LevelText(node)];
        ++byState[StateOrUnknown(node)];
    }
    nlohmann::json counts;
    counts["total"] = graph.size();
    counts["committed"] = byState["committed"];
    counts["suggested"] = byState["suggested"];
    counts["superseded"] = byState["superseded"];
    counts["by_level"] = nlohmann::json::object();
    for (const auto& [level, count] : byLevel) counts["by_level"][level] = count;

    nlohmann::json manifest;
    if (target == ManifestTarget::Human) {
        manifest["target"] = "human";
        nlohmann::json levels = nlohmann::json::object();
        for (int lvl = domain::kMinLevel; lvl <= domain::kMaxLevel; ++lvl) {
            nlohmann::json committed = nlohmann::json::array();
            nlohmann::json suggested = nlohmann::json::array();
            for (const auto& [nid, node] : graph.nodes()) {
                if (node.level() != lvl) continue;
                if (node.isCommitted()) {
                    committed.push_back(NodeSummary(node));
                } else if (node.stateText == "suggested") {
                    suggested.push_back(NodeSummary(node));
                }
            }
            nlohmann::json entry;
            entry["name"] = domain::LevelName(lvl);
            entry["committed"] = committed;
            if (!suggested.empty()) entry["suggested"] = suggested;
            levels[std::to_string(lvl)] = entry;
        }
        manifest["levels"] = levels;
    } else {
        manifest["target"] = "agent";
        nlohmann::json constitution = nlohmann::json::array();
        nlohmann::json highStakes = nlohmann::json::array();
        nlohmann::json allCommitted = nlohmann::json::array();
        nlohmann::json allSuggested = nlohmann::json::array();
        for (const auto& [nid, node] : graph.nodes()) {
            nlohmann::json summary = NodeSummary(node);
            if (node.scope == Scope::Constitution) constitution.push_back(summary);
            if (node.stakesText == "high") highStakes.push_back(summary);
            if (node.isCommitted()) {
                allCommitted.push_back(summary);
            } else if (node.stateText == "suggested") {
                allSuggested.push_back(summary);
            }
        }
        manifest["constitution"] = constitution;
        manifest["high_stakes"] = highStakes;
        manifest["all_committed"] = allCommitted;
        manifest["all_suggested"] = allSuggested;
    }
    manifest["counts"] = counts;
    return manifest;
}

} // namespace dnagraph::application
