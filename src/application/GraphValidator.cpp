/**
 * @file GraphValidator.cpp
 * @brief Implementation of whole-graph validation.
 */

#include "application/GraphValidator.hpp"
#include "application/TextUtils.hpp"

#include <algorithm>
#include <map>
#include <regex>
#include <set>
#include <sstream>

namespace dnagraph::application {

using domain::DecisionGraph;
using domain::Decision;
using domain::Scope;
using domain::ValidationReport;

namespace {

const std::regex& DecisionRefPattern() {
    static const std::regex re(R"(\bDEC-(\d{3})\b)");
    return re;
}

const std::regex& SupersedesPattern() {
    static const std::regex re(R"([Ss]upersedes?\s+(DEC-\d{3}))");
    return re;
}

std::string StateOrUnknown(const Decision& node) {
    return node.stateText.empty() ? std::string("unknown") : node.stateText;
}

std::set<std::string> UniqueMatches(const std::string& text, const std::regex& re, int group = 0) {
    std::set<std::string> found;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), re); it != std::sregex_iterator(); ++it) {
        found.insert((*it)[group].str());
    }
    return found;
}

} // namespace

std::string LevelInversionMessage(const std::string& id, int level, const std::string& depId, int depLevel) {
    return id + " (level " + std::to_string(level) + "): depends on " + depId +
           " (level " + std::to_string(depLevel) + ") - level inversion";
}

std::string IronRuleMessage(const std::string& id, const std::string& depId) {
    return id + ": constitution depends on project " + depId + " (iron rule violation)";
}

const std::vector<std::string>& GraphValidator::RequiredSections() {
    static const std::vector<std::string> sections = {"Decision", "Reasoning", "Assumptions", "Tradeoffs"};
    return sections;
}

ValidationReport GraphValidator::Validate(const DecisionGraph& graph) const {
    ValidationReport report;
    const auto reverse = graph.reverseAdjacency();

    CheckFields(graph, report);
    for (auto& cycle : FindCycles(graph)) {
        report.addError(std::move(cycle));
    }
    CheckOrphans(graph, reverse, report);
    CheckLevelOrdering(graph, report);
    CheckIronRule(graph, report);
    CheckStateHealth(graph, report);
    LintBodies(graph, report);
    CheckMissingDeps(graph, reverse, report);
    return report;
}

void GraphValidator::CheckFields(const DecisionGraph& graph, ValidationReport& report) const {
    for (const auto& [nid, node] : graph.nodes()) {
        if (!StartsWith(nid, "DEC-")) {
            report.addError(nid + ": ID must start with DEC-");
        }

        if (node.title.empty()) report.addWarning(nid + ": missing title");
        if (node.date.empty()) report.addWarning(nid + ": missing date");

        if (node.levelText.empty()) {
            report.addError(nid + ": missing level");
        } else if (!node.level() || !domain::IsValidLevel(*node.level())) {
            report.addError(nid + ": invalid level '" + node.levelText + "' (must be 1-4)");
        }

        if (node.stateText.empty()) {
            report.addWarning(nid + ": missing state");
        } else if (!node.state()) {
            report.addError(nid + ": invalid state '" + node.stateText +
                            "' (must be suggested/committed/superseded)");
        }

        if (!node.stakesText.empty() && !node.stakes()) {
            report.addError(nid + ": invalid stakes '" + node.stakesText + "' (must be high/medium/low)");
        }

        for (const auto& dep : DecisionGraph::GetDepsList(node)) {
            if (dep == nid) {
                report.addError(nid + ": self-dependency");
            } else if (!graph.contains(dep)) {
                report.addError(nid + ": depends_on references non-existent " + dep);
            }
        }

        for (const auto& section : RequiredSections()) {
            if (!HasHeading(node.body, section)) {
                report.addWarning(nid + ": missing required section ## " + section);
            }
        }
    }
}

std::vector<std::string> GraphValidator::FindCycles(const DecisionGraph& graph) {
    enum class Color { White, Gray, Black };

    std::map<std::string, Color> color;
    std::map<std::string, std::vector<std::string>> adj;
    for (const auto& [nid, node] : graph.nodes()) {
        color[nid] = Color::White;
        auto& out = adj[nid];
        for (const auto& dep : DecisionGraph::GetDepsList(node)) {
            // Self edges are reported as self-dependency, not as cycles.
            if (dep != nid && graph.contains(dep)) out.push_back(dep);
        }
    }

    struct Frame {
        const std::string* node;
        size_t next;
    };

    std::vector<std::string> cycles;
    for (const auto& entry : graph.nodes()) {
        const std::string& root = entry.first;
        if (color[root] != Color::White) continue;

        std::vector<Frame> stack{{&root, 0}};
        std::vector<std::string> path{root};
        color[root] = Color::Gray;

        while (!stack.empty()) {
            Frame& top = stack.back();
            const auto& out = adj.at(*top.node);
            if (top.next >= out.size()) {
                color[*top.node] = Color::Black;
                stack.pop_back();
                path.pop_back();
                continue;
            }

            const std::string& next = out[top.next++];
            if (color[next] == Color::Gray) {
                auto start = std::find(path.begin(), path.end(), next);
                std::string message = "Cycle detected: ";
                for (auto it = start; it != path.end(); ++it) message += *it + " -> ";
                message += next;
                cycles.push_back(message);
                // First cycle per root only; retire everything still on the stack.
                for (const auto& p : path) color[p] = Color::Black;
                break;
            }
            if (color[next] == Color::White) {
                color[next] = Color::Gray;
                path.push_back(next);
                stack.push_back({&next, 0});
            }
        }
    }
    return cycles;
}

void GraphValidator::CheckOrphans(const DecisionGraph& graph, const DecisionGraph::Adjacency& reverse,
                                  ValidationReport& report) const {
    for (const auto& [nid, node] : graph.nodes()) {
        bool hasUpstream = !DecisionGraph::GetDepsList(node).empty();
        auto it = reverse.find(nid);
        bool hasDownstream = it != reverse.end() && !it->second.empty();
        if (!hasUpstream && !hasDownstream) {
            report.addWarning(nid + ": orphan (no upstream or downstream edges)");
        }
    }
}

void GraphValidator::CheckLevelOrdering(const DecisionGraph& graph, ValidationReport& report) const {
    for (const auto& [nid, node] : graph.nodes()) {
        auto myLevel = node.level();
        if (!myLevel) continue;
        for (const auto& dep : DecisionGraph::GetDepsList(node)) {
            const Decision* upstream = graph.find(dep);
            if (!upstream) continue;
            auto depLevel = upstream->level();
            if (depLevel && *depLevel > *myLevel) {
                report.addWarning(LevelInversionMessage(nid, *myLevel, dep, *depLevel));
            }
        }
    }
}

void GraphValidator::CheckIronRule(const DecisionGraph& graph, ValidationReport& report) const {
    for (const auto& [nid, node] : graph.nodes()) {
        if (node.scope != Scope::Constitution) continue;
        for (const auto& dep : DecisionGraph::GetDepsList(node)) {
            const Decision* upstream = graph.find(dep);
            if (upstream && upstream->scope == Scope::Project) {
                report.addError(IronRuleMessage(nid, dep));
            }
        }
    }
}

void GraphValidator::CheckStateHealth(const DecisionGraph& graph, ValidationReport& report) const {
    for (const auto& [nid, node] : graph.nodes()) {
        if (!node.isCommitted()) continue;
        for (const auto& dep : DecisionGraph::GetDepsList(node)) {
            const Decision* upstream = graph.find(dep);
            if (!upstream) continue;
            if (upstream->stateText == "superseded") {
                report.addError(nid + ": committed but upstream " + dep + " is superseded");
            } else if (upstream->stateText == "suggested") {
                report.addError(nid + ": committed but upstream " + dep + " is still suggested");
            }
        }
    }
}

void GraphValidator::LintBodies(const DecisionGraph& graph, ValidationReport& report) const {
    std::vector<std::pair<std::string, std::regex>> stalePatterns;
    for (const auto& prefix : m_config.stalePrefixes) {
        stalePatterns.emplace_back(prefix, std::regex("\\b" + EscapeRegex(prefix) + "-\\d{3}\\b"));
    }

    const bool termEnabled = !m_config.flaggedTerm.empty();
    std::regex termPattern;
    if (termEnabled) {
        termPattern = std::regex("\\b" + EscapeRegex(m_config.flaggedTerm) + "\\b", std::regex::icase);
    }

    for (const auto& [nid, node] : graph.nodes()) {
        const std::string& body = node.body;
        if (body.empty()) continue;

        for (const auto& [prefix, pattern] : stalePatterns) {
            auto stale = UniqueMatches(body, pattern);
            if (!stale.empty()) {
                report.addWarning(nid + " [stale-ref]: body references " + std::to_string(stale.size()) +
                                  " stale " + prefix + " ID(s) (" + Join(stale, ", ") + ")");
            }
        }

        std::vector<std::string> broken;
        for (const auto& num : UniqueMatches(body, DecisionRefPattern(), 1)) {
            std::string refId = "DEC-" + num;
            if (refId != nid && !graph.contains(refId)) broken.push_back(refId);
        }
        if (!broken.empty()) {
            report.addWarning(nid + " [broken-ref]: body references non-existent " + Join(broken, ", "));
        }

        for (auto it = std::sregex_iterator(body.begin(), body.end(), SupersedesPattern());
             it != std::sregex_iterator(); ++it) {
            std::string target = (*it)[1].str();
            const Decision* superseded = graph.find(target);
            if (superseded && superseded->stateText != "superseded") {
                report.addWarning(nid + " [supersession]: claims to supersede " + target + ", but " + target +
                                  " state is '" + StateOrUnknown(*superseded) + "'");
            }
        }

        if (termEnabled && m_config.termExemptIds.count(nid) == 0) {
            int termLines = 0;
            for (const auto& line : SplitLines(body)) {
                if (!std::regex_search(line, termPattern)) continue;
                bool exempt = std::any_of(m_config.termExemptions.begin(), m_config.termExemptions.end(),
                                          [&line](const std::regex& re) { return std::regex_search(line, re); });
                if (!exempt) ++termLines;
            }
            if (termLines > 0) {
                report.addWarning(nid + " [terminology]: " + std::to_string(termLines) +
                                  " line(s) with unexempted '" + m_config.flaggedTerm + "' in body text");
            }
        }

        std::vector<std::string> artifacts;
        for (const auto& artifact : m_config.deletedArtifacts) {
            if (std::regex_search(body, artifact.pattern)) artifacts.push_back(artifact.label);
        }
        if (!artifacts.empty()) {
            report.addWarning(nid + " [deleted-artifact]: body references deleted artifacts: " +
                              Join(artifacts, ", "));
        }
    }
}

void GraphValidator::CheckMissingDeps(const DecisionGraph& graph, const DecisionGraph::Adjacency& reverse,
                                      ValidationReport& report) const {
    for (const auto& [nid, node] : graph.nodes()) {
        auto level = node.level();
        if (!level || *level < 2) continue;
        if (!DecisionGraph::GetDepsList(node).empty()) continue;

        auto it = reverse.find(nid);
        bool hasDownstream = it != reverse.end() && !it->second.empty();
        if (!hasDownstream) continue; // already reported as an orphan

        report.addWarning(nid + " [missing-dep]: no depends_on - L" + std::to_string(*level) +
                          " decisions should have upstream dependencies");
    }
}

} // namespace dnagraph::application
