/**
 * @file MutationValidator.cpp
 * @brief Implementation of the create and set pre-validators.
 */

#include "application/MutationValidator.hpp"
#include "application/GraphValidator.hpp"
#include "application/TextUtils.hpp"

#include <map>
#include <regex>
#include <set>

namespace dnagraph::application {

using domain::Decision;
using domain::DecisionGraph;
using domain::DecisionState;
using domain::Scope;
using domain::ValidationReport;

const char* const kScaffoldBody =
    "\n## Decision\n\n\n\n## Reasoning\n\n\n\n## Assumptions\n\n\n\n## Tradeoffs\n\n";

namespace {

std::string StateOrUnknown(const Decision& node) {
    return node.stateText.empty() ? std::string("unknown") : node.stateText;
}

bool IsLegalStateChange(const std::string& from, const std::string& to) {
    if (from == to) return true;
    auto fromState = domain::StateFromString(from);
    auto toState = domain::StateFromString(to);
    if (!fromState || !toState) return false;
    return domain::IsLegalTransition(*fromState, *toState);
}

const char* FieldTypeName(const std::string& field) {
    if (field == "depends_on") return "a list of IDs";
    if (field == "level") return "an integer";
    return "text";
}

} // namespace

bool MutationValidator::IsWellFormedId(const std::string& id) {
    static const std::regex pattern(R"(^DEC-\d{3}$)");
    return std::regex_match(id, pattern);
}

void MutationValidator::CheckDependencies(const std::string& id, std::optional<int> level,
                                          const std::vector<std::string>& deps, const DecisionGraph& graph,
                                          Scope scope, ValidationReport& report) {
    for (const auto& dep : deps) {
        if (dep == id) {
            report.addError(id + ": self-dependency");
            continue;
        }
        const Decision* upstream = graph.find(dep);
        if (!upstream) {
            report.addError(id + ": depends_on references non-existent " + dep);
            continue;
        }
        auto depLevel = upstream->level();
        if (level && depLevel && *depLevel > *level) {
            report.addWarning(LevelInversionMessage(id, *level, dep, *depLevel));
        }
    }

    if (scope == Scope::Constitution) {
        for (const auto& dep : deps) {
            const Decision* upstream = graph.find(dep);
            if (upstream && upstream->scope == Scope::Project) {
                report.addError(IronRuleMessage(id, dep));
            }
        }
    }
}

std::vector<std::string> MutationValidator::FindCyclicDependencies(const std::string& id,
                                                                   const std::vector<std::string>& proposed,
                                                                   const DecisionGraph& graph) {
    // The node's current edges are replaced by the proposed ones. Edges of
    // other nodes pointing at id count even when id is not loaded yet.
    std::map<std::string, std::set<std::string>> adj;
    for (const auto& [nid, node] : graph.nodes()) {
        if (nid == id) continue;
        for (const auto& dep : DecisionGraph::GetDepsList(node)) {
            if (graph.contains(dep) || dep == id) adj[nid].insert(dep);
        }
    }
    adj[id] = std::set<std::string>(proposed.begin(), proposed.end());

    std::vector<std::string> hits;
    for (const auto& start : proposed) {
        std::set<std::string> visited;
        std::vector<std::string> stack{start};
        while (!stack.empty()) {
            std::string current = stack.back();
            stack.pop_back();
            if (current == id) {
                hits.push_back(start);
                break;
            }
            if (!visited.insert(current).second) continue;
            auto it = adj.find(current);
            if (it == adj.end()) continue;
            stack.insert(stack.end(), it->second.begin(), it->second.end());
        }
    }
    return hits;
}

CreateOutcome MutationValidator::ValidateForCreate(const std::string& id, const NewDecision& input,
                                                   const DecisionGraph& graph, Scope targetScope) {
    CreateOutcome outcome;
    ValidationReport& report = outcome.report;

    if (!IsWellFormedId(id)) {
        report.addError(id + ": ID must match DEC-NNN (3 digits)");
    }
    if (const Decision* existing = graph.find(id)) {
        report.addError(id + ": ID already exists at " + (existing->source.empty() ? "?" : existing->source));
    }
    if (Trim(input.title).empty()) {
        report.addError(id + ": title cannot be empty");
    }
    if (!domain::IsValidLevel(input.level)) {
        report.addError(id + ": invalid level '" + std::to_string(input.level) + "' (must be 1-4)");
    }
    if (!domain::StateFromString(input.state)) {
        report.addError(id + ": invalid state '" + input.state + "' (must be suggested/committed/superseded)");
    }
    if (!input.stakes.empty() && !domain::StakesFromString(input.stakes)) {
        report.addError(id + ": invalid stakes '" + input.stakes + "' (must be high/medium/low)");
    }

    CheckDependencies(id, input.level, input.dependsOn, graph, targetScope, report);

    if (input.state == "committed") {
        for (const auto& dep : input.dependsOn) {
            const Decision* upstream = graph.find(dep);
            if (upstream && !upstream->isCommitted()) {
                report.addError(id + ": cannot create as committed - upstream " + dep + " is '" +
                                StateOrUnknown(*upstream) + "'");
            }
        }
    }

    if (!input.dependsOn.empty() && report.ok()) {
        for (const auto& dep : FindCyclicDependencies(id, input.dependsOn, graph)) {
            report.addError(id + ": adding this node would create a cycle through " + dep);
        }
    }

    if (report.ok()) {
        Decision decision(id, Trim(input.title), input.level, *domain::StateFromString(input.state));
        decision.date = Today();
        decision.stakesText = input.stakes;
        decision.setDependencies(input.dependsOn);
        decision.scope = targetScope;
        decision.body = kScaffoldBody;
        outcome.decision = std::move(decision);
    }
    return outcome;
}

ValidationReport MutationValidator::ValidateForSet(const std::string& id, const std::string& field,
                                                   const FieldValue& value, const DecisionGraph& graph) {
    ValidationReport report;

    const Decision* node = graph.find(id);
    if (!node) {
        report.addError(id + ": not found in graph");
        return report;
    }

    static const std::set<std::string> kKnownFields = {"state", "depends_on", "level", "stakes", "title"};
    if (kKnownFields.count(field) == 0) {
        report.addError("Unknown field: " + field + " (valid: state, depends_on, level, stakes, title)");
        return report;
    }

    const auto* text = std::get_if<std::string>(&value);
    const auto* number = std::get_if<int>(&value);
    const auto* list = std::get_if<std::vector<std::string>>(&value);
    bool typeOk = (field == "depends_on") ? list != nullptr : (field == "level") ? number != nullptr : text != nullptr;
    if (!typeOk) {
        report.addError(id + ": " + field + " expects " + FieldTypeName(field));
        return report;
    }

    if (field == "state") {
        std::string from = node->stateText.empty() ? std::string("suggested") : node->stateText;
        if (!IsLegalStateChange(from, *text)) {
            report.addError(id + ": Illegal state transition: " + from + " -> " + *text);
        }
        if (*text == "committed" && report.ok()) {
            for (const auto& dep : DecisionGraph::GetDepsList(*node)) {
                const Decision* upstream = graph.find(dep);
                if (upstream && !upstream->isCommitted()) {
                    report.addError(id + ": cannot commit - upstream " + dep + " is '" +
                                    StateOrUnknown(*upstream) + "'");
                }
            }
        }
    } else if (field == "depends_on") {
        CheckDependencies(id, node->level(), *list, graph, node->scope, report);
        if (!list->empty() && report.ok()) {
            for (const auto& dep : FindCyclicDependencies(id, *list, graph)) {
                report.addError(id + ": this change would create a cycle through " + dep);
            }
        }
    } else if (field == "level") {
        if (!domain::IsValidLevel(*number)) {
            report.addError(id + ": invalid level '" + std::to_string(*number) + "' (must be 1-4)");
        } else {
            for (const auto& dep : DecisionGraph::GetDepsList(*node)) {
                const Decision* upstream = graph.find(dep);
                if (!upstream) continue;
                auto depLevel = upstream->level();
                if (depLevel && *depLevel > *number) {
                    report.addWarning(LevelInversionMessage(id, *number, dep, *depLevel));
                }
            }
        }
    } else if (field == "stakes") {
        if (!domain::StakesFromString(*text)) {
            report.addError(id + ": invalid stakes '" + *text + "' (must be high/medium/low)");
        }
    } else if (field == "title") {
        if (Trim(*text).empty()) {
            report.addError(id + ": title cannot be empty");
        }
    }
    return report;
}

} // namespace dnagraph::application
