/**
 * @file Decision.hpp
 * @brief Domain entity representing a decision record and its raw persisted form.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "value_objects/DecisionState.hpp"
#include "value_objects/DependencyRef.hpp"

namespace dnagraph::domain {

/**
 * @struct DecisionRecord
 * @brief One persisted document as produced by the record source.
 */
struct DecisionRecord {
    nlohmann::json fields; ///< Frontmatter field map (object with at least "id").
    std::string body;      ///< Markdown body below the frontmatter.
    std::string source;    ///< Where the record came from (file path).
};

/**
 * @class Decision
 * @brief A node of the decision graph.
 *
 * Level, state and stakes keep the text exactly as written so that the
 * validator can report invalid values; the typed accessors return nullopt
 * when the text is missing or outside the vocabulary.
 */
class Decision {
public:
    std::string id;
    std::string title;
    std::string date;
    std::string levelText;  ///< Raw level, empty when missing.
    std::string stateText;  ///< Raw state, empty when missing.
    std::string stakesText; ///< Raw stakes, empty when missing.
    std::vector<DependencyRef> dependsOn;
    std::vector<std::string> deps; ///< dependsOn normalized to flat IDs.
    Scope scope = Scope::Project;
    std::string body;
    std::string source;

    Decision() = default;

    Decision(std::string decisionId, std::string decisionTitle, int decisionLevel, DecisionState decisionState)
        : id(std::move(decisionId)),
          title(std::move(decisionTitle)),
          levelText(std::to_string(decisionLevel)),
          stateText(StateToString(decisionState)) {}

    /**
     * @brief Builds a node from a record's field map, tagging it with the partition scope.
     */
    static Decision FromRecord(const DecisionRecord& record, Scope scope);

    std::optional<int> level() const;
    std::optional<DecisionState> state() const { return StateFromString(stateText); }
    std::optional<Stakes> stakes() const { return StakesFromString(stakesText); }

    bool isCommitted() const { return stateText == "committed"; }

    /** @brief Replaces the dependency list, keeping the normalized view in sync. */
    void setDependencies(std::vector<DependencyRef> refs) {
        dependsOn = std::move(refs);
        deps = NormalizeDependencies(dependsOn);
    }

    void setDependencies(const std::vector<std::string>& ids) {
        std::vector<DependencyRef> refs;
        refs.reserve(ids.size());
        for (const auto& d : ids) refs.push_back(PlainRef{d});
        setDependencies(std::move(refs));
    }

    /** @brief Field map in persisted form (scope and body are not part of it). */
    nlohmann::json toFields() const;
};

} // namespace dnagraph::domain
