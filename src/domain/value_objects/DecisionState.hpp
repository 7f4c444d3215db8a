/**
 * @file DecisionState.hpp
 * @brief Value Objects for the lifecycle state, hierarchy level, stakes and scope of a decision.
 */

#pragma once

#include <optional>
#include <string>

namespace dnagraph::domain {

/**
 * @enum DecisionState
 * @brief Lifecycle state of a decision. Superseded is terminal.
 */
enum class DecisionState {
    Suggested,  ///< Proposed, not yet binding.
    Committed,  ///< Binding; every upstream must be committed as well.
    Superseded  ///< Replaced. Soft delete.
};

/**
 * @enum Stakes
 * @brief Optional impact rating of a decision.
 */
enum class Stakes {
    High,
    Medium,
    Low
};

/**
 * @enum Scope
 * @brief Partition a decision was loaded from.
 */
enum class Scope {
    Constitution, ///< Upstream, authoritative partition.
    Project       ///< Project partition. May depend on constitution, never the reverse.
};

constexpr int kMinLevel = 1;
constexpr int kMaxLevel = 4;

inline std::string StateToString(DecisionState state) {
    switch (state) {
        case DecisionState::Suggested: return "suggested";
        case DecisionState::Committed: return "committed";
        case DecisionState::Superseded: return "superseded";
        default: return "unknown";
    }
}

inline std::optional<DecisionState> StateFromString(const std::string& text) {
    if (text == "suggested") return DecisionState::Suggested;
    if (text == "committed") return DecisionState::Committed;
    if (text == "superseded") return DecisionState::Superseded;
    return std::nullopt;
}

inline std::string StakesToString(Stakes stakes) {
    switch (stakes) {
        case Stakes::High: return "high";
        case Stakes::Medium: return "medium";
        case Stakes::Low: return "low";
        default: return "unknown";
    }
}

inline std::optional<Stakes> StakesFromString(const std::string& text) {
    if (text == "high") return Stakes::High;
    if (text == "medium") return Stakes::Medium;
    if (text == "low") return Stakes::Low;
    return std::nullopt;
}

inline std::string ScopeToString(Scope scope) {
    return scope == Scope::Constitution ? "constitution" : "project";
}

inline bool IsValidLevel(int level) {
    return level >= kMinLevel && level <= kMaxLevel;
}

/**
 * @brief Display name of a hierarchy level (1 = Identity ... 4 = Tactics).
 */
inline std::string LevelName(int level) {
    switch (level) {
        case 1: return "Identity";
        case 2: return "Direction";
        case 3: return "Strategy";
        case 4: return "Tactics";
        default: return "Unknown";
    }
}

/**
 * @brief Checks a state change against the transition lattice.
 *
 * suggested -> committed, suggested -> superseded and committed -> superseded
 * are the only legal changes. Same-state is a no-op and always legal.
 */
inline bool IsLegalTransition(DecisionState from, DecisionState to) {
    if (from == to) return true;
    if (from == DecisionState::Suggested) {
        return to == DecisionState::Committed || to == DecisionState::Superseded;
    }
    if (from == DecisionState::Committed) {
        return to == DecisionState::Superseded;
    }
    return false;
}

} // namespace dnagraph::domain
