/**
 * @file DependencyRef.hpp
 * @brief Value Object for a single depends_on entry.
 */

#pragma once

#include <string>
#include <variant>
#include <vector>

namespace dnagraph::domain {

/**
 * @struct PlainRef
 * @brief Bare ID entry: "- DEC-001".
 */
struct PlainRef {
    std::string id;
};

/**
 * @struct StructuredRef
 * @brief Mapping entry: "- {id: DEC-001, note: ...}". Only the id takes part in the graph.
 */
struct StructuredRef {
    std::string id;
    std::string note;
};

using DependencyRef = std::variant<PlainRef, StructuredRef>;

inline const std::string& RefId(const DependencyRef& ref) {
    return std::visit([](const auto& r) -> const std::string& { return r.id; }, ref);
}

/**
 * @brief Flattens raw dependency entries to their IDs, dropping entries with an empty id.
 */
inline std::vector<std::string> NormalizeDependencies(const std::vector<DependencyRef>& refs) {
    std::vector<std::string> ids;
    ids.reserve(refs.size());
    for (const auto& ref : refs) {
        const std::string& id = RefId(ref);
        if (!id.empty()) ids.push_back(id);
    }
    return ids;
}

} // namespace dnagraph::domain
