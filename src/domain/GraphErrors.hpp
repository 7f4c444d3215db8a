/**
 * @file GraphErrors.hpp
 * @brief Exceptions raised by graph loading and lookups.
 */

#pragma once

#include <stdexcept>
#include <string>

#include "value_objects/DecisionState.hpp"

namespace dnagraph::domain {

/**
 * @class IdCollisionError
 * @brief The same ID was loaded twice. Fatal: the whole operation aborts.
 */
class IdCollisionError : public std::runtime_error {
public:
    IdCollisionError(const std::string& id, Scope first, Scope second)
        : std::runtime_error("ID collision - " + id + " exists in both " +
                             ScopeToString(first) + " and " + ScopeToString(second)),
          m_id(id) {}

    const std::string& id() const { return m_id; }

private:
    std::string m_id;
};

/**
 * @class NodeNotFoundError
 * @brief A requested ID is not part of the graph.
 */
class NodeNotFoundError : public std::runtime_error {
public:
    explicit NodeNotFoundError(const std::string& id)
        : std::runtime_error(id + " not found in graph"), m_id(id) {}

    const std::string& id() const { return m_id; }

private:
    std::string m_id;
};

} // namespace dnagraph::domain
