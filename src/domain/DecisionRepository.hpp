/**
 * @file DecisionRepository.hpp
 * @brief Interface for reading and persisting decision records.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "Decision.hpp"

namespace dnagraph::domain {

/**
 * @class DecisionRepository
 * @brief Abstract record source and persistence sink for both partitions.
 */
class DecisionRepository {
public:
    virtual ~DecisionRepository() = default;

    /** @brief Fetches every decision record of a partition. */
    virtual std::vector<DecisionRecord> fetchPartition(Scope scope) = 0;

    /**
     * @brief Persists one decision atomically.
     * @param scope Target partition.
     * @param id Decision ID (determines the document name).
     * @param fields Frontmatter field map.
     * @param body Markdown body.
     * @return False when the write failed.
     */
    virtual bool saveRecord(Scope scope, const std::string& id,
                            const nlohmann::json& fields, const std::string& body) = 0;

    /**
     * @brief Reports what already occupies the document a new record would be written to.
     * @return The ID held there ("" when it has none), nullopt when the target is free.
     */
    virtual std::optional<std::string> occupantOf(Scope scope, const std::string& id) = 0;

    /** @brief Reads a persisted record back. */
    virtual std::optional<DecisionRecord> readRecord(Scope scope, const std::string& id) = 0;

    /** @brief Whether the constitution partition exists at all. */
    virtual bool hasPartition(Scope scope) = 0;

    /**
     * @brief Writes a derived document (e.g. INDEX.md) next to a partition's records.
     */
    virtual bool writeDocument(Scope scope, const std::string& name, const std::string& content) = 0;

    /** @brief Reads a document at the project root, nullopt if absent. */
    virtual std::optional<std::string> readRootDocument(const std::string& name) = 0;

    /** @brief Writes a document at the project root (e.g. HEALTH.md). */
    virtual bool writeRootDocument(const std::string& name, const std::string& content) = 0;
};

} // namespace dnagraph::domain
