/**
 * @file DecisionRepositoryFs.hpp
 * @brief Filesystem-based implementation of the DecisionRepository.
 */

#pragma once
#include "domain/DecisionRepository.hpp"
#include "infrastructure/PersistenceService.hpp"
#include <map>
#include <string>

namespace dnagraph::infrastructure {

/**
 * @class DecisionRepositoryFs
 * @brief Stores decisions as markdown files under <root>/constitution and <root>/dna.
 *
 * Only files named DEC-*.md are records. The constitution directory is
 * optional; the project directory is created on first write.
 */
class DecisionRepositoryFs : public domain::DecisionRepository {
public:
    /**
     * @brief Constructor for DecisionRepositoryFs.
     * @param projectRoot Directory holding constitution/, dna/ and HEALTH.md.
     */
    explicit DecisionRepositoryFs(const std::string& projectRoot);

    /** @brief Parses every DEC-*.md of a partition, by file name. @see domain::DecisionRepository::fetchPartition */
    std::vector<domain::DecisionRecord> fetchPartition(domain::Scope scope) override;

    /** @brief Serializes and atomically writes a record. @see domain::DecisionRepository::saveRecord */
    bool saveRecord(domain::Scope scope, const std::string& id,
                    const nlohmann::json& fields, const std::string& body) override;

    /** @brief Reads the ID from the file resolvePath() picks, if that file exists. @see domain::DecisionRepository::occupantOf */
    std::optional<std::string> occupantOf(domain::Scope scope, const std::string& id) override;

    std::optional<domain::DecisionRecord> readRecord(domain::Scope scope, const std::string& id) override;

    bool hasPartition(domain::Scope scope) override;

    bool writeDocument(domain::Scope scope, const std::string& name, const std::string& content) override;

    std::optional<std::string> readRootDocument(const std::string& name) override;

    bool writeRootDocument(const std::string& name, const std::string& content) override;

    /** @brief Directory of a partition. */
    std::string partitionPath(domain::Scope scope) const;

private:
    /** @brief File holding a record: where it was loaded from, else <partition>/<id>.md. */
    std::string resolvePath(domain::Scope scope, const std::string& id) const;

    std::string m_root;
    std::map<std::string, std::string> m_knownPaths; ///< ID -> file seen by fetchPartition.
    PersistenceService m_persistence;
};

} // namespace dnagraph::infrastructure
