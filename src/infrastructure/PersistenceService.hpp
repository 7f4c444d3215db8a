/**
 * @file PersistenceService.hpp
 * @brief Atomic file writes for decision records and derived documents.
 */

#pragma once
#include <string>

namespace dnagraph::infrastructure {

/**
 * @class PersistenceService
 * @brief Writes whole files through a temp file and a rename.
 *
 * A reader never observes a half-written record: the target either keeps
 * its previous content or holds the complete new content.
 */
class PersistenceService {
public:
    /**
     * @brief Writes content to a file atomically, creating parent directories.
     * @param filename Path to the file.
     * @param content The string content to write.
     * @return False when any step failed; the target is then left untouched.
     */
    bool saveText(const std::string& filename, const std::string& content);

private:
    /**
     * @brief Performs the actual atomic write (temp -> rename).
     */
    bool performAtomicWrite(const std::string& filename, const std::string& content);
};

} // namespace dnagraph::infrastructure
