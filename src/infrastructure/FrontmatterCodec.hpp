/**
 * @file FrontmatterCodec.hpp
 * @brief Reads and writes the YAML-style frontmatter of decision documents.
 *
 * Only the subset used by decision records is understood: "key: value"
 * lines, block lists ("- item"), inline lists and flow mappings inside list
 * items. It is not a general YAML parser.
 *
 * In a flow mapping ("{id: DEC-001, note: ...}") the note runs to the
 * closing brace: commas and "key: value" text after "note:" stay in the
 * note. Keys written after the note are therefore read as note text.
 */

#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace dnagraph::infrastructure {

/**
 * @struct ParsedDocument
 * @brief Field map and body of one decision document.
 */
struct ParsedDocument {
    nlohmann::json fields = nlohmann::json::object();
    std::string body;
};

class FrontmatterCodec {
public:
    /**
     * @brief Splits a document into frontmatter fields and body.
     * @return nullopt when the text does not open with a closed "---" block.
     */
    static std::optional<ParsedDocument> Parse(const std::string& text);

    /**
     * @brief Renders a document with the fixed field order
     *        id, title, date, level, state, [stakes], depends_on.
     */
    static std::string Serialize(const nlohmann::json& fields, const std::string& body);

    /** @brief Parses the inside of a frontmatter block. */
    static nlohmann::json ParseBlock(const std::string& block);

    /** @brief Converts a scalar to string, bool, null, integer or float. */
    static nlohmann::json Coerce(const std::string& value);

    /** @brief Whether a title must be double-quoted to survive a round trip. */
    static bool TitleNeedsQuoting(const std::string& title);
};

} // namespace dnagraph::infrastructure
