/**
 * @file TextUtils.hpp
 * @brief Small string helpers shared by the validators, the service and the renderer.
 */

#pragma once

#include <string>
#include <vector>

namespace dnagraph::application {

bool StartsWith(const std::string& text, const std::string& prefix);
std::string Trim(const std::string& text);
std::string TrimRight(const std::string& text);
std::string ToLower(const std::string& text);

/** @brief Splits on '\n'; a trailing newline does not produce an empty last line. */
std::vector<std::string> SplitLines(const std::string& text);

/** @brief Splits on a delimiter, trimming each piece and dropping empty ones. */
std::vector<std::string> SplitList(const std::string& text, char delimiter);

template <typename Container>
std::string Join(const Container& items, const std::string& separator) {
    std::string out;
    bool first = true;
    for (const auto& item : items) {
        if (!first) out += separator;
        out += item;
        first = false;
    }
    return out;
}

/** @brief Escapes ECMAScript regex metacharacters so the text matches literally. */
std::string EscapeRegex(const std::string& text);

/** @brief True when some line of the body, with trailing whitespace removed, is exactly "## <section>". */
bool HasHeading(const std::string& body, const std::string& section);

/**
 * @brief Text under a "## <section>" heading up to the next "## " heading.
 * @return Empty string when the section is absent.
 */
std::string ExtractSection(const std::string& body, const std::string& section);

/** @brief Number of non-overlapping occurrences of needle in text. */
size_t CountOccurrences(const std::string& text, const std::string& needle);

/** @brief Local date as YYYY-MM-DD. */
std::string Today();

} // namespace dnagraph::application
