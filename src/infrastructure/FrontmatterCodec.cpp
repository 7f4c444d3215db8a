/**
 * @file FrontmatterCodec.cpp
 * @brief Implementation of FrontmatterCodec.
 */

#include "infrastructure/FrontmatterCodec.hpp"

#include "application/TextUtils.hpp"

#include <cctype>
#include <regex>
#include <sstream>
#include <vector>

namespace dnagraph::infrastructure {

using application::SplitLines;
using application::Trim;

namespace {

const std::regex& KeyValuePattern() {
    static const std::regex re(R"(^(\w+)\s*:\s*(.*)$)");
    return re;
}

bool IsListItem(const std::string& line) {
    std::string t = Trim(line);
    return !t.empty() && t[0] == '-';
}

std::string StripDash(const std::string& line) {
    std::string t = Trim(line);
    return Trim(t.substr(1));
}

// "{id: DEC-001, note: keeps, commas}" -> {"id": "DEC-001", "note": "keeps, commas"}
// Everything after "note:" is note text, including "key: value" fragments.
nlohmann::json ParseFlowMapping(const std::string& text) {
    nlohmann::json obj = nlohmann::json::object();
    std::string inner = text.substr(1, text.size() - 2);
    std::string lastKey;
    std::stringstream ss(inner);
    std::string part;
    while (std::getline(ss, part, ',')) {
        std::smatch m;
        std::string trimmed = Trim(part);
        if (lastKey != "note" && std::regex_match(trimmed, m, KeyValuePattern())) {
            lastKey = m[1].str();
            obj[lastKey] = FrontmatterCodec::Coerce(Trim(m[2].str()));
        } else if (!lastKey.empty()) {
            // A comma inside a value.
            std::string joined = obj[lastKey].is_string() ? obj[lastKey].get<std::string>() : obj[lastKey].dump();
            obj[lastKey] = joined + "," + part;
        }
    }
    return obj;
}

nlohmann::json ParseInlineList(const std::string& text) {
    nlohmann::json arr = nlohmann::json::array();
    std::string inner = Trim(text.substr(1, text.size() - 2));
    if (inner.empty()) return arr;
    std::stringstream ss(inner);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = Trim(item);
        if (!item.empty()) arr.push_back(FrontmatterCodec::Coerce(item));
    }
    return arr;
}

std::string ScalarText(const nlohmann::json& value) {
    if (value.is_null()) return "";
    if (value.is_string()) return value.get<std::string>();
    return value.dump();
}

std::string FieldText(const nlohmann::json& fields, const char* key, const std::string& fallback = "") {
    if (!fields.contains(key) || fields.at(key).is_null()) return fallback;
    return ScalarText(fields.at(key));
}

std::string RenderDependency(const nlohmann::json& dep) {
    if (!dep.is_object()) return ScalarText(dep);
    std::string id = dep.contains("id") ? ScalarText(dep.at("id")) : "";
    if (!dep.contains("note") || ScalarText(dep.at("note")).empty()) return id;
    return "{id: " + id + ", note: " + ScalarText(dep.at("note")) + "}";
}

} // namespace

nlohmann::json FrontmatterCodec::Coerce(const std::string& value) {
    if (value.empty()) return nullptr;
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        std::string inner = value.substr(1, value.size() - 2);
        std::string out;
        for (size_t i = 0; i < inner.size(); ++i) {
            if (inner[i] == '\\' && i + 1 < inner.size() && inner[i + 1] == '"') ++i;
            out += inner[i];
        }
        return out;
    }
    if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
        return value.substr(1, value.size() - 2);
    }

    std::string lower;
    for (char c : value) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower == "true") return true;
    if (lower == "false") return false;
    if (lower == "null" || lower == "~") return nullptr;

    static const std::regex intPattern(R"(^[+-]?\d+$)");
    static const std::regex floatPattern(R"(^[+-]?(\d+\.\d*|\.\d+|\d+)([eE][+-]?\d+)?$)");
    try {
        if (std::regex_match(value, intPattern)) return std::stoll(value);
        if (std::regex_match(value, floatPattern)) return std::stod(value);
    } catch (const std::out_of_range&) {
        // Too large for a number; keep the text.
    }
    return value;
}

nlohmann::json FrontmatterCodec::ParseBlock(const std::string& block) {
    nlohmann::json result = nlohmann::json::object();
    const auto lines = SplitLines(block);

    size_t i = 0;
    while (i < lines.size()) {
        const std::string& line = lines[i];
        std::string trimmed = Trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            ++i;
            continue;
        }

        std::smatch m;
        std::string candidate = line;
        if (!candidate.empty() && candidate.back() == '\r') candidate.pop_back();
        if (!std::regex_match(candidate, m, KeyValuePattern())) {
            ++i;
            continue;
        }

        std::string key = m[1].str();
        std::string value = Trim(m[2].str());

        if (value.empty() && i + 1 < lines.size() && IsListItem(lines[i + 1])) {
            nlohmann::json items = nlohmann::json::array();
            ++i;
            while (i < lines.size() && IsListItem(lines[i])) {
                std::string item = StripDash(lines[i]);
                ++i;

                std::smatch im;
                if (item.size() >= 2 && item.front() == '{' && item.back() == '}') {
                    items.push_back(ParseFlowMapping(item));
                } else if (std::regex_match(item, im, KeyValuePattern())) {
                    // "- id: DEC-001" optionally followed by indented "note: ..." lines.
                    nlohmann::json obj = nlohmann::json::object();
                    obj[im[1].str()] = Coerce(Trim(im[2].str()));
                    while (i < lines.size() && !lines[i].empty() && (lines[i][0] == ' ' || lines[i][0] == '\t') &&
                           !IsListItem(lines[i])) {
                        std::smatch cm;
                        std::string cont = Trim(lines[i]);
                        if (!std::regex_match(cont, cm, KeyValuePattern())) break;
                        obj[cm[1].str()] = Coerce(Trim(cm[2].str()));
                        ++i;
                    }
                    items.push_back(obj);
                } else {
                    items.push_back(Coerce(item));
                }
            }
            result[key] = items;
        } else if (value.size() >= 2 && value.front() == '[' && value.back() == ']') {
            result[key] = ParseInlineList(value);
            ++i;
        } else {
            result[key] = Coerce(value);
            ++i;
        }
    }
    return result;
}

std::optional<ParsedDocument> FrontmatterCodec::Parse(const std::string& text) {
    if (text.rfind("---", 0) != 0) return std::nullopt;

    size_t end = text.find("\n---", 3);
    if (end == std::string::npos) return std::nullopt;

    ParsedDocument doc;
    std::string block = end > 4 ? text.substr(4, end - 4) : std::string();
    doc.fields = ParseBlock(block);

    // The newline closing the "---" line belongs to the delimiter, not the body.
    doc.body = text.substr(end + 4);
    if (!doc.body.empty() && doc.body[0] == '\n') doc.body.erase(0, 1);
    return doc;
}

bool FrontmatterCodec::TitleNeedsQuoting(const std::string& title) {
    static const std::regex pattern(R"([:#\["']|^[{>|*&!%@`])");
    return std::regex_search(title, pattern);
}

std::string FrontmatterCodec::Serialize(const nlohmann::json& fields, const std::string& body) {
    std::ostringstream out;
    out << "---\n";
    out << "id: " << FieldText(fields, "id") << "\n";

    std::string title = FieldText(fields, "title");
    if (TitleNeedsQuoting(title)) {
        std::string escaped;
        for (char c : title) {
            if (c == '"') escaped += '\\';
            escaped += c;
        }
        out << "title: \"" << escaped << "\"\n";
    } else {
        out << "title: " << title << "\n";
    }

    out << "date: " << FieldText(fields, "date") << "\n";
    out << "level: " << FieldText(fields, "level") << "\n";
    out << "state: " << FieldText(fields, "state", "suggested") << "\n";

    std::string stakes = FieldText(fields, "stakes");
    if (!stakes.empty()) out << "stakes: " << stakes << "\n";

    nlohmann::json deps = fields.contains("depends_on") ? fields.at("depends_on") : nlohmann::json::array();
    if (deps.is_string()) deps = nlohmann::json::array({deps});
    if (!deps.is_array() || deps.empty()) {
        out << "depends_on: []\n";
    } else {
        out << "depends_on:\n";
        for (const auto& dep : deps) {
            out << "  - " << RenderDependency(dep) << "\n";
        }
    }

    out << "---\n";
    out << body;
    return out.str();
}

} // namespace dnagraph::infrastructure
