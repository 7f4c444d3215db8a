/**
 * @file Decision.cpp
 * @brief Implementation of the Decision entity.
 */

#include "domain/Decision.hpp"

#include <algorithm>
#include <cctype>

namespace dnagraph::domain {

namespace {

std::string ScalarText(const nlohmann::json& value) {
    if (value.is_null()) return "";
    if (value.is_string()) return value.get<std::string>();
    if (value.is_boolean()) return value.get<bool>() ? "true" : "false";
    return value.dump();
}

std::string FieldText(const nlohmann::json& fields, const char* key) {
    if (!fields.is_object() || !fields.contains(key)) return "";
    return ScalarText(fields.at(key));
}

std::vector<DependencyRef> ParseDependencies(const nlohmann::json& fields) {
    std::vector<DependencyRef> refs;
    if (!fields.is_object() || !fields.contains("depends_on")) return refs;

    const auto& raw = fields.at("depends_on");
    if (raw.is_string()) {
        if (!raw.get<std::string>().empty()) refs.push_back(PlainRef{raw.get<std::string>()});
        return refs;
    }
    if (!raw.is_array()) return refs;

    for (const auto& entry : raw) {
        if (entry.is_string()) {
            refs.push_back(PlainRef{entry.get<std::string>()});
        } else if (entry.is_object() && entry.contains("id")) {
            StructuredRef ref;
            ref.id = ScalarText(entry.at("id"));
            if (entry.contains("note")) ref.note = ScalarText(entry.at("note"));
            refs.push_back(ref);
        }
        // Other shapes carry no usable id.
    }
    return refs;
}

} // namespace

Decision Decision::FromRecord(const DecisionRecord& record, Scope scope) {
    Decision d;
    d.id = FieldText(record.fields, "id");
    d.title = FieldText(record.fields, "title");
    d.date = FieldText(record.fields, "date");
    d.levelText = FieldText(record.fields, "level");
    d.stateText = FieldText(record.fields, "state");
    d.stakesText = FieldText(record.fields, "stakes");
    d.setDependencies(ParseDependencies(record.fields));
    d.scope = scope;
    d.body = record.body;
    d.source = record.source;
    return d;
}

std::optional<int> Decision::level() const {
    // Whole-number floats ("2.0") count as their integer.
    std::string whole = levelText;
    size_t dot = whole.find('.');
    if (dot != std::string::npos) {
        if (dot + 1 == whole.size() || whole.find_first_not_of('0', dot + 1) != std::string::npos) return std::nullopt;
        whole.erase(dot);
    }
    if (whole.empty()) return std::nullopt;
    size_t start = (whole[0] == '-') ? 1 : 0;
    if (start == whole.size()) return std::nullopt;
    bool digits = std::all_of(whole.begin() + start, whole.end(),
                              [](unsigned char c) { return std::isdigit(c); });
    if (!digits || whole.size() > 9) return std::nullopt;
    return std::stoi(whole);
}

nlohmann::json Decision::toFields() const {
    nlohmann::json fields = nlohmann::json::object();
    fields["id"] = id;
    fields["title"] = title;
    fields["date"] = date;
    if (auto lvl = level()) {
        fields["level"] = *lvl;
    } else {
        fields["level"] = levelText;
    }
    fields["state"] = stateText.empty() ? std::string("suggested") : stateText;
    if (!stakesText.empty()) fields["stakes"] = stakesText;

    nlohmann::json deps = nlohmann::json::array();
    for (const auto& ref : dependsOn) {
        if (const auto* plain = std::get_if<PlainRef>(&ref)) {
            deps.push_back(plain->id);
        } else if (const auto* structured = std::get_if<StructuredRef>(&ref)) {
            nlohmann::json entry = {{"id", structured->id}};
            if (!structured->note.empty()) entry["note"] = structured->note;
            deps.push_back(entry);
        }
    }
    fields["depends_on"] = deps;
    return fields;
}

} // namespace dnagraph::domain
