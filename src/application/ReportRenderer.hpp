/**
 * @file ReportRenderer.hpp
 * @brief Renders query results as JSON, markdown or a plain text table.
 */

#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "application/CascadeService.hpp"
#include "application/DecisionService.hpp"
#include "application/FrontierService.hpp"
#include "domain/DecisionGraph.hpp"
#include "domain/ValidationReport.hpp"

namespace dnagraph::application {

class ReportRenderer {
public:
    /** @brief Sorted ERRORS/WARNINGS listing, or the pass line when both are empty. */
    static std::string ValidationText(const domain::ValidationReport& report, size_t decisionCount);

    static nlohmann::json CascadeJson(const CascadeResult& result);
    static std::string CascadeMarkdown(const CascadeResult& result, const domain::DecisionGraph& graph);
    static std::string CascadeTable(const CascadeResult& result);

    static nlohmann::json FrontierJson(const FrontierReport& report);
    static std::string FrontierMarkdown(const FrontierReport& report);
    static std::string FrontierTable(const FrontierReport& report);

    static nlohmann::json SearchJson(const std::vector<std::string>& terms, const std::vector<SearchHit>& hits);
    static std::string SearchTable(const std::vector<std::string>& terms, const std::vector<SearchHit>& hits);

    /** @brief Human-readable form of a manifest produced by DecisionService::CompileManifest. */
    static std::string ManifestText(const nlohmann::json& manifest);

    static std::string EditText(const std::string& id, const EditOutcome& outcome);
};

} // namespace dnagraph::application
