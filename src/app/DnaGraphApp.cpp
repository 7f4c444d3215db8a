/**
 * @file DnaGraphApp.cpp
 * @brief Implementation of the DnaGraphApp class.
 */
#include "app/DnaGraphApp.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>

#include "application/CascadeService.hpp"
#include "application/ReportRenderer.hpp"
#include "application/TextUtils.hpp"
#include "domain/GraphErrors.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/DecisionRepositoryFs.hpp"

namespace dnagraph::app {

using application::ReportRenderer;

namespace {

enum class OutputFormat {
    Table,
    Json,
    Markdown
};

bool HasFlag(const std::vector<std::string>& args, const std::string& flag) {
    for (const auto& a : args) {
        if (a == flag) return true;
    }
    return false;
}

OutputFormat FormatFrom(const std::vector<std::string>& args) {
    if (HasFlag(args, "--json")) return OutputFormat::Json;
    if (HasFlag(args, "--markdown")) return OutputFormat::Markdown;
    return OutputFormat::Table;
}

/** Value following an option, or empty when the option is absent. Throws when the value is missing. */
std::string OptionValue(const std::vector<std::string>& args, const std::string& option) {
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] != option) continue;
        if (i + 1 >= args.size()) throw std::invalid_argument(option + " requires a value");
        return args[i + 1];
    }
    return {};
}

/** Positional arguments, skipping flags and the values of the listed options. */
std::vector<std::string> Positionals(const std::vector<std::string>& args,
                                     const std::vector<std::string>& valueOptions) {
    std::vector<std::string> out;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (application::StartsWith(a, "--")) {
            for (const auto& opt : valueOptions) {
                if (a == opt) {
                    ++i;
                    break;
                }
            }
            continue;
        }
        out.push_back(a);
    }
    return out;
}

/** Strict integer parse: the whole text must be a number. */
bool ParseInt(const std::string& text, int& out) {
    if (text.empty()) return false;
    size_t consumed = 0;
    try {
        out = std::stoi(text, &consumed);
    } catch (const std::exception&) {
        return false;
    }
    return consumed == text.size();
}

} // namespace

DnaGraphApp::DnaGraphApp(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) m_rawArgs.emplace_back(argv[i]);
}

std::string DnaGraphApp::ResolveProjectRoot(const std::string& flagValue) {
    if (!flagValue.empty()) return flagValue;
    if (const char* env = std::getenv("DNA_PROJECT_DIR")) {
        if (*env != '\0') return env;
    }
    return std::filesystem::current_path().string();
}

void DnaGraphApp::PrintUsage() {
    std::cerr << "Usage: dna-graph [--root DIR] <command> [args]\n"
              << "\n"
              << "Commands:\n"
              << "  validate                                  Validate the whole graph\n"
              << "  cascade DEC-NNN [--reverse] [--json|--markdown]\n"
              << "  frontier [--top N] [--json|--markdown]\n"
              << "  search TERM... [--json]\n"
              << "  index                                     Regenerate INDEX.md files\n"
              << "  health                                    Regenerate HEALTH.md\n"
              << "  compile-manifest [--target human|agent] [--json]\n"
              << "  create DEC-NNN --title T --level N [--state S] [--stakes K]\n"
              << "                 [--depends-on A,B] [--constitution]\n"
              << "  set DEC-NNN FIELD VALUE...\n"
              << "  edit DEC-NNN OLD NEW\n";
}

bool DnaGraphApp::Init() {
    std::string rootFlag;
    for (size_t i = 0; i < m_rawArgs.size(); ++i) {
        const std::string& a = m_rawArgs[i];
        if (m_command.empty() && a == "--root") {
            if (i + 1 >= m_rawArgs.size()) {
                std::cerr << "ERROR: --root requires a directory" << std::endl;
                return false;
            }
            rootFlag = m_rawArgs[++i];
        } else if (m_command.empty()) {
            m_command = a;
        } else {
            m_args.push_back(a);
        }
    }
    if (m_command.empty() || m_command == "--help" || m_command == "-h") {
        PrintUsage();
        return false;
    }

    m_root = ResolveProjectRoot(rootFlag);
    auto config = infrastructure::ConfigLoader::LoadLintConfig(m_root);
    m_service = std::make_unique<application::DecisionService>(
        std::make_unique<infrastructure::DecisionRepositoryFs>(m_root), std::move(config));
    return true;
}

int DnaGraphApp::Run() {
    if (!Init()) return 1;

    try {
        return Dispatch(m_command, m_args);
    } catch (const domain::IdCollisionError& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
    } catch (const domain::NodeNotFoundError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
    } catch (const std::invalid_argument& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[DnaGraphApp] Unexpected failure: " << e.what() << std::endl;
    }
    return 1;
}

int DnaGraphApp::Dispatch(const std::string& command, const std::vector<std::string>& args) {
    if (command == "validate") return CmdValidate();
    if (command == "cascade") return CmdCascade(args);
    if (command == "frontier") return CmdFrontier(args);
    if (command == "search") return CmdSearch(args);
    if (command == "index") return CmdIndex();
    if (command == "health") return CmdHealth();
    if (command == "compile-manifest") return CmdCompileManifest(args);
    if (command == "create") return CmdCreate(args);
    if (command == "set") return CmdSet(args);
    if (command == "edit") return CmdEdit(args);

    std::cerr << "ERROR: unknown command '" << command << "'" << std::endl;
    PrintUsage();
    return 1;
}

int DnaGraphApp::ReportIssues(const domain::ValidationReport& report) {
    for (const auto& w : report.warnings) std::cerr << "WARNING: " << w << std::endl;
    for (const auto& e : report.errors) std::cerr << "ERROR: " << e << std::endl;
    return report.ok() ? 0 : 1;
}

int DnaGraphApp::CmdValidate() {
    domain::DecisionGraph graph = m_service->LoadGraph();
    domain::ValidationReport report = m_service->Validate(graph);
    std::cout << ReportRenderer::ValidationText(report, graph.size());
    return report.ok() ? 0 : 1;
}

int DnaGraphApp::CmdCascade(const std::vector<std::string>& args) {
    auto positional = Positionals(args, {});
    if (positional.size() != 1) {
        std::cerr << "ERROR: cascade expects exactly one decision ID" << std::endl;
        return 1;
    }
    auto direction = HasFlag(args, "--reverse") ? application::Direction::Upstream
                                                : application::Direction::Downstream;

    domain::DecisionGraph graph = m_service->LoadGraph();
    auto result = application::CascadeService::Compute(graph, positional.front(), direction);

    switch (FormatFrom(args)) {
        case OutputFormat::Json: std::cout << ReportRenderer::CascadeJson(result).dump(2) << std::endl; break;
        case OutputFormat::Markdown: std::cout << ReportRenderer::CascadeMarkdown(result, graph); break;
        case OutputFormat::Table: std::cout << ReportRenderer::CascadeTable(result); break;
    }
    return 0;
}

int DnaGraphApp::CmdFrontier(const std::vector<std::string>& args) {
    int top = application::FrontierService::kDefaultTopN;
    std::string topText = OptionValue(args, "--top");
    if (!topText.empty() && (!ParseInt(topText, top) || top < 0)) {
        std::cerr << "ERROR: --top expects a non-negative number, got '" << topText << "'" << std::endl;
        return 1;
    }

    auto report = m_service->Frontier(top);
    switch (FormatFrom(args)) {
        case OutputFormat::Json: std::cout << ReportRenderer::FrontierJson(report).dump(2) << std::endl; break;
        case OutputFormat::Markdown: std::cout << ReportRenderer::FrontierMarkdown(report); break;
        case OutputFormat::Table: std::cout << ReportRenderer::FrontierTable(report); break;
    }
    return 0;
}

int DnaGraphApp::CmdSearch(const std::vector<std::string>& args) {
    auto terms = Positionals(args, {});
    if (terms.empty()) {
        std::cerr << "ERROR: search expects at least one term" << std::endl;
        return 1;
    }
    auto hits = m_service->Search(terms);
    if (HasFlag(args, "--json")) {
        std::cout << ReportRenderer::SearchJson(terms, hits).dump(2) << std::endl;
    } else {
        std::cout << ReportRenderer::SearchTable(terms, hits);
    }
    return 0;
}

int DnaGraphApp::CmdIndex() {
    auto result = m_service->RebuildIndex();
    if (!result.ok) {
        std::cerr << "ERROR: failed to write INDEX.md" << std::endl;
        return 1;
    }
    if (result.constitutionWritten) {
        std::cout << "constitution/INDEX.md: " << result.constitutionCount << " decisions" << std::endl;
    }
    std::cout << "dna/INDEX.md: " << result.projectCount << " decisions" << std::endl;
    return 0;
}

int DnaGraphApp::CmdHealth() {
    auto result = m_service->RebuildHealth();
    if (!result.ok) {
        std::cerr << "ERROR: failed to write HEALTH.md" << std::endl;
        return 1;
    }
    std::cout << "HEALTH.md updated: " << result.totalDecisions << " decisions, " << result.flaggedItems
              << " flagged items" << std::endl;
    return 0;
}

int DnaGraphApp::CmdCompileManifest(const std::vector<std::string>& args) {
    std::string targetText = OptionValue(args, "--target");
    application::ManifestTarget target = application::ManifestTarget::Human;
    if (targetText == "agent") {
        target = application::ManifestTarget::Agent;
    } else if (!targetText.empty() && targetText != "human") {
        std::cerr << "ERROR: --target must be 'human' or 'agent', got '" << targetText << "'" << std::endl;
        return 1;
    }

    auto manifest = m_service->CompileManifest(target);
    if (HasFlag(args, "--json")) {
        std::cout << manifest.dump(2) << std::endl;
    } else {
        std::cout << ReportRenderer::ManifestText(manifest);
    }
    return 0;
}

int DnaGraphApp::CmdCreate(const std::vector<std::string>& args) {
    const std::vector<std::string> valueOptions = {"--title", "--level", "--state", "--stakes", "--depends-on"};
    auto positional = Positionals(args, valueOptions);
    if (positional.size() != 1) {
        std::cerr << "ERROR: create expects exactly one decision ID" << std::endl;
        return 1;
    }

    application::NewDecision input;
    input.title = OptionValue(args, "--title");
    std::string levelText = OptionValue(args, "--level");
    if (levelText.empty()) {
        std::cerr << "ERROR: --level is required" << std::endl;
        return 1;
    }
    if (!ParseInt(levelText, input.level)) {
        std::cerr << "ERROR: level must be a number, got '" << levelText << "'" << std::endl;
        return 1;
    }
    std::string state = OptionValue(args, "--state");
    if (!state.empty()) input.state = state;
    input.stakes = OptionValue(args, "--stakes");
    std::string deps = OptionValue(args, "--depends-on");
    if (!deps.empty()) input.dependsOn = application::SplitList(deps, ',');

    const bool constitution = HasFlag(args, "--constitution");
    const auto scope = constitution ? domain::Scope::Constitution : domain::Scope::Project;
    const std::string& id = positional.front();

    auto outcome = m_service->Create(id, input, scope);
    if (ReportIssues(outcome.report) != 0) return 1;

    std::cout << "Created " << id << " (level " << input.level << ", " << input.state << ") in "
              << (constitution ? "constitution/" : "dna/") << std::endl;
    return 0;
}

int DnaGraphApp::CmdSet(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        std::cerr << "ERROR: set expects DEC-NNN FIELD VALUE" << std::endl;
        return 1;
    }
    const std::string& id = args[0];
    const std::string& field = args[1];
    std::vector<std::string> rest(args.begin() + 2, args.end());

    application::FieldValue value;
    if (field == "depends_on") {
        std::string joined = application::Join(rest, ",");
        if (application::Trim(joined) == "[]") joined.clear();
        value = application::SplitList(joined, ',');
    } else if (field == "level") {
        int level = 0;
        if (!ParseInt(rest.front(), level)) {
            std::cerr << "ERROR: level must be a number, got '" << rest.front() << "'" << std::endl;
            return 1;
        }
        value = level;
    } else if (field == "title") {
        value = application::Join(rest, " ");
    } else {
        value = rest.front();
    }

    auto outcome = m_service->Set(id, field, value);
    if (ReportIssues(outcome.report) != 0) return 1;

    std::cout << id << ": " << field << " " << outcome.oldValue << " -> " << outcome.newValue << std::endl;
    return 0;
}

int DnaGraphApp::CmdEdit(const std::vector<std::string>& args) {
    if (args.size() != 3) {
        std::cerr << "ERROR: edit expects DEC-NNN OLD NEW" << std::endl;
        return 1;
    }
    auto outcome = m_service->Edit(args[0], args[1], args[2]);
    if (ReportIssues(outcome.report) != 0) return 1;

    std::cout << ReportRenderer::EditText(args[0], outcome);
    return outcome.ok() ? 0 : 1;
}

} // namespace dnagraph::app
