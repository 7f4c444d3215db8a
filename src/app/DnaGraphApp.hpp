/**
 * @file DnaGraphApp.hpp
 * @brief Command-line entry point for dna-graph.
 * @author dna-graph Team
 * @date 2026-10-19
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "application/DecisionService.hpp"

namespace dnagraph::app {

/**
 * @class DnaGraphApp
 * @brief Resolves the project root, wires the services and dispatches one command.
 */
class DnaGraphApp {
public:
    DnaGraphApp(int argc, char** argv);

    /**
     * @brief Runs the requested command.
     * @return Exit code (0 for success, 1 on any error).
     */
    int Run();

private:
    /**
     * @brief Splits global options from the command, loads config and builds the service.
     * @return False when the command line is unusable.
     */
    bool Init();

    int Dispatch(const std::string& command, const std::vector<std::string>& args);

    int CmdValidate();
    int CmdCascade(const std::vector<std::string>& args);
    int CmdFrontier(const std::vector<std::string>& args);
    int CmdSearch(const std::vector<std::string>& args);
    int CmdIndex();
    int CmdHealth();
    int CmdCompileManifest(const std::vector<std::string>& args);
    int CmdCreate(const std::vector<std::string>& args);
    int CmdSet(const std::vector<std::string>& args);
    int CmdEdit(const std::vector<std::string>& args);

    /** @brief Prints warnings then errors to stderr; returns 1 when there are errors. */
    static int ReportIssues(const domain::ValidationReport& report);

    static void PrintUsage();

    /** @brief --root value, else DNA_PROJECT_DIR, else the current directory. */
    static std::string ResolveProjectRoot(const std::string& flagValue);

    std::vector<std::string> m_rawArgs;                          ///< argv without the program name.
    std::string m_command;                                       ///< First positional argument.
    std::vector<std::string> m_args;                             ///< Arguments after the command.
    std::string m_root;                                          ///< Resolved project root.
    std::unique_ptr<application::DecisionService> m_service;
};

} // namespace dnagraph::app
