// =================================================================
// src/PrintCode/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "PrintCode/CliParser.hpp"
#include "PrintCode/Version.hpp"

namespace PrintCode {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_commands = Commands();
    m_app = std::make_shared<CLI::App>(
        "pc - print code.\n"
        "Recursively print source files with file-path headers, ready to paste\n"
        "into other tools. Respects .gitignore, .ignore and git exclude files.",
        "pc");

    m_app->set_version_flag("--version", PRINTCODE_VERSION);

    m_app->add_option("paths", m_commands.paths,
                      "Paths to scan (files or directories). Defaults to the current directory.");

    setupSelectionOptions(*m_app);
    setupTraversalOptions(*m_app);
    setupOutputOptions(*m_app);
    setupDiagnosticOptions(*m_app);

    // Fill in what CLI11 cannot bind directly once parsing succeeded
    m_app->callback([this]() {
        m_commands.max_bytes_set = m_max_bytes_option->count() > 0;
        if (m_commands.paths.empty()) {
            m_commands.paths.push_back(".");
        }
    });

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupSelectionOptions(CLI::App& app) {
    // One value per flag occurrence, so `-t py src` keeps src as a path
    app.add_option("-t,--type,--ext", m_commands.types,
                   "File extensions to include (e.g. py, rs). Repeatable or comma-separated.")
        ->delimiter(',')
        ->allow_extra_args(false)
        ->type_name("EXT");

    app.add_option("-E,--exclude", m_commands.excludes,
                   "Glob patterns to exclude, relative to each PATH (e.g. 'tests/**'). "
                   "Repeatable or comma-separated.")
        ->allow_extra_args(false)
        ->type_name("GLOB");

    m_max_bytes_option = app.add_option("--max-bytes", m_commands.max_bytes,
                                        "Skip files larger than N bytes.")
        ->type_name("N");
}

void CliParser::setupTraversalOptions(CLI::App& app) {
    app.add_flag("--no-gitignore", m_commands.no_gitignore,
                 "Do not read .gitignore, .ignore or git exclude files.");
    app.add_flag("--follow-symlinks", m_commands.follow_symlinks,
                 "Follow symbolic links during traversal.");
    app.add_flag("--hidden", m_commands.hidden,
                 "Include hidden files and directories.");
}

void CliParser::setupOutputOptions(CLI::App& app) {
    app.add_flag("--strip-comments", m_commands.strip_comments,
                 "Strip full-line comments and blank lines.");
    app.add_flag("--end-marker", m_commands.end_marker,
                 "Print an explicit END marker after each file.");
    app.add_flag("--json", m_commands.json,
                 "Output a JSON array of {path, file_name, content} objects.");
}

void CliParser::setupDiagnosticOptions(CLI::App& app) {
    app.add_option("--config", m_commands.config_path,
                   "Read defaults from this YAML file instead of ./.pc.yml.")
        ->type_name("FILE");
    auto* verbose = app.add_flag("-v,--verbose", m_commands.verbosity,
                                 "Log progress to stderr (-vv for debug output).");
    app.add_flag("-q,--quiet", m_commands.quiet, "Only log errors.")
        ->excludes(verbose);
    app.add_option("--log-file", m_commands.log_file,
                   "Also write log messages to this file.")
        ->type_name("FILE");
}

} // namespace PrintCode
