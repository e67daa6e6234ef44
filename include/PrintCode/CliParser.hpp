// =================================================================
// include/PrintCode/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace PrintCode {

// A simple struct to hold the parsed command line.
struct Commands {
    std::vector<std::string> paths;     // Scan roots, "." when none given
    std::vector<std::string> types;     // Raw --type values
    std::vector<std::string> excludes;  // Raw --exclude values

    bool no_gitignore = false;
    bool follow_symlinks = false;
    bool hidden = false;
    bool strip_comments = false;
    bool end_marker = false;
    bool json = false;

    bool max_bytes_set = false;
    std::uint64_t max_bytes = 0;

    std::string config_path;
    int verbosity = 0;
    bool quiet = false;
    std::string log_file;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI options and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    void setupSelectionOptions(CLI::App& app);
    void setupTraversalOptions(CLI::App& app);
    void setupOutputOptions(CLI::App& app);
    void setupDiagnosticOptions(CLI::App& app);

    std::shared_ptr<CLI::App> m_app;
    CLI::Option* m_max_bytes_option = nullptr;
    Commands m_commands;
};

} // namespace PrintCode
