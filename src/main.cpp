#include "PrintCode/CliParser.hpp"
#include "PrintCode/Core.hpp"
#include "PrintCode/Errors.hpp"
#include "PrintCode/Logger.hpp"
#include "PrintCode/ScanConfig.hpp"
#include <chrono>
#include <iostream>

int main(int argc, char** argv) {
    // CliParser is responsible for defining and parsing all command-line
    // arguments using the CLI11 library.
    PrintCode::CliParser parser;
    auto app = parser.setupCli();

    try {
        app->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app->exit(e);
    }

    auto start_time = std::chrono::steady_clock::now();
    auto& logger = PrintCode::Logger::getInstance();

    try {
        PrintCode::ScanConfig config = PrintCode::ScanConfig::resolve(parser.getCommands());

        logger.setConsoleLogLevel(config.log_level);
        if (!config.log_file.empty() && !logger.openLogFile(config.log_file)) {
            std::cerr << "Error: Cannot open log file: " << config.log_file << std::endl;
            return 2;
        }
        logger.logRunStart(config.roots.size(), PrintCode::outputModeName(config.output_mode));

        PrintCode::Core core(config);
        int exit_code = core.run(std::cout, std::cerr);

        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        logger.logRunEnd(exit_code, static_cast<long>(duration.count()));
        logger.flush();
        return exit_code;
    } catch (const PrintCode::ConfigurationError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
