// =================================================================
// src/PrintCode/Core.cpp
// =================================================================
// Implementation for the scanning pipeline.

#include "PrintCode/Core.hpp"
#include "PrintCode/ContentSanitizer.hpp"
#include "PrintCode/Emitter.hpp"
#include "PrintCode/Errors.hpp"
#include "PrintCode/ExclusionMatcher.hpp"
#include "PrintCode/ExtensionSet.hpp"
#include "PrintCode/FileReader.hpp"
#include "PrintCode/IgnoreWalker.hpp"
#include "PrintCode/Logger.hpp"
#include "PrintCode/SelectionFilter.hpp"
#include "PrintCode/StringUtils.hpp"
#include <filesystem>

namespace fs = std::filesystem;

namespace PrintCode {

const char* const Core::INCOMPLETE_RUN_MESSAGE =
    "Error: One or more files could not be read. See stderr for details.";

Core::Core(const ScanConfig& config)
    : m_config(config)
{
}

Core::~Core() = default;

int Core::run(std::ostream& out, std::ostream& err) {
    m_stats = ScanStats();

    // Everything that can reject the configuration happens before output
    ExtensionSet extensions(m_config.types);
    ExclusionMatcher exclusions(m_config.excludes);
    SelectionFilter filter(extensions, exclusions, m_config.size_limit);

    std::string ext_list;
    for (const auto& ext : extensions.sorted()) {
        if (!ext_list.empty()) {
            ext_list += ",";
        }
        ext_list += ext;
    }
    Logger::getInstance().debug("Core", "Extensions: " + ext_list,
                                std::to_string(exclusions.size()) + " exclude patterns");

    std::unique_ptr<Emitter> emitter = createEmitter(m_config.output_mode, out, m_config.end_marker);

    for (const auto& root : m_config.roots) {
        scanRoot(root, filter, exclusions, *emitter, err);
    }

    emitter->finish();
    Logger::getInstance().logScanSummary(m_stats);

    if (m_stats.hadErrors()) {
        err << INCOMPLETE_RUN_MESSAGE << std::endl;
        return 1;
    }
    return 0;
}

void Core::scanRoot(const std::string& raw_root,
                    const SelectionFilter& filter,
                    const ExclusionMatcher& exclusions,
                    Emitter& emitter,
                    std::ostream& err) {
    // Canonical roots keep relative paths stable whatever the working directory
    std::error_code ec;
    fs::path root = fs::canonical(raw_root, ec);
    if (ec) {
        err << "Skipping root " << raw_root << ": " << ec.message() << std::endl;
        ++m_stats.walk_errors;
        return;
    }

    ++m_stats.roots_scanned;
    PC_LOG_INFO("Core", "Scanning root: " + toSlashPath(root));

    IgnoreWalker walker(root, m_config.walk);
    if (!exclusions.empty()) {
        walker.setDirectoryPruner([&exclusions](const std::string& relative_dir) {
            return exclusions.isExcludedDirectory(relative_dir);
        });
    }
    walker.setErrorHandler([&err](const std::string& message) {
        err << "Walk error: " << message << std::endl;
    });

    size_t walk_errors = walker.walk([&](const Candidate& candidate) {
        ++m_stats.candidates;

        SelectionDecision decision = filter.evaluate(candidate);
        if (!decision.accepted) {
            switch (decision.reason) {
                case RejectReason::Extension:
                    ++m_stats.rejected_extension;
                    break;
                case RejectReason::Excluded:
                    ++m_stats.rejected_excluded;
                    break;
                case RejectReason::TooLarge:
                    ++m_stats.rejected_size;
                    break;
                default:
                    break;
            }
            if (!decision.diagnostic.empty()) {
                err << decision.diagnostic << std::endl;
            }
            return;
        }

        EmittedRecord record;
        record.relative_path = candidate.relative_path;
        record.file_name = candidate.file_name;

        try {
            record.content = FileReader::readText(candidate.absolute_path);
        } catch (const ReadError& e) {
            err << "Error printing " << candidate.relative_path << ": " << e.what() << std::endl;
            ++m_stats.read_errors;
            return;
        }

        if (m_config.strip_comments) {
            record.content = ContentSanitizer::strip(record.content,
                                                     ExtensionSet::extensionOf(candidate.absolute_path));
        }

        emitter.emit(record);
        ++m_stats.emitted;
        PC_LOG_DEBUG("Core", "Emitted " + record.relative_path);
    });

    m_stats.walk_errors += walk_errors;
}

} // namespace PrintCode
