// =================================================================
// include/PrintCode/Core.hpp
// =================================================================
// Defines the scanning pipeline orchestrator.

#pragma once

#include "PrintCode/ScanConfig.hpp"
#include <memory>
#include <ostream>
#include <string>

namespace PrintCode {

class Emitter;
class ExclusionMatcher;
class SelectionFilter;

/**
 * @brief Counters collected over one run
 */
struct ScanStats {
    size_t roots_scanned = 0;
    size_t candidates = 0;
    size_t emitted = 0;
    size_t rejected_extension = 0;
    size_t rejected_excluded = 0;
    size_t rejected_size = 0;
    size_t read_errors = 0;
    size_t walk_errors = 0;

    bool hadErrors() const { return read_errors > 0 || walk_errors > 0; }
};

/**
 * @brief Runs roots through walker, filter, sanitizer and emitter
 *
 * Roots are processed strictly in the order given and candidates in walker
 * order. File content goes to `out`; size skips, read errors and walk
 * errors go to `err`.
 */
class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param config The merged run configuration.
     */
    explicit Core(const ScanConfig& config);

    ~Core();

    /**
     * @brief Runs the pipeline over every configured root.
     * @return 0 on a completed scan, 1 if any file or directory could not be read.
     * @throws ConfigurationError before anything is written when the extension
     *         set is empty or an exclusion glob is malformed.
     */
    int run(std::ostream& out, std::ostream& err);

    const ScanStats& getStats() const { return m_stats; }

    /**
     * @brief Message printed on stderr when a run had read or walk errors
     */
    static const char* const INCOMPLETE_RUN_MESSAGE;

private:
    void scanRoot(const std::string& raw_root,
                  const SelectionFilter& filter,
                  const ExclusionMatcher& exclusions,
                  Emitter& emitter,
                  std::ostream& err);

    const ScanConfig& m_config;
    ScanStats m_stats;
};

} // namespace PrintCode
