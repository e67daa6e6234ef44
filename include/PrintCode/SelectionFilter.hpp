// =================================================================
// include/PrintCode/SelectionFilter.hpp
// =================================================================
// Header for the ordered accept/reject checks applied to each candidate.

#pragma once

#include "PrintCode/ExtensionSet.hpp"
#include "PrintCode/ExclusionMatcher.hpp"
#include "PrintCode/IgnoreWalker.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace PrintCode {

/**
 * @brief Optional maximum file size; files strictly larger are skipped
 */
struct SizeLimit {
    bool enabled = false;
    std::uintmax_t max_bytes = 0;
};

/**
 * @brief Why a candidate was turned away
 */
enum class RejectReason {
    None,
    Extension,
    Excluded,
    TooLarge
};

/**
 * @brief Result of running a candidate through the filter
 *
 * Only size rejections carry a diagnostic; the other reasons are silent.
 */
struct SelectionDecision {
    bool accepted = true;
    RejectReason reason = RejectReason::None;
    std::string diagnostic;

    static SelectionDecision accept() { return SelectionDecision(); }

    static SelectionDecision reject(RejectReason why, const std::string& message = "") {
        SelectionDecision decision;
        decision.accepted = false;
        decision.reason = why;
        decision.diagnostic = message;
        return decision;
    }
};

/**
 * @brief Applies extension, exclusion and size checks in that order
 *
 * Each check is a stage; evaluation stops at the first rejecting stage so
 * later, costlier checks (the size check stats the file) are skipped.
 * The extension set and exclusion matcher are borrowed and must outlive
 * the filter.
 */
class SelectionFilter {
public:
    SelectionFilter(const ExtensionSet& extensions,
                    const ExclusionMatcher& exclusions,
                    const SizeLimit& size_limit);

    SelectionFilter(const SelectionFilter&) = delete;
    SelectionFilter& operator=(const SelectionFilter&) = delete;

    SelectionDecision evaluate(const Candidate& candidate) const;

    /**
     * @brief Names of the stages in evaluation order
     */
    std::vector<std::string> stageNames() const;

    /**
     * @brief Text of the size-limit diagnostic line
     */
    static std::string formatSizeSkip(const std::string& relative_path,
                                      std::uintmax_t actual_bytes,
                                      std::uintmax_t limit_bytes);

    static std::string reasonName(RejectReason reason);

private:
    struct Stage {
        std::string name;
        std::function<SelectionDecision(const Candidate&)> check;
    };

    std::vector<Stage> m_stages;
};

} // namespace PrintCode
