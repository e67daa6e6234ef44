// =================================================================
// src/PrintCode/SelectionFilter.cpp
// =================================================================
// Implementation for the candidate selection stages.

#include "PrintCode/SelectionFilter.hpp"
#include <filesystem>
#include <sstream>

namespace PrintCode {

SelectionFilter::SelectionFilter(const ExtensionSet& extensions,
                                 const ExclusionMatcher& exclusions,
                                 const SizeLimit& size_limit)
{
    const ExtensionSet* ext_set = &extensions;
    const ExclusionMatcher* matcher = &exclusions;

    m_stages.push_back({"extension", [ext_set](const Candidate& candidate) {
        if (!ext_set->matches(candidate.absolute_path)) {
            return SelectionDecision::reject(RejectReason::Extension);
        }
        return SelectionDecision::accept();
    }});

    m_stages.push_back({"exclude", [matcher](const Candidate& candidate) {
        if (matcher->isExcluded(candidate.relative_path)) {
            return SelectionDecision::reject(RejectReason::Excluded);
        }
        return SelectionDecision::accept();
    }});

    if (size_limit.enabled) {
        std::uintmax_t limit = size_limit.max_bytes;
        m_stages.push_back({"size", [limit](const Candidate& candidate) {
            std::error_code ec;
            std::uintmax_t size = std::filesystem::file_size(candidate.absolute_path, ec);
            // An unreadable size is left for the read to report
            if (!ec && size > limit) {
                return SelectionDecision::reject(RejectReason::TooLarge,
                    formatSizeSkip(candidate.relative_path, size, limit));
            }
            return SelectionDecision::accept();
        }});
    }
}

SelectionDecision SelectionFilter::evaluate(const Candidate& candidate) const {
    for (const auto& stage : m_stages) {
        SelectionDecision decision = stage.check(candidate);
        if (!decision.accepted) {
            return decision;
        }
    }
    return SelectionDecision::accept();
}

std::vector<std::string> SelectionFilter::stageNames() const {
    std::vector<std::string> names;
    for (const auto& stage : m_stages) {
        names.push_back(stage.name);
    }
    return names;
}

std::string SelectionFilter::formatSizeSkip(const std::string& relative_path,
                                            std::uintmax_t actual_bytes,
                                            std::uintmax_t limit_bytes) {
    std::ostringstream line;
    line << "Skipping " << relative_path
         << " (size " << actual_bytes << " bytes > max " << limit_bytes << " bytes)";
    return line.str();
}

std::string SelectionFilter::reasonName(RejectReason reason) {
    switch (reason) {
        case RejectReason::None: return "none";
        case RejectReason::Extension: return "extension";
        case RejectReason::Excluded: return "excluded";
        case RejectReason::TooLarge: return "size";
        default: return "unknown";
    }
}

} // namespace PrintCode
