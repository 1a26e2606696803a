#ifndef DOCSHIELD_MODEL_ISSUE_HPP
#define DOCSHIELD_MODEL_ISSUE_HPP

#include <string>

/**
 * @file issue.hpp
 * @brief A single finding raised by a detection rule.
 */

namespace docshield {
namespace model {

enum class IssueKind {
    InjectionKeyword,
    HiddenText,
    MicroText
};

enum class Severity {
    High,
    Medium
};

inline std::string issueKindName(IssueKind kind)
{
    switch (kind) {
    case IssueKind::InjectionKeyword: return "Injection Keyword";
    case IssueKind::HiddenText:       return "Hidden Text";
    case IssueKind::MicroText:        return "Micro-text";
    }
    return "Unknown";
}

/// Short tag used inside Issue ids.
inline std::string issueKindTag(IssueKind kind)
{
    switch (kind) {
    case IssueKind::InjectionKeyword: return "keyword";
    case IssueKind::HiddenText:       return "hidden";
    case IssueKind::MicroText:        return "micro";
    }
    return "unknown";
}

inline std::string severityName(Severity severity)
{
    return severity == Severity::High ? "high" : "medium";
}

/**
 * @struct Issue
 * @brief Owned by the ScanResult it belongs to.
 */
struct Issue
{
    std::string id;       ///< p<page>-r<run>-<kind>-<ordinal>
    IssueKind kind = IssueKind::InjectionKeyword;
    std::string detail;   ///< Human-readable description
    std::string context;  ///< Full text of the originating run
    int page = 1;
    Severity severity = Severity::High;
};

inline bool operator==(const Issue &a, const Issue &b)
{
    return a.id == b.id && a.kind == b.kind && a.detail == b.detail
        && a.context == b.context && a.page == b.page && a.severity == b.severity;
}

} // namespace model
} // namespace docshield

#endif // DOCSHIELD_MODEL_ISSUE_HPP
