#ifndef DOCSHIELD_SCAN_AGGREGATOR_HPP
#define DOCSHIELD_SCAN_AGGREGATOR_HPP

#include <string>
#include <utility>
#include <vector>
#include "extract/format_adapter.hpp"
#include "model/document_format.hpp"
#include "model/issue.hpp"
#include "model/scan_result.hpp"
#include "scan/sanitizer.hpp"
#include "util/text_utils.hpp"

/**
 * @file aggregator.hpp
 * @brief Folds per-run Issues and the adapter output into one ScanResult.
 *
 * Issues are kept in the order they are added, which is run-encounter order.
 * isEmpty and safe are derived here and nowhere else.
 */

namespace docshield {
namespace scan {

class Aggregator
{
public:
    void add(std::vector<model::Issue> issues)
    {
        for (auto &issue : issues) {
            issues_.push_back(std::move(issue));
        }
    }

    size_t issueCount() const { return issues_.size(); }

    /**
     * @brief Build the result. The aggregator is left empty afterwards.
     * @param sanitizer Produces sanitizedText; skipped for empty documents.
     */
    model::ScanResult finish(const extract::AdapterOutput &output,
                             const std::string &fileName,
                             model::DocumentFormat format,
                             const std::string &digest,
                             const Sanitizer &sanitizer)
    {
        model::ScanResult result;
        result.fileName = fileName;
        result.format = format;
        result.documentSha256 = digest;
        result.pageCount = output.pageCount;
        result.rawText = output.rawText;
        result.isEmpty = util::text::isBlank(result.rawText);
        result.issues = std::move(issues_);
        result.safe = result.issues.empty() && !result.isEmpty;
        if (!result.isEmpty) {
            result.sanitizedText = sanitizer.sanitize(result.rawText);
        }
        issues_.clear();
        return result;
    }

private:
    std::vector<model::Issue> issues_;
};

} // namespace scan
} // namespace docshield

#endif // DOCSHIELD_SCAN_AGGREGATOR_HPP
