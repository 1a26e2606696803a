#ifndef DOCSHIELD_MODEL_SCAN_RESULT_HPP
#define DOCSHIELD_MODEL_SCAN_RESULT_HPP

#include <string>
#include <vector>
#include "model/document_format.hpp"
#include "model/issue.hpp"

/**
 * @file scan_result.hpp
 * @brief The outcome of scanning one document. Replaced wholesale on every
 *        new scan, never edited in place.
 *
 * Invariants (established by scan::Aggregator):
 *   - isEmpty == (trimmed rawText is empty)
 *   - safe == (issues.empty() && !isEmpty)
 */

namespace docshield {
namespace model {

struct ScanResult
{
    bool safe = false;
    std::vector<Issue> issues;      ///< Encounter order
    int pageCount = 0;
    std::string fileName;
    std::string rawText;
    std::string sanitizedText;      ///< Empty when isEmpty
    bool isEmpty = true;
    DocumentFormat format = DocumentFormat::Pdf;
    std::string documentSha256;
};

} // namespace model
} // namespace docshield

#endif // DOCSHIELD_MODEL_SCAN_RESULT_HPP
