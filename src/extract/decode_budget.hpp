#ifndef DOCSHIELD_EXTRACT_DECODE_BUDGET_HPP
#define DOCSHIELD_EXTRACT_DECODE_BUDGET_HPP

#include <cstddef>
#include <string>
#include "extract/errors.hpp"

/**
 * @file decode_budget.hpp
 * @brief Ceilings on decompressed data while one document is extracted.
 *
 * Both adapters meter the bytes their decoder produces and stop as soon as a
 * single stream (PDF content/font stream, zip entry) or the document as a
 * whole goes over its limit, before the oversized data is held in memory.
 */

namespace docshield {
namespace extract {

struct DecodeLimits
{
    size_t maxStreamBytes = 64u * 1024u * 1024u;
    size_t maxDocumentBytes = 256u * 1024u * 1024u;
};

/**
 * @class DecodeBudget
 * @brief Running totals for one document. Not thread-safe; one per extraction.
 */
class DecodeBudget
{
public:
    explicit DecodeBudget(const DecodeLimits &limits)
        : limits_(limits)
    {
    }

    /**
     * @brief Account for @p bytes more output of the stream named @p what.
     * @param streamTotal The stream's running total, updated in place.
     * @throw ParseFailure when the stream or the document exceeds its limit.
     */
    void charge(const std::string &what, size_t &streamTotal, size_t bytes)
    {
        streamTotal += bytes;
        documentTotal_ += bytes;
        if (streamTotal > limits_.maxStreamBytes) {
            throw ParseFailure(what + " decodes to more than "
                               + std::to_string(limits_.maxStreamBytes) + " bytes");
        }
        if (documentTotal_ > limits_.maxDocumentBytes) {
            throw ParseFailure(what + ": document decodes to more than "
                               + std::to_string(limits_.maxDocumentBytes) + " bytes");
        }
    }

    size_t documentTotal() const { return documentTotal_; }
    const DecodeLimits &limits() const { return limits_; }

private:
    DecodeLimits limits_;
    size_t documentTotal_ = 0;
};

} // namespace extract
} // namespace docshield

#endif // DOCSHIELD_EXTRACT_DECODE_BUDGET_HPP
