#ifndef DOCSHIELD_EXTRACT_FORMAT_ADAPTER_HPP
#define DOCSHIELD_EXTRACT_FORMAT_ADAPTER_HPP

#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "extract/errors.hpp"
#include "model/document_format.hpp"
#include "model/text_run.hpp"
#include "util/text_utils.hpp"

/**
 * @file format_adapter.hpp
 * @brief Common interface of the per-format adapters and format resolution.
 *
 * DESIGN GOALS:
 *   - An adapter turns raw bytes into an ordered stream of TextRuns, delivered
 *     one at a time to a RunSink, and returns the raw text it assembled.
 *   - Progress is reported as a fraction in [0, 1].
 *   - Any failure is a ParseFailure; nothing partial escapes an adapter.
 */

namespace docshield {
namespace extract {

using RunSink = std::function<void(const model::TextRun &)>;
using ProgressSink = std::function<void(double)>;

/**
 * @struct AdapterOutput
 * @brief What an adapter hands to the aggregator besides the run stream.
 */
struct AdapterOutput
{
    std::string rawText;
    int pageCount = 0;
};

/**
 * @class FormatAdapter
 * @brief Abstract base for PdfAdapter and DocxAdapter.
 */
class FormatAdapter
{
public:
    virtual ~FormatAdapter() = default;

    virtual model::DocumentFormat format() const = 0;

    /**
     * @brief Extract every run in document order.
     * @throw ParseFailure on malformed input.
     */
    virtual AdapterOutput extract(const std::vector<uint8_t> &bytes,
                                  const RunSink &onRun,
                                  const ProgressSink &onProgress) = 0;
};

/**
 * @brief Resolve a declared format name ("pdf", "docx", any case).
 * @throw UnsupportedFormat for anything else.
 */
inline model::DocumentFormat parseFormatName(const std::string &name)
{
    std::string lower = util::text::toLower(name);
    if (lower == "pdf" || lower == "application/pdf") {
        return model::DocumentFormat::Pdf;
    }
    if (lower == "docx"
        || lower == "application/vnd.openxmlformats-officedocument.wordprocessingml.document") {
        return model::DocumentFormat::Docx;
    }
    throw UnsupportedFormat("unsupported document format '" + name + "'");
}

/**
 * @brief Resolve the format from a file name's extension.
 * @throw UnsupportedFormat when the extension is not .pdf or .docx.
 */
inline model::DocumentFormat formatFromFileName(const std::string &fileName)
{
    auto dot = fileName.find_last_of('.');
    auto slash = fileName.find_last_of("/\\");
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        throw UnsupportedFormat("cannot determine document format of '" + fileName + "'");
    }
    try {
        return parseFormatName(fileName.substr(dot + 1));
    }
    catch (const UnsupportedFormat &) {
        throw UnsupportedFormat("unsupported document type '" + fileName + "'");
    }
}

} // namespace extract
} // namespace docshield

#endif // DOCSHIELD_EXTRACT_FORMAT_ADAPTER_HPP
