#ifndef DOCSHIELD_SCAN_DOCUMENT_SCANNER_HPP
#define DOCSHIELD_SCAN_DOCUMENT_SCANNER_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "config/scan_config.hpp"
#include "extract/decode_budget.hpp"
#include "extract/docx/docx_adapter.hpp"
#include "extract/errors.hpp"
#include "extract/format_adapter.hpp"
#include "extract/pdf/pdf_adapter.hpp"
#include "model/scan_result.hpp"
#include "scan/aggregator.hpp"
#include "scan/sanitizer.hpp"
#include "scan/scanner.hpp"
#include "util/hashing.hpp"
#include "util/logger.hpp"

/**
 * @file document_scanner.hpp
 * @brief Runs one document through adapter -> scanner -> aggregator.
 *
 * DESIGN GOALS:
 *   - The only entry point that turns bytes into a ScanResult.
 *   - The format is settled before any adapter runs; anything other than PDF
 *     or DOCX is an UnsupportedFormat.
 *   - Adapter failures propagate as ParseFailure and no result is built.
 *   - Rules and sanitizer are built once per configuration, so a bad
 *     redaction token is reported at construction, not mid-scan.
 *
 * USAGE:
 *   @code
 *   DocumentScanner scanner(config);
 *   model::ScanResult result = scanner.scan(bytes, "report.pdf", model::DocumentFormat::Pdf);
 *   @endcode
 */

namespace docshield {
namespace scan {

class DocumentScanner
{
public:
    /**
     * @throw std::invalid_argument for an unusable redaction token.
     */
    explicit DocumentScanner(const config::ScanConfig &cfg)
        : config_(cfg),
          scanner_(cfg),
          sanitizer_(scanner_.phrases(), cfg.redactionToken)
    {
        extract::DecodeLimits limits;
        limits.maxStreamBytes = cfg.maxDecodedStreamBytes;
        limits.maxDocumentBytes = cfg.maxDecodedDocumentBytes;
        adapters_[model::DocumentFormat::Pdf] = std::make_unique<extract::PdfAdapter>(limits);
        adapters_[model::DocumentFormat::Docx] = std::make_unique<extract::DocxAdapter>(limits);
    }

    DocumentScanner(const DocumentScanner&) = delete;
    DocumentScanner& operator=(const DocumentScanner&) = delete;

    /**
     * @brief Replace the adapter used for a format.
     */
    void setAdapter(std::unique_ptr<extract::FormatAdapter> adapter)
    {
        model::DocumentFormat format = adapter->format();
        adapters_[format] = std::move(adapter);
    }

    const config::ScanConfig &config() const { return config_; }
    const Scanner &scanner() const { return scanner_; }
    const Sanitizer &sanitizer() const { return sanitizer_; }

    /**
     * @throw extract::ParseFailure on malformed input.
     */
    model::ScanResult scan(const std::vector<uint8_t> &bytes,
                           const std::string &fileName,
                           model::DocumentFormat format,
                           const extract::ProgressSink &onProgress = extract::ProgressSink()) const
    {
        auto it = adapters_.find(format);
        if (it == adapters_.end()) {
            throw extract::UnsupportedFormat("no adapter for format " + model::formatName(format));
        }

        Aggregator aggregator;
        size_t runs = 0;
        extract::AdapterOutput output;
        try {
            output = it->second->extract(bytes,
                [&](const model::TextRun &run) {
                    ++runs;
                    aggregator.add(scanner_.scanRun(run));
                },
                onProgress);
        }
        catch (const extract::ParseFailure &ex) {
            util::logger::error("DocumentScanner: " + fileName + ": " + ex.what());
            throw;
        }

        model::ScanResult result = aggregator.finish(output, fileName, format,
                                                     util::hashing::sha256(bytes), sanitizer_);
        util::logger::info("DocumentScanner: " + fileName + " [" + model::formatName(format) + "] "
                           + std::to_string(result.pageCount) + " page(s), "
                           + std::to_string(runs) + " run(s), "
                           + std::to_string(result.issues.size()) + " issue(s)"
                           + (result.isEmpty ? ", empty" : (result.safe ? ", safe" : "")));
        return result;
    }

    /**
     * @brief Scan with the format taken from a declared name ("pdf", "docx" or a MIME type).
     * @throw extract::UnsupportedFormat before any adapter runs.
     */
    model::ScanResult scan(const std::vector<uint8_t> &bytes,
                           const std::string &fileName,
                           const std::string &declaredFormat,
                           const extract::ProgressSink &onProgress = extract::ProgressSink()) const
    {
        return scan(bytes, fileName, extract::parseFormatName(declaredFormat), onProgress);
    }

private:
    config::ScanConfig config_;
    Scanner scanner_;
    Sanitizer sanitizer_;
    std::map<model::DocumentFormat, std::unique_ptr<extract::FormatAdapter>> adapters_;
};

} // namespace scan
} // namespace docshield

#endif // DOCSHIELD_SCAN_DOCUMENT_SCANNER_HPP
