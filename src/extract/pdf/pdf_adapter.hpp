#ifndef DOCSHIELD_EXTRACT_PDF_PDF_ADAPTER_HPP
#define DOCSHIELD_EXTRACT_PDF_PDF_ADAPTER_HPP

#include <cmath>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "extract/decode_budget.hpp"
#include "extract/errors.hpp"
#include "extract/format_adapter.hpp"
#include "extract/pdf/pdf_text_source.hpp"
#include "model/text_run.hpp"
#include "util/logger.hpp"

/**
 * @file pdf_adapter.hpp
 * @brief Paginated-container adapter: one TextRun per text item, pages in order.
 *
 * fontSizePt is |a| of the item's transform. Item texts are joined with a
 * single space inside a page and pages are separated by a blank line.
 */

namespace docshield {
namespace extract {

class PdfAdapter : public FormatAdapter
{
public:
    using SourceFactory = std::function<std::unique_ptr<pdf::PageTextSource>(const std::vector<uint8_t>&)>;

    /**
     * @param limits Decoded-size ceilings handed to each PdfTextSource.
     */
    explicit PdfAdapter(const DecodeLimits &limits = DecodeLimits())
        : factory_([limits](const std::vector<uint8_t> &bytes) -> std::unique_ptr<pdf::PageTextSource> {
              return std::make_unique<pdf::PdfTextSource>(bytes, limits);
          })
    {
    }

    /**
     * @param factory Opens the page/text-extraction capability for a document.
     */
    explicit PdfAdapter(SourceFactory factory)
        : factory_(std::move(factory))
    {
    }

    model::DocumentFormat format() const override { return model::DocumentFormat::Pdf; }

    AdapterOutput extract(const std::vector<uint8_t> &bytes,
                          const RunSink &onRun,
                          const ProgressSink &onProgress) override
    {
        try {
            return run(bytes, onRun, onProgress);
        }
        catch (const ParseFailure &) {
            throw;
        }
        catch (const std::exception &ex) {
            throw ParseFailure(std::string("PDF: extraction failed: ") + ex.what());
        }
    }

private:
    SourceFactory factory_;

    AdapterOutput run(const std::vector<uint8_t> &bytes, const RunSink &onRun,
                      const ProgressSink &onProgress)
    {
        std::unique_ptr<pdf::PageTextSource> source = factory_(bytes);
        if (!source) {
            throw ParseFailure("PDF: no text source for document");
        }

        AdapterOutput out;
        out.pageCount = source->pageCount();
        size_t runIndex = 0;

        for (int p = 0; p < out.pageCount; ++p) {
            std::vector<pdf::TextItem> items = source->textContent(p);
            std::string pageText;
            for (size_t i = 0; i < items.size(); ++i) {
                model::TextRun textRun;
                textRun.text = items[i].text;
                textRun.page = p + 1;
                textRun.fontSizePt = std::fabs(items[i].transform[0]);
                textRun.origin = model::DocumentFormat::Pdf;
                textRun.index = runIndex++;
                if (onRun) {
                    onRun(textRun);
                }
                if (i > 0) {
                    pageText += ' ';
                }
                pageText += items[i].text;
            }
            if (p > 0) {
                out.rawText += "\n\n";
            }
            out.rawText += pageText;

            util::logger::debug("[PdfAdapter] page " + std::to_string(p + 1) + "/"
                                + std::to_string(out.pageCount) + ": "
                                + std::to_string(items.size()) + " items");
            if (onProgress) {
                onProgress(static_cast<double>(p + 1) / out.pageCount);
            }
        }
        return out;
    }
};

} // namespace extract
} // namespace docshield

#endif // DOCSHIELD_EXTRACT_PDF_PDF_ADAPTER_HPP
