#ifndef DOCSHIELD_EXTRACT_DOCX_DOCX_ADAPTER_HPP
#define DOCSHIELD_EXTRACT_DOCX_DOCX_ADAPTER_HPP

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>
#include <tinyxml2.h>
#include "extract/decode_budget.hpp"
#include "extract/docx/zip_archive.hpp"
#include "extract/errors.hpp"
#include "extract/format_adapter.hpp"
#include "model/text_run.hpp"
#include "util/logger.hpp"
#include "util/text_utils.hpp"

/**
 * @file docx_adapter.hpp
 * @brief Compound-archive adapter: WordprocessingML runs from word/document.xml.
 *
 * DESIGN GOALS:
 *   - Every w:r element, in document order (nested runs such as text-box
 *     content included), becomes one TextRun holding the concatenated text of
 *     its w:t descendants. Runs without w:t are skipped.
 *   - Formatting is read from the run's first w:rPr: w:color gives colorHex
 *     (w:val uppercased, or the theme token when only w:themeColor is set),
 *     w:sz gives fontSizePt = halfPoints / 2.
 *   - The format has no pagination model here: every run is on page 1.
 *
 * REQUIREMENTS:
 *   - tinyxml2 for the markup, libzip (via ZipArchive) for the container.
 */

namespace docshield {
namespace extract {

/**
 * @brief Leading-integer parse of a w:sz value, as browsers' parseInt does.
 * @return false when no digits lead the value.
 */
inline bool parseHalfPoints(const char *value, long &out)
{
    if (!value) {
        return false;
    }
    char *end = nullptr;
    errno = 0;
    long v = std::strtol(value, &end, 10);
    if (end == value || errno == ERANGE) {
        return false;
    }
    out = v;
    return true;
}

class DocxAdapter : public FormatAdapter
{
public:
    static constexpr const char *kDocumentPart = "word/document.xml";

    explicit DocxAdapter(const DecodeLimits &limits = DecodeLimits())
        : limits_(limits)
    {
    }

    model::DocumentFormat format() const override { return model::DocumentFormat::Docx; }

    AdapterOutput extract(const std::vector<uint8_t> &bytes,
                          const RunSink &onRun,
                          const ProgressSink &onProgress) override
    {
        docx::ZipArchive archive(bytes);
        if (!archive.contains(kDocumentPart)) {
            throw ParseFailure(std::string("DOCX: archive has no ") + kDocumentPart);
        }
        DecodeBudget budget(limits_);
        std::string xml = archive.read(kDocumentPart, budget);
        if (onProgress) {
            onProgress(0.1);
        }

        tinyxml2::XMLDocument doc(true, tinyxml2::PRESERVE_WHITESPACE);
        if (doc.Parse(xml.c_str(), xml.size()) != tinyxml2::XML_SUCCESS) {
            throw ParseFailure(std::string("DOCX: malformed document markup: ") + doc.ErrorStr());
        }
        if (onProgress) {
            onProgress(0.5);
        }

        AdapterOutput out;
        out.pageCount = 1;
        size_t runIndex = 0;
        visitRuns(doc.RootElement(), out, onRun, runIndex);
        util::logger::debug("[DocxAdapter] " + std::to_string(runIndex) + " runs extracted");

        if (onProgress) {
            onProgress(1.0);
        }
        return out;
    }

private:
    DecodeLimits limits_;

    static bool named(const tinyxml2::XMLElement *e, const char *name)
    {
        return e && e->Name() && std::string(e->Name()) == name;
    }

    /// First descendant (pre-order) with the given name, or nullptr.
    static const tinyxml2::XMLElement *firstDescendant(const tinyxml2::XMLElement *root, const char *name)
    {
        for (auto child = root->FirstChildElement(); child; child = child->NextSiblingElement()) {
            if (named(child, name)) {
                return child;
            }
            if (const tinyxml2::XMLElement *found = firstDescendant(child, name)) {
                return found;
            }
        }
        return nullptr;
    }

    static void collectText(const tinyxml2::XMLElement *node, std::string &out)
    {
        for (auto child = node->FirstChildElement(); child; child = child->NextSiblingElement()) {
            if (named(child, "w:t")) {
                for (auto text = child->FirstChild(); text; text = text->NextSibling()) {
                    if (text->ToText() && text->Value()) {
                        out += text->Value();
                    }
                }
            } else {
                collectText(child, out);
            }
        }
    }

    static bool hasText(const tinyxml2::XMLElement *run)
    {
        return firstDescendant(run, "w:t") != nullptr;
    }

    static void readFormatting(const tinyxml2::XMLElement *run, model::TextRun &textRun)
    {
        const tinyxml2::XMLElement *rPr = firstDescendant(run, "w:rPr");
        if (!rPr) {
            return;
        }
        if (const tinyxml2::XMLElement *color = firstDescendant(rPr, "w:color")) {
            if (const char *val = color->Attribute("w:val")) {
                textRun.colorHex = util::text::toUpper(val);
            } else if (const char *theme = color->Attribute("w:themeColor")) {
                textRun.colorHex = util::text::toUpper(theme);
            }
        }
        if (const tinyxml2::XMLElement *sz = firstDescendant(rPr, "w:sz")) {
            long halfPoints = 0;
            if (parseHalfPoints(sz->Attribute("w:val"), halfPoints)) {
                textRun.fontSizePt = static_cast<double>(halfPoints) / 2.0;
            }
        }
    }

    void visitRuns(const tinyxml2::XMLElement *node, AdapterOutput &out,
                   const RunSink &onRun, size_t &runIndex) const
    {
        if (!node) {
            return;
        }
        for (auto child = node->FirstChildElement(); child; child = child->NextSiblingElement()) {
            if (named(child, "w:r") && hasText(child)) {
                model::TextRun textRun;
                collectText(child, textRun.text);
                textRun.page = 1;
                textRun.origin = model::DocumentFormat::Docx;
                textRun.index = runIndex++;
                readFormatting(child, textRun);

                if (textRun.index > 0) {
                    out.rawText += ' ';
                }
                out.rawText += textRun.text;
                if (onRun) {
                    onRun(textRun);
                }
            }
            visitRuns(child, out, onRun, runIndex);
        }
    }
};

} // namespace extract
} // namespace docshield

#endif // DOCSHIELD_EXTRACT_DOCX_DOCX_ADAPTER_HPP
