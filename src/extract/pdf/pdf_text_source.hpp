#ifndef DOCSHIELD_EXTRACT_PDF_PDF_TEXT_SOURCE_HPP
#define DOCSHIELD_EXTRACT_PDF_PDF_TEXT_SOURCE_HPP

#include <array>
#include <cstdint>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include <podofo/podofo.h>
#include "extract/decode_budget.hpp"
#include "extract/errors.hpp"
#include "util/logger.hpp"

/**
 * @file pdf_text_source.hpp
 * @brief The page/text-extraction capability behind PdfAdapter.
 *
 * DESIGN GOALS:
 *   - PageTextSource is the narrow seam the adapter depends on: a page count
 *     and, per page, the ordered text items with their affine transforms.
 *   - PdfTextSource implements it with PoDoFo. PoDoFo parses the file, walks
 *     the page tree, decodes streams, tokenizes content (following form
 *     XObjects) and maps glyph codes to Unicode through each font's encoding.
 *     This class only keeps the text state needed to place each item:
 *     transform = [size*Th 0 0 size 0 rise] x Tm x CTM.
 *   - Every stream PoDoFo may inflate for a page is first drained through a
 *     metered sink, so an oversized stream fails with ParseFailure before it
 *     is ever materialized.
 *
 * REQUIREMENTS:
 *   - Links against PoDoFo 0.10.
 *
 * USAGE:
 *   @code
 *   PdfTextSource source(bytes, limits);
 *   for (int p = 0; p < source.pageCount(); ++p) {
 *       for (const TextItem &item : source.textContent(p)) { ... }
 *   }
 *   @endcode
 */

namespace docshield {
namespace extract {
namespace pdf {

using Matrix = std::array<double, 6>;

inline Matrix identityMatrix()
{
    return Matrix{1.0, 0.0, 0.0, 1.0, 0.0, 0.0};
}

/// Row-vector convention: the result applies @p m first, then @p n.
inline Matrix multiply(const Matrix &m, const Matrix &n)
{
    return Matrix{
        m[0] * n[0] + m[1] * n[2],
        m[0] * n[1] + m[1] * n[3],
        m[2] * n[0] + m[3] * n[2],
        m[2] * n[1] + m[3] * n[3],
        m[4] * n[0] + m[5] * n[2] + n[4],
        m[4] * n[1] + m[5] * n[3] + n[5]
    };
}

struct TextItem
{
    std::string text;
    Matrix transform = identityMatrix();
};

/**
 * @class PageTextSource
 * @brief An opened paginated document. Page indices are 0-based.
 */
class PageTextSource
{
public:
    virtual ~PageTextSource() = default;

    virtual int pageCount() const = 0;

    /**
     * @throw ParseFailure if the page cannot be read.
     */
    virtual std::vector<TextItem> textContent(int pageIndex) = 0;
};

/**
 * @class MeteredSink
 * @brief PoDoFo output stream that keeps nothing and charges a DecodeBudget.
 */
class MeteredSink : public PoDoFo::OutputStream
{
public:
    MeteredSink(DecodeBudget &budget, std::string what)
        : budget_(budget), what_(std::move(what))
    {
    }

protected:
    void writeBuffer(const char *, size_t size) override
    {
        budget_.charge(what_, total_, size);
    }

private:
    DecodeBudget &budget_;
    std::string what_;
    size_t total_ = 0;
};

class PdfTextSource : public PageTextSource
{
public:
    /**
     * @throw ParseFailure if PoDoFo cannot load the document or it needs a password.
     */
    explicit PdfTextSource(const std::vector<uint8_t> &bytes, const DecodeLimits &limits = DecodeLimits())
        : buffer_(bytes.begin(), bytes.end()), budget_(limits)
    {
        try {
            document_.LoadFromBuffer(PoDoFo::bufferview(buffer_.data(), buffer_.size()));
            pageCount_ = static_cast<int>(document_.GetPages().GetCount());
        }
        catch (const PoDoFo::PdfError &ex) {
            if (ex.GetCode() == PoDoFo::PdfErrorCode::InvalidPassword) {
                throw ParseFailure("PDF: document is password-protected");
            }
            throw ParseFailure(std::string("PDF: cannot open document: ") + ex.what());
        }
    }

    int pageCount() const override { return pageCount_; }

    std::vector<TextItem> textContent(int pageIndex) override
    {
        if (pageIndex < 0 || pageIndex >= pageCount_) {
            throw ParseFailure("PDF: page index " + std::to_string(pageIndex) + " out of range");
        }
        PoDoFo::PdfPage &page = document_.GetPages().GetPageAt(static_cast<unsigned>(pageIndex));
        PoDoFo::PdfDictionary &pageDict = page.GetDictionary();
        PoDoFo::PdfObject *resources = pageDict.FindKeyParent("Resources");

        meterContents(pageDict.FindKey("Contents"));
        meterResources(resources, 0);

        std::vector<TextItem> items;
        interpret(page, resources, items);
        return items;
    }

private:
    static constexpr int kMaxFormDepth = 32;
    static constexpr double kWordGapThreshold = -250.0;

    struct GraphicsState
    {
        Matrix ctm = identityMatrix();
        double horizontalScale = 1.0;
        double leading = 0.0;
        double fontSize = 0.0;
        double rise = 0.0;
        const PoDoFo::PdfFont *font = nullptr;
    };

    std::vector<char> buffer_;     ///< PoDoFo reads from it lazily; outlives document_
    PoDoFo::PdfMemDocument document_;
    DecodeBudget budget_;
    int pageCount_ = 0;
    std::set<const PoDoFo::PdfObject*> metered_;

    // ------------------------------------------------------------------------
    //  Decode metering
    // ------------------------------------------------------------------------
    void meterStream(const PoDoFo::PdfObject *obj)
    {
        if (!obj || !obj->HasStream() || !metered_.insert(obj).second) {
            return;
        }
        MeteredSink sink(budget_, "PDF: stream of object "
                                  + std::to_string(obj->GetIndirectReference().ObjectNumber()));
        obj->GetStream()->CopyTo(sink);
    }

    void meterContents(const PoDoFo::PdfObject *contents)
    {
        if (!contents) {
            return;
        }
        if (contents->IsArray()) {
            const PoDoFo::PdfArray &parts = contents->GetArray();
            for (unsigned i = 0; i < parts.GetSize(); ++i) {
                meterStream(parts.FindAt(i));
            }
        } else {
            meterStream(contents);
        }
    }

    void meterFont(const PoDoFo::PdfObject *font, bool descendant)
    {
        if (!font || !font->IsDictionary()) {
            return;
        }
        const PoDoFo::PdfDictionary &dict = font->GetDictionary();
        meterStream(dict.FindKey("ToUnicode"));
        const PoDoFo::PdfObject *descriptor = dict.FindKey("FontDescriptor");
        if (descriptor && descriptor->IsDictionary()) {
            for (const char *key : {"FontFile", "FontFile2", "FontFile3"}) {
                meterStream(descriptor->GetDictionary().FindKey(key));
            }
        }
        const PoDoFo::PdfObject *descendants = dict.FindKey("DescendantFonts");
        if (!descendant && descendants && descendants->IsArray() && descendants->GetArray().GetSize() > 0) {
            meterFont(descendants->GetArray().FindAt(0), true);
        }
    }

    void meterResources(const PoDoFo::PdfObject *resources, int depth)
    {
        if (!resources || !resources->IsDictionary()) {
            return;
        }
        if (depth > kMaxFormDepth) {
            throw ParseFailure("PDF: form XObjects nested more than "
                               + std::to_string(kMaxFormDepth) + " deep");
        }
        const PoDoFo::PdfDictionary &dict = resources->GetDictionary();

        const PoDoFo::PdfObject *fonts = dict.FindKey("Font");
        if (fonts && fonts->IsDictionary()) {
            for (const auto &entry : fonts->GetDictionary()) {
                meterFont(fonts->GetDictionary().FindKey(entry.first.GetString()), false);
            }
        }

        const PoDoFo::PdfObject *xobjects = dict.FindKey("XObject");
        if (!xobjects || !xobjects->IsDictionary()) {
            return;
        }
        for (const auto &entry : xobjects->GetDictionary()) {
            const PoDoFo::PdfObject *xobject = xobjects->GetDictionary().FindKey(entry.first.GetString());
            if (!isForm(xobject) || metered_.count(xobject) != 0) {
                continue;
            }
            meterStream(xobject);
            meterResources(xobject->GetDictionary().FindKey("Resources"), depth + 1);
        }
    }

    static bool isForm(const PoDoFo::PdfObject *xobject)
    {
        if (!xobject || !xobject->HasStream() || !xobject->IsDictionary()) {
            return false;
        }
        const PoDoFo::PdfObject *subtype = xobject->GetDictionary().FindKey("Subtype");
        return subtype && subtype->IsName() && subtype->GetName() == "Form";
    }

    // ------------------------------------------------------------------------
    //  Operands. PoDoFo indexes the operand stack from the top: Stack[0] is
    //  the operand written last.
    // ------------------------------------------------------------------------
    static double number(const PoDoFo::PdfContent &content, unsigned fromTop)
    {
        if (fromTop >= content.Stack.GetSize()) {
            return 0.0;
        }
        const PoDoFo::PdfVariant &v = content.Stack[fromTop];
        return v.IsNumberOrReal() ? v.GetReal() : 0.0;
    }

    static bool hasNumbers(const PoDoFo::PdfContent &content, unsigned count)
    {
        if (content.Stack.GetSize() < count) {
            return false;
        }
        for (unsigned i = 0; i < count; ++i) {
            if (!content.Stack[i].IsNumberOrReal()) {
                return false;
            }
        }
        return true;
    }

    static Matrix matrixOperand(const PoDoFo::PdfContent &content)
    {
        return Matrix{number(content, 5), number(content, 4), number(content, 3),
                      number(content, 2), number(content, 1), number(content, 0)};
    }

    static Matrix matrixEntry(const PoDoFo::PdfObject *array)
    {
        Matrix m = identityMatrix();
        if (!array || !array->IsArray() || array->GetArray().GetSize() != 6) {
            return m;
        }
        for (unsigned i = 0; i < 6; ++i) {
            const PoDoFo::PdfObject *v = array->GetArray().FindAt(i);
            m[i] = (v && v->IsNumberOrReal()) ? v->GetReal() : 0.0;
        }
        return m;
    }

    static PoDoFo::PdfObject *resourceEntry(PoDoFo::PdfObject *resources, const char *category,
                                            const std::string &name)
    {
        if (!resources || !resources->IsDictionary()) {
            return nullptr;
        }
        PoDoFo::PdfObject *group = resources->GetDictionary().FindKey(category);
        if (!group || !group->IsDictionary()) {
            return nullptr;
        }
        return group->GetDictionary().FindKey(name);
    }

    // ------------------------------------------------------------------------
    //  Text
    // ------------------------------------------------------------------------
    const PoDoFo::PdfFont *loadFont(PoDoFo::PdfObject *resources, const std::string &name)
    {
        PoDoFo::PdfObject *fontObj = resourceEntry(resources, "Font", name);
        if (!fontObj) {
            util::logger::debug("PdfTextSource: font /" + name + " not found in resources");
            return nullptr;
        }
        const PoDoFo::PdfFont *font = document_.GetFonts().GetLoadedFont(*fontObj);
        if (!font) {
            util::logger::warn("PdfTextSource: font /" + name + " could not be loaded");
        }
        return font;
    }

    static std::string decodeString(const PoDoFo::PdfString &str, const GraphicsState &gs)
    {
        if (!gs.font) {
            return std::string(str.GetString());
        }
        std::string utf8;
        if (!gs.font->GetEncoding().TryConvertToUtf8(str, utf8)) {
            util::logger::debug("PdfTextSource: some glyph codes have no Unicode mapping");
        }
        return utf8;
    }

    static std::string decodeShown(const PoDoFo::PdfVariant &operand, const GraphicsState &gs)
    {
        if (operand.IsString()) {
            return decodeString(operand.GetString(), gs);
        }
        std::string out;
        if (!operand.IsArray()) {
            return out;
        }
        for (const PoDoFo::PdfObject &part : operand.GetArray()) {
            if (part.IsString()) {
                out += decodeString(part.GetString(), gs);
            } else if (part.IsNumberOrReal() && part.GetReal() <= kWordGapThreshold
                       && !out.empty() && out.back() != ' ') {
                out += ' ';
            }
        }
        return out;
    }

    static void emit(const std::string &text, const GraphicsState &gs, const Matrix &tm,
                     std::vector<TextItem> &items)
    {
        if (text.empty()) {
            return;
        }
        Matrix params{gs.fontSize * gs.horizontalScale, 0.0, 0.0, gs.fontSize, 0.0, gs.rise};
        TextItem item;
        item.text = text;
        item.transform = multiply(multiply(params, tm), gs.ctm);
        items.push_back(std::move(item));
    }

    void interpret(PoDoFo::PdfPage &page, PoDoFo::PdfObject *pageResources, std::vector<TextItem> &items)
    {
        GraphicsState gs;
        std::vector<GraphicsState> saved;
        // one entry per form being read, restored when PoDoFo leaves it
        std::vector<std::pair<GraphicsState, PoDoFo::PdfObject*>> forms;
        PoDoFo::PdfObject *resources = pageResources;
        Matrix tm = identityMatrix();
        Matrix tlm = identityMatrix();

        auto moveLine = [&](double tx, double ty) {
            tlm = multiply(Matrix{1.0, 0.0, 0.0, 1.0, tx, ty}, tlm);
            tm = tlm;
        };

        PoDoFo::PdfContentStreamReader reader(page);
        PoDoFo::PdfContent content;
        while (reader.TryReadNext(content)) {
            if (content.Type == PoDoFo::PdfContentType::DoXObject) {
                PoDoFo::PdfObject *xobject = content.Stack.GetSize() > 0 && content.Stack[0].IsName()
                    ? resourceEntry(resources, "XObject", std::string(content.Stack[0].GetName().GetString()))
                    : nullptr;
                if (isForm(xobject)) {
                    forms.emplace_back(gs, resources);
                    gs.ctm = multiply(matrixEntry(xobject->GetDictionary().FindKey("Matrix")), gs.ctm);
                    PoDoFo::PdfObject *formResources = xobject->GetDictionary().FindKey("Resources");
                    if (formResources) {
                        resources = formResources;
                    }
                }
                continue;
            }
            if (content.Type == PoDoFo::PdfContentType::EndXObjectForm) {
                if (!forms.empty()) {
                    gs = forms.back().first;
                    resources = forms.back().second;
                    forms.pop_back();
                }
                continue;
            }
            if (content.Type != PoDoFo::PdfContentType::Operator) {
                continue; // inline images and stray keywords
            }

            const std::string op(content.Keyword);
            if (op == "q") {
                saved.push_back(gs);
            } else if (op == "Q") {
                if (!saved.empty()) {
                    gs = saved.back();
                    saved.pop_back();
                }
            } else if (op == "cm" && hasNumbers(content, 6)) {
                gs.ctm = multiply(matrixOperand(content), gs.ctm);
            } else if (op == "BT") {
                tm = identityMatrix();
                tlm = identityMatrix();
            } else if (op == "Tf" && content.Stack.GetSize() >= 2) {
                gs.fontSize = number(content, 0);
                gs.font = content.Stack[1].IsName()
                    ? loadFont(resources, std::string(content.Stack[1].GetName().GetString()))
                    : nullptr;
            } else if (op == "Tz") {
                gs.horizontalScale = number(content, 0) / 100.0;
            } else if (op == "TL") {
                gs.leading = number(content, 0);
            } else if (op == "Ts") {
                gs.rise = number(content, 0);
            } else if (op == "Td" && hasNumbers(content, 2)) {
                moveLine(number(content, 1), number(content, 0));
            } else if (op == "TD" && hasNumbers(content, 2)) {
                gs.leading = -number(content, 0);
                moveLine(number(content, 1), number(content, 0));
            } else if (op == "Tm" && hasNumbers(content, 6)) {
                tlm = matrixOperand(content);
                tm = tlm;
            } else if (op == "T*") {
                moveLine(0.0, -gs.leading);
            } else if ((op == "Tj" || op == "TJ") && content.Stack.GetSize() > 0) {
                emit(decodeShown(content.Stack[0], gs), gs, tm, items);
            } else if ((op == "'" || op == "\"") && content.Stack.GetSize() > 0) {
                moveLine(0.0, -gs.leading);
                emit(decodeShown(content.Stack[0], gs), gs, tm, items);
            }
        }
    }
};

} // namespace pdf
} // namespace extract
} // namespace docshield

#endif // DOCSHIELD_EXTRACT_PDF_PDF_TEXT_SOURCE_HPP
