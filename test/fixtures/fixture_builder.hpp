#ifndef DOCSHIELD_TEST_FIXTURES_FIXTURE_BUILDER_HPP
#define DOCSHIELD_TEST_FIXTURES_FIXTURE_BUILDER_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include <zlib.h>

/**
 * @file fixture_builder.hpp
 * @brief Synthesizes small PDF and DOCX documents for the test suites.
 *
 * DESIGN:
 *   - PdfBuilder numbers objects in insertion order and writes a classic
 *     xref table and trailer. Streams can be FlateDecode-compressed.
 *   - ZipBuilder writes stored or deflated entries with correct CRC-32s; a
 *     CRC can be corrupted on purpose.
 *   - docxRun()/docxDocument() produce WordprocessingML for DocxAdapter.
 */

namespace docshield {
namespace test {

inline std::vector<uint8_t> toBytes(const std::string &s)
{
    return std::vector<uint8_t>(s.begin(), s.end());
}

inline std::string zlibCompress(const std::string &in)
{
    uLongf outSize = compressBound(in.size());
    std::string out(outSize, '\0');
    compress2(reinterpret_cast<Bytef*>(&out[0]), &outSize,
              reinterpret_cast<const Bytef*>(in.data()), in.size(), Z_BEST_COMPRESSION);
    out.resize(outSize);
    return out;
}

inline std::string rawDeflate(const std::string &in)
{
    z_stream s{};
    deflateInit2(&s, Z_BEST_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY);
    std::string out(deflateBound(&s, in.size()) + 16, '\0');
    s.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(in.data()));
    s.avail_in = static_cast<uInt>(in.size());
    s.next_out = reinterpret_cast<Bytef*>(&out[0]);
    s.avail_out = static_cast<uInt>(out.size());
    deflate(&s, Z_FINISH);
    out.resize(s.total_out);
    deflateEnd(&s);
    return out;
}

// ----------------------------------------------------------------------------
//  PDF
// ----------------------------------------------------------------------------
class PdfBuilder
{
public:
    /// Reserve an object number to fill in later with set().
    int reserve()
    {
        bodies_.emplace_back();
        return static_cast<int>(bodies_.size());
    }

    void set(int num, const std::string &body) { bodies_[num - 1] = body; }

    int add(const std::string &body)
    {
        bodies_.push_back(body);
        return static_cast<int>(bodies_.size());
    }

    /**
     * @param dictEntries Extra dictionary entries (without << >>).
     */
    int addStream(const std::string &dictEntries, const std::string &data, bool flate)
    {
        std::string payload = flate ? zlibCompress(data) : data;
        std::string body = "<< " + dictEntries + (flate ? " /Filter /FlateDecode" : "")
                         + " /Length " + std::to_string(payload.size()) + " >>\nstream\n"
                         + payload + "\nendstream";
        return add(body);
    }

    std::vector<uint8_t> build(int rootNum, const std::string &extraTrailer = "") const
    {
        std::string out = "%PDF-1.7\n%\xE2\xE3\xCF\xD3\n";
        std::vector<size_t> offsets;
        for (size_t i = 0; i < bodies_.size(); ++i) {
            offsets.push_back(out.size());
            out += std::to_string(i + 1) + " 0 obj\n" + bodies_[i] + "\nendobj\n";
        }
        size_t xref = out.size();
        out += "xref\n0 " + std::to_string(bodies_.size() + 1) + "\n0000000000 65535 f \n";
        for (size_t off : offsets) {
            std::string n = std::to_string(off);
            out += std::string(10 - n.size(), '0') + n + " 00000 n \n";
        }
        out += "trailer\n<< /Size " + std::to_string(bodies_.size() + 1) + " /Root "
             + std::to_string(rootNum) + " 0 R " + extraTrailer + ">>\nstartxref\n"
             + std::to_string(xref) + "\n%%EOF\n";
        return toBytes(out);
    }

private:
    std::vector<std::string> bodies_;
};

/**
 * @brief A document with one page per content stream, a Helvetica /F1
 *        inherited from the page tree root.
 */
inline std::vector<uint8_t> simplePdf(const std::vector<std::string> &pageContents, bool flate = false)
{
    PdfBuilder b;
    int catalog = b.reserve();
    int pages = b.reserve();
    int font = b.add("<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica >>");

    std::string kids;
    for (const auto &content : pageContents) {
        int stream = b.addStream("", content, flate);
        int page = b.add("<< /Type /Page /Parent " + std::to_string(pages) + " 0 R /MediaBox [0 0 612 792]"
                         " /Contents " + std::to_string(stream) + " 0 R >>");
        kids += std::to_string(page) + " 0 R ";
    }
    b.set(catalog, "<< /Type /Catalog /Pages " + std::to_string(pages) + " 0 R >>");
    b.set(pages, "<< /Type /Pages /Kids [" + kids + "] /Count " + std::to_string(pageContents.size())
                 + " /Resources << /Font << /F1 " + std::to_string(font) + " 0 R >> >> >>");
    return b.build(catalog);
}

/// "BT /F1 <size> Tf 72 <y> Td (<text>) Tj ET"
inline std::string showText(const std::string &text, double size, int y = 700)
{
    std::string s = std::to_string(size);
    return "BT /F1 " + s + " Tf 72 " + std::to_string(y) + " Td (" + text + ") Tj ET\n";
}

// ----------------------------------------------------------------------------
//  ZIP / DOCX
// ----------------------------------------------------------------------------
class ZipBuilder
{
public:
    void add(const std::string &name, const std::string &content, bool deflated = true, bool corruptCrc = false)
    {
        entries_.push_back(Entry{name, content, deflated, corruptCrc});
    }

    std::vector<uint8_t> build() const
    {
        std::string out;
        std::string central;
        for (const auto &e : entries_) {
            uint32_t crc = static_cast<uint32_t>(crc32(0L, reinterpret_cast<const Bytef*>(e.content.data()),
                                                       static_cast<uInt>(e.content.size())));
            if (e.corruptCrc) {
                crc ^= 0xFFFFFFFFu;
            }
            std::string data = e.deflated ? rawDeflate(e.content) : e.content;
            uint16_t method = e.deflated ? 8 : 0;
            uint32_t offset = static_cast<uint32_t>(out.size());

            put32(out, 0x04034b50);
            put16(out, 20);
            put16(out, 0);
            put16(out, method);
            put16(out, 0);
            put16(out, 0x21);
            put32(out, crc);
            put32(out, static_cast<uint32_t>(data.size()));
            put32(out, static_cast<uint32_t>(e.content.size()));
            put16(out, static_cast<uint16_t>(e.name.size()));
            put16(out, 0);
            out += e.name;
            out += data;

            put32(central, 0x02014b50);
            put16(central, 20);
            put16(central, 20);
            put16(central, 0);
            put16(central, method);
            put16(central, 0);
            put16(central, 0x21);
            put32(central, crc);
            put32(central, static_cast<uint32_t>(data.size()));
            put32(central, static_cast<uint32_t>(e.content.size()));
            put16(central, static_cast<uint16_t>(e.name.size()));
            put16(central, 0);
            put16(central, 0);
            put16(central, 0);
            put16(central, 0);
            put32(central, 0);
            put32(central, offset);
            central += e.name;
        }
        uint32_t centralOffset = static_cast<uint32_t>(out.size());
        out += central;
        put32(out, 0x06054b50);
        put16(out, 0);
        put16(out, 0);
        put16(out, static_cast<uint16_t>(entries_.size()));
        put16(out, static_cast<uint16_t>(entries_.size()));
        put32(out, static_cast<uint32_t>(central.size()));
        put32(out, centralOffset);
        put16(out, 0);
        return toBytes(out);
    }

private:
    struct Entry
    {
        std::string name;
        std::string content;
        bool deflated;
        bool corruptCrc;
    };
    std::vector<Entry> entries_;

    static void put16(std::string &out, uint16_t v)
    {
        out.push_back(static_cast<char>(v & 0xFF));
        out.push_back(static_cast<char>((v >> 8) & 0xFF));
    }

    static void put32(std::string &out, uint32_t v)
    {
        put16(out, static_cast<uint16_t>(v & 0xFFFF));
        put16(out, static_cast<uint16_t>(v >> 16));
    }
};

/**
 * @param color  w:color value, empty for none
 * @param halfPoints w:sz value, empty for none
 */
inline std::string docxRun(const std::string &text, const std::string &color = "",
                           const std::string &halfPoints = "")
{
    std::string rPr;
    if (!color.empty() || !halfPoints.empty()) {
        rPr = "<w:rPr>";
        if (!color.empty()) {
            rPr += "<w:color w:val=\"" + color + "\"/>";
        }
        if (!halfPoints.empty()) {
            rPr += "<w:sz w:val=\"" + halfPoints + "\"/>";
        }
        rPr += "</w:rPr>";
    }
    return "<w:r>" + rPr + "<w:t xml:space=\"preserve\">" + text + "</w:t></w:r>";
}

inline std::string docxDocument(const std::vector<std::string> &paragraphs)
{
    std::string body;
    for (const auto &p : paragraphs) {
        body += "<w:p>" + p + "</w:p>";
    }
    return "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
           "<w:document xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\">"
           "<w:body>" + body + "</w:body></w:document>";
}

inline std::vector<uint8_t> docxPackage(const std::string &documentXml)
{
    ZipBuilder zip;
    zip.add("[Content_Types].xml",
            "<?xml version=\"1.0\"?><Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\">"
            "<Override PartName=\"/word/document.xml\" ContentType=\"application/"
            "vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml\"/></Types>");
    zip.add("word/document.xml", documentXml);
    return zip.build();
}

} // namespace test
} // namespace docshield

#endif // DOCSHIELD_TEST_FIXTURES_FIXTURE_BUILDER_HPP
