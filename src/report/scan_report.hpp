#ifndef DOCSHIELD_REPORT_SCAN_REPORT_HPP
#define DOCSHIELD_REPORT_SCAN_REPORT_HPP

#include <iomanip>
#include <sstream>
#include <string>
#include <vector>
#include "model/issue.hpp"
#include "model/scan_result.hpp"
#include "scan/highlighter.hpp"

/**
 * @file scan_report.hpp
 * @brief Renders a ScanResult for the presentation layer.
 *
 * DESIGN GOALS:
 *   - Three human views (findings list, sanitized text, highlighted proof
 *     text) plus a JSON document for machine consumers.
 *   - Empty documents have no sanitized or proof view; those render a notice.
 *   - Highlighting uses ANSI reverse-red when color is on, [[...]] markers
 *     otherwise.
 *
 * USAGE EXAMPLE:
 *   @code
 *   ScanReport report(result, scanner.phrases(), true);
 *   std::cout << report.findingsView() << report.proofView();
 *   std::string json = report.toJson();
 *   @endcode
 */

namespace docshield {
namespace report {

class ScanReport
{
public:
    ScanReport(const model::ScanResult &result, const std::vector<std::string> &phrases, bool color)
        : result_(result), phrases_(phrases), color_(color)
    {
    }

    /// Sanitized and proof views exist only for documents with text.
    bool textViewsEnabled() const { return !result_.isEmpty; }

    std::string statusLine() const
    {
        if (result_.isEmpty) {
            return "EMPTY: no extractable text";
        }
        if (result_.safe) {
            return "SAFE: no threats detected";
        }
        return "THREATS: " + std::to_string(result_.issues.size()) + " issue(s) found";
    }

    std::string findingsView() const
    {
        std::ostringstream oss;
        oss << result_.fileName << " (" << model::formatName(result_.format) << ", "
            << result_.pageCount << " page(s))\n";
        oss << "  " << paint(statusLine(), result_.safe ? kGreen : kRed) << "\n";
        for (const auto &issue : result_.issues) {
            oss << "  [" << model::severityName(issue.severity) << "] "
                << model::issueKindName(issue.kind) << " p." << issue.page
                << " (" << issue.id << "): " << issue.detail << "\n";
            oss << "      context: \"" << issue.context << "\"\n";
        }
        return oss.str();
    }

    std::string sanitizedView() const
    {
        if (!textViewsEnabled()) {
            return "(no extractable text: sanitized view unavailable)\n";
        }
        return result_.sanitizedText + "\n";
    }

    std::string proofView() const
    {
        if (!textViewsEnabled()) {
            return "(no extractable text: proof view unavailable)\n";
        }
        scan::Highlighter highlighter(phrases_, result_.issues);
        std::string out;
        for (const auto &segment : highlighter.segment(result_.rawText)) {
            if (!segment.highlighted) {
                out += segment.text;
            } else if (color_) {
                out += std::string(kReverseRed) + segment.text + kReset;
            } else {
                out += "[[" + segment.text + "]]";
            }
        }
        return out + "\n";
    }

    std::string toJson() const
    {
        std::ostringstream oss;
        oss << "{";
        oss << R"("fileName":")" << escapeString(result_.fileName) << "\",";
        oss << R"("format":")" << model::formatName(result_.format) << "\",";
        oss << R"("sha256":")" << result_.documentSha256 << "\",";
        oss << R"("pageCount":)" << result_.pageCount << ",";
        oss << R"("safe":)" << (result_.safe ? "true" : "false") << ",";
        oss << R"("isEmpty":)" << (result_.isEmpty ? "true" : "false") << ",";
        oss << R"("issues":[)";
        for (size_t i = 0; i < result_.issues.size(); ++i) {
            const model::Issue &issue = result_.issues[i];
            if (i > 0) {
                oss << ",";
            }
            oss << "{"
                << R"("id":")" << escapeString(issue.id) << "\","
                << R"("kind":")" << escapeString(model::issueKindName(issue.kind)) << "\","
                << R"("severity":")" << model::severityName(issue.severity) << "\","
                << R"("page":)" << issue.page << ","
                << R"("detail":")" << escapeString(issue.detail) << "\","
                << R"("context":")" << escapeString(issue.context) << "\""
                << "}";
        }
        oss << "],";
        oss << R"("rawText":")" << escapeString(result_.rawText) << "\",";
        oss << R"("sanitizedText":")" << escapeString(result_.sanitizedText) << "\"";
        oss << "}";
        return oss.str();
    }

    /**
     * @brief Escape a string for a JSON string literal.
     */
    static std::string escapeString(const std::string &in)
    {
        std::ostringstream oss;
        for (char c : in) {
            switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\b': oss << "\\b";  break;
            case '\f': oss << "\\f";  break;
            case '\n': oss << "\\n";  break;
            case '\r': oss << "\\r";  break;
            case '\t': oss << "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
                } else {
                    oss << c;
                }
                break;
            }
        }
        return oss.str();
    }

private:
    static constexpr const char *kReset = "\033[0m";
    static constexpr const char *kRed = "\033[31m";
    static constexpr const char *kGreen = "\033[32m";
    static constexpr const char *kReverseRed = "\033[7;31m";

    model::ScanResult result_;
    std::vector<std::string> phrases_;
    bool color_;

    std::string paint(const std::string &text, const char *code) const
    {
        return color_ ? std::string(code) + text + kReset : text;
    }
};

} // namespace report
} // namespace docshield

#endif // DOCSHIELD_REPORT_SCAN_REPORT_HPP
