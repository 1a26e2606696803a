#ifndef DOCSHIELD_TEST_UNIT_TEST_SCAN_REPORT_HPP
#define DOCSHIELD_TEST_UNIT_TEST_SCAN_REPORT_HPP

#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "model/issue.hpp"
#include "model/scan_result.hpp"
#include "report/scan_report.hpp"

/**
 * @file test_scan_report.hpp
 * @brief Human and JSON renderings of a ScanResult.
 */

namespace docshield {
namespace test {

inline model::ScanResult threatResult()
{
    model::ScanResult result;
    result.fileName = "memo \"q3\".pdf";
    result.format = model::DocumentFormat::Pdf;
    result.documentSha256 = "abc123";
    result.pageCount = 1;
    result.rawText = "Please jailbreak now\ttoday";
    result.sanitizedText = "Please [REMOVED] now\ttoday";
    result.isEmpty = false;
    result.safe = false;

    model::Issue issue;
    issue.id = "p1-r0-keyword-0";
    issue.kind = model::IssueKind::InjectionKeyword;
    issue.severity = model::Severity::High;
    issue.page = 1;
    issue.detail = "Blocked phrase: \"jailbreak\"";
    issue.context = result.rawText;
    result.issues.push_back(issue);
    return result;
}

TEST(ScanReportTest, EscapesJsonStrings)
{
    EXPECT_EQ(report::ScanReport::escapeString("a\"b\\c\nd\x01"), "a\\\"b\\\\c\\nd\\u0001");
    EXPECT_EQ(report::ScanReport::escapeString("caf\xC3\xA9"), "caf\xC3\xA9");
}

TEST(ScanReportTest, JsonCarriesResultFields)
{
    report::ScanReport report(threatResult(), {"jailbreak"}, false);
    const std::string json = report.toJson();
    EXPECT_NE(json.find("\"fileName\":\"memo \\\"q3\\\".pdf\""), std::string::npos);
    EXPECT_NE(json.find("\"format\":\"pdf\""), std::string::npos);
    EXPECT_NE(json.find("\"safe\":false"), std::string::npos);
    EXPECT_NE(json.find("\"isEmpty\":false"), std::string::npos);
    EXPECT_NE(json.find("\"id\":\"p1-r0-keyword-0\""), std::string::npos);
    EXPECT_NE(json.find("\"kind\":\"Injection Keyword\""), std::string::npos);
    EXPECT_NE(json.find("\"severity\":\"high\""), std::string::npos);
    EXPECT_NE(json.find("\"sanitizedText\":\"Please [REMOVED] now\\ttoday\""), std::string::npos);
    EXPECT_EQ(json.front(), '{');
    EXPECT_EQ(json.back(), '}');
}

TEST(ScanReportTest, ProofViewMarksFlaggedText)
{
    model::ScanResult result = threatResult();
    result.issues.clear();
    report::ScanReport plain(result, {"jailbreak"}, false);
    EXPECT_EQ(plain.proofView(), "Please [[jailbreak]] now\ttoday\n");

    report::ScanReport colored(result, {"jailbreak"}, true);
    EXPECT_EQ(colored.proofView(), "Please \033[7;31mjailbreak\033[0m now\ttoday\n");
}

TEST(ScanReportTest, FindingsAndStatus)
{
    report::ScanReport report(threatResult(), {"jailbreak"}, false);
    EXPECT_EQ(report.statusLine(), "THREATS: 1 issue(s) found");
    const std::string findings = report.findingsView();
    EXPECT_NE(findings.find("[high] Injection Keyword p.1 (p1-r0-keyword-0)"), std::string::npos);
    EXPECT_EQ(findings.find("\033["), std::string::npos);
}

TEST(ScanReportTest, EmptyDocumentHasNoTextViews)
{
    model::ScanResult result;
    result.fileName = "blank.docx";
    result.format = model::DocumentFormat::Docx;
    result.pageCount = 1;
    result.isEmpty = true;
    result.safe = false;

    report::ScanReport report(result, {"jailbreak"}, false);
    EXPECT_FALSE(report.textViewsEnabled());
    EXPECT_EQ(report.statusLine(), "EMPTY: no extractable text");
    EXPECT_EQ(report.sanitizedView(), "(no extractable text: sanitized view unavailable)\n");
    EXPECT_EQ(report.proofView(), "(no extractable text: proof view unavailable)\n");
    EXPECT_NE(report.toJson().find("\"isEmpty\":true"), std::string::npos);
}

} // namespace test
} // namespace docshield

#endif // DOCSHIELD_TEST_UNIT_TEST_SCAN_REPORT_HPP
