#ifndef DOCSHIELD_SCAN_DETECTION_RULE_HPP
#define DOCSHIELD_SCAN_DETECTION_RULE_HPP

#include <iomanip>
#include <utility>
#include <set>
#include <sstream>
#include <string>
#include <vector>
#include "model/issue.hpp"
#include "model/text_run.hpp"
#include "util/text_utils.hpp"

/**
 * @file detection_rule.hpp
 * @brief The three per-run detection rules.
 *
 * DESIGN GOALS:
 *   - A rule is a pure function TextRun -> Issues. It keeps no state between
 *     runs and never throws.
 *   - Issues come back without an id; the Scanner assigns ids because only it
 *     knows how many Issues of each kind a run has produced.
 */

namespace docshield {
namespace scan {

class DetectionRule
{
public:
    virtual ~DetectionRule() = default;

    virtual model::IssueKind kind() const = 0;

    virtual std::vector<model::Issue> evaluate(const model::TextRun &run) const = 0;

protected:
    static model::Issue makeIssue(const model::TextRun &run, model::IssueKind kind,
                                  model::Severity severity, std::string detail)
    {
        model::Issue issue;
        issue.kind = kind;
        issue.severity = severity;
        issue.detail = std::move(detail);
        issue.context = run.text;
        issue.page = run.page;
        return issue;
    }
};

/**
 * @class KeywordRule
 * @brief Flags a run containing one configured phrase (ASCII case-insensitive).
 *        Repeated occurrences in the same run still give a single Issue.
 */
class KeywordRule : public DetectionRule
{
public:
    explicit KeywordRule(std::string phrase)
        : phrase_(std::move(phrase))
    {
    }

    const std::string &phrase() const { return phrase_; }

    model::IssueKind kind() const override { return model::IssueKind::InjectionKeyword; }

    std::vector<model::Issue> evaluate(const model::TextRun &run) const override
    {
        std::vector<model::Issue> out;
        if (util::text::containsIgnoreCase(run.text, phrase_)) {
            out.push_back(makeIssue(run, kind(), model::Severity::High,
                                    "Blocked phrase: \"" + phrase_ + "\""));
        }
        return out;
    }

private:
    std::string phrase_;
};

/**
 * @class MicroTextRule
 * @brief Flags non-blank text set in an imperceptibly small font.
 *
 * PDF sizes come from the text matrix and fall in the open band (0, threshold).
 * DOCX sizes are whole half-points, where the band is size <= threshold.
 */
class MicroTextRule : public DetectionRule
{
public:
    explicit MicroTextRule(double thresholdPt)
        : thresholdPt_(thresholdPt)
    {
    }

    double thresholdPt() const { return thresholdPt_; }

    model::IssueKind kind() const override { return model::IssueKind::MicroText; }

    bool appliesTo(const model::TextRun &run) const
    {
        if (!run.fontSizePt || util::text::isBlank(run.text)) {
            return false;
        }
        const double size = *run.fontSizePt;
        if (run.origin == model::DocumentFormat::Docx) {
            return size <= thresholdPt_;
        }
        return size > 0.0 && size < thresholdPt_;
    }

    std::vector<model::Issue> evaluate(const model::TextRun &run) const override
    {
        std::vector<model::Issue> out;
        if (appliesTo(run)) {
            std::ostringstream detail;
            detail << "Micro-text caught (Size: " << std::fixed << std::setprecision(1)
                   << *run.fontSizePt << ")";
            out.push_back(makeIssue(run, kind(), model::Severity::Medium, detail.str()));
        }
        return out;
    }

private:
    double thresholdPt_;
};

/**
 * @class HiddenColorRule
 * @brief Flags DOCX runs whose color is one of the configured invisible colors.
 */
class HiddenColorRule : public DetectionRule
{
public:
    explicit HiddenColorRule(const std::vector<std::string> &colors)
    {
        for (const auto &c : colors) {
            colors_.insert(util::text::toUpper(util::text::trimmed(c)));
        }
    }

    model::IssueKind kind() const override { return model::IssueKind::HiddenText; }

    std::vector<model::Issue> evaluate(const model::TextRun &run) const override
    {
        std::vector<model::Issue> out;
        if (run.origin != model::DocumentFormat::Docx || !run.colorHex
            || util::text::isBlank(run.text)) {
            return out;
        }
        if (colors_.count(util::text::toUpper(*run.colorHex))) {
            out.push_back(makeIssue(run, kind(), model::Severity::High,
                                    "White-on-white text detected (color " + *run.colorHex + ")"));
        }
        return out;
    }

private:
    std::set<std::string> colors_;
};

} // namespace scan
} // namespace docshield

#endif // DOCSHIELD_SCAN_DETECTION_RULE_HPP
