#ifndef DOCSHIELD_SCAN_SCANNER_HPP
#define DOCSHIELD_SCAN_SCANNER_HPP

#include <map>
#include <memory>
#include <string>
#include <vector>
#include "config/scan_config.hpp"
#include "model/issue.hpp"
#include "model/text_run.hpp"
#include "scan/detection_rule.hpp"
#include "util/logger.hpp"
#include "util/text_utils.hpp"

/**
 * @file scanner.hpp
 * @brief Applies the configured rule set to each TextRun and assigns Issue ids.
 *
 * DESIGN GOALS:
 *   - Rule set built once from ScanConfig: one KeywordRule per distinct
 *     phrase (case-insensitive, configuration order), then MicroTextRule,
 *     then HiddenColorRule. Issues of a run come out in that order.
 *   - Ids are deterministic: p<page>-r<runIndex>-<kind>-<ordinal>, the
 *     ordinal counting Issues of that kind within the run from 0.
 *   - With collapseRuleHits, a run reports only its first highest-severity
 *     Issue. Otherwise every rule hit is kept.
 *
 * USAGE:
 *   @code
 *   Scanner scanner(config);
 *   std::vector<model::Issue> hits = scanner.scanRun(run);
 *   @endcode
 */

namespace docshield {
namespace scan {

class Scanner
{
public:
    explicit Scanner(const config::ScanConfig &cfg)
        : collapse_(cfg.collapseRuleHits)
    {
        for (const auto &phrase : cfg.phrases) {
            if (util::text::isBlank(phrase)) {
                util::logger::warn("Scanner: ignoring blank phrase");
                continue;
            }
            bool duplicate = false;
            for (const auto &known : phrases_) {
                duplicate = duplicate || util::text::equalsIgnoreCase(known, phrase);
            }
            if (duplicate) {
                util::logger::debug("Scanner: duplicate phrase '" + phrase + "' skipped");
                continue;
            }
            phrases_.push_back(phrase);
            rules_.push_back(std::make_unique<KeywordRule>(phrase));
        }
        rules_.push_back(std::make_unique<MicroTextRule>(cfg.microTextThresholdPt));
        rules_.push_back(std::make_unique<HiddenColorRule>(cfg.hiddenColors));

        util::logger::debug("Scanner: " + std::to_string(rules_.size()) + " rules ("
                            + std::to_string(phrases_.size()) + " phrases)");
    }

    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;

    /// Distinct phrases in evaluation order.
    const std::vector<std::string> &phrases() const { return phrases_; }

    bool collapsesRuleHits() const { return collapse_; }

    /**
     * @brief Evaluate every rule against one run. Never throws on any input.
     */
    std::vector<model::Issue> scanRun(const model::TextRun &run) const
    {
        std::vector<model::Issue> issues;
        std::map<model::IssueKind, int> ordinals;

        for (const auto &rule : rules_) {
            for (auto &issue : rule->evaluate(run)) {
                int ordinal = ordinals[issue.kind]++;
                issue.id = "p" + std::to_string(run.page) + "-r" + std::to_string(run.index) + "-"
                         + model::issueKindTag(issue.kind) + "-" + std::to_string(ordinal);
                issues.push_back(std::move(issue));
            }
        }

        if (collapse_ && issues.size() > 1) {
            size_t best = 0;
            for (size_t i = 1; i < issues.size(); ++i) {
                if (issues[i].severity == model::Severity::High
                    && issues[best].severity != model::Severity::High) {
                    best = i;
                }
            }
            std::vector<model::Issue> kept;
            kept.push_back(std::move(issues[best]));
            return kept;
        }
        return issues;
    }

private:
    bool collapse_;
    std::vector<std::string> phrases_;
    std::vector<std::unique_ptr<DetectionRule>> rules_;
};

} // namespace scan
} // namespace docshield

#endif // DOCSHIELD_SCAN_SCANNER_HPP
