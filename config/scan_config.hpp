#ifndef DOCSHIELD_CONFIG_SCAN_CONFIG_HPP
#define DOCSHIELD_CONFIG_SCAN_CONFIG_HPP

#include <cstddef>
#include <string>
#include <vector>
#include "util/logger.hpp"

/**
 * @file scan_config.hpp
 * @brief Defines the tunables of the DocShield threat detection engine.
 *
 * USAGE:
 *   - This struct can be populated either manually or through config_parser.hpp
 *   - The phrase list, the micro-text threshold and the hidden-color set are
 *     the engine's only detection tunables; everything else controls the
 *     ambient stack (logging, history).
 */

namespace docshield {
namespace config {

/**
 * @brief The phrases flagged by default, in the order they are evaluated.
 */
inline std::vector<std::string> defaultInjectionPhrases()
{
    return {
        "ignore previous instructions",
        "system prompt",
        "hidden instruction",
        "jailbreak",
        "do anything now",
        "ignore all rules",
        "forgot about previous",
        "actually move in",
        "instead of",
        "new instructions"
    };
}

/**
 * @struct ScanConfig
 * @brief Holds the detection configuration plus a few process-level settings:
 *   - phrases: injection phrases matched case-insensitively.
 *   - microTextThresholdPt: font size (points) below which text counts as micro-text.
 *   - hiddenColors: uppercase color values / theme tokens treated as invisible.
 *   - redactionToken: replacement written by the sanitizer.
 *   - collapseRuleHits: keep only one Issue per run when several rules fire.
 *   - maxDecodedStreamBytes / maxDecodedDocumentBytes: ceilings on inflated
 *     data, per stream or archive entry and per document.
 */
struct ScanConfig
{
    /**
     * @brief Construct a new ScanConfig with defaults:
     *   phrases = defaultInjectionPhrases()
     *   microTextThresholdPt = 4.0
     *   hiddenColors = { "FFFFFF", "FFFFFF00" }
     *   redactionToken = "[REMOVED]"
     */
    ScanConfig()
        : phrases(defaultInjectionPhrases()),
          microTextThresholdPt(4.0),
          hiddenColors({"FFFFFF", "FFFFFF00"}),
          redactionToken("[REMOVED]"),
          collapseRuleHits(false),
          maxDecodedStreamBytes(64u * 1024u * 1024u),
          maxDecodedDocumentBytes(256u * 1024u * 1024u),
          logLevel(util::logger::LogLevel::INFO)
    {
    }

    /// Injection phrases, matched as case-insensitive substrings.
    std::vector<std::string> phrases;

    /// Upper bound (points) of the micro-text band.
    double microTextThresholdPt;

    /// Recognized hidden-color encodings for DOCX runs (uppercase).
    std::vector<std::string> hiddenColors;

    /// Token substituted for every phrase occurrence in sanitized text.
    std::string redactionToken;

    /// When true, a run that triggers several rules yields a single Issue.
    bool collapseRuleHits;

    /// A single PDF stream or zip entry that inflates past this is a ParseFailure.
    size_t maxDecodedStreamBytes;

    /// Same, summed over everything decoded for one document.
    size_t maxDecodedDocumentBytes;

    util::logger::LogLevel logLevel;

    /// Optional log file; empty keeps console-only logging.
    std::string logFile;

    /// Optional SQLite scan history; empty disables it.
    std::string historyDatabase;
};

} // namespace config
} // namespace docshield

#endif // DOCSHIELD_CONFIG_SCAN_CONFIG_HPP
