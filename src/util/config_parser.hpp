#ifndef DOCSHIELD_UTIL_CONFIG_PARSER_HPP
#define DOCSHIELD_UTIL_CONFIG_PARSER_HPP

#include <string>
#include <fstream>
#include <istream>
#include <sstream>
#include <stdexcept>
#include <mutex>
#include "config/scan_config.hpp"
#include "util/logger.hpp"
#include "util/text_utils.hpp"

/**
 * @file config_parser.hpp
 * @brief Provides a minimal parser for DocShield's ScanConfig.
 *
 * DESIGN GOALS:
 *   - Read a simple "key=value" style configuration file.
 *   - Populate docshield::config::ScanConfig fields.
 *   - List-valued settings (phrase, hiddenColor) are given one entry per line;
 *     the first such line in a source replaces the built-in defaults, later
 *     lines append.
 *   - Header-only, no external libraries.
 *
 * USAGE:
 *   @code
 *   docshield::config::ScanConfig scanConfig;
 *   docshield::util::ConfigParser parser(scanConfig);
 *   parser.loadFromFile("docshield.conf");
 *   @endcode
 *
 * Example file:
 *   @code
 *   # detection
 *   phrase = ignore previous instructions
 *   phrase = reveal your system prompt
 *   microTextThresholdPt = 3.5
 *   hiddenColor = FFFFFF
 *   hiddenColor = background1
 *   redactionToken = [REDACTED]
 *   maxDecodedStreamBytes = 16777216
 *   logLevel = DEBUG
 *   @endcode
 */

namespace docshield {
namespace util {

/**
 * @class ConfigParser
 * @brief Reads a plain text key=value config and updates ScanConfig fields.
 */
class ConfigParser
{
public:
    /**
     * @param scanConfig A reference to an existing ScanConfig to populate.
     */
    explicit ConfigParser(docshield::config::ScanConfig &scanConfig)
        : scanConfig_(scanConfig)
    {
    }

    /**
     * @brief Read the given file, parse line by line, storing recognized keys.
     *        A missing file is not an error: defaults stay in place.
     * @throw std::runtime_error if lines are malformed.
     */
    inline void loadFromFile(const std::string &filepath)
    {
        std::ifstream inFile(filepath);
        if (!inFile.is_open()) {
            logger::warn("ConfigParser: File not found: " + filepath);
            return;
        }

        logger::info("ConfigParser: Loading config from " + filepath);
        loadFromStream(inFile);
        logger::info("ConfigParser: Config loaded.");
    }

    /**
     * @brief Parse key=value lines from any stream.
     * @throw std::runtime_error on a malformed line or value.
     */
    inline void loadFromStream(std::istream &in)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        phrasesSeen_ = false;
        colorsSeen_ = false;

        std::string line;
        size_t lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            line = text::trimmed(line);

            if (line.empty() || line[0] == '#') {
                continue;
            }

            auto pos = line.find('=');
            if (pos == std::string::npos) {
                throw std::runtime_error("ConfigParser: invalid line " + std::to_string(lineNo)
                                         + " (no '='): " + line);
            }
            std::string key = text::trimmed(line.substr(0, pos));
            std::string val = text::trimmed(line.substr(pos + 1));

            applyKeyValue(key, val);
        }
    }

private:
    docshield::config::ScanConfig &scanConfig_;
    std::mutex mutex_;
    bool phrasesSeen_ = false;
    bool colorsSeen_ = false;

    inline void applyKeyValue(const std::string &key, const std::string &val)
    {
        if (key == "phrase") {
            if (val.empty()) {
                logger::warn("ConfigParser: ignoring empty phrase");
                return;
            }
            if (!phrasesSeen_) {
                scanConfig_.phrases.clear();
                phrasesSeen_ = true;
            }
            scanConfig_.phrases.push_back(val);
            logger::debug("ConfigParser: phrase added: " + val);
        }
        else if (key == "hiddenColor") {
            if (val.empty()) {
                logger::warn("ConfigParser: ignoring empty hiddenColor");
                return;
            }
            if (!colorsSeen_) {
                scanConfig_.hiddenColors.clear();
                colorsSeen_ = true;
            }
            scanConfig_.hiddenColors.push_back(text::toUpper(val));
            logger::debug("ConfigParser: hiddenColor added: " + text::toUpper(val));
        }
        else if (key == "microTextThresholdPt") {
            scanConfig_.microTextThresholdPt = parsePositiveDouble(val);
            logger::debug("ConfigParser: microTextThresholdPt set to " + val);
        }
        else if (key == "maxDecodedStreamBytes") {
            scanConfig_.maxDecodedStreamBytes = parsePositiveSize(val);
            logger::debug("ConfigParser: maxDecodedStreamBytes set to " + val);
        }
        else if (key == "maxDecodedDocumentBytes") {
            scanConfig_.maxDecodedDocumentBytes = parsePositiveSize(val);
            logger::debug("ConfigParser: maxDecodedDocumentBytes set to " + val);
        }
        else if (key == "redactionToken") {
            if (val.empty()) {
                throw std::runtime_error("ConfigParser: redactionToken must not be empty");
            }
            scanConfig_.redactionToken = val;
            logger::debug("ConfigParser: redactionToken set to " + val);
        }
        else if (key == "collapseRuleHits") {
            scanConfig_.collapseRuleHits = parseBool(val);
            logger::debug("ConfigParser: collapseRuleHits set to " + val);
        }
        else if (key == "logLevel") {
            try {
                scanConfig_.logLevel = logger::parseLogLevel(val);
            }
            catch (const std::invalid_argument &ex) {
                throw std::runtime_error(std::string("ConfigParser: ") + ex.what());
            }
        }
        else if (key == "logFile") {
            scanConfig_.logFile = val;
        }
        else if (key == "historyDatabase") {
            scanConfig_.historyDatabase = val;
            logger::debug("ConfigParser: historyDatabase set to " + val);
        }
        else {
            logger::warn("ConfigParser: Unrecognized key '" + key + "' with value '" + val + "'");
        }
    }

    inline double parsePositiveDouble(const std::string &val) const
    {
        double n = 0.0;
        try {
            size_t idx = 0;
            n = std::stod(val, &idx);
            if (idx != val.size()) {
                throw std::runtime_error("Non-numeric suffix");
            }
        }
        catch (const std::exception &ex) {
            throw std::runtime_error("ConfigParser: parsePositiveDouble failed on '" + val + "': " + ex.what());
        }
        if (!(n > 0.0)) {
            throw std::runtime_error("ConfigParser: value must be positive: '" + val + "'");
        }
        return n;
    }

    inline size_t parsePositiveSize(const std::string &val) const
    {
        unsigned long long n = 0;
        try {
            size_t idx = 0;
            if (val.empty() || val[0] == '-') {
                throw std::runtime_error("not an unsigned integer");
            }
            n = std::stoull(val, &idx);
            if (idx != val.size()) {
                throw std::runtime_error("Non-numeric suffix");
            }
        }
        catch (const std::exception &ex) {
            throw std::runtime_error("ConfigParser: parsePositiveSize failed on '" + val + "': " + ex.what());
        }
        if (n == 0) {
            throw std::runtime_error("ConfigParser: value must be positive: '" + val + "'");
        }
        return static_cast<size_t>(n);
    }

    inline bool parseBool(const std::string &val) const
    {
        std::string lower = text::toLower(val);
        if (lower == "true" || lower == "1" || lower == "yes") {
            return true;
        }
        if (lower == "false" || lower == "0" || lower == "no") {
            return false;
        }
        throw std::runtime_error("ConfigParser: expected a boolean, got '" + val + "'");
    }
};

} // namespace util
} // namespace docshield

#endif // DOCSHIELD_UTIL_CONFIG_PARSER_HPP
