#ifndef DOCSHIELD_SCAN_SANITIZER_HPP
#define DOCSHIELD_SCAN_SANITIZER_HPP

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "util/logger.hpp"
#include "util/text_utils.hpp"

/**
 * @file sanitizer.hpp
 * @brief Redacts every configured phrase from a document's raw text.
 *
 * DESIGN GOALS:
 *   - Independent of the Issue list: every case-insensitive occurrence of every
 *     phrase is replaced, including occurrences inside longer phrases.
 *   - One left-to-right pass. At each position the longest matching phrase
 *     wins and the scan resumes after it, so overlapping phrases never leave
 *     partial fragments behind.
 *   - The redaction token may not re-form a phrase with its surroundings.
 *     With that guarantee the output contains no phrase and sanitize() is
 *     idempotent.
 *
 * USAGE EXAMPLE:
 *   @code
 *   Sanitizer sanitizer(config.phrases, config.redactionToken);
 *   std::string clean = sanitizer.sanitize(result.rawText);
 *   @endcode
 */

namespace docshield {
namespace scan {

class Sanitizer
{
public:
    /**
     * @throw std::invalid_argument if the token is empty or could combine
     *        with adjacent text into a phrase occurrence.
     */
    Sanitizer(const std::vector<std::string> &phrases, std::string token)
        : token_(std::move(token))
    {
        if (token_.empty()) {
            throw std::invalid_argument("Sanitizer: redaction token must not be empty");
        }
        for (const auto &p : phrases) {
            if (util::text::isBlank(p)) {
                continue;
            }
            bool known = false;
            for (const auto &q : phrases_) {
                known = known || util::text::equalsIgnoreCase(p, q);
            }
            if (!known) {
                validateToken(p);
                phrases_.push_back(p);
            }
        }
        std::stable_sort(phrases_.begin(), phrases_.end(),
                         [](const std::string &a, const std::string &b) { return a.size() > b.size(); });
    }

    const std::string &token() const { return token_; }

    std::string sanitize(const std::string &text) const
    {
        std::string out;
        out.reserve(text.size());
        size_t replaced = 0;
        size_t pos = 0;
        while (pos < text.size()) {
            const std::string *hit = nullptr;
            for (const auto &phrase : phrases_) {
                if (util::text::matchesAtIgnoreCase(text, pos, phrase)) {
                    hit = &phrase;
                    break;
                }
            }
            if (hit) {
                out += token_;
                pos += hit->size();
                ++replaced;
            } else {
                out.push_back(text[pos++]);
            }
        }
        if (replaced > 0) {
            util::logger::debug("Sanitizer: redacted " + std::to_string(replaced) + " occurrence(s)");
        }
        return out;
    }

private:
    std::string token_;
    std::vector<std::string> phrases_;  ///< longest first

    /**
     * @throw std::invalid_argument naming the token, the phrase and how they conflict.
     */
    void validateToken(const std::string &phrase) const
    {
        using util::text::containsIgnoreCase;
        using util::text::matchesAtIgnoreCase;

        if (containsIgnoreCase(token_, phrase)) {
            rejectToken(phrase, "contains the phrase");
        }
        if (containsIgnoreCase(phrase, token_)) {
            rejectToken(phrase, "occurs inside the phrase");
        }
        const size_t limit = std::min(token_.size(), phrase.size());
        for (size_t k = 1; k < limit; ++k) {
            if (matchesAtIgnoreCase(token_, token_.size() - k, phrase.substr(0, k))) {
                rejectToken(phrase, "ends with the first " + std::to_string(k) + " byte(s) of the phrase");
            }
            if (matchesAtIgnoreCase(phrase, phrase.size() - k, token_.substr(0, k))) {
                rejectToken(phrase, "starts with the last " + std::to_string(k) + " byte(s) of the phrase");
            }
        }
    }

    void rejectToken(const std::string &phrase, const std::string &how) const
    {
        throw std::invalid_argument("Sanitizer: redaction token '" + token_ + "' " + how + " '"
                                    + phrase + "'; choose a token that cannot form a phrase with adjacent text");
    }
};

} // namespace scan
} // namespace docshield

#endif // DOCSHIELD_SCAN_SANITIZER_HPP
