#ifndef DOCSHIELD_SCAN_HIGHLIGHTER_HPP
#define DOCSHIELD_SCAN_HIGHLIGHTER_HPP

#include <algorithm>
#include <string>
#include <vector>
#include "model/issue.hpp"
#include "util/text_utils.hpp"

/**
 * @file highlighter.hpp
 * @brief Splits raw text into plain and highlighted segments for the proof view.
 *
 * The flaggable set is the configured phrases plus every distinct non-empty
 * Issue context, ordered longest first so that a short fragment never splits
 * a longer flagged string. Segments are copied out of the input unchanged:
 * joining them reproduces the raw text byte for byte.
 */

namespace docshield {
namespace scan {

struct Segment
{
    std::string text;
    bool highlighted = false;
};

inline bool operator==(const Segment &a, const Segment &b)
{
    return a.text == b.text && a.highlighted == b.highlighted;
}

class Highlighter
{
public:
    Highlighter(const std::vector<std::string> &phrases, const std::vector<model::Issue> &issues)
    {
        for (const auto &p : phrases) {
            add(p);
        }
        for (const auto &issue : issues) {
            add(issue.context);
        }
        std::stable_sort(flaggable_.begin(), flaggable_.end(),
                         [](const std::string &a, const std::string &b) { return a.size() > b.size(); });
    }

    const std::vector<std::string> &flaggable() const { return flaggable_; }

    std::vector<Segment> segment(const std::string &rawText) const
    {
        std::vector<Segment> out;
        size_t pos = 0;
        while (pos < rawText.size()) {
            size_t len = matchAt(rawText, pos);
            if (len > 0) {
                out.push_back(Segment{rawText.substr(pos, len), true});
                pos += len;
                continue;
            }
            if (out.empty() || out.back().highlighted) {
                out.push_back(Segment{std::string(), false});
            }
            out.back().text.push_back(rawText[pos++]);
        }
        return out;
    }

    static std::string join(const std::vector<Segment> &segments)
    {
        std::string out;
        for (const auto &s : segments) {
            out += s.text;
        }
        return out;
    }

private:
    std::vector<std::string> flaggable_;

    void add(const std::string &s)
    {
        if (s.empty() || std::find(flaggable_.begin(), flaggable_.end(), s) != flaggable_.end()) {
            return;
        }
        flaggable_.push_back(s);
    }

    size_t matchAt(const std::string &text, size_t pos) const
    {
        for (const auto &f : flaggable_) {
            if (util::text::matchesAtIgnoreCase(text, pos, f)) {
                return f.size();
            }
        }
        return 0;
    }
};

} // namespace scan
} // namespace docshield

#endif // DOCSHIELD_SCAN_HIGHLIGHTER_HPP
