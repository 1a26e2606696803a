#ifndef DOCSHIELD_EXTRACT_ERRORS_HPP
#define DOCSHIELD_EXTRACT_ERRORS_HPP

#include <stdexcept>
#include <string>

/**
 * @file errors.hpp
 * @brief Failure conditions raised while turning document bytes into text runs.
 *
 * Only the extraction layer throws these; detection rules are total.
 */

namespace docshield {
namespace extract {

/**
 * @brief Malformed container, unreadable markup or an extraction error.
 *        No ScanResult is produced for a document that raises it.
 */
class ParseFailure : public std::runtime_error
{
public:
    explicit ParseFailure(const std::string &what)
        : std::runtime_error(what)
    {
    }
};

/**
 * @brief The input is neither a PDF nor a DOCX document. Raised before any
 *        adapter runs.
 */
class UnsupportedFormat : public std::runtime_error
{
public:
    explicit UnsupportedFormat(const std::string &what)
        : std::runtime_error(what)
    {
    }
};

} // namespace extract
} // namespace docshield

#endif // DOCSHIELD_EXTRACT_ERRORS_HPP
