#ifndef DOCSHIELD_MODEL_TEXT_RUN_HPP
#define DOCSHIELD_MODEL_TEXT_RUN_HPP

#include <cstddef>
#include <optional>
#include <string>
#include "model/document_format.hpp"

/**
 * @file text_run.hpp
 * @brief One atomic text fragment produced by a format adapter, with the
 *        formatting metadata the detection rules look at.
 */

namespace docshield {
namespace model {

/**
 * @struct TextRun
 * @brief Immutable once produced; lives for a single adapter pass.
 */
struct TextRun
{
    std::string text;                   ///< Raw extracted text (UTF-8)
    int page = 1;                       ///< 1-based page number
    std::optional<double> fontSizePt;   ///< Size in points, if the format carries one
    std::optional<std::string> colorHex;///< Uppercase hex color or theme token
    DocumentFormat origin = DocumentFormat::Pdf;
    size_t index = 0;                   ///< Position in the document's run stream
};

} // namespace model
} // namespace docshield

#endif // DOCSHIELD_MODEL_TEXT_RUN_HPP
