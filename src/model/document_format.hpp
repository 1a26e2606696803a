#ifndef DOCSHIELD_MODEL_DOCUMENT_FORMAT_HPP
#define DOCSHIELD_MODEL_DOCUMENT_FORMAT_HPP

#include <string>

/**
 * @file document_format.hpp
 * @brief The container formats DocShield can extract text from.
 */

namespace docshield {
namespace model {

enum class DocumentFormat {
    Pdf,    ///< paginated container
    Docx    ///< compound archive (zip + WordprocessingML)
};

inline std::string formatName(DocumentFormat format)
{
    switch (format) {
    case DocumentFormat::Pdf:  return "pdf";
    case DocumentFormat::Docx: return "docx";
    }
    return "unknown";
}

} // namespace model
} // namespace docshield

#endif // DOCSHIELD_MODEL_DOCUMENT_FORMAT_HPP
