#ifndef DOCSHIELD_EXTRACT_DOCX_ZIP_ARCHIVE_HPP
#define DOCSHIELD_EXTRACT_DOCX_ZIP_ARCHIVE_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <zip.h>
#include "extract/decode_budget.hpp"
#include "extract/errors.hpp"
#include "util/logger.hpp"

/**
 * @file zip_archive.hpp
 * @brief Read-only view of an in-memory zip archive, backed by libzip.
 *
 * The archive is opened with ZIP_CHECKCONS so that inconsistent central
 * directories are rejected up front; libzip verifies each entry's CRC-32 as
 * it is read. Encrypted entries are refused, since DOCX parts never are.
 * Inflated output is charged to a DecodeBudget chunk by chunk, so an entry
 * whose data (or whose recorded size) exceeds the limit never fills memory.
 *
 * REQUIREMENTS:
 *   - Links against libzip.
 */

namespace docshield {
namespace extract {
namespace docx {

class ZipArchive
{
public:
    /**
     * @brief Open an archive from a byte buffer (copied).
     * @throw ParseFailure if the buffer is not a readable zip archive.
     */
    explicit ZipArchive(const std::vector<uint8_t> &bytes)
        : m_storage(bytes)
    {
        zip_error_t error;
        zip_error_init(&error);

        zip_source_t *source = zip_source_buffer_create(m_storage.data(), m_storage.size(), 0, &error);
        if (!source) {
            fail("cannot create zip source", error);
        }
        m_archive = zip_open_from_source(source, ZIP_RDONLY | ZIP_CHECKCONS, &error);
        if (!m_archive) {
            zip_source_free(source);
            fail("not a readable zip archive", error);
        }
        zip_error_fini(&error);
    }

    ~ZipArchive()
    {
        if (m_archive) {
            zip_discard(m_archive);
        }
    }

    ZipArchive(const ZipArchive&) = delete;
    ZipArchive& operator=(const ZipArchive&) = delete;

    std::vector<std::string> entryNames() const
    {
        std::vector<std::string> names;
        zip_int64_t count = zip_get_num_entries(m_archive, 0);
        for (zip_int64_t i = 0; i < count; ++i) {
            const char *name = zip_get_name(m_archive, static_cast<zip_uint64_t>(i), ZIP_FL_ENC_RAW);
            if (name) {
                names.emplace_back(name);
            }
        }
        return names;
    }

    bool contains(const std::string &name) const
    {
        return zip_name_locate(m_archive, name.c_str(), ZIP_FL_ENC_RAW) >= 0;
    }

    /// Inflate one entry under the default decode limits.
    std::string read(const std::string &name) const
    {
        DecodeBudget budget{DecodeLimits()};
        return read(name, budget);
    }

    /**
     * @brief Inflate one entry.
     * @throw ParseFailure if the entry is missing, encrypted, uses an
     *        unsupported method, fails its CRC check or exceeds @p budget.
     */
    std::string read(const std::string &name, DecodeBudget &budget) const
    {
        zip_int64_t index = zip_name_locate(m_archive, name.c_str(), ZIP_FL_ENC_RAW);
        if (index < 0) {
            throw ParseFailure("DOCX: archive has no entry '" + name + "'");
        }

        zip_stat_t st;
        zip_stat_init(&st);
        if (zip_stat_index(m_archive, static_cast<zip_uint64_t>(index), 0, &st) != 0) {
            throw ParseFailure("DOCX: cannot stat '" + name + "': " + zip_strerror(m_archive));
        }
        if ((st.valid & ZIP_STAT_ENCRYPTION_METHOD) && st.encryption_method != ZIP_EM_NONE) {
            throw ParseFailure("DOCX: entry '" + name + "' is encrypted");
        }
        if (!(st.valid & ZIP_STAT_SIZE)) {
            throw ParseFailure("DOCX: entry '" + name + "' has no recorded size");
        }

        if (st.size > budget.limits().maxStreamBytes) {
            throw ParseFailure("DOCX: entry '" + name + "' declares " + std::to_string(st.size)
                               + " bytes, more than the limit of "
                               + std::to_string(budget.limits().maxStreamBytes));
        }

        zip_file_t *file = zip_fopen_index(m_archive, static_cast<zip_uint64_t>(index), 0);
        if (!file) {
            throw ParseFailure("DOCX: cannot open '" + name + "': " + zip_strerror(m_archive));
        }

        // read until EOF: libzip checks the CRC when the end of the entry is reached
        std::string data;
        data.reserve(static_cast<size_t>(st.size));
        char buffer[16384];
        zip_int64_t got = 0;
        size_t inflated = 0;
        try {
            while ((got = zip_fread(file, buffer, sizeof(buffer))) > 0) {
                budget.charge("DOCX: entry '" + name + "'", inflated, static_cast<size_t>(got));
                data.append(buffer, static_cast<size_t>(got));
            }
        }
        catch (const ParseFailure &) {
            zip_fclose(file);
            throw;
        }
        std::string fileError = got < 0 ? zip_error_strerror(zip_file_get_error(file)) : "";
        zip_fclose(file);

        if (got < 0) {
            throw ParseFailure("DOCX: error reading '" + name + "': " + fileError);
        }
        if (data.size() != st.size) {
            throw ParseFailure("DOCX: entry '" + name + "' is truncated");
        }
        util::logger::debug("ZipArchive: read " + name + " (" + std::to_string(data.size()) + " bytes)");
        return data;
    }

private:
    std::vector<uint8_t> m_storage;
    zip_t *m_archive = nullptr;

    [[noreturn]] static void fail(const std::string &what, zip_error_t &error)
    {
        std::string message = "DOCX: " + what + " (" + zip_error_strerror(&error) + ")";
        zip_error_fini(&error);
        throw ParseFailure(message);
    }
};

} // namespace docx
} // namespace extract
} // namespace docshield

#endif // DOCSHIELD_EXTRACT_DOCX_ZIP_ARCHIVE_HPP
