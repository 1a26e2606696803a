#ifndef DOCSHIELD_HISTORY_SCAN_HISTORY_HPP
#define DOCSHIELD_HISTORY_SCAN_HISTORY_HPP

#include "model/scan_result.hpp"
#include "util/logger.hpp"
#include <cstdint>
#include <mutex>
#include <sqlite3.h>
#include <string>
#include <vector>
#include <zlib.h>

namespace docshield {
namespace history {

// One row of the scans table.
struct ScanRecord {
    int64_t id = 0;
    std::string digest;
    std::string fileName;
    std::string format;
    int pageCount = 0;
    int issueCount = 0;
    bool safe = false;
    bool empty = false;
    std::string sanitizedText;
    std::string scannedAt;
};

class ScanHistory {
  public:
    // -------------------------------------------------------------------------
    // Constructor accepting the path to the .sqlite database (":memory:" works
    // for a process-local history). The file is created on first use.
    // -------------------------------------------------------------------------
    explicit ScanHistory(const std::string& dbFilePath) : m_dbFilePath(dbFilePath), m_db(nullptr) {}

    ~ScanHistory() {
        if (m_db) {
            sqlite3_close(m_db);
        }
    }

    ScanHistory(const ScanHistory&) = delete;
    ScanHistory& operator=(const ScanHistory&) = delete;

    // -------------------------------------------------------------------------
    // Appends one row for a completed scan. Storage problems are logged and
    // reported as false; they never abort the scan that produced the result.
    // -------------------------------------------------------------------------
    bool Record(const model::ScanResult& result) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!ensureOpen()) {
            return false;
        }

        const char* sql = "INSERT INTO scans (digest, file_name, format, page_count, issue_count,"
                          " safe, empty, sanitized, sanitized_size) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);";
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK || !stmt) {
            logError("prepare insert");
            return false;
        }

        std::vector<uint8_t> compressed;
        if (!compressText(result.sanitizedText, compressed)) {
            util::logger::error("[ScanHistory] compress2 failed for " + result.fileName);
            sqlite3_finalize(stmt);
            return false;
        }

        const std::string format = model::formatName(result.format);
        bool bound = sqlite3_bind_text(stmt, 1, result.documentSha256.c_str(), -1, SQLITE_STATIC) == SQLITE_OK
                  && sqlite3_bind_text(stmt, 2, result.fileName.c_str(), -1, SQLITE_STATIC) == SQLITE_OK
                  && sqlite3_bind_text(stmt, 3, format.c_str(), -1, SQLITE_STATIC) == SQLITE_OK
                  && sqlite3_bind_int(stmt, 4, result.pageCount) == SQLITE_OK
                  && sqlite3_bind_int(stmt, 5, static_cast<int>(result.issues.size())) == SQLITE_OK
                  && sqlite3_bind_int(stmt, 6, result.safe ? 1 : 0) == SQLITE_OK
                  && sqlite3_bind_int(stmt, 7, result.isEmpty ? 1 : 0) == SQLITE_OK
                  && sqlite3_bind_blob(stmt, 8, compressed.data(), static_cast<int>(compressed.size()),
                                       SQLITE_STATIC) == SQLITE_OK
                  && sqlite3_bind_int64(stmt, 9, static_cast<sqlite3_int64>(result.sanitizedText.size()))
                         == SQLITE_OK;
        if (!bound) {
            logError("bind insert");
            sqlite3_finalize(stmt);
            return false;
        }

        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            logError("insert");
            return false;
        }
        util::logger::debug("[ScanHistory] recorded " + result.fileName + " (" + result.documentSha256 + ")");
        return true;
    }

    // -------------------------------------------------------------------------
    // All rows recorded for a digest, oldest first. Empty on any error.
    // -------------------------------------------------------------------------
    std::vector<ScanRecord> FindByDigest(const std::string& digest) {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<ScanRecord> rows;
        if (!ensureOpen()) {
            return rows;
        }

        const char* sql = "SELECT id, digest, file_name, format, page_count, issue_count, safe, empty,"
                          " sanitized, sanitized_size, scanned_at FROM scans WHERE digest = ? ORDER BY id;";
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK || !stmt) {
            logError("prepare select");
            return rows;
        }
        if (sqlite3_bind_text(stmt, 1, digest.c_str(), -1, SQLITE_STATIC) != SQLITE_OK) {
            logError("bind select");
            sqlite3_finalize(stmt);
            return rows;
        }

        int rc = SQLITE_ROW;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            ScanRecord row;
            row.id = sqlite3_column_int64(stmt, 0);
            row.digest = columnText(stmt, 1);
            row.fileName = columnText(stmt, 2);
            row.format = columnText(stmt, 3);
            row.pageCount = sqlite3_column_int(stmt, 4);
            row.issueCount = sqlite3_column_int(stmt, 5);
            row.safe = sqlite3_column_int(stmt, 6) != 0;
            row.empty = sqlite3_column_int(stmt, 7) != 0;

            const void* blob = sqlite3_column_blob(stmt, 8);
            int blobSize = sqlite3_column_bytes(stmt, 8);
            sqlite3_int64 originalSize = sqlite3_column_int64(stmt, 9);
            if (!uncompressText(blob, blobSize, originalSize, row.sanitizedText)) {
                util::logger::warn("[ScanHistory] could not inflate sanitized text of row "
                                   + std::to_string(row.id));
            }
            row.scannedAt = columnText(stmt, 10);
            rows.push_back(std::move(row));
        }
        if (rc != SQLITE_DONE) {
            logError("select");
        }
        sqlite3_finalize(stmt);
        return rows;
    }

    const std::string& Path() const { return m_dbFilePath; }

  private:
    // -------------------------------------------------------------------------
    // Helper: open the database and create the schema on first use
    // -------------------------------------------------------------------------
    bool ensureOpen() {
        if (m_db) {
            return true;
        }
        if (sqlite3_open(m_dbFilePath.c_str(), &m_db) != SQLITE_OK || !m_db) {
            util::logger::error("[ScanHistory] Could not open database: " + m_dbFilePath);
            if (m_db) {
                sqlite3_close(m_db);
                m_db = nullptr;
            }
            return false;
        }

        const char* ddl = "CREATE TABLE IF NOT EXISTS scans ("
                          " id INTEGER PRIMARY KEY AUTOINCREMENT,"
                          " digest TEXT NOT NULL,"
                          " file_name TEXT,"
                          " format TEXT,"
                          " page_count INTEGER,"
                          " issue_count INTEGER,"
                          " safe INTEGER,"
                          " empty INTEGER,"
                          " sanitized BLOB,"
                          " sanitized_size INTEGER,"
                          " scanned_at DATETIME DEFAULT CURRENT_TIMESTAMP"
                          ");"
                          "CREATE INDEX IF NOT EXISTS scans_digest ON scans(digest);";
        char* errMsg = nullptr;
        if (sqlite3_exec(m_db, ddl, nullptr, nullptr, &errMsg) != SQLITE_OK) {
            util::logger::error("[ScanHistory] schema error: " + std::string(errMsg ? errMsg : "unknown"));
            sqlite3_free(errMsg);
            sqlite3_close(m_db);
            m_db = nullptr;
            return false;
        }
        return true;
    }

    static bool compressText(const std::string& text, std::vector<uint8_t>& out) {
        uLongf outSize = compressBound(text.size());
        out.resize(outSize);
        if (compress2(out.data(), &outSize, reinterpret_cast<const Bytef*>(text.data()), text.size(),
                      Z_BEST_COMPRESSION) != Z_OK) {
            return false;
        }
        out.resize(outSize);
        return true;
    }

    static bool uncompressText(const void* blob, int blobSize, sqlite3_int64 originalSize,
                               std::string& out) {
        out.clear();
        if (originalSize <= 0) {
            return true;
        }
        if (!blob || blobSize <= 0) {
            return false;
        }
        out.resize(static_cast<size_t>(originalSize));
        uLongf outSize = static_cast<uLongf>(originalSize);
        int rc = uncompress(reinterpret_cast<Bytef*>(&out[0]), &outSize, static_cast<const Bytef*>(blob),
                            static_cast<uLong>(blobSize));
        if (rc != Z_OK) {
            out.clear();
            return false;
        }
        out.resize(outSize);
        return true;
    }

    static std::string columnText(sqlite3_stmt* stmt, int col) {
        const unsigned char* text = sqlite3_column_text(stmt, col);
        return text ? reinterpret_cast<const char*>(text) : "";
    }

    void logError(const std::string& what) {
        util::logger::error("[ScanHistory] " + what + " failed: " + sqlite3_errmsg(m_db));
    }

  private:
    std::string m_dbFilePath;
    sqlite3* m_db;
    std::mutex m_mutex;
};

} // namespace history
} // namespace docshield

#endif // DOCSHIELD_HISTORY_SCAN_HISTORY_HPP
