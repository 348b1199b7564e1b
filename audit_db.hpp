#pragma once

#include <string>
#include <vector>
#include <sqlite3.h>

#include "stream_processor.hpp"

bool initialize_db(sqlite3 *&db, const std::string &db_path);

// Inserts one run and its redactions inside a transaction that is left open
// for the caller to COMMIT. Rolls back and returns false (after logging) on
// any SQLite error.
bool store_redactions(sqlite3 *db,
                      const std::string &input_path,
                      const std::string &output_path,
                      const RunSummary &summary,
                      const std::vector<RedactionEntry> &entries);

// One run in the audit database. The database is created if missing and
// earlier runs are kept. A staged run that is never committed is rolled back
// when the log goes out of scope.
class AuditLog
{
public:
    AuditLog() = default;
    ~AuditLog();

    AuditLog(const AuditLog &) = delete;
    AuditLog &operator=(const AuditLog &) = delete;

    bool open(const std::string &db_path);
    bool is_open() const { return db_ != nullptr; }

    bool stage(const std::string &input_path,
               const std::string &output_path,
               const RunSummary &summary,
               const std::vector<RedactionEntry> &entries);
    bool commit();

private:
    sqlite3 *db_ = nullptr;
    std::string path_;
    size_t staged_entries_ = 0;
    bool staged_ = false;
};
