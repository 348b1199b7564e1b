#include "audit_db.hpp"

#include <iostream>

namespace
{
    bool exec(sqlite3 *db, const char *sql)
    {
        char *errMsg = nullptr;
        if (sqlite3_exec(db, sql, nullptr, nullptr, &errMsg) != SQLITE_OK)
        {
            std::cerr << "❌ DB Error: " << (errMsg ? errMsg : sqlite3_errmsg(db)) << "\n";
            sqlite3_free(errMsg);
            return false;
        }
        return true;
    }

    // Owns a prepared statement for the duration of a scope.
    struct Statement {
        sqlite3_stmt *stmt = nullptr;
        ~Statement() { sqlite3_finalize(stmt); }
    };
}

bool initialize_db(sqlite3 *&db, const std::string &db_path)
{
    if (sqlite3_open(db_path.c_str(), &db) != SQLITE_OK)
    {
        std::cerr << "❌ DB Open Error: " << sqlite3_errmsg(db) << "\n";
        sqlite3_close(db);
        db = nullptr;
        return false;
    }
    const char *schema = R"(
        CREATE TABLE IF NOT EXISTS runs (
            id INTEGER PRIMARY KEY,
            input TEXT,
            output TEXT,
            records INTEGER,
            records_changed INTEGER,
            total_matches INTEGER,
            elapsed_ms INTEGER,
            created_at TEXT DEFAULT CURRENT_TIMESTAMP
        );
        CREATE TABLE IF NOT EXISTS redactions (
            run_id INTEGER REFERENCES runs(id),
            record_index INTEGER,
            record_kind TEXT,
            field_index INTEGER,
            field_kind TEXT,
            ordinal INTEGER,
            pattern TEXT,
            start INTEGER,
            length INTEGER
        );
    )";
    if (!exec(db, schema))
    {
        sqlite3_close(db);
        db = nullptr;
        return false;
    }
    return true;
}

bool store_redactions(sqlite3 *db,
                      const std::string &input_path,
                      const std::string &output_path,
                      const RunSummary &summary,
                      const std::vector<RedactionEntry> &entries)
{
    if (!exec(db, "BEGIN TRANSACTION;"))
        return false;

    Statement run;
    const char *run_sql = "INSERT INTO runs (input, output, records, records_changed, total_matches, elapsed_ms) "
                          "VALUES (?, ?, ?, ?, ?, ?);";
    if (sqlite3_prepare_v2(db, run_sql, -1, &run.stmt, nullptr) != SQLITE_OK)
    {
        std::cerr << "❌ DB Prepare Error: " << sqlite3_errmsg(db) << "\n";
        exec(db, "ROLLBACK;");
        return false;
    }
    sqlite3_bind_text(run.stmt, 1, input_path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(run.stmt, 2, output_path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(run.stmt, 3, static_cast<sqlite3_int64>(summary.records_processed));
    sqlite3_bind_int64(run.stmt, 4, static_cast<sqlite3_int64>(summary.records_changed));
    sqlite3_bind_int64(run.stmt, 5, static_cast<sqlite3_int64>(summary.total_matches));
    sqlite3_bind_int64(run.stmt, 6, static_cast<sqlite3_int64>(summary.elapsed.count()));
    if (sqlite3_step(run.stmt) != SQLITE_DONE)
    {
        std::cerr << "❌ DB Insert Error: " << sqlite3_errmsg(db) << "\n";
        exec(db, "ROLLBACK;");
        return false;
    }
    sqlite3_int64 run_id = sqlite3_last_insert_rowid(db);

    Statement ins;
    const char *ins_sql = "INSERT INTO redactions (run_id, record_index, record_kind, field_index, field_kind, "
                          "ordinal, pattern, start, length) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);";
    if (sqlite3_prepare_v2(db, ins_sql, -1, &ins.stmt, nullptr) != SQLITE_OK)
    {
        std::cerr << "❌ DB Prepare Error: " << sqlite3_errmsg(db) << "\n";
        exec(db, "ROLLBACK;");
        return false;
    }
    for (const auto &e : entries)
    {
        sqlite3_reset(ins.stmt);
        sqlite3_bind_int64(ins.stmt, 1, run_id);
        sqlite3_bind_int64(ins.stmt, 2, static_cast<sqlite3_int64>(e.record_index));
        sqlite3_bind_text(ins.stmt, 3, record_kind_name(e.record_kind), -1, SQLITE_STATIC);
        sqlite3_bind_int(ins.stmt, 4, static_cast<int>(e.field_index));
        sqlite3_bind_text(ins.stmt, 5, field_kind_name(e.field_kind), -1, SQLITE_STATIC);
        sqlite3_bind_int(ins.stmt, 6, static_cast<int>(e.ordinal));
        sqlite3_bind_text(ins.stmt, 7, e.pattern.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(ins.stmt, 8, static_cast<sqlite3_int64>(e.start));
        sqlite3_bind_int64(ins.stmt, 9, static_cast<sqlite3_int64>(e.length));
        if (sqlite3_step(ins.stmt) != SQLITE_DONE)
        {
            std::cerr << "❌ DB Insert Error: " << sqlite3_errmsg(db) << "\n";
            exec(db, "ROLLBACK;");
            return false;
        }
    }

    return true;
}

AuditLog::~AuditLog()
{
    if (!db_)
        return;
    if (staged_)
        exec(db_, "ROLLBACK;");
    sqlite3_close(db_);
}

bool AuditLog::open(const std::string &db_path)
{
    path_ = db_path;
    if (!initialize_db(db_, db_path))
    {
        std::cerr << "❌ Failed to init audit database: " << db_path << "\n";
        return false;
    }
    return true;
}

bool AuditLog::stage(const std::string &input_path,
                     const std::string &output_path,
                     const RunSummary &summary,
                     const std::vector<RedactionEntry> &entries)
{
    if (!db_ || staged_)
        return false;
    if (!store_redactions(db_, input_path, output_path, summary, entries))
        return false;
    staged_ = true;
    staged_entries_ = entries.size();
    return true;
}

bool AuditLog::commit()
{
    if (!staged_)
        return false;
    staged_ = false;
    if (!exec(db_, "COMMIT;"))
    {
        exec(db_, "ROLLBACK;");
        return false;
    }
    std::cout << "[SQLite] " << staged_entries_ << " redactions recorded in " << path_ << " ✅\n";
    return true;
}
