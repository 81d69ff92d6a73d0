#include "database.h"

Database::Database(const std::string& filename) {
    sqlite3* db_raw = nullptr;
    const int result = sqlite3_open(filename.c_str(), &db_raw);

    if (result != SQLITE_OK) {
        const std::string error_msg = db_raw ? sqlite3_errmsg(db_raw) : "unknown error";
        if (db_raw) sqlite3_close(db_raw);
        throw DatabaseError("Failed to open database: " + error_msg);
    }

    db_.reset(db_raw);
}

void Database::execute(const std::string& sql) const {
    char* errmsg = nullptr;
    if (sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &errmsg) != SQLITE_OK) {
        const std::string error_msg = errmsg ? errmsg : sqlite3_errmsg(db_.get());
        sqlite3_free(errmsg);
        throw DatabaseError("SQL execution failed: " + error_msg);
    }
}

bool Database::tableExists(const std::string& tableName) const {
    Statement stmt(*this, "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?;");
    stmt.bindText(1, tableName);
    return stmt.step();
}

std::int64_t Database::countRows(const std::string& tableName) const {
    Statement stmt(*this, "SELECT COUNT(*) FROM " + quoteIdentifier(tableName) + ";");
    if (!stmt.step()) {
        throw DatabaseError("Failed to count rows of table " + tableName);
    }
    return stmt.columnInt64(0);
}

Statement::Statement(const Database& db, const std::string& sql) : db_(db.get()) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        throw DatabaseError("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }
    stmt_.reset(stmt);
}

bool Statement::step() {
    const int result = sqlite3_step(stmt_.get());
    if (result == SQLITE_ROW) return true;
    if (result == SQLITE_DONE) return false;
    throw DatabaseError("Failed to step statement: " + std::string(sqlite3_errmsg(db_)));
}

void Statement::reset() {
    sqlite3_reset(stmt_.get());
    sqlite3_clear_bindings(stmt_.get());
}

void Statement::bindText(int index, const std::string& value) {
    if (sqlite3_bind_text(stmt_.get(), index, value.c_str(), static_cast<int>(value.length()), SQLITE_TRANSIENT) != SQLITE_OK) {
        throw DatabaseError("Failed to bind text parameter: " + std::string(sqlite3_errmsg(db_)));
    }
}

void Statement::bindInt64(int index, std::int64_t value) {
    if (sqlite3_bind_int64(stmt_.get(), index, value) != SQLITE_OK) {
        throw DatabaseError("Failed to bind integer parameter: " + std::string(sqlite3_errmsg(db_)));
    }
}

std::string Statement::columnText(int column) const {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_.get(), column));
    return text ? std::string(text) : std::string();
}

std::int64_t Statement::columnInt64(int column) const {
    return sqlite3_column_int64(stmt_.get(), column);
}

std::string quoteIdentifier(const std::string& name) {
    std::string quoted = "\"";
    for (char c : name) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

Transaction::Transaction(const Database& db) : db_(db) {
    db_.execute("BEGIN;");
}

Transaction::~Transaction() {
    if (!committed_) {
        sqlite3_exec(db_.get(), "ROLLBACK;", nullptr, nullptr, nullptr);
    }
}

void Transaction::commit() {
    db_.execute("COMMIT;");
    committed_ = true;
}
