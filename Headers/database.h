#pragma once
#include <sqlite3.h>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

// Error raised for any failed SQLite call, carries the SQLite message
class DatabaseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class Database {
public:
    // Constructor that opens the database
    explicit Database(const std::string& filename);

    // Disable copy semantics
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    // Enable move semantics
    Database(Database&&) = default;
    Database& operator=(Database&&) = default;

    // Explicit getter for the raw sqlite3* pointer
    sqlite3* get() const { return db_.get(); }

    // Execute one or more statements that return no rows
    void execute(const std::string& sql) const;

    // Check whether a table with the given name exists
    bool tableExists(const std::string& tableName) const;

    // Count the rows of a table
    std::int64_t countRows(const std::string& tableName) const;

private:
    struct Deleter {
        void operator()(sqlite3* db) const {
            if (db) sqlite3_close(db);
        }
    };

    std::unique_ptr<sqlite3, Deleter> db_;
};

// Prepared statement owning its sqlite3_stmt
class Statement {
public:
    Statement(const Database& db, const std::string& sql);

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement(Statement&&) = default;
    Statement& operator=(Statement&&) = default;

    // Advance to the next row; false once the statement is done
    bool step();

    // Reset the statement so it can be bound and stepped again
    void reset();

    void bindText(int index, const std::string& value);
    void bindInt64(int index, std::int64_t value);

    std::string columnText(int column) const;
    std::int64_t columnInt64(int column) const;

private:
    struct Finalizer {
        void operator()(sqlite3_stmt* stmt) const {
            if (stmt) sqlite3_finalize(stmt);
        }
    };

    sqlite3* db_ = nullptr;
    std::unique_ptr<sqlite3_stmt, Finalizer> stmt_;
};

// Quote an identifier for use in SQL text ("name" with embedded quotes doubled)
std::string quoteIdentifier(const std::string& name);

// Scoped transaction, rolled back unless committed
class Transaction {
public:
    explicit Transaction(const Database& db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    const Database& db_;
    bool committed_ = false;
};
