#include "core/CompletionLedger.hpp"
#include <filesystem>
#include <stdexcept>
#include <sqlite3.h>

namespace podfetch {
namespace core {

namespace {

// Finalizes a prepared statement on every exit path
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : stmt_(nullptr) {
        rc_ = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr);
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return rc_ == SQLITE_OK; }
    sqlite3_stmt* get() const { return stmt_; }

    bool bind(int index, const std::string& value) {
        return sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT) ==
               SQLITE_OK;
    }

private:
    sqlite3_stmt* stmt_;
    int rc_;
};

const char* const createTableSql =
    "CREATE TABLE IF NOT EXISTS completion (output_id TEXT NOT NULL UNIQUE);";

} // namespace

CompletionLedger::CompletionLedger(const std::string& path)
    : path_(path), db_(nullptr) {
    if (path_ != ":memory:") {
        std::error_code ec;
        auto dir = std::filesystem::path(path_).parent_path();
        if (!dir.empty()) {
            std::filesystem::create_directories(dir, ec);
            if (ec) {
                throw std::runtime_error("Cannot create ledger directory " + dir.string() + ": " + ec.message());
            }
        }
    }

    int rc = sqlite3_open(path_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open ledger " + path_ + ": " + message);
    }

    sqlite3_busy_timeout(db_, 5000);

    try {
        exec(createTableSql);
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

CompletionLedger::~CompletionLedger() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void CompletionLedger::exec(const char* sql) {
    char* errMsg = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string message = errMsg ? errMsg : sqlite3_errstr(rc);
        sqlite3_free(errMsg);
        throw std::runtime_error("Ledger statement failed: " + message);
    }
}

void CompletionLedger::fail(const std::string& what) const {
    throw std::runtime_error(what + ": " + sqlite3_errmsg(db_));
}

bool CompletionLedger::contains(const std::string& id) const {
    Statement stmt(db_, "SELECT count(*) FROM completion WHERE output_id = ?;");
    if (!stmt.ok()) {
        fail("Failed to prepare ledger lookup");
    }
    if (!stmt.bind(1, id)) {
        fail("Failed to bind " + id);
    }

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        fail("Failed to query ledger");
    }
    return sqlite3_column_int64(stmt.get(), 0) > 0;
}

LedgerWrite CompletionLedger::record(const std::string& id) {
    Statement stmt(db_, "INSERT INTO completion (output_id) VALUES (?);");
    if (!stmt.ok()) {
        fail("Failed to prepare ledger insert");
    }
    if (!stmt.bind(1, id)) {
        fail("Failed to bind " + id);
    }

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
        return LedgerWrite::Inserted;
    }
    if (sqlite3_extended_errcode(db_) == SQLITE_CONSTRAINT_UNIQUE) {
        return LedgerWrite::DuplicateEntry;
    }
    fail("Failed to record " + id);
}

void CompletionLedger::remove(const std::string& id) {
    Statement stmt(db_, "DELETE FROM completion WHERE output_id = ?;");
    if (!stmt.ok()) {
        fail("Failed to prepare ledger delete");
    }
    if (!stmt.bind(1, id)) {
        fail("Failed to bind " + id);
    }

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        fail("Failed to remove " + id);
    }
}

std::vector<std::string> CompletionLedger::entries() const {
    Statement stmt(db_, "SELECT output_id FROM completion ORDER BY rowid;");
    if (!stmt.ok()) {
        fail("Failed to prepare ledger listing");
    }

    std::vector<std::string> result;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        const unsigned char* text = sqlite3_column_text(stmt.get(), 0);
        result.emplace_back(text ? reinterpret_cast<const char*>(text) : "");
    }
    if (rc != SQLITE_DONE) {
        fail("Failed to list ledger");
    }
    return result;
}

std::size_t CompletionLedger::size() const {
    Statement stmt(db_, "SELECT count(*) FROM completion;");
    if (!stmt.ok() || sqlite3_step(stmt.get()) != SQLITE_ROW) {
        fail("Failed to count ledger entries");
    }
    return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
}

} // namespace core
} // namespace podfetch
