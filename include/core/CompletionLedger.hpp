#pragma once

#include <string>
#include <vector>

struct sqlite3;

namespace podfetch {
namespace core {

enum class LedgerWrite {
    Inserted,
    DuplicateEntry
};

// Durable set of output identifiers whose transfer has completed.
// Backed by a single SQLite table with a UNIQUE column; opening an
// existing ledger never disturbs its rows. Use ":memory:" for a
// throwaway ledger.
class CompletionLedger {
public:
    explicit CompletionLedger(const std::string& path);
    ~CompletionLedger();

    CompletionLedger(const CompletionLedger&) = delete;
    CompletionLedger& operator=(const CompletionLedger&) = delete;

    bool contains(const std::string& id) const;

    // DuplicateEntry when id is already present; the row is left untouched
    LedgerWrite record(const std::string& id);

    // Removing an absent id is not an error
    void remove(const std::string& id);

    std::vector<std::string> entries() const;
    std::size_t size() const;

    const std::string& path() const { return path_; }

private:
    void exec(const char* sql);
    [[noreturn]] void fail(const std::string& what) const;

    std::string path_;
    sqlite3* db_;
};

} // namespace core
} // namespace podfetch
