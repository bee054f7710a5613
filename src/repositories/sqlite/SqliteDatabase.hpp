#pragma once

#include "repositories/sqlite/IDatabase.hpp"

#include <memory>
#include <string>

struct sqlite3;

namespace esc::repositories::sqlite {

class SqliteDatabase : public IDatabase {
public:
    ~SqliteDatabase() override;

    SqliteDatabase(const SqliteDatabase&) = delete;
    SqliteDatabase& operator=(const SqliteDatabase&) = delete;

    /// Open (or create) a database file. ":memory:" opens a private in-memory database.
    static std::unique_ptr<SqliteDatabase> open(const std::string& location);

    void execute(const std::string& statement, const SqlParams& params = {}) override;
    std::vector<SqlRow> query(const std::string& statement,
                              const SqlParams& params = {}) const override;
    void close() override;
    bool is_open() const noexcept override { return db_ != nullptr; }

    const std::string& location() const noexcept { return location_; }

private:
    SqliteDatabase(sqlite3* db, std::string location);

    sqlite3* handle() const;

    sqlite3* db_;
    std::string location_;
};

} // namespace esc::repositories::sqlite
