#include "repositories/sqlite/SqliteDatabase.hpp"

#include "repositories/IEventRepository.hpp"

#include <sqlite3.h>

#include <type_traits>
#include <variant>

namespace esc::repositories::sqlite {

namespace {

struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

[[noreturn]] void fail(sqlite3* db, const std::string& context) {
    throw StorageError(context + ": " + sqlite3_errmsg(db));
}

Statement prepare(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), static_cast<int>(sql.size()), &raw, nullptr) !=
        SQLITE_OK) {
        fail(db, "prepare \"" + sql + "\"");
    }
    return Statement(raw);
}

void bind(sqlite3* db, sqlite3_stmt* stmt, const SqlParams& params) {
    for (size_t i = 0; i < params.size(); ++i) {
        int index = static_cast<int>(i) + 1;
        int rc = std::visit([&](const auto& value) {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return sqlite3_bind_null(stmt, index);
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return sqlite3_bind_int64(stmt, index, value);
            } else if constexpr (std::is_same_v<T, double>) {
                return sqlite3_bind_double(stmt, index, value);
            } else {
                return sqlite3_bind_text(stmt, index, value.data(),
                                         static_cast<int>(value.size()), SQLITE_TRANSIENT);
            }
        }, params[i]);
        if (rc != SQLITE_OK) {
            fail(db, "bind parameter " + std::to_string(index));
        }
    }
}

SqlValue column_value(sqlite3_stmt* stmt, int col) {
    switch (sqlite3_column_type(stmt, col)) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt, col));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, col);
        case SQLITE_NULL:
            return std::monostate{};
        default: {
            // TEXT and BLOB both come back as bytes
            const auto* data = static_cast<const char*>(sqlite3_column_blob(stmt, col));
            int size = sqlite3_column_bytes(stmt, col);
            return data ? std::string(data, static_cast<size_t>(size)) : std::string();
        }
    }
}

} // namespace

SqliteDatabase::SqliteDatabase(sqlite3* db, std::string location)
    : db_(db), location_(std::move(location)) {}

SqliteDatabase::~SqliteDatabase() {
    close();
}

std::unique_ptr<SqliteDatabase> SqliteDatabase::open(const std::string& location) {
    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(location.c_str(), &db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        sqlite3_close(db);
        throw StorageError("open " + location + ": " + message);
    }
    return std::unique_ptr<SqliteDatabase>(new SqliteDatabase(db, location));
}

void SqliteDatabase::execute(const std::string& statement, const SqlParams& params) {
    sqlite3* db = handle();
    auto stmt = prepare(db, statement);
    bind(db, stmt.get(), params);

    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {}
    if (rc != SQLITE_DONE) {
        fail(db, "execute \"" + statement + "\"");
    }
}

std::vector<SqlRow> SqliteDatabase::query(const std::string& statement,
                                          const SqlParams& params) const {
    sqlite3* db = handle();
    auto stmt = prepare(db, statement);
    bind(db, stmt.get(), params);

    std::vector<SqlRow> rows;
    int columns = sqlite3_column_count(stmt.get());
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        SqlRow row;
        for (int col = 0; col < columns; ++col) {
            row.emplace(sqlite3_column_name(stmt.get(), col), column_value(stmt.get(), col));
        }
        rows.push_back(std::move(row));
    }
    if (rc != SQLITE_DONE) {
        fail(db, "query \"" + statement + "\"");
    }
    return rows;
}

void SqliteDatabase::close() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

sqlite3* SqliteDatabase::handle() const {
    if (!db_) {
        throw StorageError("Database " + location_ + " is closed");
    }
    return db_;
}

} // namespace esc::repositories::sqlite
