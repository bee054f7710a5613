#include "repositories/sqlite/SqliteEventRepository.hpp"

#include <stdexcept>
#include <variant>

using namespace esc::domain;

namespace esc::repositories::sqlite {

namespace {

std::string text_column(const SqlRow& row, const std::string& name) {
    auto it = row.find(name);
    if (it == row.end() || std::holds_alternative<std::monostate>(it->second)) {
        return "";
    }
    if (const auto* text = std::get_if<std::string>(&it->second)) {
        return *text;
    }
    if (const auto* integer = std::get_if<int64_t>(&it->second)) {
        return std::to_string(*integer);
    }
    return nlohmann::json(std::get<double>(it->second)).dump();
}

std::string value_expression(EventDataType type) {
    switch (type) {
        case EventDataType::JSON: return "json(?)";
        case EventDataType::JSONB: return "jsonb(?)";
        case EventDataType::TEXT: break;
    }
    return "?";
}

} // namespace

EventDataType event_data_type_from_string(const std::string& str) {
    if (str == "text") return EventDataType::TEXT;
    if (str == "json") return EventDataType::JSON;
    if (str == "jsonb") return EventDataType::JSONB;
    throw std::invalid_argument("Invalid SQLite data type: " + str);
}

SqliteEventRepository::SqliteEventRepository(std::unique_ptr<IDatabase> db,
                                             SqliteEventRepositoryOptions options)
    : db_(std::move(db)), options_(options) {
    if (!db_) {
        throw std::invalid_argument("SqliteEventRepository requires a database");
    }
    if (options_.wal) {
        // journal_mode returns a row; query() consumes it
        (void)db_->query("PRAGMA journal_mode=WAL;");
    }
    std::string data_column = options_.data_type == EventDataType::JSONB ? "BLOB" : "TEXT";
    db_->execute(
        "CREATE TABLE IF NOT EXISTS events ("
        "id TEXT PRIMARY KEY, "
        "type TEXT, "
        "data " + data_column + ", "
        "schema_version TEXT DEFAULT '1.0.0')");
}

SqliteEventRepository::~SqliteEventRepository() {
    dispose();
}

void SqliteEventRepository::append(const Event& event) {
    upsert(event);
}

void SqliteEventRepository::append_all(const std::vector<Event>& events) {
    if (events.empty()) return;
    in_transaction([&] {
        for (const auto& event : events) {
            upsert(event);
        }
    });
}

std::vector<Event> SqliteEventRepository::get_all() const {
    auto rows = db_->query("SELECT " + select_columns() + " FROM events ORDER BY rowid");
    std::vector<Event> events;
    events.reserve(rows.size());
    for (const auto& row : rows) {
        events.push_back(event_from_row(row));
    }
    return events;
}

std::optional<Event> SqliteEventRepository::get_by_id(const std::string& id) const {
    auto rows = db_->query("SELECT " + select_columns() + " FROM events WHERE id = ?", {id});
    if (rows.empty()) return std::nullopt;
    return event_from_row(rows.front());
}

void SqliteEventRepository::delete_all() {
    db_->execute("DELETE FROM events");
}

void SqliteEventRepository::replace_all(const std::vector<Event>& events) {
    in_transaction([&] {
        db_->execute("DELETE FROM events");
        for (const auto& event : events) {
            upsert(event);
        }
    });
}

void SqliteEventRepository::dispose() {
    if (db_ && db_->is_open()) {
        db_->close();
    }
}

size_t SqliteEventRepository::row_count() const {
    auto rows = db_->query("SELECT COUNT(*) AS n FROM events");
    return static_cast<size_t>(std::get<int64_t>(rows.front().at("n")));
}

void SqliteEventRepository::upsert(const Event& event) {
    db_->execute(
        "INSERT INTO events (id, type, data, schema_version) VALUES (?, ?, " +
            value_expression(options_.data_type) + ", ?) "
            "ON CONFLICT(id) DO UPDATE SET "
            "type = excluded.type, data = excluded.data, "
            "schema_version = excluded.schema_version",
        {event.id().to_string(), event.type(), event.data_to_json(), event.schema_version()});
}

void SqliteEventRepository::in_transaction(const std::function<void()>& body) {
    db_->execute("BEGIN");
    try {
        body();
        db_->execute("COMMIT");
    } catch (const std::exception&) {
        db_->execute("ROLLBACK");
        throw;
    }
}

std::string SqliteEventRepository::select_columns() const {
    if (options_.data_type == EventDataType::TEXT) {
        return "id, type, data, schema_version";
    }
    return "id, type, json(data) AS data, schema_version";
}

Event SqliteEventRepository::event_from_row(const SqlRow& row) {
    auto version = text_column(row, "schema_version");
    return Event(Hlc::parse(text_column(row, "id")),
                 text_column(row, "type"),
                 Event::parse_data(text_column(row, "data")),
                 version.empty() ? Event::kDefaultSchemaVersion : version);
}

} // namespace esc::repositories::sqlite
