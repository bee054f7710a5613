#pragma once

#include "repositories/IEventRepository.hpp"
#include "repositories/sqlite/IDatabase.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace esc::repositories::sqlite {

// Storage type of the payload column
enum class EventDataType {
    TEXT,   // plain text, any SQLite version
    JSON,   // JSON text validated through json()
    JSONB,  // binary JSON, SQLite 3.45+
};

EventDataType event_data_type_from_string(const std::string& str);

struct SqliteEventRepositoryOptions {
    EventDataType data_type = EventDataType::TEXT;
    bool wal = false;
};

// Events in a single `events` table keyed by id. Writes are upserts, so a second
// write with an existing id replaces the row in place (last write wins).
class SqliteEventRepository : public esc::repositories::IEventRepository {
public:
    explicit SqliteEventRepository(std::unique_ptr<IDatabase> db,
                                   SqliteEventRepositoryOptions options = {});
    ~SqliteEventRepository() override;

    // IEventRepository
    void append(const esc::domain::Event& event) override;
    // One transaction; rolled back entirely if any row fails
    void append_all(const std::vector<esc::domain::Event>& events) override;
    std::vector<esc::domain::Event> get_all() const override;
    std::optional<esc::domain::Event> get_by_id(const std::string& id) const override;
    void delete_all() override;
    // Delete and re-insert in one transaction
    void replace_all(const std::vector<esc::domain::Event>& events) override;
    void dispose() override;

    size_t row_count() const;
    EventDataType data_type() const noexcept { return options_.data_type; }

private:
    void upsert(const esc::domain::Event& event);
    void in_transaction(const std::function<void()>& body);
    std::string select_columns() const;
    static esc::domain::Event event_from_row(const SqlRow& row);

    std::unique_ptr<IDatabase> db_;
    SqliteEventRepositoryOptions options_;
};

} // namespace esc::repositories::sqlite
