#include "repositories/RepositoryFactory.hpp"

#include "repositories/InMemoryEventRepository.hpp"
#include "repositories/jsonl/JsonLinesEventRepository.hpp"
#include "repositories/sqlite/SqliteDatabase.hpp"
#include "repositories/sqlite/SqliteEventRepository.hpp"

#include <filesystem>
#include <stdexcept>

namespace esc::repositories {

std::unique_ptr<IEventRepository> make_repository(const esc::config::StorageSettings& settings) {
    if (settings.backend == "memory") {
        return std::make_unique<InMemoryEventRepository>();
    }

    if (settings.backend == "jsonl") {
        auto fs = jsonl::JsonLinesEventRepository::make_local_fs(settings.data_directory);
        return std::make_unique<jsonl::JsonLinesEventRepository>(fs, settings.event_file);
    }

    if (settings.backend == "sqlite") {
        sqlite::SqliteEventRepositoryOptions options;
        options.data_type = sqlite::event_data_type_from_string(settings.sqlite_data_type);
        options.wal = settings.sqlite_wal;

        std::string location = settings.sqlite_path;
        if (location != ":memory:" && std::filesystem::path(location).is_relative()) {
            std::filesystem::create_directories(settings.data_directory);
            location = (std::filesystem::path(settings.data_directory) / location).string();
        }
        return std::make_unique<sqlite::SqliteEventRepository>(
            sqlite::SqliteDatabase::open(location), options);
    }

    throw std::invalid_argument("Unknown storage backend: " + settings.backend);
}

} // namespace esc::repositories
