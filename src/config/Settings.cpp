#include "config/Settings.hpp"

#include <cstdlib>

namespace esc::config {

namespace {

std::string env_or(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : fallback;
}

bool env_bool_or(const char* name, bool fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    std::string s(val);
    if (s == "true" || s == "1" || s == "yes") return true;
    if (s == "false" || s == "0" || s == "no") return false;
    return fallback;
}

} // namespace

Settings Settings::from_environment() {
    std::string env = env_or("ESC_ENV", "development");
    Settings s = (env == "production") ? production() : development();
    s.clock.node_id = env_or("ESC_NODE_ID", s.clock.node_id);
    s.storage.backend = env_or("ESC_STORAGE_BACKEND", s.storage.backend);
    s.storage.data_directory = env_or("ESC_DATA_DIRECTORY", s.storage.data_directory);
    s.storage.event_file = env_or("ESC_EVENT_FILE", s.storage.event_file);
    s.storage.sqlite_path = env_or("ESC_SQLITE_PATH", s.storage.sqlite_path);
    s.storage.sqlite_data_type = env_or("ESC_SQLITE_DATA_TYPE", s.storage.sqlite_data_type);
    s.storage.sqlite_wal = env_bool_or("ESC_SQLITE_WAL", s.storage.sqlite_wal);
    return s;
}

Settings Settings::development() {
    Settings s;
    s.storage.data_directory = "data/dev";
    return s;
}

Settings Settings::production() {
    Settings s;
    s.storage.backend = "sqlite";
    s.storage.data_directory = "data/prod";
    s.storage.sqlite_data_type = "json";
    s.storage.sqlite_wal = true;
    return s;
}

} // namespace esc::config
