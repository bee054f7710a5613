#pragma once

#include <string>

namespace esc::config {

struct ClockSettings {
    std::string node_id = "node1";
};

struct StorageSettings {
    std::string backend = "memory";       // "memory", "jsonl", or "sqlite"
    std::string data_directory = "data";
    // jsonl backend
    std::string event_file = "events.jsonl";
    // sqlite backend; relative paths resolve against data_directory
    std::string sqlite_path = "events.db";
    std::string sqlite_data_type = "text"; // "text", "json", or "jsonb"
    bool sqlite_wal = false;
};

struct Settings {
    ClockSettings clock;
    StorageSettings storage;

    static Settings from_environment();
    static Settings development();
    static Settings production();
};

} // namespace esc::config
