#include "config/Settings.hpp"

#include <gtest/gtest.h>

#include <cstdlib>

using namespace esc::config;

namespace {

void clear_env() {
    unsetenv("ESC_ENV");
    unsetenv("ESC_NODE_ID");
    unsetenv("ESC_STORAGE_BACKEND");
    unsetenv("ESC_DATA_DIRECTORY");
    unsetenv("ESC_EVENT_FILE");
    unsetenv("ESC_SQLITE_PATH");
    unsetenv("ESC_SQLITE_DATA_TYPE");
    unsetenv("ESC_SQLITE_WAL");
}

} // namespace

TEST(Settings, DefaultsAreReasonable) {
    Settings s;
    EXPECT_EQ(s.clock.node_id, "node1");
    EXPECT_EQ(s.storage.backend, "memory");
    EXPECT_EQ(s.storage.data_directory, "data");
    EXPECT_EQ(s.storage.event_file, "events.jsonl");
    EXPECT_EQ(s.storage.sqlite_path, "events.db");
    EXPECT_EQ(s.storage.sqlite_data_type, "text");
    EXPECT_FALSE(s.storage.sqlite_wal);
}

TEST(Settings, FromEnvironmentDefaultsToDevelopment) {
    clear_env();

    auto s = Settings::from_environment();
    auto dev = Settings::development();
    EXPECT_EQ(s.storage.backend, dev.storage.backend);
    EXPECT_EQ(s.storage.data_directory, dev.storage.data_directory);
    EXPECT_EQ(s.clock.node_id, dev.clock.node_id);
}

TEST(Settings, FromEnvironmentSelectsProductionPreset) {
    clear_env();
    setenv("ESC_ENV", "production", 1);

    auto s = Settings::from_environment();
    auto prod = Settings::production();
    EXPECT_EQ(s.storage.backend, "sqlite");
    EXPECT_EQ(s.storage.data_directory, prod.storage.data_directory);
    EXPECT_EQ(s.storage.sqlite_data_type, prod.storage.sqlite_data_type);
    EXPECT_TRUE(s.storage.sqlite_wal);

    unsetenv("ESC_ENV");
}

TEST(Settings, FromEnvironmentReadsEnvVars) {
    clear_env();
    setenv("ESC_NODE_ID", "device-7", 1);
    setenv("ESC_STORAGE_BACKEND", "jsonl", 1);
    setenv("ESC_DATA_DIRECTORY", "/tmp/esc", 1);
    setenv("ESC_EVENT_FILE", "log.jsonl", 1);
    setenv("ESC_SQLITE_PATH", "/tmp/esc/events.db", 1);
    setenv("ESC_SQLITE_DATA_TYPE", "json", 1);
    setenv("ESC_SQLITE_WAL", "true", 1);

    auto s = Settings::from_environment();
    EXPECT_EQ(s.clock.node_id, "device-7");
    EXPECT_EQ(s.storage.backend, "jsonl");
    EXPECT_EQ(s.storage.data_directory, "/tmp/esc");
    EXPECT_EQ(s.storage.event_file, "log.jsonl");
    EXPECT_EQ(s.storage.sqlite_path, "/tmp/esc/events.db");
    EXPECT_EQ(s.storage.sqlite_data_type, "json");
    EXPECT_TRUE(s.storage.sqlite_wal);

    clear_env();
}

TEST(Settings, FromEnvironmentHandlesInvalidBool) {
    clear_env();
    setenv("ESC_SQLITE_WAL", "maybe", 1);
    auto s = Settings::from_environment();
    EXPECT_FALSE(s.storage.sqlite_wal);  // Falls back to dev preset default
    unsetenv("ESC_SQLITE_WAL");
}

TEST(Settings, DevelopmentPreset) {
    auto s = Settings::development();
    EXPECT_EQ(s.storage.backend, "memory");
    EXPECT_EQ(s.storage.data_directory, "data/dev");
}

TEST(Settings, ProductionPreset) {
    auto s = Settings::production();
    EXPECT_EQ(s.storage.backend, "sqlite");
    EXPECT_EQ(s.storage.data_directory, "data/prod");
    EXPECT_EQ(s.storage.sqlite_data_type, "json");
    EXPECT_TRUE(s.storage.sqlite_wal);
}
