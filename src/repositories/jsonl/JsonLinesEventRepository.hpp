#pragma once

#include "repositories/IEventRepository.hpp"

#include <arrow/filesystem/api.h>

#include <memory>
#include <string>
#include <vector>

namespace esc::repositories::jsonl {

// Append-only newline-delimited JSON log, one event record per line.
//
// Readers skip blank lines. An unreadable final record is a torn write from an
// interrupted append and is treated as absent; on construction its bytes are
// truncated so the next append starts on a clean line. An unreadable record
// followed by a valid one is corruption and raises StorageError.
class JsonLinesEventRepository : public esc::repositories::IEventRepository {
public:
    JsonLinesEventRepository(std::shared_ptr<arrow::fs::FileSystem> fs, std::string path);

    /// Create a local filesystem rooted at root_dir (creates dir if needed).
    static std::shared_ptr<arrow::fs::FileSystem> make_local_fs(const std::string& root_dir);

    // IEventRepository
    void append(const esc::domain::Event& event) override;
    void append_all(const std::vector<esc::domain::Event>& events) override;
    std::vector<esc::domain::Event> get_all() const override;
    std::optional<esc::domain::Event> get_by_id(const std::string& id) const override;
    void delete_all() override;
    // Encodes every record before the file is truncated and rewritten
    void replace_all(const std::vector<esc::domain::Event>& events) override;
    void dispose() override;

    const std::string& path() const noexcept { return path_; }

    // Encoded form of one record, terminated by '\n'
    static std::string encode_line(const esc::domain::Event& event);

private:
    void ensure_file();
    void recover_torn_tail();
    void write_lines(const std::string& lines);
    void rewrite(const std::string& content);
    std::string read_content() const;
    std::vector<esc::domain::Event> read_events() const;

    std::shared_ptr<arrow::fs::FileSystem> fs_;
    std::string path_;
};

} // namespace esc::repositories::jsonl
