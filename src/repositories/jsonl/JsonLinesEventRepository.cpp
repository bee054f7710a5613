#include "repositories/jsonl/JsonLinesEventRepository.hpp"

#include <arrow/buffer.h>
#include <arrow/filesystem/localfs.h>
#include <arrow/io/interfaces.h>
#include <nlohmann/json.hpp>

#include <iostream>
#include <optional>

using namespace esc::domain;

namespace esc::repositories::jsonl {

namespace {

void check(const arrow::Status& status, const std::string& context) {
    if (!status.ok()) {
        throw StorageError(context + ": " + status.ToString());
    }
}

template <typename T>
T unwrap(arrow::Result<T> result, const std::string& context) {
    check(result.status(), context);
    return std::move(result).ValueOrDie();
}

std::string parent_path(const std::string& path) {
    auto pos = path.rfind('/');
    if (pos == std::string::npos) return "";
    return path.substr(0, pos);
}

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::optional<Event> decode_line(const std::string& line) {
    auto record = nlohmann::ordered_json::parse(line, nullptr, false);
    if (record.is_discarded()) return std::nullopt;
    try {
        return Event::from_json(record);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
}

std::vector<std::string> split_lines(const std::string& content) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < content.size()) {
        auto end = content.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(content.substr(start));
            break;
        }
        lines.push_back(content.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

} // namespace

JsonLinesEventRepository::JsonLinesEventRepository(std::shared_ptr<arrow::fs::FileSystem> fs,
                                                   std::string path)
    : fs_(std::move(fs)), path_(std::move(path)) {
    if (!fs_) {
        throw std::invalid_argument("JsonLinesEventRepository requires a filesystem");
    }
    if (path_.empty()) {
        throw std::invalid_argument("JsonLinesEventRepository requires a file path");
    }
    ensure_file();
    recover_torn_tail();
}

std::shared_ptr<arrow::fs::FileSystem> JsonLinesEventRepository::make_local_fs(
    const std::string& root_dir) {
    auto local = std::make_shared<arrow::fs::LocalFileSystem>();
    (void)local->CreateDir(root_dir, /*recursive=*/true);
    return std::make_shared<arrow::fs::SubTreeFileSystem>(root_dir, local);
}

std::string JsonLinesEventRepository::encode_line(const Event& event) {
    return event.to_json().dump() + "\n";
}

void JsonLinesEventRepository::append(const Event& event) {
    write_lines(encode_line(event));
}

void JsonLinesEventRepository::append_all(const std::vector<Event>& events) {
    if (events.empty()) return;
    std::string lines;
    for (const auto& event : events) {
        lines += encode_line(event);
    }
    write_lines(lines);
}

std::vector<Event> JsonLinesEventRepository::get_all() const {
    return read_events();
}

std::optional<Event> JsonLinesEventRepository::get_by_id(const std::string& id) const {
    for (auto& event : read_events()) {
        if (event.id().to_string() == id) return event;
    }
    return std::nullopt;
}

void JsonLinesEventRepository::delete_all() {
    rewrite("");
}

void JsonLinesEventRepository::replace_all(const std::vector<Event>& events) {
    std::string content;
    for (const auto& event : events) {
        content += encode_line(event);
    }
    rewrite(content);
}

void JsonLinesEventRepository::dispose() {
    // Every append opens and closes its own stream; no handle outlives a call.
}

void JsonLinesEventRepository::ensure_file() {
    auto info = unwrap(fs_->GetFileInfo(path_), "stat " + path_);
    if (info.type() == arrow::fs::FileType::File) return;
    if (info.type() != arrow::fs::FileType::NotFound) {
        throw StorageError("Event log path is not a regular file: " + path_);
    }

    auto parent = parent_path(path_);
    if (!parent.empty()) {
        check(fs_->CreateDir(parent, /*recursive=*/true), "create directory " + parent);
    }
    rewrite("");
}

void JsonLinesEventRepository::recover_torn_tail() {
    auto content = read_content();
    if (content.empty() || content.back() == '\n') return;

    auto last_newline = content.rfind('\n');
    std::string kept = (last_newline == std::string::npos) ? "" : content.substr(0, last_newline + 1);
    std::string tail = content.substr(kept.size());

    if (is_blank(tail)) {
        rewrite(kept);
        return;
    }
    if (decode_line(tail)) {
        // Complete record that only lost its terminator
        write_lines("\n");
        return;
    }

    std::cerr << "[jsonl] Discarding torn trailing record in " << path_
              << " (" << tail.size() << " bytes)" << std::endl;
    rewrite(kept);
}

void JsonLinesEventRepository::write_lines(const std::string& lines) {
    auto stream = unwrap(fs_->OpenAppendStream(path_), "open " + path_ + " for append");
    check(stream->Write(lines.data(), static_cast<int64_t>(lines.size())), "append to " + path_);
    check(stream->Close(), "close " + path_);
}

void JsonLinesEventRepository::rewrite(const std::string& content) {
    auto stream = unwrap(fs_->OpenOutputStream(path_), "open " + path_ + " for write");
    if (!content.empty()) {
        check(stream->Write(content.data(), static_cast<int64_t>(content.size())),
              "write " + path_);
    }
    check(stream->Close(), "close " + path_);
}

std::string JsonLinesEventRepository::read_content() const {
    auto info = unwrap(fs_->GetFileInfo(path_), "stat " + path_);
    if (info.type() == arrow::fs::FileType::NotFound) return "";

    auto file = unwrap(fs_->OpenInputFile(path_), "open " + path_);
    auto size = unwrap(file->GetSize(), "size " + path_);
    auto buffer = unwrap(file->Read(size), "read " + path_);
    check(file->Close(), "close " + path_);

    return std::string(reinterpret_cast<const char*>(buffer->data()),
                       static_cast<size_t>(buffer->size()));
}

std::vector<Event> JsonLinesEventRepository::read_events() const {
    auto lines = split_lines(read_content());

    size_t last_record = lines.size();
    for (size_t i = lines.size(); i > 0; --i) {
        if (!is_blank(lines[i - 1])) {
            last_record = i - 1;
            break;
        }
    }

    std::vector<Event> events;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (is_blank(lines[i])) continue;
        auto event = decode_line(lines[i]);
        if (event) {
            events.push_back(std::move(*event));
        } else if (i != last_record) {
            throw StorageError("Corrupt record at line " + std::to_string(i + 1) +
                               " of " + path_);
        }
    }
    return events;
}

} // namespace esc::repositories::jsonl
