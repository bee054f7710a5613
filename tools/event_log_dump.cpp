#include "repositories/jsonl/JsonLinesEventRepository.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <string>

using esc::repositories::jsonl::JsonLinesEventRepository;

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: event_log_dump <events.jsonl>" << std::endl;
        return 1;
    }

    std::filesystem::path path = std::filesystem::absolute(argv[1]);
    if (!std::filesystem::exists(path)) {
        std::cerr << "[error] No such file: " << path.string() << std::endl;
        return 1;
    }

    try {
        auto fs = JsonLinesEventRepository::make_local_fs(path.parent_path().string());
        JsonLinesEventRepository repo(fs, path.filename().string());

        size_t count = 0;
        for (const auto& event : repo.get_all()) {
            std::cout << event.id().to_string()
                      << "  node=" << event.node_id()
                      << "  type=" << event.type()
                      << "  version=" << event.schema_version()
                      << "  data=" << event.data_to_json() << std::endl;
            ++count;
        }
        std::cout << "[dump] " << count << " events" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[error] " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
