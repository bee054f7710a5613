#include "config/Settings.hpp"
#include "domain/value_objects/ClockGenerator.hpp"
#include "projections/counter/CounterProjection.hpp"
#include "repositories/RepositoryFactory.hpp"
#include "services/ViewStore.hpp"

#include <cstdint>
#include <exception>
#include <iostream>
#include <string>

using esc::projections::counter::CounterProjection;

namespace {

void print_usage() {
    std::cerr << "Usage: event_sourcing_core <command> [args]" << std::endl;
    std::cerr << "  increment [key] [amount]" << std::endl;
    std::cerr << "  decrement [key] [amount]" << std::endl;
    std::cerr << "  set <key> <value>" << std::endl;
    std::cerr << "  reset [key]" << std::endl;
    std::cerr << "  show" << std::endl;
    std::cerr << "  history" << std::endl;
    std::cerr << "  restore <event_id>" << std::endl;
    std::cerr << "Storage is selected with ESC_STORAGE_BACKEND=memory|jsonl|sqlite." << std::endl;
}

std::string arg_or(int argc, char* argv[], int index, const std::string& fallback) {
    return argc > index ? std::string(argv[index]) : fallback;
}

void print_counters(const CounterProjection& view) {
    if (view.state().empty()) {
        std::cout << "(no counters)" << std::endl;
        return;
    }
    for (const auto& [key, value] : view.state()) {
        std::cout << key << " = " << value << std::endl;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    auto settings = esc::config::Settings::from_environment();
    std::string command = argv[1];

    try {
        esc::domain::ClockGenerator clock;
        CounterProjection view(esc::repositories::make_repository(settings.storage),
                               clock, settings.clock.node_id);
        esc::services::ScopedView scope(view);

        // Hydrate the projection from whatever the backend already holds
        view.rebuild();
        std::cout << "[engine] Loaded " << view.event_store().get_all().size()
                  << " events from " << settings.storage.backend << " storage" << std::endl;

        if (command == "increment") {
            auto event = view.increment(arg_or(argc, argv, 2, "counter"),
                                        std::stoll(arg_or(argc, argv, 3, "1")));
            std::cout << "[engine] Recorded " << event.id().to_string() << std::endl;
        } else if (command == "decrement") {
            auto event = view.decrement(arg_or(argc, argv, 2, "counter"),
                                        std::stoll(arg_or(argc, argv, 3, "1")));
            std::cout << "[engine] Recorded " << event.id().to_string() << std::endl;
        } else if (command == "set") {
            if (argc < 4) {
                print_usage();
                return 1;
            }
            auto event = view.set_value(argv[2], std::stoll(argv[3]));
            std::cout << "[engine] Recorded " << event.id().to_string() << std::endl;
        } else if (command == "reset") {
            auto event = view.reset(arg_or(argc, argv, 2, "counter"));
            std::cout << "[engine] Recorded " << event.id().to_string() << std::endl;
        } else if (command == "history") {
            for (const auto& event : view.event_store().get_all()) {
                std::cout << event.id().to_string() << " " << event.type() << " "
                          << event.data_to_json() << std::endl;
            }
            return 0;
        } else if (command == "restore") {
            if (argc < 3) {
                print_usage();
                return 1;
            }
            auto target = view.event_store().get_by_id(argv[2]);
            if (!target) {
                std::cerr << "[engine] No event with id " << argv[2] << std::endl;
                return 1;
            }
            bool found = view.restore_to_event(*target);
            std::cout << "[engine] Restored to " << argv[2]
                      << (found ? "" : " (not found, unchanged)") << std::endl;
        } else if (command != "show") {
            print_usage();
            return 1;
        }

        print_counters(view);
    } catch (const std::exception& e) {
        std::cerr << "[engine] Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
