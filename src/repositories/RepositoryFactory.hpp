#pragma once

#include "config/Settings.hpp"
#include "repositories/IEventRepository.hpp"

#include <memory>

namespace esc::repositories {

// Builds the backend named by settings.backend. Throws std::invalid_argument
// for an unknown backend or SQLite data type.
std::unique_ptr<IEventRepository> make_repository(const esc::config::StorageSettings& settings);

} // namespace esc::repositories
