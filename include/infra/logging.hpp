#pragma once

#include "core/config.hpp"

namespace rwc {

// Installs the default spdlog logger: colored console, plus a file sink when file_path is set.
// Throws std::runtime_error for an unknown level or a file that can't be opened
void InitLogging(const LoggingConfig& cfg);

}
