#pragma once
#include <memory>
#include <spdlog/logger.h>

namespace shellsage {

// Named "shellsage" logger on stderr. Created on first use at level warn.
std::shared_ptr<spdlog::logger> logger();

// debug=true lowers the level to debug (--debug / SHELLSAGE_DEBUG).
void init_logging(bool debug);

} // namespace shellsage
