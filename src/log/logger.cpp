#include <shellsage/log/logger.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace shellsage {

std::shared_ptr<spdlog::logger> logger() {
    if (auto existing = spdlog::get("shellsage")) return existing;
    auto lg = spdlog::stderr_color_mt("shellsage");
    lg->set_pattern("[%H:%M:%S] [%^%l%$] %v");
    lg->set_level(spdlog::level::warn);
    return lg;
}

void init_logging(bool debug) {
    logger()->set_level(debug ? spdlog::level::debug : spdlog::level::warn);
}

} // namespace shellsage
