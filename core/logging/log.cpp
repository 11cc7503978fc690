#include "logging/log.hpp"

#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace pairank {
namespace logging {

namespace {
constexpr const char* kLoggerName = "pairank";
std::mutex g_logger_mutex;
}

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    auto existing = spdlog::get(kLoggerName);
    if (existing) return existing;

    auto created = spdlog::stderr_color_mt(kLoggerName);
    created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    created->set_level(spdlog::level::info);
    return created;
}

void setLevel(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace logging
} // namespace pairank
