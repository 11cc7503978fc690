#pragma once

#include <memory>
#include <spdlog/spdlog.h>

namespace pairank {
namespace logging {

/// Shared "pairank" logger, created on first use (stderr, colour).
std::shared_ptr<spdlog::logger> logger();

/// Adjust verbosity for every pairank component.
void setLevel(spdlog::level::level_enum level);

} // namespace logging
} // namespace pairank

#define PAIRANK_LOG_DEBUG(...) ::pairank::logging::logger()->debug(__VA_ARGS__)
#define PAIRANK_LOG_INFO(...)  ::pairank::logging::logger()->info(__VA_ARGS__)
#define PAIRANK_LOG_WARN(...)  ::pairank::logging::logger()->warn(__VA_ARGS__)
#define PAIRANK_LOG_ERROR(...) ::pairank::logging::logger()->error(__VA_ARGS__)
