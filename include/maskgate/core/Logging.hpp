#ifndef INCLUDE_MASKGATE_CORE_LOGGING_HPP
#define INCLUDE_MASKGATE_CORE_LOGGING_HPP

#include <memory>
#include <spdlog/spdlog.h>

namespace maskgate::core
{

constexpr const char* g_kLoggerName{ "maskgate" };

// Returns the process-wide "maskgate" stdout logger, creating it on first use.
[[nodiscard]] std::shared_ptr<spdlog::logger> makeDefaultLogger();

} // namespace maskgate::core

#endif // INCLUDE_MASKGATE_CORE_LOGGING_HPP
