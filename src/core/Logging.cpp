#include "maskgate/core/Logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace maskgate::core
{

std::shared_ptr<spdlog::logger> makeDefaultLogger()
{
    if (auto existing{ spdlog::get(g_kLoggerName) }; existing)
    {
        return existing;
    }

    try
    {
        return spdlog::stdout_color_mt(g_kLoggerName);
    }
    catch (const spdlog::spdlog_ex&)
    {
        // Another thread registered it between get() and stdout_color_mt().
        return spdlog::get(g_kLoggerName);
    }
}

} // namespace maskgate::core
