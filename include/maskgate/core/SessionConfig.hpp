#ifndef INCLUDE_MASKGATE_CORE_SESSIONCONFIG_HPP
#define INCLUDE_MASKGATE_CORE_SESSIONCONFIG_HPP

#include <chrono>
#include <functional>

namespace maskgate::core
{

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::seconds;
using NowProvider = std::function<TimePoint()>;

#if defined(MASKGATE_SESSION_DURATION_SECONDS)
constexpr Duration g_kDefaultSessionDuration{ MASKGATE_SESSION_DURATION_SECONDS };
#else
constexpr Duration g_kDefaultSessionDuration{ 24 * 60 * 60 };
#endif

// Shared by every session of one registry; sessions cannot override it.
struct SessionConfig final
{
    Duration duration{ g_kDefaultSessionDuration };
    NowProvider now{ [] { return Clock::now(); } };
};

} // namespace maskgate::core

#endif // INCLUDE_MASKGATE_CORE_SESSIONCONFIG_HPP
