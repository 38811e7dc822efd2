#include "notevault/logging/LogRegistry.hpp"

#include <array>
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <string_view>

namespace notevault::logging
{
namespace
{

constexpr std::string_view g_kLogPattern{ "%Y-%m-%d %H:%M:%S | %^%-8l%$ | %n | %v" };
constexpr std::array<std::string_view, 6> g_kSubsystems{ "notevault", "auth", "crypto", "storage", "config", "shell" };

std::mutex g_registryMutex;

[[nodiscard]] spdlog::sink_ptr sharedSink()
{
    static const spdlog::sink_ptr sink{ []
                                        {
                                            auto s{ std::make_shared<spdlog::sinks::stderr_color_sink_mt>() };
                                            s->set_pattern(std::string{ g_kLogPattern });
                                            return s;
                                        }() };
    return sink;
}

[[nodiscard]] std::shared_ptr<spdlog::logger> makeLogger(const std::string& name, spdlog::level::level_enum level)
{
    auto logger{ std::make_shared<spdlog::logger>(name, sharedSink()) };
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}

} // namespace

void LogRegistry::init(spdlog::level::level_enum level)
{
    const std::lock_guard<std::mutex> lock{ g_registryMutex };
    if (s_initialized)
    {
        spdlog::get("notevault")->warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    for (const auto subsystem : g_kSubsystems)
    {
        const std::string name{ subsystem };
        if (auto existing{ spdlog::get(name) })
        {
            existing->set_level(level);
            continue;
        }
        (void)makeLogger(name, level);
    }

    s_initialized = true;
    spdlog::get("notevault")->debug("[LogRegistry] Initialized at level {}", spdlog::level::to_string_view(level));
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name)
{
    if (auto logger{ spdlog::get(name) })
    {
        return logger;
    }

    const std::lock_guard<std::mutex> lock{ g_registryMutex };
    if (auto logger{ spdlog::get(name) })
    {
        return logger;
    }
    return makeLogger(name, spdlog::level::warn);
}

spdlog::level::level_enum LogRegistry::levelForVerbosity(int verbosity) noexcept
{
    if (verbosity <= 0)
    {
        return spdlog::level::info;
    }
    if (verbosity == 1)
    {
        return spdlog::level::debug;
    }
    return spdlog::level::trace;
}

bool LogRegistry::isInitialized() noexcept
{
    return s_initialized;
}

} // namespace notevault::logging
