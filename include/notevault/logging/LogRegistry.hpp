#ifndef INCLUDE_NOTEVAULT_LOGGING_LOGREGISTRY_HPP
#define INCLUDE_NOTEVAULT_LOGGING_LOGREGISTRY_HPP

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace notevault::logging
{

class LogRegistry final
{
public:
    // Creates every subsystem logger on one stderr sink. Call once from main.
    static void init(spdlog::level::level_enum level);

    // Unknown names and calls before init() get a lazily created logger at warn.
    [[nodiscard]] static std::shared_ptr<spdlog::logger> get(const std::string& name);

    [[nodiscard]] static std::shared_ptr<spdlog::logger> notevault()
    {
        return get("notevault");
    }
    [[nodiscard]] static std::shared_ptr<spdlog::logger> auth()
    {
        return get("auth");
    }
    [[nodiscard]] static std::shared_ptr<spdlog::logger> crypto()
    {
        return get("crypto");
    }
    [[nodiscard]] static std::shared_ptr<spdlog::logger> storage()
    {
        return get("storage");
    }
    [[nodiscard]] static std::shared_ptr<spdlog::logger> config()
    {
        return get("config");
    }
    [[nodiscard]] static std::shared_ptr<spdlog::logger> shell()
    {
        return get("shell");
    }

    // Maps the -v count: 0 info, 1 debug, 2+ trace.
    [[nodiscard]] static spdlog::level::level_enum levelForVerbosity(int verbosity) noexcept;

    [[nodiscard]] static bool isInitialized() noexcept;

private:
    static inline bool s_initialized{ false };
};

} // namespace notevault::logging

#endif // INCLUDE_NOTEVAULT_LOGGING_LOGREGISTRY_HPP
