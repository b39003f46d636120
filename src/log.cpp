#include <steer/log.hpp>

#include <cstdlib>
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <string>

namespace steer
{
namespace log
{

namespace
{

constexpr const char* LOGGER_NAME = "steer";

spdlog::level::level_enum level_from_environment()
{
    const char* value = std::getenv("STEER_LOG_LEVEL");
    if (value == nullptr || value[0] == '\0')
        return spdlog::level::info;

    // from_str maps unrecognised names to "off"; keep the default instead
    auto level = spdlog::level::from_str(value);
    if (level == spdlog::level::off && std::string(value) != "off")
        return spdlog::level::info;
    return level;
}

} // namespace

std::shared_ptr<spdlog::logger> logger()
{
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> instance;

    std::call_once(once,
                   []
                   {
                       instance = spdlog::get(LOGGER_NAME);
                       if (!instance)
                           instance = spdlog::stderr_color_mt(LOGGER_NAME);
                       instance->set_level(level_from_environment());
                   });
    return instance;
}

void set_level(spdlog::level::level_enum level)
{
    logger()->set_level(level);
}

} // namespace log
} // namespace steer
