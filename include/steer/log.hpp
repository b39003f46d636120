#ifndef STEER_LOG_HPP
#define STEER_LOG_HPP

#include <memory>
#include <spdlog/spdlog.h>

namespace steer
{
namespace log
{

// Named "steer" logger writing to stderr. Created on first use; the initial level
// comes from STEER_LOG_LEVEL (trace, debug, info, warn, error, critical, off).
std::shared_ptr<spdlog::logger> logger();

void set_level(spdlog::level::level_enum level);

} // namespace log
} // namespace steer

#endif // STEER_LOG_HPP
