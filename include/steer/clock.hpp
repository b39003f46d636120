#ifndef STEER_CLOCK_HPP
#define STEER_CLOCK_HPP

#include <chrono>

namespace steer
{

// Source of "now" for interruption windows, durations and transcript timestamps.
class Clock
{
  public:
    using time_point = std::chrono::system_clock::time_point;

    virtual ~Clock() = default;
    virtual time_point now() const = 0;
};

class SystemClock : public Clock
{
  public:
    time_point now() const override
    {
        return std::chrono::system_clock::now();
    }
};

} // namespace steer

#endif // STEER_CLOCK_HPP
