#ifndef STEER_INTERRUPTION_TRACKER_HPP
#define STEER_INTERRUPTION_TRACKER_HPP

#include <steer/clock.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace steer
{

// Remembers when each agent was last cancelled so that the echo and the
// execution-error result the backend emits after an abort can be recognised.
// Thread-safe: the sweeper runs on its own thread.
class InterruptionTracker
{
  public:
    using time_point = Clock::time_point;

    explicit InterruptionTracker(std::chrono::milliseconds window);

    void record(const std::string& agent_id, time_point cancelled_at);
    void clear(const std::string& agent_id);

    std::optional<time_point> last_interruption(const std::string& agent_id) const;

    // True while a record for agent_id is younger than the window.
    bool is_active(const std::string& agent_id, time_point now) const;

    // True if a live record applies to a query started at query_started_at.
    // A query started after the cancel is never affected.
    bool suppresses(const std::string& agent_id, time_point now,
                    time_point query_started_at) const;

    // Drops expired records, returns how many were removed.
    std::size_t sweep(time_point now);

    std::size_t size() const;

    std::chrono::milliseconds window() const
    {
        return window_;
    }

  private:
    bool expired(time_point cancelled_at, time_point now) const;

    std::chrono::milliseconds window_;
    mutable std::mutex mutex_;
    std::map<std::string, time_point> records_;
};

// Runs a task every interval on a background thread until destroyed or stopped.
class PeriodicSweeper
{
  public:
    PeriodicSweeper(std::chrono::milliseconds interval, std::function<void()> task);
    ~PeriodicSweeper();

    PeriodicSweeper(const PeriodicSweeper&) = delete;
    PeriodicSweeper& operator=(const PeriodicSweeper&) = delete;

    void stop();
    bool is_running() const;

  private:
    void run();

    std::chrono::milliseconds interval_;
    std::function<void()> task_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
    std::thread thread_;
};

} // namespace steer

#endif // STEER_INTERRUPTION_TRACKER_HPP
