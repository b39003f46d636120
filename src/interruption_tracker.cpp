#include <steer/interruption_tracker.hpp>
#include <steer/log.hpp>

#include <exception>

namespace steer
{

InterruptionTracker::InterruptionTracker(std::chrono::milliseconds window) : window_(window) {}

void InterruptionTracker::record(const std::string& agent_id, time_point cancelled_at)
{
    std::lock_guard<std::mutex> lock(mutex_);
    records_[agent_id] = cancelled_at;
}

void InterruptionTracker::clear(const std::string& agent_id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    records_.erase(agent_id);
}

std::optional<InterruptionTracker::time_point>
InterruptionTracker::last_interruption(const std::string& agent_id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(agent_id);
    if (it == records_.end())
        return std::nullopt;
    return it->second;
}

bool InterruptionTracker::is_active(const std::string& agent_id, time_point now) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(agent_id);
    return it != records_.end() && !expired(it->second, now);
}

bool InterruptionTracker::suppresses(const std::string& agent_id, time_point now,
                                     time_point query_started_at) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(agent_id);
    if (it == records_.end())
        return false;
    return !expired(it->second, now) && query_started_at <= it->second;
}

std::size_t InterruptionTracker::sweep(time_point now)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = records_.begin(); it != records_.end();)
    {
        if (expired(it->second, now))
        {
            it = records_.erase(it);
            ++removed;
        }
        else
        {
            ++it;
        }
    }
    return removed;
}

std::size_t InterruptionTracker::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

bool InterruptionTracker::expired(time_point cancelled_at, time_point now) const
{
    return now - cancelled_at >= window_;
}

// ============================================================================
// PeriodicSweeper
// ============================================================================

PeriodicSweeper::PeriodicSweeper(std::chrono::milliseconds interval, std::function<void()> task)
    : interval_(interval), task_(std::move(task))
{
    thread_ = std::thread([this] { run(); });
}

PeriodicSweeper::~PeriodicSweeper()
{
    stop();
}

void PeriodicSweeper::stop()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable())
        thread_.join();
}

bool PeriodicSweeper::is_running() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return !stopping_;
}

void PeriodicSweeper::run()
{
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_)
    {
        if (cv_.wait_for(lock, interval_, [this] { return stopping_; }))
            break;

        lock.unlock();
        try
        {
            task_();
        }
        catch (const std::exception& e)
        {
            log::logger()->warn("periodic sweep failed: {}", e.what());
        }
        lock.lock();
    }
}

} // namespace steer
