#ifndef STEER_NOTIFIER_HPP
#define STEER_NOTIFIER_HPP

#include <steer/log.hpp>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <vector>

namespace steer
{

// Multi-subscriber observer for one event type. Listeners run in registration
// order on the notifying thread; a listener that throws is logged and the
// remaining listeners still run.
template <typename Event>
class Notifier
{
  public:
    using Listener = std::function<void(const Event&)>;
    using SubscriptionId = std::uint64_t;

    SubscriptionId subscribe(Listener listener)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        SubscriptionId id = next_id_++;
        listeners_.push_back(Entry{id, std::move(listener)});
        return id;
    }

    bool unsubscribe(SubscriptionId id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = listeners_.begin(); it != listeners_.end(); ++it)
        {
            if (it->id == id)
            {
                listeners_.erase(it);
                return true;
            }
        }
        return false;
    }

    void notify(const Event& event) const
    {
        std::vector<Listener> to_call;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            to_call.reserve(listeners_.size());
            for (const auto& entry : listeners_)
                to_call.push_back(entry.listener);
        }
        for (const auto& listener : to_call)
        {
            try
            {
                listener(event);
            }
            catch (const std::exception& e)
            {
                log::logger()->warn("observer threw: {}", e.what());
            }
            catch (...)
            {
                log::logger()->warn("observer threw a non-standard exception");
            }
        }
    }

    std::size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return listeners_.size();
    }

  private:
    struct Entry
    {
        SubscriptionId id;
        Listener listener;
    };

    mutable std::mutex mutex_;
    std::vector<Entry> listeners_;
    SubscriptionId next_id_ = 1;
};

} // namespace steer

#endif // STEER_NOTIFIER_HPP
