#include <gtest/gtest.h>
#include <steer/query_registry.hpp>

#include <chrono>
#include <future>
#include <stdexcept>

using namespace steer;
using namespace std::chrono_literals;

namespace
{

std::shared_ptr<QueryHandle> make_handle(ChannelDispatcher& dispatcher, const std::string& agent,
                                         const std::string& id)
{
    auto handle = std::make_shared<QueryHandle>();
    handle->id = id;
    handle->agent_id = agent;
    for (const auto& channel : {channels::message(id), channels::error(id), channels::complete(id)})
        handle->subscriptions.push_back(dispatcher.subscribe(channel, [](const json&) {}));
    return handle;
}

} // namespace

TEST(CancellationTokenTest, CopiesShareState)
{
    CancellationToken token;
    CancellationToken copy = token;

    EXPECT_FALSE(copy.is_cancelled());
    token.cancel();
    EXPECT_TRUE(copy.is_cancelled());
}

TEST(QueryHandleTest, ResolvesOnceWithAccumulatedText)
{
    QueryHandle handle;
    auto future = handle.completion.get_future();

    handle.text = "partial";
    handle.resolve();
    handle.text = "more";
    handle.resolve();
    handle.fail(std::make_exception_ptr(std::runtime_error("late")));

    ASSERT_EQ(future.wait_for(0ms), std::future_status::ready);
    EXPECT_EQ(future.get(), "partial");
    EXPECT_TRUE(handle.is_resolved());
}

TEST(QueryHandleTest, FailCarriesException)
{
    QueryHandle handle;
    auto future = handle.completion.get_future();

    handle.fail(std::make_exception_ptr(std::runtime_error("no backend")));
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(RegistryTest, OneLiveQueryPerAgent)
{
    ChannelDispatcher dispatcher;
    AgentQueryRegistry registry(dispatcher);

    EXPECT_EQ(registry.start_query(make_handle(dispatcher, "a1", "q1")), nullptr);
    EXPECT_EQ(registry.start_query(make_handle(dispatcher, "a2", "q2")), nullptr);

    EXPECT_EQ(registry.live_count(), 2u);
    EXPECT_EQ(registry.current("a1")->id, "q1");
    EXPECT_EQ(registry.current("a2")->id, "q2");
    EXPECT_FALSE(registry.has_live_query("a3"));
}

TEST(RegistryTest, SupersessionDetachesPredecessor)
{
    ChannelDispatcher dispatcher;
    AgentQueryRegistry registry(dispatcher);

    registry.start_query(make_handle(dispatcher, "a1", "q1"));
    auto previous = registry.start_query(make_handle(dispatcher, "a1", "q2"));

    ASSERT_NE(previous, nullptr);
    EXPECT_EQ(previous->id, "q1");
    EXPECT_TRUE(previous->detached);
    EXPECT_FALSE(previous->live);
    EXPECT_TRUE(previous->subscriptions.empty());

    EXPECT_EQ(dispatcher.listener_count(channels::message("q1")), 0u);
    EXPECT_EQ(dispatcher.listener_count(channels::message("q2")), 1u);
    EXPECT_EQ(dispatcher.total_listeners(), 3u);
    EXPECT_EQ(registry.current("a1")->id, "q2");
}

TEST(RegistryTest, ReleaseUnsubscribesExactlyOnce)
{
    ChannelDispatcher dispatcher;
    AgentQueryRegistry registry(dispatcher);

    auto handle = make_handle(dispatcher, "a1", "q1");
    registry.start_query(handle);

    registry.release(*handle);
    registry.release(*handle);
    registry.detach("a1");

    auto stats = dispatcher.stats();
    EXPECT_EQ(stats.unsubscribed, 3u);
    EXPECT_EQ(stats.rejected_unsubscribes, 0u);
    EXPECT_EQ(dispatcher.total_listeners(), 0u);
}

TEST(RegistryTest, CancelIsIdempotent)
{
    ChannelDispatcher dispatcher;
    AgentQueryRegistry registry(dispatcher);

    EXPECT_EQ(registry.cancel_query("a1"), nullptr);

    registry.start_query(make_handle(dispatcher, "a1", "q1"));
    auto cancelled = registry.cancel_query("a1");
    ASSERT_NE(cancelled, nullptr);
    EXPECT_TRUE(cancelled->token.is_cancelled());

    EXPECT_EQ(registry.cancel_query("a1"), nullptr);
    // Cancelling leaves the slot to the query's terminal event
    EXPECT_TRUE(registry.has_live_query("a1"));
}

TEST(RegistryTest, TerminalForSupersededQueryLeavesSlotAlone)
{
    ChannelDispatcher dispatcher;
    AgentQueryRegistry registry(dispatcher);

    registry.start_query(make_handle(dispatcher, "a1", "q1"));
    registry.start_query(make_handle(dispatcher, "a1", "q2"));

    EXPECT_EQ(registry.on_terminal("a1", "q1"), nullptr);
    EXPECT_EQ(registry.current("a1")->id, "q2");

    auto cleared = registry.on_terminal("a1", "q2");
    ASSERT_NE(cleared, nullptr);
    EXPECT_FALSE(cleared->live);
    EXPECT_FALSE(registry.has_live_query("a1"));
    // Listeners stay until the caller releases them
    EXPECT_EQ(dispatcher.listener_count(channels::complete("q2")), 1u);
}

TEST(RegistryTest, DetachAllReleasesEveryQuery)
{
    ChannelDispatcher dispatcher;
    AgentQueryRegistry registry(dispatcher);

    registry.start_query(make_handle(dispatcher, "a1", "q1"));
    registry.start_query(make_handle(dispatcher, "a2", "q2"));

    auto detached = registry.detach_all();

    EXPECT_EQ(detached.size(), 2u);
    EXPECT_EQ(registry.live_count(), 0u);
    EXPECT_EQ(dispatcher.total_listeners(), 0u);
}
