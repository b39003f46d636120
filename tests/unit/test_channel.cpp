#include <gtest/gtest.h>
#include <stdexcept>
#include <steer/channel.hpp>
#include <string>
#include <vector>

using namespace steer;

TEST(ChannelNamesTest, ScopedByQueryId)
{
    EXPECT_EQ(channels::message("q7"), "message:q7");
    EXPECT_EQ(channels::complete("q7"), "complete:q7");
    EXPECT_EQ(channels::error("q7"), "error:q7");
}

TEST(PromptPayloadTest, OptionalFieldsOmittedWhenUnset)
{
    PromptPayload payload;
    payload.agent_id = "agent-1";
    payload.prompt = "hi";
    payload.working_directory = "/work";

    json j = payload.to_json();
    EXPECT_EQ(j["agent_id"], "agent-1");
    EXPECT_FALSE(j.contains("resume"));
    EXPECT_FALSE(j.contains("model"));
    EXPECT_FALSE(j.contains("max_turns"));

    payload.resume = "sess-1";
    payload.max_turns = 4;
    j = payload.to_json();
    EXPECT_EQ(j["resume"], "sess-1");
    EXPECT_EQ(j["max_turns"], 4);
}

TEST(DispatcherTest, DeliversOnlyToMatchingChannel)
{
    ChannelDispatcher dispatcher;
    std::vector<std::string> seen;

    dispatcher.subscribe("message:q1", [&](const json& p) { seen.push_back("q1:" + p.dump()); });
    dispatcher.subscribe("message:q2", [&](const json& p) { seen.push_back("q2:" + p.dump()); });

    EXPECT_EQ(dispatcher.publish("message:q1", json(1)), 1u);
    EXPECT_EQ(dispatcher.publish("message:q3", json(3)), 0u);

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], "q1:1");
}

TEST(DispatcherTest, RegistrationOrderPreserved)
{
    ChannelDispatcher dispatcher;
    std::string order;

    dispatcher.subscribe("c", [&](const json&) { order += "a"; });
    dispatcher.subscribe("c", [&](const json&) { order += "b"; });
    dispatcher.subscribe("c", [&](const json&) { order += "c"; });

    dispatcher.publish("c", nullptr);
    EXPECT_EQ(order, "abc");
}

TEST(DispatcherTest, UnsubscribeIsExactlyOnce)
{
    ChannelDispatcher dispatcher;
    auto id = dispatcher.subscribe("c", [](const json&) {});

    EXPECT_TRUE(dispatcher.unsubscribe(id));
    EXPECT_FALSE(dispatcher.unsubscribe(id));
    EXPECT_FALSE(dispatcher.unsubscribe(9999));

    auto stats = dispatcher.stats();
    EXPECT_EQ(stats.subscribed, 1u);
    EXPECT_EQ(stats.unsubscribed, 1u);
    EXPECT_EQ(stats.rejected_unsubscribes, 2u);
    EXPECT_EQ(dispatcher.total_listeners(), 0u);
    EXPECT_EQ(dispatcher.listener_count("c"), 0u);
}

TEST(DispatcherTest, ListenerRemovedDuringDeliveryIsSkipped)
{
    ChannelDispatcher dispatcher;
    int second_calls = 0;
    ChannelDispatcher::ListenerId second = 0;

    dispatcher.subscribe("c", [&](const json&) { dispatcher.unsubscribe(second); });
    second = dispatcher.subscribe("c", [&](const json&) { ++second_calls; });

    EXPECT_EQ(dispatcher.publish("c", nullptr), 1u);
    EXPECT_EQ(second_calls, 0);
}

TEST(DispatcherTest, ListenerAddedDuringDeliveryWaitsForNextPublish)
{
    ChannelDispatcher dispatcher;
    int late_calls = 0;
    bool added = false;

    dispatcher.subscribe("c",
                         [&](const json&)
                         {
                             if (!added)
                             {
                                 added = true;
                                 dispatcher.subscribe("c", [&](const json&) { ++late_calls; });
                             }
                         });

    dispatcher.publish("c", nullptr);
    EXPECT_EQ(late_calls, 0);
    dispatcher.publish("c", nullptr);
    EXPECT_EQ(late_calls, 1);
}

TEST(DispatcherTest, ThrowingListenerDoesNotStopDelivery)
{
    ChannelDispatcher dispatcher;
    int calls = 0;

    dispatcher.subscribe("c", [](const json&) { throw std::runtime_error("boom"); });
    dispatcher.subscribe("c", [&](const json&) { ++calls; });

    EXPECT_EQ(dispatcher.publish("c", nullptr), 2u);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(dispatcher.stats().listener_failures, 1u);
}

TEST(DispatcherTest, NonStandardThrowDoesNotStopDelivery)
{
    ChannelDispatcher dispatcher;
    int calls = 0;

    dispatcher.subscribe("c", [](const json&) { throw 42; });
    dispatcher.subscribe("c", [&](const json&) { ++calls; });

    EXPECT_NO_THROW(dispatcher.publish("c", nullptr));
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(dispatcher.stats().listener_failures, 1u);
}

TEST(DispatcherTest, ClearDropsEverything)
{
    ChannelDispatcher dispatcher;
    auto id = dispatcher.subscribe("a", [](const json&) {});
    dispatcher.subscribe("b", [](const json&) {});

    dispatcher.clear();

    EXPECT_EQ(dispatcher.total_listeners(), 0u);
    EXPECT_EQ(dispatcher.publish("a", nullptr), 0u);
    EXPECT_FALSE(dispatcher.unsubscribe(id));
}
