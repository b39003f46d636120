// End-to-end query lifecycles against the in-process channel.

#include "../test_utils.hpp"

#include <gtest/gtest.h>
#include <steer/orchestrator.hpp>

#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

using namespace steer;
using namespace std::chrono_literals;

namespace
{

class ScenarioTest : public ::testing::Test
{
  protected:
    ScenarioTest()
        : clock(std::make_shared<test::FakeClock>()),
          orchestrator(channel, transcript, settings, OrchestratorOptions{15000ms, 0ms, clock})
    {
        for (const char* id : {"agent-x", "agent-y"})
        {
            AgentSession session;
            session.id = id;
            orchestrator.sessions().add(session);
        }
    }

    std::size_t marker_lines(const std::string& agent_id)
    {
        auto lines = transcript.get_messages(agent_id);
        return static_cast<std::size_t>(
            std::count_if(lines.begin(), lines.end(), [](const TranscriptMessage& m)
                          { return m.content == INTERRUPTION_MARKER; }));
    }

    test::FakeQueryChannel channel;
    InMemoryTranscriptStore transcript;
    StaticSettingsProvider settings;
    std::shared_ptr<test::FakeClock> clock;
    StreamingQueryOrchestrator orchestrator;
};

} // namespace

TEST_F(ScenarioTest, QueryingEndsAtResultStreamingAtComplete)
{
    auto future = orchestrator.send("agent-x", "hi");
    EXPECT_TRUE(orchestrator.is_querying("agent-x"));
    EXPECT_TRUE(orchestrator.is_streaming("agent-x"));

    channel.emit("q1", test::init_message("sess-x"));
    channel.emit("q1", test::assistant_text("Hello!"));
    EXPECT_TRUE(orchestrator.is_querying("agent-x"));

    channel.emit("q1", test::result_success());
    EXPECT_FALSE(orchestrator.is_querying("agent-x"));
    EXPECT_TRUE(orchestrator.is_streaming("agent-x"));

    channel.emit_complete("q1");
    EXPECT_FALSE(orchestrator.is_querying("agent-x"));
    EXPECT_FALSE(orchestrator.is_streaming("agent-x"));
    EXPECT_EQ(future.get(), "Hello!");
}

TEST_F(ScenarioTest, AgentsAreIsolated)
{
    auto x = orchestrator.send("agent-x", "task x");
    auto y = orchestrator.send("agent-y", "task y");
    channel.emit("q2", test::assistant_text("y is working"));

    auto y_lines_before = transcript.get_messages("agent-y");

    orchestrator.stop("agent-x");
    channel.emit("q1", test::user_text(INTERRUPTION_MARKER));
    channel.emit("q1", test::result_execution_error());
    channel.emit_complete("q1");

    EXPECT_TRUE(orchestrator.is_querying("agent-y"));
    EXPECT_TRUE(orchestrator.is_streaming("agent-y"));
    EXPECT_FALSE(orchestrator.interruptions().last_interruption("agent-y").has_value());

    auto y_lines_after = transcript.get_messages("agent-y");
    ASSERT_EQ(y_lines_after.size(), y_lines_before.size());
    for (std::size_t i = 0; i < y_lines_after.size(); ++i)
    {
        EXPECT_EQ(y_lines_after[i].id, y_lines_before[i].id);
        EXPECT_EQ(y_lines_after[i].content, y_lines_before[i].content);
    }

    // Completing y leaves x's (finished) state alone too
    channel.emit("q2", test::result_success());
    channel.emit_complete("q2");
    EXPECT_FALSE(orchestrator.is_streaming("agent-x"));
    EXPECT_EQ(y.get(), "y is working");
    EXPECT_EQ(marker_lines("agent-y"), 0u);
}

TEST_F(ScenarioTest, SilentStopThenSendLeavesNoMarker)
{
    orchestrator.send("agent-x", "first");
    channel.emit("q1", test::assistant_text("partial"));

    orchestrator.stop("agent-x", StopOptions{true});
    auto second = orchestrator.send("agent-x", "new text");

    // The backend still echoes the interruption on the old stream
    channel.emit("q1", test::user_text(INTERRUPTION_MARKER));
    channel.emit("q1", test::result_execution_error());
    channel.emit_complete("q1");

    channel.emit("q2", test::assistant_text("fresh answer"));
    channel.emit("q2", test::result_success());
    channel.emit_complete("q2");

    EXPECT_EQ(marker_lines("agent-x"), 0u);
    auto lines = transcript.get_messages("agent-x");
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0].content, "first");
    EXPECT_EQ(lines[1].content, "partial");
    EXPECT_EQ(lines[2].content, "new text");
    EXPECT_EQ(lines[3].content, "fresh answer");
    EXPECT_EQ(second.get(), "fresh answer");
}

TEST_F(ScenarioTest, ExecutionErrorSuppressedOnlyInsideWindow)
{
    std::vector<QueryErrorEvent> errors;
    orchestrator.events().error.subscribe([&](const QueryErrorEvent& e) { errors.push_back(e); });

    // Within the window
    orchestrator.send("agent-x", "one");
    orchestrator.stop("agent-x");
    clock->advance(5s);
    channel.emit("q1", test::result_execution_error());
    channel.emit_complete("q1");

    EXPECT_TRUE(errors.empty());
    auto lines = transcript.get_messages("agent-x");
    // user line and marker, no extra error line
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(marker_lines("agent-x"), 1u);

    // Twenty seconds after the stop
    orchestrator.send("agent-y", "two");
    orchestrator.stop("agent-y");
    clock->advance(20s);
    channel.emit("q2", test::result_execution_error());
    channel.emit_complete("q2");

    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].agent_id, "agent-y");
    EXPECT_EQ(errors[0].error.message, "error_during_execution");
}

TEST_F(ScenarioTest, TextThenToolUseEmittedInOrder)
{
    std::vector<std::string> order;
    std::optional<std::string> parent = std::string("unset");
    orchestrator.events().content_delta.subscribe([&](const ContentDeltaEvent& e)
                                                  { order.push_back("delta:" + e.text); });
    orchestrator.events().tool_invocation.subscribe(
        [&](const ToolEvent& e)
        {
            order.push_back("tool:" + e.tool.name);
            parent = e.tool.parent_tool_id;
        });

    orchestrator.send("agent-x", "look around");
    channel.emit("q1", test::assistant_content(
                           {{{"type", "text"}, {"text", "Let me check."}},
                            {{"type", "tool_use"}, {"id", "toolu_1"}, {"name", "Glob"},
                             {"input", {{"pattern", "*.cpp"}}}}}));

    ASSERT_EQ(order.size(), 2u);
    EXPECT_EQ(order[0], "delta:Let me check.");
    EXPECT_EQ(order[1], "tool:Glob");
    EXPECT_FALSE(parent.has_value());
}
