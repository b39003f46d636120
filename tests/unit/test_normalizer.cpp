#include "../../src/internal/message_parser.hpp"
#include "../test_utils.hpp"

#include <gtest/gtest.h>
#include <steer/normalizer.hpp>

using namespace steer;
using namespace std::chrono_literals;

namespace
{

std::vector<NormalizedEvent> run(const json& message, NormalizerContext context = {})
{
    return normalize(protocol::MessageParser::parse(message), context);
}

template <typename T>
const T& event_at(const std::vector<NormalizedEvent>& events, std::size_t index)
{
    return std::get<T>(events.at(index));
}

} // namespace

TEST(NormalizerTest, AssistantTextBecomesContentDelta)
{
    auto events = run(test::assistant_text("Hello"));

    ASSERT_EQ(events.size(), 1u);
    const auto& delta = event_at<normalized::ContentDelta>(events, 0);
    EXPECT_EQ(delta.text, "Hello");
    EXPECT_TRUE(delta.is_new_message);
}

TEST(NormalizerTest, OnlyFirstTextBlockStartsAMessage)
{
    auto events = run(test::assistant_content({{{"type", "text"}, {"text", "one "}},
                                               {{"type", "thinking"}, {"thinking", "..."}},
                                               {{"type", "text"}, {"text", "two"}}}));

    ASSERT_EQ(events.size(), 2u);
    EXPECT_TRUE(event_at<normalized::ContentDelta>(events, 0).is_new_message);
    EXPECT_FALSE(event_at<normalized::ContentDelta>(events, 1).is_new_message);
    EXPECT_EQ(event_at<normalized::ContentDelta>(events, 1).text, "two");
}

TEST(NormalizerTest, ThinkingOnlyMessageProducesNothing)
{
    auto events = run(test::assistant_content({{{"type", "thinking"}, {"thinking", "hmm"}}}));
    EXPECT_TRUE(events.empty());
}

TEST(NormalizerTest, EmptyTextItemsAreSkipped)
{
    auto events = run(test::assistant_content({{{"type", "text"}, {"text", ""}},
                                               {{"type", "text"}, {"text", "kept"}}}));

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(event_at<normalized::ContentDelta>(events, 0).text, "kept");
    EXPECT_TRUE(event_at<normalized::ContentDelta>(events, 0).is_new_message);
}

TEST(NormalizerTest, ToolUseAndUsageFollowText)
{
    json usage = {{"input_tokens", 40}, {"output_tokens", 7}};
    json msg = test::assistant_content(
        {{{"type", "text"}, {"text", "Let me look"}},
         {{"type", "tool_use"}, {"id", "toolu_1"}, {"name", "Grep"}, {"input", {{"q", "x"}}}}});
    msg["message"]["usage"] = usage;

    auto events = run(msg);

    ASSERT_EQ(events.size(), 3u);
    const auto& tool = event_at<normalized::ToolInvocation>(events, 1);
    EXPECT_EQ(tool.tool_id, "toolu_1");
    EXPECT_EQ(tool.name, "Grep");
    EXPECT_EQ(tool.input["q"], "x");
    EXPECT_FALSE(tool.parent_tool_id.has_value());
    EXPECT_EQ(event_at<normalized::UsageReported>(events, 2).usage.output_tokens, 7u);
}

TEST(NormalizerTest, EmptyUsageIsNotReported)
{
    auto events = run(test::assistant_text("x", {{"input_tokens", 0}, {"output_tokens", 0}}));
    ASSERT_EQ(events.size(), 1u);
}

TEST(NormalizerTest, ToolResultBecomesCompletion)
{
    auto events = run(test::user_tool_result("toolu_1", "no matches", true));

    ASSERT_EQ(events.size(), 1u);
    const auto& done = event_at<normalized::ToolCompletion>(events, 0);
    EXPECT_EQ(done.tool_id, "toolu_1");
    EXPECT_EQ(done.content, "no matches");
    EXPECT_TRUE(done.is_error);
}

TEST(NormalizerTest, TopLevelToolMessagesAreNormalizedToo)
{
    auto invocation =
        run({{"type", "tool_use"}, {"id", "t2"}, {"name", "Bash"}, {"parent_tool_use_id", "t1"}});
    ASSERT_EQ(invocation.size(), 1u);
    EXPECT_EQ(event_at<normalized::ToolInvocation>(invocation, 0).parent_tool_id.value_or(""),
              "t1");

    auto completion = run({{"type", "tool_result"}, {"tool_use_id", "t2"}, {"content", "ok"}});
    ASSERT_EQ(completion.size(), 1u);
    EXPECT_FALSE(event_at<normalized::ToolCompletion>(completion, 0).is_error);
}

TEST(NormalizerTest, InterruptionEchoSuppressedWhileActive)
{
    NormalizerContext context;
    context.interruption_active = true;

    EXPECT_TRUE(run(test::user_text(INTERRUPTION_MARKER), context).empty());
}

TEST(NormalizerTest, InterruptionEchoKeptOutsideWindow)
{
    auto events = run(test::user_text(INTERRUPTION_MARKER));

    ASSERT_EQ(events.size(), 1u);
    const auto& line = event_at<normalized::UserLine>(events, 0);
    EXPECT_EQ(line.text, INTERRUPTION_MARKER);
    EXPECT_TRUE(line.is_interruption_marker);
}

TEST(NormalizerTest, EchoMatchIsExact)
{
    EXPECT_TRUE(is_interruption_echo("[Request interrupted by user]"));
    EXPECT_FALSE(is_interruption_echo("[Request interrupted by user] "));
    EXPECT_FALSE(is_interruption_echo("[request interrupted by user]"));
    EXPECT_FALSE(is_interruption_echo(""));

    NormalizerContext context;
    context.interruption_active = true;
    auto events = run(test::user_text("please continue"), context);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_FALSE(event_at<normalized::UserLine>(events, 0).is_interruption_marker);
}

TEST(NormalizerTest, SystemInitBindsSession)
{
    auto events = run(test::init_message("sess-42"));

    ASSERT_EQ(events.size(), 1u);
    const auto& binding = event_at<normalized::SessionBinding>(events, 0);
    EXPECT_EQ(binding.backend_session_id, "sess-42");
    EXPECT_EQ(binding.model, "claude-sonnet-4-5");
    EXPECT_EQ(binding.mcp_servers.size(), 1u);
}

TEST(NormalizerTest, InitWithoutSessionIdBindsNothing)
{
    EXPECT_TRUE(run({{"type", "system"}, {"subtype", "init"}}).empty());
}

TEST(NormalizerTest, CompactBoundaryCarriesDisplayText)
{
    auto events = run({{"type", "system"},
                       {"subtype", "compact_boundary"},
                       {"compact_metadata", {{"trigger", "manual"}, {"pre_tokens", 120000}}}});

    ASSERT_EQ(events.size(), 1u);
    const auto& boundary = event_at<normalized::CompactionBoundary>(events, 0);
    EXPECT_EQ(boundary.pre_tokens, 120000u);
    EXPECT_EQ(boundary.text, compaction_text(120000, "manual"));
    EXPECT_EQ(boundary.text,
              "Compaction completed\n\nPre-compaction tokens: 120000\n\nTrigger: manual");
}

TEST(NormalizerTest, UnknownMessagesProduceNothing)
{
    EXPECT_TRUE(run({{"type", "stream_event"}}).empty());
    EXPECT_TRUE(run({{"type", "system"}, {"subtype", "status"}}).empty());
}

TEST(NormalizerTest, SuccessfulResultFinalizesTurn)
{
    auto events = run(test::result_success(0.25, {{"input_tokens", 10}, {"output_tokens", 5}}));

    ASSERT_EQ(events.size(), 1u);
    const auto& summary = event_at<normalized::TurnFinalized>(events, 0).summary;
    EXPECT_EQ(summary.subtype, "success");
    EXPECT_EQ(summary.duration_ms, 1200);
    EXPECT_TRUE(summary.duration_reported_by_backend);
    EXPECT_DOUBLE_EQ(summary.total_cost_usd, 0.25);
    EXPECT_EQ(summary.usage.total(), 15u);
    EXPECT_FALSE(summary.error.has_value());
    EXPECT_FALSE(summary.error_suppressed);
}

TEST(NormalizerTest, DurationFallsBackToElapsed)
{
    NormalizerContext context;
    context.elapsed = 3456ms;

    auto events = run({{"type", "result"}, {"subtype", "success"}, {"is_error", false}}, context);

    const auto& summary = event_at<normalized::TurnFinalized>(events, 0).summary;
    EXPECT_EQ(summary.duration_ms, 3456);
    EXPECT_FALSE(summary.duration_reported_by_backend);
}

TEST(NormalizerTest, ExecutionErrorSuppressedAfterInterruption)
{
    NormalizerContext context;
    context.interruption_active = true;

    auto events = run(test::result_execution_error(), context);

    const auto& summary = event_at<normalized::TurnFinalized>(events, 0).summary;
    EXPECT_FALSE(summary.error.has_value());
    EXPECT_TRUE(summary.error_suppressed);
}

TEST(NormalizerTest, ExecutionErrorSurfacedWithoutInterruption)
{
    auto events = run(test::result_execution_error());

    const auto& summary = event_at<normalized::TurnFinalized>(events, 0).summary;
    ASSERT_TRUE(summary.error.has_value());
    EXPECT_EQ(summary.error->message, "error_during_execution");
    EXPECT_EQ(summary.error->type, "api_error");
}

TEST(NormalizerTest, OtherErrorsSurfaceEvenWhileInterrupted)
{
    NormalizerContext context;
    context.interruption_active = true;

    auto events = run({{"type", "result"},
                       {"subtype", "error_max_turns"},
                       {"is_error", true},
                       {"result", "Rate limit reached for requests"}},
                      context);

    const auto& summary = event_at<normalized::TurnFinalized>(events, 0).summary;
    ASSERT_TRUE(summary.error.has_value());
    EXPECT_EQ(summary.error->type, "rate_limit_error");
    EXPECT_EQ(summary.error->message, "Rate limit reached for requests");
    EXPECT_FALSE(summary.error_suppressed);
}

TEST(ClassifyErrorTest, MapsKnownPhrases)
{
    EXPECT_EQ(classify_error("Invalid API key. Please run /login"), "authentication_error");
    EXPECT_EQ(classify_error("Rate limit exceeded"), "rate_limit_error");
    EXPECT_EQ(classify_error("API is Overloaded"), "overloaded_error");
    EXPECT_EQ(classify_error("Permission denied for tool"), "permission_error");
    EXPECT_EQ(classify_error("model not found"), "not_found_error");
    EXPECT_EQ(classify_error("Prompt is too large"), "request_too_large");
    EXPECT_EQ(classify_error("invalid request: bad field"), "invalid_request_error");
    EXPECT_EQ(classify_error("something else"), "api_error");
}
