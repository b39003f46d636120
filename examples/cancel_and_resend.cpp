// Starts a long answer, interrupts it, then redirects the agent with a new
// prompt. Shows stop(), cancel_and_send() and the interruption marker.

#include <chrono>
#include <iostream>
#include <steer/steer.hpp>

using namespace std::chrono_literals;

namespace
{

void pump(steer::SubprocessQueryChannel& channel, std::chrono::milliseconds how_long)
{
    auto until = std::chrono::steady_clock::now() + how_long;
    while (std::chrono::steady_clock::now() < until)
        channel.poll(50ms);
}

void print_transcript(const steer::TranscriptStore& transcript, const std::string& agent_id)
{
    std::cout << "\n--- transcript ---\n";
    for (const auto& message : transcript.get_messages(agent_id))
    {
        std::cout << steer::to_string(message.role) << ": " << message.content;
        if (message.is_interruption_marker)
            std::cout << "  (marker)";
        if (!message.tool_usages.empty())
            std::cout << "  [" << message.tool_usages.size() << " tool call(s)]";
        std::cout << "\n";
    }
}

} // namespace

int main()
{
    steer::Settings defaults;
    defaults.permission_mode = "bypassPermissions";
    steer::StaticSettingsProvider settings(defaults);

    steer::SubprocessQueryChannel channel;
    steer::InMemoryTranscriptStore transcript;
    steer::StreamingQueryOrchestrator orchestrator(channel, transcript, settings);

    steer::AgentSession session;
    session.id = "writer";
    orchestrator.sessions().add(session);

    orchestrator.events().content_delta.subscribe([](const steer::ContentDeltaEvent& e)
                                                  { std::cout << e.text << std::flush; });
    orchestrator.events().session_bound.subscribe(
        [](const steer::SessionBoundEvent& e)
        { std::cout << "[session " << e.backend_session_id << "]\n"; });

    try
    {
        // 1. Interrupt a long answer and keep the marker in the transcript
        auto first = orchestrator.send(session.id, "Write a 2000 word essay about rivers.");
        pump(channel, 5s);
        std::cout << "\n[stop]\n";
        orchestrator.stop(session.id);
        while (orchestrator.is_streaming(session.id))
            channel.poll(100ms);
        std::cout << "[first query returned " << first.get().size() << " chars]\n";

        // 2. Redirect mid-answer without a marker
        auto second = orchestrator.send(session.id, "Now write a long poem about mountains.");
        pump(channel, 5s);
        std::cout << "\n[cancel_and_send]\n";
        auto third = orchestrator.cancel_and_send(session.id, "Actually, just say hello.");
        while (orchestrator.is_streaming(session.id))
            channel.poll(100ms);
        std::cout << "\n[final answer: " << third.get() << "]\n";
        second.get();
    }
    catch (const steer::ChannelError& e)
    {
        std::cerr << "Error: CLI could not be started - " << e.what() << "\n";
        return 1;
    }
    catch (const steer::SteerError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    print_transcript(transcript, session.id);
    return 0;
}
