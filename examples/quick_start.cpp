#include <chrono>
#include <future>
#include <iostream>
#include <steer/steer.hpp>
#include <vector>

using namespace std::chrono_literals;

constexpr bool TIMING = true;
constexpr bool VERBOSE = false;

int main()
{
    std::cout << "steer version: " << steer::version_string() << "\n\n";

    steer::Settings defaults;
    defaults.permission_mode = "bypassPermissions";
    defaults.model = "claude-sonnet-4-5";
    steer::StaticSettingsProvider settings(defaults);

    steer::SubprocessQueryChannel channel;
    steer::InMemoryTranscriptStore transcript;
    steer::StreamingQueryOrchestrator orchestrator(
        channel, transcript, settings, steer::OrchestratorOptions::from_environment());

    steer::AgentSession session;
    session.id = "quick-start";
    orchestrator.sessions().add(session);

    orchestrator.events().content_delta.subscribe(
        [](const steer::ContentDeltaEvent& e)
        {
            if (VERBOSE)
                std::cout << "  [delta] " << e.text << "\n";
        });
    orchestrator.events().error.subscribe([](const steer::QueryErrorEvent& e)
                                          { std::cerr << "  [" << e.error.type << "] "
                                                      << e.error.message << "\n"; });

    std::vector<std::string> queries = {"What is 2+2? Be very brief.", "Name a primary color.",
                                        "What did I ask you first?"};

    for (std::size_t i = 0; i < queries.size(); ++i)
    {
        std::cout << "Query " << (i + 1) << ": " << queries[i] << "\n";
        auto start = std::chrono::steady_clock::now();

        std::future<std::string> answer;
        try
        {
            answer = orchestrator.send(session.id, queries[i]);
        }
        catch (const steer::ConfigurationError& e)
        {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }

        while (orchestrator.is_streaming(session.id))
            channel.poll(100ms);

        try
        {
            std::cout << "  Response: " << answer.get() << "\n";
        }
        catch (const steer::ChannelError& e)
        {
            std::cerr << "Error: CLI could not be started - " << e.what() << "\n";
            std::cerr << "Please install: npm install -g @anthropic-ai/claude-code\n";
            return 1;
        }

        if (TIMING)
        {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);
            std::cout << "  Time: " << elapsed.count() << " ms\n";
        }
        std::cout << "\n";
    }

    auto usage = orchestrator.usage(session.id);
    std::cout << "Turns: " << usage.turns << "\n";
    std::cout << "Session tokens: " << usage.session.total() << "\n";
    std::cout << "Session cost: $" << usage.session_cost_usd << "\n";
    std::cout << "Transcript lines: " << transcript.size(session.id) << "\n";
    return 0;
}
