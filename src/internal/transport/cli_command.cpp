#include "cli_command.hpp"

#include "../subprocess/process.hpp"

#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <steer/errors.hpp>

namespace steer
{
namespace transport
{

std::vector<std::string> build_cli_arguments(const PromptPayload& payload)
{
    std::vector<std::string> cmd;

    cmd.push_back("--output-format");
    cmd.push_back("stream-json");
    cmd.push_back("--verbose");
    cmd.push_back("--print");

    if (payload.resume && !payload.resume->empty())
    {
        cmd.push_back("--resume");
        cmd.push_back(*payload.resume);
    }

    if (payload.model && !payload.model->empty())
    {
        cmd.push_back("--model");
        cmd.push_back(*payload.model);
    }

    if (payload.permission_mode && !payload.permission_mode->empty())
    {
        cmd.push_back("--permission-mode");
        cmd.push_back(*payload.permission_mode);
    }

    if (payload.max_turns)
    {
        cmd.push_back("--max-turns");
        cmd.push_back(std::to_string(*payload.max_turns));
    }

    if (!payload.allowed_tools.empty())
    {
        std::ostringstream oss;
        for (std::size_t i = 0; i < payload.allowed_tools.size(); ++i)
        {
            if (i > 0)
                oss << ",";
            oss << payload.allowed_tools[i];
        }
        cmd.push_back("--allowedTools");
        cmd.push_back(oss.str());
    }

    if (!payload.system_prompt.empty())
    {
        cmd.push_back("--system-prompt");
        cmd.push_back(payload.system_prompt);
    }

    // Prompt last, after "--" so a leading dash is not taken for a flag
    cmd.push_back("--");
    cmd.push_back(payload.prompt);

    return cmd;
}

std::string find_cli(const std::string& configured)
{
    auto usable = [](const std::string& path) -> std::string
    {
        auto found = subprocess::find_executable(path);
        if (!found)
            throw ChannelError("CLI path is not an executable file: " + path);
        return *found;
    };

    if (!configured.empty())
        return usable(configured);

    if (const char* env_cli = std::getenv("STEER_CLI_PATH"); env_cli != nullptr && env_cli[0])
        return usable(env_cli);

    if (auto path = subprocess::find_executable("claude"))
        return *path;

    if (const char* home = std::getenv("HOME"))
    {
        const std::filesystem::path base(home);
        for (const auto& candidate : {base / ".npm-global" / "bin" / "claude",
                                      base / ".local" / "bin" / "claude",
                                      base / ".claude" / "local" / "claude"})
        {
            if (auto path = subprocess::find_executable(candidate.string()))
                return *path;
        }
    }

    throw ChannelError("Claude Code CLI not found. Install it, add it to PATH, or set "
                       "STEER_CLI_PATH");
}

} // namespace transport
} // namespace steer
