#ifndef STEER_INTERNAL_TRANSPORT_CLI_COMMAND_HPP
#define STEER_INTERNAL_TRANSPORT_CLI_COMMAND_HPP

#include <steer/channel.hpp>

#include <string>
#include <vector>

namespace steer
{
namespace transport
{

// Arguments (without the executable) for one non-interactive stream-json run.
std::vector<std::string> build_cli_arguments(const PromptPayload& payload);

// Locates the CLI: the configured path, then STEER_CLI_PATH, then PATH, then the
// usual per-user install locations. Throws ChannelError if none is usable.
std::string find_cli(const std::string& configured);

} // namespace transport
} // namespace steer

#endif // STEER_INTERNAL_TRANSPORT_CLI_COMMAND_HPP
