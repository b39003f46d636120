#ifndef STEER_PROMPT_HPP
#define STEER_PROMPT_HPP

#include <optional>
#include <string>
#include <vector>

namespace steer
{

// Turns an opaque attachment reference into a file path the backend can read.
class AttachmentResolver
{
  public:
    virtual ~AttachmentResolver() = default;

    // std::nullopt if the reference is unknown.
    virtual std::optional<std::string> resolve(const std::string& reference) = 0;
};

// Appends an "Attached files:" section listing paths; returns text unchanged
// when paths is empty.
std::string append_attachments(const std::string& text, const std::vector<std::string>& paths);

// "/command:sub ..." -> "/command/sub ..."; anything else is returned as-is.
std::string rewrite_slash_command(const std::string& text);

} // namespace steer

#endif // STEER_PROMPT_HPP
