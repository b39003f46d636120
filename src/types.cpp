#include <steer/types.hpp>
#include <type_traits>

namespace steer
{

std::string get_text_content(const std::vector<ContentBlock>& content)
{
    std::string result;

    for (const auto& block : content)
    {
        if (auto* text_block = std::get_if<TextBlock>(&block))
            result += text_block->text;
    }

    return result;
}

std::string message_kind(const ProtocolMessage& msg)
{
    return std::visit(
        [](const auto& m) -> std::string
        {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, SystemInitMessage> ||
                          std::is_same_v<T, CompactBoundaryMessage>)
                return m.type + "/" + m.subtype;
            else if constexpr (std::is_same_v<T, UnknownMessage>)
                return m.subtype.empty() ? m.type : m.type + "/" + m.subtype;
            else
                return m.type;
        },
        msg);
}

std::string to_string(Role role)
{
    return role == Role::User ? "user" : "assistant";
}

} // namespace steer
