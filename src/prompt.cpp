#include <steer/prompt.hpp>

#include <cctype>
#include <sstream>

namespace steer
{

namespace
{

bool is_word_char(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

} // namespace

std::string append_attachments(const std::string& text, const std::vector<std::string>& paths)
{
    if (paths.empty())
        return text;

    std::ostringstream oss;
    oss << text << "\n\nAttached files:\n";
    for (std::size_t i = 0; i < paths.size(); ++i)
    {
        if (i > 0)
            oss << "\n";
        oss << "- " << paths[i];
    }
    oss << "\n\nPlease use the Read tool to examine these files.";
    return oss.str();
}

std::string rewrite_slash_command(const std::string& text)
{
    if (text.size() < 4 || text[0] != '/')
        return text;

    std::size_t pos = 1;
    while (pos < text.size() && is_word_char(text[pos]))
        ++pos;
    if (pos == 1 || pos >= text.size() || text[pos] != ':')
        return text;

    std::size_t sub = pos + 1;
    if (sub >= text.size() || !is_word_char(text[sub]))
        return text;

    std::string rewritten = text;
    rewritten[pos] = '/';
    return rewritten;
}

} // namespace steer
