#include "delimiters.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <cstddef>

namespace mdkatex {

namespace {

using namespace std::string_view_literals;

constexpr std::array<std::pair<std::string_view, std::string_view>, 4>
    delimiter_table{{
        {inline_math_open, inline_math_close},
        {block_math_open, block_math_close},
        {"$`"sv, "`$"sv},
        {"$``"sv, "``$"sv},
    }};

[[nodiscard]] constexpr bool is_escapable(const char c) noexcept
{
    switch (c)
    {
        case '(':
        case ')':
        case '{':
        case '}':
        case '[':
        case ']':
        case '*':
        case '!':
        case '`':
        case '+':
        case '-':
        case '_':
        case '#': return true;
        default: return false;
    }
}

} // namespace

std::optional<std::string_view> closing_for(
    const std::string_view opening) noexcept
{
    for (const auto& [open, close] : delimiter_table)
    {
        if (open == opening)
        {
            return close;
        }
    }

    return std::nullopt;
}

void append_escaped_backslashes(
    std::string& output_buffer, const std::string_view text)
{
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        output_buffer.append(1, text[i]);

        if (text[i] == '\\' && i + 1 < text.size() && is_escapable(text[i + 1]))
        {
            output_buffer.append(1, '\\');
        }
    }
}

std::string escape_backslashes(const std::string_view text)
{
    std::string result;
    result.reserve(text.size() + 8);

    append_escaped_backslashes(result, text);
    return result;
}

} // namespace mdkatex
