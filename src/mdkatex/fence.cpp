#include "fence.hpp"

#include "delimiters.hpp"

#include <optional>
#include <string>
#include <string_view>

#include <cstddef>

namespace mdkatex {

bool is_whitespace(const char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' ||
           c == '\v';
}

std::string_view trim_left(const std::string_view sv) noexcept
{
    std::size_t i = 0;
    while (i < sv.size() && is_whitespace(sv[i]))
    {
        ++i;
    }

    return sv.substr(i);
}

std::string_view trim_right(const std::string_view sv) noexcept
{
    std::size_t n = sv.size();
    while (n > 0 && is_whitespace(sv[n - 1]))
    {
        --n;
    }

    return sv.substr(0, n);
}

std::string_view strip_indent(
    const std::string_view line, const std::size_t n) noexcept
{
    std::size_t i = 0;
    while (i < n && i < line.size() && is_whitespace(line[i]))
    {
        ++i;
    }

    return line.substr(i);
}

std::optional<fence_opening> parse_fence_opening(const std::string_view line)
{
    const std::size_t indent_length = line.size() - trim_left(line).size();
    if (indent_length == line.size())
    {
        return std::nullopt;
    }

    const char fence_char = line[indent_length];
    if (fence_char != '`' && fence_char != '~')
    {
        return std::nullopt;
    }

    std::size_t run_end = indent_length;
    while (run_end < line.size() && line[run_end] == fence_char)
    {
        ++run_end;
    }

    const std::size_t run_length = run_end - indent_length;
    if (run_length < 3)
    {
        return std::nullopt;
    }

    const std::string_view info = trim_right(line.substr(run_end));

    return fence_opening{._indent = std::string{line.substr(0, indent_length)},
        ._fence_char = fence_char,
        ._run_length = run_length,
        ._info = std::string{info}};
}

bool closes_fence(
    const std::string_view line, const fence_opening& fence) noexcept
{
    const std::string_view trimmed = trim_right(line);

    if (trimmed.substr(0, fence._indent.size()) != fence._indent)
    {
        return false;
    }

    const std::string_view run = trimmed.substr(fence._indent.size());
    if (run.size() != fence._run_length)
    {
        return false;
    }

    for (const char c : run)
    {
        if (c != fence._fence_char)
        {
            return false;
        }
    }

    return true;
}

bool opens_bracket_block(const std::string_view line) noexcept
{
    return trim_left(line).substr(0, block_math_open.size()) ==
           block_math_open;
}

} // namespace mdkatex
