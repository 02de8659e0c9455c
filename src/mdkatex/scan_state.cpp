#include "scan_state.hpp"

#include "fence.hpp"
#include "markup.hpp"

#include <string>
#include <string_view>

#include <cassert>
#include <cstddef>

namespace mdkatex {

namespace {

template <typename F>
[[nodiscard]] std::string join_interior_lines(
    const block_math_buffer& buffer, F&& transform_line)
{
    assert(buffer.size() >= 2);

    std::string result;
    for (std::size_t i = 1; i + 1 < buffer.size(); ++i)
    {
        if (i > 1)
        {
            result.append(1, '\n');
        }

        result.append(transform_line(buffer[i]));
    }

    result.resize(trim_right(result).size());
    return result;
}

} // namespace

std::string enclose_fenced_math(
    const block_math_buffer& buffer, const std::size_t indent_length)
{
    const std::string body = join_interior_lines(buffer,
        [&](const std::string_view line)
        { return strip_indent(line, indent_length); });

    return block_math_markup(body);
}

std::string enclose_bracket_math(const block_math_buffer& buffer)
{
    const std::string body = join_interior_lines(
        buffer, [](const std::string_view line) { return line; });

    return block_math_markup(body);
}

} // namespace mdkatex
