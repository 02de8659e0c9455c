#include "markup.hpp"

#include "delimiters.hpp"

#include <string>
#include <string_view>

namespace mdkatex {

namespace {

using namespace std::string_view_literals;

constexpr auto inline_prefix = R"(<span class="math-inline">)"sv;
constexpr auto inline_suffix = "</span>"sv;
constexpr auto block_prefix = R"(<div class="math-block">)"sv;
constexpr auto block_suffix = "</div>"sv;

} // namespace

void append_inline_math_markup(std::string& output_buffer,
    const std::string_view body, const bool escape_delimiters)
{
    output_buffer.append(inline_prefix);

    if (escape_delimiters)
    {
        append_escaped_backslashes(output_buffer, inline_math_open);
        append_escaped_backslashes(output_buffer, body);
        append_escaped_backslashes(output_buffer, inline_math_close);
    }
    else
    {
        output_buffer.append(inline_math_open);
        append_escaped_backslashes(output_buffer, body);
        output_buffer.append(inline_math_close);
    }

    output_buffer.append(inline_suffix);
}

void append_block_math_markup(
    std::string& output_buffer, const std::string_view body)
{
    output_buffer.append(block_prefix);
    output_buffer.append(block_math_open);
    output_buffer.append(1, '\n');
    output_buffer.append(body);
    output_buffer.append(1, '\n');
    output_buffer.append(block_math_close);
    output_buffer.append(block_suffix);
}

std::string inline_math_markup(
    const std::string_view body, const bool escape_delimiters)
{
    std::string result;
    append_inline_math_markup(result, body, escape_delimiters);
    return result;
}

std::string block_math_markup(const std::string_view body)
{
    std::string result;
    append_block_math_markup(result, body);
    return result;
}

} // namespace mdkatex
