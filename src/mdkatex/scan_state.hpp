#pragma once

#include "fence.hpp"

#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <cstddef>

namespace mdkatex {

// Lines of a block construct, from its opening line up to and including its
// closing line once found. Views refer to the document being converted.
using block_math_buffer = std::vector<std::string_view>;

struct normal_state
{
};

struct in_fence_state
{
    fence_opening _fence;
    std::size_t _opening_line;
};

struct in_fence_math_state
{
    fence_opening _fence;
    block_math_buffer _buffer;
    std::size_t _opening_line;
};

struct in_bracket_block_state
{
    std::string_view _closing;
    block_math_buffer _buffer;
    std::size_t _opening_line;
};

using scan_state = std::variant<normal_state, in_fence_state,
    in_fence_math_state, in_bracket_block_state>;

// Wraps the lines between the first and the last line of `buffer`, dedented by
// up to `indent_length` whitespace characters, as block math markup.
[[nodiscard]] std::string enclose_fenced_math(
    const block_math_buffer& buffer, const std::size_t indent_length);

// Wraps the lines between the first and the last line of `buffer` as block
// math markup.
[[nodiscard]] std::string enclose_bracket_math(const block_math_buffer& buffer);

} // namespace mdkatex
