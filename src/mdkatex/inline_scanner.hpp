#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <cstddef>

namespace mdkatex {

inline constexpr std::size_t no_partner_token = static_cast<std::size_t>(-1);

enum class token_kind
{
    text,
    code_span_open,
    code_span_close,
    bracket_math_open,
    bracket_math_close
};

// A classified piece of a single line. Tokens produced by `tokenize_inline`
// cover the whole line, in order, without gaps.
struct inline_token
{
    token_kind _kind;
    std::size_t _offset;
    std::size_t _length;

    // Index of the matching `code_span_close` for a `code_span_open`, and
    // vice versa. `no_partner_token` for other kinds.
    std::size_t _partner;

    [[nodiscard]] std::size_t end() const noexcept
    {
        return _offset + _length;
    }
};

enum class math_kind
{
    bracket, // \( ... \)
    gitlab   // $` ... `$ and $`` ... ``$
};

struct inline_math_span
{
    // Index of the first character of the opening delimiter.
    std::size_t _start;

    // Index one past the last character of the closing delimiter.
    std::size_t _end;

    // Text between the delimiters.
    std::string _inline_math;

    math_kind _kind;
};

[[nodiscard]] std::vector<inline_token> tokenize_inline(
    const std::string_view line);

[[nodiscard]] std::vector<inline_math_span> match_inline(
    const std::string_view line, const std::vector<inline_token>& tokens);

// Finds every inline math span of `line` that is not inside a plain code
// span. The result is sorted by `_start` and free of overlaps.
[[nodiscard]] std::vector<inline_math_span> scan_inline(
    const std::string_view line);

// Replaces each span of `spans` in `line` with inline math markup. Spans must
// come from scanning `line` itself.
[[nodiscard]] std::string apply_inline_math(const std::string_view line,
    const std::vector<inline_math_span>& spans,
    const bool escape_delimiters = false);

} // namespace mdkatex
