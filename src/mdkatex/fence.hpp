#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <cstddef>

namespace mdkatex {

// Opening line of a fenced code block: optional indent, then a run of at
// least three backticks or tildes, then the info string (everything after the
// run, without trailing whitespace).
struct fence_opening
{
    std::string _indent;
    char _fence_char;
    std::size_t _run_length;
    std::string _info;

    [[nodiscard]] bool is_math() const noexcept
    {
        return _info == "math";
    }
};

[[nodiscard]] std::optional<fence_opening> parse_fence_opening(
    const std::string_view line);

// True if `line`, without trailing whitespace, is exactly `fence`'s indent
// followed by the same fence run.
[[nodiscard]] bool closes_fence(
    const std::string_view line, const fence_opening& fence) noexcept;

// True if the first non-whitespace characters of `line` are `\[`.
[[nodiscard]] bool opens_bracket_block(const std::string_view line) noexcept;

[[nodiscard]] bool is_whitespace(const char c) noexcept;

[[nodiscard]] std::string_view trim_left(const std::string_view sv) noexcept;
[[nodiscard]] std::string_view trim_right(const std::string_view sv) noexcept;

// Removes up to `n` leading whitespace characters.
[[nodiscard]] std::string_view strip_indent(
    const std::string_view line, const std::size_t n) noexcept;

} // namespace mdkatex
