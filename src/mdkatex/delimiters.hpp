#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace mdkatex {

inline constexpr std::string_view inline_math_open = "\\(";
inline constexpr std::string_view inline_math_close = "\\)";
inline constexpr std::string_view block_math_open = "\\[";
inline constexpr std::string_view block_math_close = "\\]";

// Returns the closing token registered for `opening`, or `std::nullopt` if
// `opening` is not a known delimiter.
[[nodiscard]] std::optional<std::string_view> closing_for(
    const std::string_view opening) noexcept;

// Doubles every backslash that precedes one of the characters a Markdown
// inline-escape pass would consume: ( ) { } [ ] * ! ` + - _ #
void append_escaped_backslashes(
    std::string& output_buffer, const std::string_view text);

[[nodiscard]] std::string escape_backslashes(const std::string_view text);

} // namespace mdkatex
