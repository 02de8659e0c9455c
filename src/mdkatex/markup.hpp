#pragma once

#include <string>
#include <string_view>

namespace mdkatex {

// `<span class="math-inline">\(` + escaped body + `\)</span>`
//
// With `escape_delimiters` set, the escaping also covers the wrapper's own
// bracket delimiters, which then read `\\(` and `\\)`.
void append_inline_math_markup(std::string& output_buffer,
    const std::string_view body, const bool escape_delimiters = false);

// `<div class="math-block">\[` + newline + body + newline + `\]</div>`
void append_block_math_markup(
    std::string& output_buffer, const std::string_view body);

[[nodiscard]] std::string inline_math_markup(
    const std::string_view body, const bool escape_delimiters = false);

[[nodiscard]] std::string block_math_markup(const std::string_view body);

} // namespace mdkatex
