#pragma once

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace mdkatex {

class converter
{
private:
    std::ostream& _err_stream;

public:
    struct config
    {
        bool skip_bracket_inline_math = false;
        bool skip_gitlab_inline_math = false;
        bool skip_bracket_block_math = false;
        bool skip_fenced_block_math = false;
        bool escape_inline_delimiters = false;
        bool skip_unterminated_diagnostics = false;
    };

    [[nodiscard]] explicit converter(std::ostream& err_stream);
    ~converter();

    // `output_lines` and `lines` must be distinct vectors.
    [[nodiscard]] bool convert(const config& cfg,
        std::vector<std::string>& output_lines,
        const std::vector<std::string>& lines) noexcept;

    // Lines of `source` are split on '\n' only; a '\r' before it stays part of
    // the line.
    [[nodiscard]] bool convert(const config& cfg, std::string& output_buffer,
        const std::string_view source) noexcept;
};

// Rewrites every math span and math block of `lines` into markup a client
// side renderer can find. Writes no diagnostics.
[[nodiscard]] std::vector<std::string> transform(
    const std::vector<std::string>& lines, const converter::config& cfg = {});

} // namespace mdkatex
