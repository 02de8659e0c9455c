#include "converter.hpp"

#include "delimiters.hpp"
#include "fence.hpp"
#include "inline_scanner.hpp"
#include "scan_state.hpp"

#include <iostream>
#include <new>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <cassert>
#include <cstddef>

namespace mdkatex {

namespace {

[[nodiscard]] std::vector<std::string_view> split_lines(
    const std::string_view source)
{
    std::vector<std::string_view> result;

    std::size_t line_start = 0;
    while (line_start < source.size())
    {
        std::size_t line_end = source.find('\n', line_start);
        if (line_end == std::string_view::npos)
        {
            line_end = source.size();
        }

        result.push_back(source.substr(line_start, line_end - line_start));
        line_start = line_end + 1 /* newline */;
    }

    return result;
}

[[nodiscard]] std::string_view bracket_block_closing() noexcept
{
    const std::optional<std::string_view> result =
        closing_for(block_math_open);

    assert(result.has_value());
    return *result;
}

class converter_pass
{
private:
    const converter::config& _cfg;
    std::ostream* const _err_stream;
    std::vector<std::string>& _output_lines;
    scan_state _state;
    std::size_t _curr_line;

    [[nodiscard]] bool is_reporting_unterminated() const noexcept
    {
        return _err_stream != nullptr && !_cfg.skip_unterminated_diagnostics;
    }

    [[nodiscard]] std::ostream& warning_diagnostic_stream(
        const std::size_t line)
    {
        assert(_err_stream != nullptr);
        return *_err_stream << "((MDKATEX WARNING))(" << line << "): ";
    }

    void warning_diagnostic_unterminated(
        const std::size_t opening_line, const std::string_view construct)
    {
        if (!is_reporting_unterminated())
        {
            return;
        }

        warning_diagnostic_stream(opening_line)
            << "Unterminated " << construct << " (emitted verbatim)\n\n";
    }

    void emit(const std::string_view line)
    {
        _output_lines.emplace_back(line);
    }

    void emit(std::string&& line)
    {
        _output_lines.push_back(std::move(line));
    }

    [[nodiscard]] bool is_enabled(const math_kind kind) const noexcept
    {
        return kind == math_kind::bracket ? !_cfg.skip_bracket_inline_math
                                          : !_cfg.skip_gitlab_inline_math;
    }

    [[nodiscard]] std::string convert_inline(const std::string_view line)
    {
        std::vector<inline_math_span> spans = scan_inline(line);

        std::erase_if(spans, [&](const inline_math_span& span)
            { return !is_enabled(span._kind); });

        if (spans.empty())
        {
            return std::string{line};
        }

        return apply_inline_math(line, spans, _cfg.escape_inline_delimiters);
    }

    //
    // Each `process_line` overload handles one line in one state, and returns
    // the state to switch to, if any.
    // ------------------------------------------------------------------------

    [[nodiscard]] std::optional<scan_state> process_line(
        normal_state&, const std::string_view line)
    {
        std::optional<fence_opening> fence = parse_fence_opening(line);

        if (fence.has_value())
        {
            if (fence->is_math() && !_cfg.skip_fenced_block_math)
            {
                return in_fence_math_state{._fence = std::move(*fence),
                    ._buffer = {line},
                    ._opening_line = _curr_line};
            }

            emit(line);
            return in_fence_state{
                ._fence = std::move(*fence), ._opening_line = _curr_line};
        }

        if (!_cfg.skip_bracket_block_math && opens_bracket_block(line))
        {
            return in_bracket_block_state{._closing = bracket_block_closing(),
                ._buffer = {line},
                ._opening_line = _curr_line};
        }

        emit(convert_inline(line));
        return std::nullopt;
    }

    [[nodiscard]] std::optional<scan_state> process_line(
        in_fence_state& state, const std::string_view line)
    {
        emit(line);

        if (!closes_fence(line, state._fence))
        {
            return std::nullopt;
        }

        return normal_state{};
    }

    [[nodiscard]] std::optional<scan_state> process_line(
        in_fence_math_state& state, const std::string_view line)
    {
        state._buffer.push_back(line);

        if (!closes_fence(line, state._fence))
        {
            return std::nullopt;
        }

        emit(enclose_fenced_math(state._buffer, state._fence._indent.size()));
        return normal_state{};
    }

    [[nodiscard]] std::optional<scan_state> process_line(
        in_bracket_block_state& state, const std::string_view line)
    {
        state._buffer.push_back(line);

        if (line.find(state._closing) == std::string_view::npos)
        {
            return std::nullopt;
        }

        emit(enclose_bracket_math(state._buffer));
        return normal_state{};
    }

    void emit_unterminated(const block_math_buffer& buffer)
    {
        for (const std::string_view line : buffer)
        {
            emit(line);
        }
    }

public:
    [[nodiscard]] explicit converter_pass(const converter::config& cfg,
        std::ostream* const err_stream, std::vector<std::string>& output_lines)
        : _cfg{cfg},
          _err_stream{err_stream},
          _output_lines{output_lines},
          _state{normal_state{}},
          _curr_line{0}
    {}

    void feed(const std::string_view line)
    {
        ++_curr_line;

        std::optional<scan_state> next_state = std::visit(
            [&](auto& state) { return process_line(state, line); }, _state);

        if (next_state.has_value())
        {
            _state = std::move(*next_state);
        }
    }

    void finish()
    {
        if (const auto* fence = std::get_if<in_fence_state>(&_state))
        {
            warning_diagnostic_unterminated(fence->_opening_line, "code fence");
        }
        else if (const auto* fence_math =
                     std::get_if<in_fence_math_state>(&_state))
        {
            emit_unterminated(fence_math->_buffer);
            warning_diagnostic_unterminated(
                fence_math->_opening_line, "math fence");
        }
        else if (const auto* bracket_block =
                     std::get_if<in_bracket_block_state>(&_state))
        {
            emit_unterminated(bracket_block->_buffer);
            warning_diagnostic_unterminated(
                bracket_block->_opening_line, "'\\[' math block");
        }

        _state = normal_state{};
    }
};

[[nodiscard]] std::ostream& error_diagnostic_stream(std::ostream& err_stream)
{
    return err_stream << "((MDKATEX ERROR))(?): ";
}

} // namespace

converter::converter(std::ostream& err_stream) : _err_stream{err_stream}
{}

converter::~converter() = default;

bool converter::convert(const config& cfg,
    std::vector<std::string>& output_lines,
    const std::vector<std::string>& lines) noexcept
{
    assert(&output_lines != &lines);

    try
    {
        converter_pass pass{cfg, &_err_stream, output_lines};

        for (const std::string& line : lines)
        {
            pass.feed(line);
        }

        pass.finish();
        return true;
    }
    catch (const std::bad_alloc&)
    {
        error_diagnostic_stream(_err_stream) << "Out of memory\n\n";
        return false;
    }
}

bool converter::convert(const config& cfg, std::string& output_buffer,
    const std::string_view source) noexcept
{
    try
    {
        std::vector<std::string> output_lines;
        converter_pass pass{cfg, &_err_stream, output_lines};

        for (const std::string_view line : split_lines(source))
        {
            pass.feed(line);
        }

        pass.finish();

        for (std::size_t i = 0; i < output_lines.size(); ++i)
        {
            if (i > 0)
            {
                output_buffer.append(1, '\n');
            }

            output_buffer.append(output_lines[i]);
        }

        if (!source.empty() && source.back() == '\n')
        {
            output_buffer.append(1, '\n');
        }

        return true;
    }
    catch (const std::bad_alloc&)
    {
        error_diagnostic_stream(_err_stream) << "Out of memory\n\n";
        return false;
    }
}

std::vector<std::string> transform(
    const std::vector<std::string>& lines, const converter::config& cfg)
{
    std::vector<std::string> result;
    result.reserve(lines.size());

    converter_pass pass{cfg, nullptr, result};

    for (const std::string& line : lines)
    {
        pass.feed(line);
    }

    pass.finish();
    return result;
}

} // namespace mdkatex
