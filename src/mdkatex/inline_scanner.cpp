#include "inline_scanner.hpp"

#include "delimiters.hpp"
#include "markup.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <cassert>
#include <cstddef>

namespace mdkatex {

namespace {

[[nodiscard]] std::string_view bracket_math_closing() noexcept
{
    const std::optional<std::string_view> result =
        closing_for(inline_math_open);

    assert(result.has_value());
    return *result;
}

class inline_lexer
{
private:
    const std::string_view _line;
    const std::string_view _open;
    const std::string_view _close;
    std::vector<inline_token>& _tokens;
    std::size_t _curr_idx;
    std::size_t _text_start_idx;

    [[nodiscard]] bool is_done() const noexcept
    {
        return _curr_idx >= _line.size();
    }

    [[nodiscard]] bool next_is(const std::string_view token) const noexcept
    {
        return _line.substr(_curr_idx, token.size()) == token;
    }

    void flush_text()
    {
        if (_curr_idx > _text_start_idx)
        {
            _tokens.push_back(inline_token{._kind = token_kind::text,
                ._offset = _text_start_idx,
                ._length = _curr_idx - _text_start_idx,
                ._partner = no_partner_token});
        }
    }

    void push_token(const token_kind kind, const std::size_t length)
    {
        flush_text();

        _tokens.push_back(inline_token{._kind = kind,
            ._offset = _curr_idx,
            ._length = length,
            ._partner = no_partner_token});

        _curr_idx += length;
        _text_start_idx = _curr_idx;
    }

public:
    [[nodiscard]] explicit inline_lexer(
        const std::string_view line, std::vector<inline_token>& tokens)
        : _line{line},
          _open{inline_math_open},
          _close{bracket_math_closing()},
          _tokens{tokens},
          _curr_idx{0},
          _text_start_idx{0}
    {}

    // Backtick runs are emitted as unresolved `code_span_open` tokens, in
    // chunks of at most two backticks.
    void lex()
    {
        while (!is_done())
        {
            if (_line[_curr_idx] == '`')
            {
                const bool is_double = _curr_idx + 1 < _line.size() &&
                                       _line[_curr_idx + 1] == '`';

                push_token(token_kind::code_span_open, is_double ? 2 : 1);
                continue;
            }

            if (next_is(_open))
            {
                push_token(token_kind::bracket_math_open, _open.size());
                continue;
            }

            if (next_is(_close))
            {
                push_token(token_kind::bracket_math_close, _close.size());
                continue;
            }

            ++_curr_idx;
        }

        flush_text();
    }
};

[[nodiscard]] std::optional<std::size_t> find_matching_backticks(
    const std::vector<inline_token>& tokens, const std::size_t open_idx)
{
    for (std::size_t i = open_idx + 1; i < tokens.size(); ++i)
    {
        if (tokens[i]._kind == token_kind::code_span_open &&
            tokens[i]._length == tokens[open_idx]._length)
        {
            return {i};
        }
    }

    return std::nullopt;
}

void pair_code_spans(std::vector<inline_token>& tokens)
{
    std::size_t i = 0;
    while (i < tokens.size())
    {
        if (tokens[i]._kind != token_kind::code_span_open)
        {
            ++i;
            continue;
        }

        const std::optional<std::size_t> close_idx =
            find_matching_backticks(tokens, i);

        if (!close_idx.has_value())
        {
            tokens[i]._kind = token_kind::text;
            ++i;
            continue;
        }

        for (std::size_t k = i + 1; k < *close_idx; ++k)
        {
            tokens[k]._kind = token_kind::text;
        }

        tokens[i]._partner = *close_idx;
        tokens[*close_idx]._kind = token_kind::code_span_close;
        tokens[*close_idx]._partner = i;

        i = *close_idx + 1;
    }
}

[[nodiscard]] std::vector<inline_token> merge_text_tokens(
    const std::vector<inline_token>& tokens)
{
    std::vector<inline_token> result;
    result.reserve(tokens.size());

    std::vector<std::size_t> new_idx(tokens.size(), no_partner_token);

    for (std::size_t i = 0; i < tokens.size(); ++i)
    {
        const inline_token& token = tokens[i];

        if (token._kind == token_kind::text && !result.empty() &&
            result.back()._kind == token_kind::text)
        {
            result.back()._length += token._length;
        }
        else
        {
            result.push_back(token);
        }

        new_idx[i] = result.size() - 1;
    }

    for (inline_token& token : result)
    {
        if (token._partner != no_partner_token)
        {
            token._partner = new_idx[token._partner];
        }
    }

    return result;
}

[[nodiscard]] bool is_dollar_bounded(const std::string_view line,
    const inline_token& open, const inline_token& close,
    const std::size_t cursor) noexcept
{
    if (open._offset == 0 || open._offset - 1 < cursor)
    {
        return false;
    }

    if (close.end() >= line.size())
    {
        return false;
    }

    return line[open._offset - 1] == '$' && line[close.end()] == '$';
}

} // namespace

std::vector<inline_token> tokenize_inline(const std::string_view line)
{
    std::vector<inline_token> tokens;
    inline_lexer{line, tokens}.lex();

    pair_code_spans(tokens);
    return merge_text_tokens(tokens);
}

std::vector<inline_math_span> match_inline(
    const std::string_view line, const std::vector<inline_token>& tokens)
{
    std::vector<inline_math_span> result;

    // Nothing before `cursor` may become part of a new span.
    std::size_t cursor = 0;
    std::optional<std::size_t> pending_open_idx;

    for (std::size_t i = 0; i < tokens.size(); ++i)
    {
        const inline_token& token = tokens[i];

        switch (token._kind)
        {
            case token_kind::text: break;

            case token_kind::bracket_math_open:
            {
                if (!pending_open_idx.has_value())
                {
                    pending_open_idx = i;
                }

                break;
            }

            case token_kind::bracket_math_close:
            {
                if (!pending_open_idx.has_value())
                {
                    break;
                }

                const inline_token& open = tokens[*pending_open_idx];
                const std::size_t math_start = open.end();

                result.push_back(inline_math_span{._start = open._offset,
                    ._end = token.end(),
                    ._inline_math = std::string{line.substr(
                        math_start, token._offset - math_start)},
                    ._kind = math_kind::bracket});

                cursor = token.end();
                pending_open_idx.reset();
                break;
            }

            case token_kind::code_span_open:
            {
                // Bracket math never crosses into a code span.
                pending_open_idx.reset();

                assert(token._partner < tokens.size());
                const inline_token& close = tokens[token._partner];
                assert(close._kind == token_kind::code_span_close);

                if (is_dollar_bounded(line, token, close, cursor))
                {
                    const std::size_t math_start = token.end();

                    result.push_back(inline_math_span{
                        ._start = token._offset - 1 /* $ */,
                        ._end = close.end() + 1 /* $ */,
                        ._inline_math = std::string{line.substr(
                            math_start, close._offset - math_start)},
                        ._kind = math_kind::gitlab});

                    cursor = close.end() + 1;
                }
                else
                {
                    cursor = close.end();
                }

                i = token._partner;
                break;
            }

            case token_kind::code_span_close:
            {
                // Always skipped over together with its opening.
                assert(false);
                break;
            }
        }
    }

    return result;
}

std::vector<inline_math_span> scan_inline(const std::string_view line)
{
    return match_inline(line, tokenize_inline(line));
}

std::string apply_inline_math(const std::string_view line,
    const std::vector<inline_math_span>& spans, const bool escape_delimiters)
{
    std::string result;
    result.reserve(line.size() + spans.size() * 48);

    std::size_t idx = 0;
    for (const inline_math_span& span : spans)
    {
        assert(span._start >= idx);
        assert(span._end <= line.size());

        result.append(line.substr(idx, span._start - idx));
        append_inline_math_markup(result, span._inline_math, escape_delimiters);
        idx = span._end;
    }

    result.append(line.substr(idx));
    return result;
}

} // namespace mdkatex
