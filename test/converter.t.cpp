#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <mdkatex/converter.hpp>

#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <cstddef>

using namespace std::string_view_literals;

namespace {

void do_test_one_pass(const std::string_view source,
    const std::string_view expected,
    const mdkatex::converter::config& cfg = {},
    std::ostream& err_stream = std::cerr)
{
    mdkatex::converter cnvtr{err_stream};

    std::string output_buffer;
    const bool ok = cnvtr.convert(cfg, output_buffer, source);

    REQUIRE(ok);
    REQUIRE(output_buffer == expected);
}

void do_test_lines(const std::vector<std::string>& lines,
    const std::vector<std::string>& expected,
    const mdkatex::converter::config& cfg = {})
{
    REQUIRE(mdkatex::transform(lines, cfg) == expected);
}

[[nodiscard]] bool diagnostic_contains(
    const std::ostringstream& oss, const std::string_view needle)
{
    if (oss.str().find(needle) == std::string::npos)
    {
        std::cerr << "OUTPUT:\n" << oss.str() << '\n';
        return false;
    }

    return true;
}

[[nodiscard]] bool has_warning_diagnostic(
    const std::ostringstream& oss, const std::size_t line)
{
    std::ostringstream needle;
    needle << "((MDKATEX WARNING))(" << line << "): ";

    return diagnostic_contains(oss, needle.str());
}

} // namespace

TEST_CASE("converter ctor/dtor")
{
    mdkatex::converter c{std::cerr};
    (void)c;
}

TEST_CASE("converter convert #0")
{
    const std::string_view source = R"(
# hello world

some markdown here... test@mail.com, $5 and $10

**bold** `code` *italic*
)"sv;

    do_test_one_pass(source, source);
}

TEST_CASE("converter convert #1")
{
    do_test_lines({R"(Formula: \(E=mc^2\))"},
        {R"(Formula: <span class="math-inline">\(E=mc^2\)</span>)"});
}

TEST_CASE("converter convert #2")
{
    do_test_lines({"Gitlab: $`E=mc^2`$"},
        {R"(Gitlab: <span class="math-inline">\(E=mc^2\)</span>)"});
}

TEST_CASE("converter convert #3")
{
    do_test_lines({"```math", "x+1=2", "```"},
        {"<div class=\"math-block\">\\[\nx+1=2\n\\]</div>"});
}

TEST_CASE("converter convert #4")
{
    do_test_lines({R"(\(no close)"}, {R"(\(no close)"});
}

TEST_CASE("converter convert #5")
{
    const std::string_view source = R"md(
```cpp
auto x = "\(a\)" + "$`b`$";
\[
```
after
)md"sv;

    do_test_one_pass(source, source);
}

TEST_CASE("converter convert #6")
{
    const std::string_view source = R"(
Brackets: \(\{x\}\) and code `\(y\)`

\[
\int_0^\infty e^{-x^2} dx = \frac{\sqrt{\pi}}{2}
\]
)"sv;

    const std::string_view expected = R"(
Brackets: <span class="math-inline">\(\\{x\\}\)</span> and code `\(y\)`

<div class="math-block">\[
\int_0^\infty e^{-x^2} dx = \frac{\sqrt{\pi}}{2}
\]</div>
)"sv;

    do_test_one_pass(source, expected);
}

TEST_CASE("converter convert #7")
{
    // Indented tilde fence: body dedented by the fence's indent.
    do_test_lines({"  ~~~math", "    a", "  b  ", "", "  ~~~"},
        {"<div class=\"math-block\">\\[\n  a\nb\n\\]</div>"});
}

TEST_CASE("converter convert #8")
{
    // Only the exact opening run closes the fence.
    do_test_lines({"````math", "x", "```", " ````", "`````", "y", "````"},
        {"<div class=\"math-block\">\\[\nx\n```\n ````\n`````\ny\n\\]</div>"});
}

TEST_CASE("converter convert #8b")
{
    // A longer run inside a plain fence is code, not a closing fence.
    do_test_lines({"```", "code", "````", "\\(x\\)", "```", "\\(y\\)"},
        {"```", "code", "````", "\\(x\\)", "```",
            R"(<span class="math-inline">\(y\)</span>)"});
}

TEST_CASE("converter convert #8c")
{
    // `math` must follow the run directly; anything else is plain code.
    do_test_lines({"``` math", "\\(x\\)", "```"},
        {"``` math", "\\(x\\)", "```"});
}

TEST_CASE("converter convert #9")
{
    do_test_lines({"a", "```math", "x", "```", "b"},
        {"a", "<div class=\"math-block\">\\[\nx\n\\]</div>", "b"});
}

TEST_CASE("converter convert #10")
{
    // Block bodies keep their backslashes as-is.
    do_test_lines({"  \\[", "a \\\\ b", "\\{c\\}", "\\]"},
        {"<div class=\"math-block\">\\[\na \\\\ b\n\\{c\\}\n\\]</div>"});
}

TEST_CASE("converter convert #11")
{
    // The opening line is never tested for the closing token.
    do_test_lines({R"(\[x\])", "y", R"(z \] w)", "after"},
        {"<div class=\"math-block\">\\[\ny\n\\]</div>", "after"});
}

TEST_CASE("converter convert #12")
{
    do_test_lines({"text", "```math", "x", "  \\(y\\)"},
        {"text", "```math", "x", "  \\(y\\)"});
}

TEST_CASE("converter convert #13")
{
    do_test_lines({"\\[", "x", "\\(y\\)"}, {"\\[", "x", "\\(y\\)"});
}

TEST_CASE("converter convert #14")
{
    do_test_lines({"```", "\\(x\\)"}, {"```", "\\(x\\)"});
}

TEST_CASE("converter convert #15")
{
    // A math fence inside a plain fence is plain code.
    do_test_lines({"~~~~", "```math", "x", "```", "~~~~", "\\(y\\)"},
        {"~~~~", "```math", "x", "```", "~~~~",
            R"(<span class="math-inline">\(y\)</span>)"});
}

TEST_CASE("converter convert #16")
{
    // A fence closed by a differently indented run stays open.
    do_test_lines({"  ```math", "x", "```"}, {"  ```math", "x", "```"});
}

TEST_CASE("converter convert #17")
{
    do_test_lines({}, {});
    do_test_one_pass("", "");
    do_test_one_pass("\n", "\n");
    do_test_one_pass(R"(\(a\))", R"(<span class="math-inline">\(a\)</span>)");
}

TEST_CASE("converter convert #18")
{
    do_test_one_pass("a\r\n\\(x\\)\r\n",
        "a\r\n<span class=\"math-inline\">\\(x\\)</span>\r\n");
}

TEST_CASE("converter convert #18b")
{
    // CRLF plain fences come out byte for byte.
    const std::string_view source = "```\r\nx \\(y\\)\r\n```\r\n\\(z\\)\r\n"sv;

    do_test_one_pass(source,
        "```\r\nx \\(y\\)\r\n```\r\n"
        "<span class=\"math-inline\">\\(z\\)</span>\r\n");
}

TEST_CASE("converter convert #18c")
{
    do_test_one_pass("```math\r\nx+1=2\r\n```\r\n",
        "<div class=\"math-block\">\\[\nx+1=2\n\\]</div>\n");
}

TEST_CASE("converter convert #19")
{
    const std::string_view source = R"(
```math
\begin{aligned}
a &= b \\
c &= d
\end{aligned}
```
)"sv;

    const std::string_view expected = R"(
<div class="math-block">\[
\begin{aligned}
a &= b \\
c &= d
\end{aligned}
\]</div>
)"sv;

    do_test_one_pass(source, expected);
}

TEST_CASE("converter config #0")
{
    const std::vector<std::string> lines{R"($`a`$ \(b\))"};

    do_test_lines(lines, {R"($`a`$ <span class="math-inline">\(b\)</span>)"},
        {.skip_gitlab_inline_math = true});

    do_test_lines(lines, {R"(<span class="math-inline">\(a\)</span> \(b\))"},
        {.skip_bracket_inline_math = true});
}

TEST_CASE("converter config #1")
{
    // Skipped GitLab spans are still code spans and hide their content.
    do_test_lines({R"($`\(a\)`$)"}, {R"($`\(a\)`$)"},
        {.skip_gitlab_inline_math = true});
}

TEST_CASE("converter config #2")
{
    do_test_lines({"```math", "\\(x\\)", "```"},
        {"```math", "\\(x\\)", "```"}, {.skip_fenced_block_math = true});
}

TEST_CASE("converter config #3")
{
    do_test_lines({"\\[", "\\(y\\)", "\\]"},
        {"\\[", R"(<span class="math-inline">\(y\)</span>)", "\\]"},
        {.skip_bracket_block_math = true});
}

TEST_CASE("converter config #4")
{
    do_test_lines({R"(\(\_a\))"},
        {R"(<span class="math-inline">\\(\\_a\\)</span>)"},
        {.escape_inline_delimiters = true});
}

TEST_CASE("converter diagnostics #0")
{
    std::ostringstream oss;
    do_test_one_pass("a\n```math\nx\n", "a\n```math\nx\n", {}, oss);

    REQUIRE(has_warning_diagnostic(oss, 2));
    REQUIRE(diagnostic_contains(oss, "math fence"));
}

TEST_CASE("converter diagnostics #1")
{
    std::ostringstream oss;
    do_test_one_pass("a\nb\n\\[\nx\n", "a\nb\n\\[\nx\n", {}, oss);

    REQUIRE(has_warning_diagnostic(oss, 3));
}

TEST_CASE("converter diagnostics #2")
{
    std::ostringstream oss;
    do_test_one_pass("~~~\nx\n", "~~~\nx\n", {}, oss);

    REQUIRE(has_warning_diagnostic(oss, 1));
    REQUIRE(diagnostic_contains(oss, "code fence"));
}

TEST_CASE("converter diagnostics #3")
{
    std::ostringstream oss;
    do_test_one_pass("```math\nx\n", "```math\nx\n",
        {.skip_unterminated_diagnostics = true}, oss);

    REQUIRE(oss.str().empty());
}

TEST_CASE("converter diagnostics #4")
{
    std::ostringstream oss;
    do_test_one_pass("```math\nx\n```\n\\(no close\n",
        "<div class=\"math-block\">\\[\nx\n\\]</div>\n\\(no close\n", {}, oss);

    REQUIRE(oss.str().empty());
}

TEST_CASE("converter convert lines")
{
    std::ostringstream oss;
    mdkatex::converter cnvtr{oss};

    std::vector<std::string> output_lines;
    const bool ok = cnvtr.convert(
        {}, output_lines, {"\\(a\\)", "```math", "b", "```", "c"});

    REQUIRE(ok);
    REQUIRE(output_lines ==
            std::vector<std::string>{
                R"(<span class="math-inline">\(a\)</span>)",
                "<div class=\"math-block\">\\[\nb\n\\]</div>", "c"});

    REQUIRE(oss.str().empty());
}

TEST_CASE("converter state is per call")
{
    std::ostringstream oss;
    mdkatex::converter cnvtr{oss};

    std::string first;
    REQUIRE(cnvtr.convert({}, first, "```math\nx\n"));

    std::string second;
    REQUIRE(cnvtr.convert({}, second, "\\(y\\)\n"));
    REQUIRE(second == "<span class=\"math-inline\">\\(y\\)</span>\n");

    REQUIRE(mdkatex::transform({"```"}) == std::vector<std::string>{"```"});
    REQUIRE(mdkatex::transform({"\\(z\\)"}) ==
            std::vector<std::string>{
                R"(<span class="math-inline">\(z\)</span>)"});
}

TEST_CASE("converter transform concurrent")
{
    const std::vector<std::string> fst_lines{
        "```math", "a", "```", R"(\(b\))", "\\[", "c", "\\]"};

    const std::vector<std::string> snd_lines{
        "~~~", "$`d`$", "~~~", "$`e`$", "```math", "f"};

    const std::vector<std::string> fst_expected{
        "<div class=\"math-block\">\\[\na\n\\]</div>",
        R"(<span class="math-inline">\(b\)</span>)",
        "<div class=\"math-block\">\\[\nc\n\\]</div>"};

    const std::vector<std::string> snd_expected{"~~~", "$`d`$", "~~~",
        R"(<span class="math-inline">\(e\)</span>)", "```math", "f"};

    constexpr int n_iterations = 500;

    std::vector<std::vector<std::string>> fst_results(n_iterations);
    std::vector<std::vector<std::string>> snd_results(n_iterations);

    std::thread fst_thread{[&]
        {
            for (int i = 0; i < n_iterations; ++i)
            {
                fst_results[i] = mdkatex::transform(fst_lines);
            }
        }};

    std::thread snd_thread{[&]
        {
            for (int i = 0; i < n_iterations; ++i)
            {
                snd_results[i] = mdkatex::transform(snd_lines);
            }
        }};

    fst_thread.join();
    snd_thread.join();

    for (int i = 0; i < n_iterations; ++i)
    {
        REQUIRE(fst_results[i] == fst_expected);
        REQUIRE(snd_results[i] == snd_expected);
    }
}
