#include <doctest/doctest.h>
#include <climits>
#include <string>
#include <vector>

#include "parser.h"
#include "parse_commons.h"
#include "parse_lines.h"
#include "parse_spans.h"
#include "math_codec.h"

namespace {
    /* Wraps the native expression so that derived LaTeX is recognizable */
    class TagTranspiler: public LF::MathTranspiler {
    public:
        std::string to_native(const std::string& latex) const override {
            return "N(" + latex + ")";
        }
        std::string to_latex(const std::string& native) const override {
            return "L(" + native + ")";
        }
    };

    std::shared_ptr<LF::SpanMathDetail> math_of(const LF::InlineSpan& span) {
        return std::static_pointer_cast<LF::SpanMathDetail>(span.detail);
    }
}

TEST_SUITE("Bracket matcher") {
    TEST_CASE("Nested pairs") {
        CHECK(LF::find_matching("a(b(c)d)e", 1, '(', ')') == 7);
        CHECK(LF::find_matching("[x[y]z]", 0, '[', ']') == 6);
        CHECK(LF::find_matching("[x[y]z]", 2, '[', ']') == 4);
    }
    TEST_CASE("Unterminated") {
        CHECK(LF::find_matching("((a)", 0, '(', ')') == -1);
        CHECK(LF::find_matching("[", 0, '[', ']') == -1);
    }
}

TEST_SUITE("Math codec") {
    TEST_CASE("Base64") {
        CHECK(LF::base64_encode("\\pi r^2") == "XHBpIHJeMg==");
        CHECK(LF::base64_encode("") == "");
        std::string out;
        CHECK(LF::base64_decode("XGZyYWN7MX17Mn0=", out));
        CHECK(out == "\\frac{1}{2}");
        CHECK_FALSE(LF::base64_decode("@@@@", out));
        CHECK_FALSE(LF::base64_decode("abcde", out));
    }
    TEST_CASE("UTF-8 validation") {
        CHECK(LF::is_valid_utf8("plain"));
        CHECK(LF::is_valid_utf8("\xC3\xA9\xE2\x88\x91"));
        CHECK_FALSE(LF::is_valid_utf8("\xC3"));
        CHECK_FALSE(LF::is_valid_utf8("\xC0\xAF"));
        CHECK_FALSE(LF::is_valid_utf8("\xED\xA0\x80"));
    }
    TEST_CASE("LaTeX source survives encoding") {
        std::vector<std::pair<std::string, std::string>> pairs = {
            {"frac(1, 2)", "\\frac{1}{2}"},
            {"x", "x"},
            {"sum_(i=1)^n i", "\\sum_{i=1}^{n} i"},
            {"", "\\alpha"},
            {"a", "\xC3\xA9t\xC3\xA9 \xE2\x88\x91"},
        };
        for (auto& pair : pairs) {
            std::string encoded = LF::encode_math(pair.first, pair.second);
            LF::InlineSpan span;
            LF::OFFSET next = LF::decode_math(encoded, 0, &span);
            REQUIRE(next == (LF::OFFSET)encoded.length());
            auto info = math_of(span);
            REQUIRE(info);
            CHECK(info->latex_expr == pair.second);
            CHECK(info->native_expr == pair.first);
            CHECK(info->format == LF::MATH_LATEX);
        }
    }
    TEST_CASE("Without LaTeX comment") {
        CHECK(LF::encode_math("x^2", "") == "$x^2$");

        TagTranspiler transpiler;
        LF::Options options;
        options.transpiler = &transpiler;
        LF::InlineSpan span;
        CHECK(LF::decode_math("$x^2$ rest", 0, &span, options) == 5);
        auto info = math_of(span);
        CHECK(info->format == LF::MATH_NATIVE);
        CHECK(info->latex_expr == "L(x^2)");
        CHECK(info->id == "im-1");
    }
    TEST_CASE("Bad payload falls back to the derived form") {
        std::string text = "$x$/*LF_LATEX:!!!*/";
        LF::InlineSpan span;
        CHECK(LF::decode_math(text, 0, &span) == (LF::OFFSET)text.length());
        auto info = math_of(span);
        CHECK(info->native_expr == "x");
        CHECK(info->format == LF::MATH_NATIVE);
        CHECK(info->latex_expr == "x");

        /* Decodes, but not to UTF-8 */
        std::string invalid = "$y$/*LF_LATEX:" + LF::base64_encode("\xFF\xFE") + "*/";
        CHECK(LF::decode_math(invalid, 0, &span) == (LF::OFFSET)invalid.length());
        CHECK(math_of(span)->latex_expr == "y");
    }
    TEST_CASE("Unterminated formula") {
        LF::InlineSpan span;
        CHECK(LF::decode_math("$abc", 0, &span) == -1);
        CHECK(LF::decode_math("abc", 0, &span) == -1);
    }
}

TEST_SUITE("Line splitter") {
    TEST_CASE("Empty input") {
        CHECK(LF::split_into_lines("") == std::vector<std::string>{""});
        CHECK(LF::split_into_lines("   ") == std::vector<std::string>{""});
    }
    TEST_CASE("Breaks") {
        CHECK(LF::split_into_lines("a#linebreak()b\nc") == std::vector<std::string>{"a", "b", "c"});
        CHECK(LF::split_into_lines("a\r\nb") == std::vector<std::string>{"a", "b"});
        CHECK(LF::split_into_lines("a  b ") == std::vector<std::string>{"a  b"});
    }
    TEST_CASE("Trailing empty lines") {
        CHECK(LF::split_into_lines("a\n") == std::vector<std::string>{"a"});
        CHECK(LF::split_into_lines("a\n\n") == std::vector<std::string>{"a", ""});
        CHECK(LF::split_into_lines("a\n  ") == std::vector<std::string>{"a"});
    }
    TEST_CASE("Styled runs") {
        CHECK(LF::split_into_lines("#strike[x #linebreak() y]")
            == std::vector<std::string>{"#strike[x]", "#strike[y]"});
        CHECK(LF::split_into_lines("#strike[a\nb]") == std::vector<std::string>{"#strike[a\nb]"});
        CHECK(LF::split_into_lines("k #text(fill: rgb(\"#f00\"))[a#linebreak()b] z")
            == std::vector<std::string>{"k #text(fill: rgb(\"#f00\"))[a]", "#text(fill: rgb(\"#f00\"))[b] z"});
        /* The break is nested in another run, the outer one is kept whole */
        CHECK(LF::split_into_lines("#text(fill: rgb(\"#f00\"))[#strike[a #linebreak() b]]")
            == std::vector<std::string>{"#text(fill: rgb(\"#f00\"))[#strike[a #linebreak() b]]"});
        CHECK(LF::split_into_lines("#strike[open\nrest") == std::vector<std::string>{"#strike[open\nrest"});
    }
}

TEST_SUITE("Line classifier") {
    TEST_CASE("Kinds") {
        CHECK(LF::classify_line("- x") == LF::LINE_BULLET);
        CHECK(LF::classify_line("* x") == LF::LINE_BULLET);
        CHECK(LF::classify_line("-x") == LF::LINE_TEXT);
        CHECK(LF::classify_line("12) x") == LF::LINE_ORDERED);
        CHECK(LF::classify_line("3.") == LF::LINE_ORDERED);
        CHECK(LF::classify_line("3.14") == LF::LINE_TEXT);
        CHECK(LF::classify_line("#text(fill: rgb(\"#f00\"))[- x]") == LF::LINE_BULLET);
        CHECK(LF::classify_line("#strike[2. x] tail") == LF::LINE_TEXT);
    }
    TEST_CASE("Segments") {
        auto segments = LF::segment_lines({"- a", "- b", "x", "1. y", "z"});
        REQUIRE(segments.size() == 4);
        CHECK(segments[0].kind == LF::LINE_BULLET);
        CHECK(segments[0].lines.size() == 2);
        CHECK(segments[1].kind == LF::LINE_TEXT);
        CHECK(segments[2].kind == LF::LINE_ORDERED);
        CHECK(segments[3].kind == LF::LINE_TEXT);
    }
    TEST_CASE("Prefixes") {
        CHECK(LF::strip_list_prefix("  - item", LF::LINE_BULLET) == "item");
        CHECK(LF::strip_list_prefix("#text(fill: rgb(\"#f00\"))[2. two]", LF::LINE_ORDERED)
            == "#text(fill: rgb(\"#f00\"))[two]");
        CHECK(LF::list_start("5. a") == 5);
        CHECK(LF::list_start("0. zero") == 1);
        CHECK(LF::list_start("99999999999. x") == INT_MAX);
    }
    TEST_CASE("List kind of a block of text") {
        CHECK(LF::detect_list_kind("- a\n\n- b") == LF::LINE_BULLET);
        CHECK(LF::detect_list_kind("1. a\n2) b") == LF::LINE_ORDERED);
        CHECK(LF::detect_list_kind("- a\nb") == LF::LINE_TEXT);
        CHECK(LF::detect_list_kind("") == LF::LINE_TEXT);
    }
}

TEST_SUITE("Inline spans") {
    TEST_CASE("Bold and italic") {
        auto spans = LF::parse_spans("*a _b_*");
        REQUIRE(spans.size() == 1);
        CHECK(spans[0].type == LF::SPAN_STRONG);
        REQUIRE(spans[0].children.size() == 2);
        CHECK(spans[0].children[0].text == "a ");
        CHECK(spans[0].children[1].type == LF::SPAN_EM);
    }
    TEST_CASE("Escapes") {
        auto spans = LF::parse_spans("\\*not bold\\*");
        REQUIRE(spans.size() == 1);
        CHECK(spans[0].type == LF::SPAN_TEXT);
        CHECK(spans[0].text == "*not bold*");
    }
    TEST_CASE("Colors") {
        auto spans = LF::parse_spans("#text(size: 10pt)[plain]");
        REQUIRE(spans.size() == 1);
        CHECK(spans[0].type == LF::SPAN_COLOR);
        CHECK(std::static_pointer_cast<LF::SpanColorDetail>(spans[0].detail)->color == "#000000");

        spans = LF::parse_spans("#text(weight: \"bold\", FILL: RGB(\"#abc\"))[x]");
        REQUIRE(spans.size() == 1);
        CHECK(std::static_pointer_cast<LF::SpanColorDetail>(spans[0].detail)->color == "#abc");
    }
    TEST_CASE("Formula comment does not close a run") {
        std::string formula = LF::encode_math("frac(1,2)", "\\frac{1}{2}");
        auto spans = LF::parse_spans("*half " + formula + "*");
        REQUIRE(spans.size() == 1);
        CHECK(spans[0].type == LF::SPAN_STRONG);
        REQUIRE(spans[0].children.size() == 2);
        CHECK(spans[0].children[0].text == "half ");
        REQUIRE(spans[0].children[1].type == LF::SPAN_LATEXMATH);
        CHECK(math_of(spans[0].children[1])->latex_expr == "\\frac{1}{2}");

        spans = LF::parse_spans("2 * 3 = " + formula);
        REQUIRE(spans.size() == 2);
        CHECK(spans[0].type == LF::SPAN_TEXT);
        CHECK(spans[0].text == "2 * 3 = ");
        REQUIRE(spans[1].type == LF::SPAN_LATEXMATH);
        CHECK(math_of(spans[1])->latex_expr == "\\frac{1}{2}");

        spans = LF::parse_spans("_a $x$ b_");
        REQUIRE(spans.size() == 1);
        CHECK(spans[0].type == LF::SPAN_EM);
    }
    TEST_CASE("Text call without body stays literal") {
        auto spans = LF::parse_spans("#text(fill: red) x");
        REQUIRE(spans.size() == 1);
        CHECK(spans[0].text == "#text(fill: red) x");
    }
    TEST_CASE("Hard breaks") {
        auto spans = LF::parse_spans("#strike[a\nb]");
        REQUIRE(spans.size() == 1);
        REQUIRE(spans[0].children.size() == 3);
        CHECK(spans[0].children[1].type == LF::SPAN_BR);
    }
    TEST_CASE("Nesting limit") {
        std::string open;
        std::string close;
        for (int i = 0;i < 40;i++) {
            open += "#strike[";
            close += "]";
        }
        auto spans = LF::parse_spans(open + "x" + close);
        int depth = 0;
        const LF::InlineSpan* span = &spans.front();
        while (span->type == LF::SPAN_DEL) {
            depth++;
            REQUIRE(span->children.size() == 1);
            span = &span->children.front();
        }
        CHECK(depth == RECURSE_LIMIT);
        CHECK(span->type == LF::SPAN_TEXT);
        CHECK(span->text == open.substr(0, 8 * (40 - RECURSE_LIMIT)) + "x" + close.substr(0, 40 - RECURSE_LIMIT));
    }
}

TEST_SUITE("Document") {
    TEST_CASE("Ordered list start") {
        LF::Document doc = LF::parse_document("5. a\n6. b\n7. c");
        REQUIRE(doc.size() == 1);
        CHECK(doc[0].kind == LF::LINE_ORDERED);
        CHECK(doc[0].start == 5);
        CHECK(doc[0].lines.size() == 3);
    }
    TEST_CASE("Formula ids are unique in a document") {
        LF::CounterIdGenerator ids("eq-");
        LF::Options options;
        options.ids = &ids;
        LF::Document doc = LF::parse_document("$a$\n$b$", options);
        REQUIRE(doc.size() == 1);
        REQUIRE(doc[0].lines.size() == 2);
        CHECK(math_of(doc[0].lines[0].spans[0])->id == "eq-1");
        CHECK(math_of(doc[0].lines[1].spans[0])->id == "eq-2");
    }
    TEST_CASE("Plain text") {
        CHECK(LF::to_plain_text(LF::parse_document("*a*\n$x$ y #strike[z]")) == "a\nx y z");
        CHECK(LF::to_plain_text(LF::parse_document("")) == "");
    }
    TEST_CASE("Stopping the walk") {
        LF::Parser parser;
        int texts = 0;
        parser.text = [&](LF::TEXT_TYPE, const std::string&) -> bool {
            texts++;
            return false;
        };
        CHECK_FALSE(LF::parse("a\nb\nc", &parser));
        CHECK(texts == 1);

        LF::Parser empty;
        CHECK(LF::parse("a *b*", &empty));
    }
}
