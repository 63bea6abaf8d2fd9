#include <doctest/doctest.h>
#include <string>
#include <vector>

#include "parser.h"
#include "render.h"
#include "serialize.h"

namespace {
    LF::RichNode text(const std::string& content) {
        return LF::make_text_node(content);
    }

    LF::RichNode el(const std::string& tag, const std::vector<LF::RichNode>& children) {
        return LF::make_element(tag, {}, children);
    }

    LF::RichNode with_attr(const std::string& tag, const std::string& name, const std::string& value, const std::vector<LF::RichNode>& children) {
        LF::Attributes attributes;
        attributes[name] = value;
        return LF::make_element(tag, attributes, children);
    }

    /* Root holding a single line */
    LF::RichNode line(const std::vector<LF::RichNode>& children) {
        return el("div", {el("div", children)});
    }

    class TagTranspiler: public LF::MathTranspiler {
    public:
        std::string to_native(const std::string& latex) const override {
            return "N(" + latex + ")";
        }
        std::string to_latex(const std::string& native) const override {
            return "L(" + native + ")";
        }
    };

    std::string round_trip(const std::string& markup) {
        return LF::encode_tree(LF::render_tree(LF::parse_document(markup)));
    }
}

TEST_SUITE("Tree walker") {
    TEST_CASE("Inline styles") {
        CHECK(LF::encode_tree(line({text("Hello "), el("strong", {text("bold")})})) == "Hello *bold*");
        CHECK(LF::encode_tree(line({el("b", {text("x")}), el("i", {text("y")})})) == "*x*_y_");
        CHECK(LF::encode_tree(line({el("s", {text("x")})})) == "#strike[x]");
        CHECK(LF::encode_tree(line({el("del", {text("x")})})) == "#strike[x]");
        CHECK(LF::encode_tree(line({el("span", {text("plain")})})) == "plain");
    }
    TEST_CASE("Hard break inside bold") {
        CHECK(LF::encode_tree(line({el("strong", {text("a"), el("br", {}), text("b")})})) == "*a*\n*b*");
        CHECK(LF::encode_tree(line({el("em", {text("a"), el("br", {})})})) == "_a_");
    }
    TEST_CASE("Colors") {
        CHECK(LF::encode_tree(line({with_attr("span", "style", "color: rgb(255, 0, 0)", {text("x")})}))
            == "#text(fill: rgb(\"#ff0000\"))[x]");
        CHECK(LF::encode_tree(line({with_attr("span", "style", "background-color: red", {text("x")})})) == "x");
        CHECK(LF::encode_tree(line({with_attr("font", "color", "#00AA00", {text("x")})}))
            == "#text(fill: rgb(\"#00AA00\"))[x]");
        CHECK(LF::encode_tree(line({with_attr("span", "style", "color: #00ff00; text-decoration: line-through", {text("x")})}))
            == "#strike[#text(fill: rgb(\"#00ff00\"))[x]]");
    }
    TEST_CASE("RGB conversion") {
        CHECK(LF::rgb_to_hex("rgb(300, 0, 16)") == "#ff0010");
        CHECK(LF::rgb_to_hex("rgba(1,2,3,0.5)") == "#010203");
        CHECK(LF::rgb_to_hex("#abc") == "#abc");
        CHECK(LF::rgb_to_hex("rgb()") == "rgb()");
    }
    TEST_CASE("Lists") {
        LF::RichNode ol = with_attr("ol", "start", "5", {el("li", {text("a")}), el("li", {text("b")}), el("li", {text("c")})});
        std::string markup = LF::encode_tree(el("div", {ol}));
        CHECK(markup == "5. a\n6. b\n7. c");

        LF::Document doc = LF::parse_document(markup);
        REQUIRE(doc.size() == 1);
        CHECK(doc[0].kind == LF::LINE_ORDERED);
        CHECK(doc[0].start == 5);
        CHECK(doc[0].lines.size() == 3);

        LF::RichNode bad_start = with_attr("ol", "start", "abc", {el("li", {text("a")})});
        CHECK(LF::encode_tree(el("div", {bad_start})) == "1. a");
        LF::RichNode zero_start = with_attr("ol", "start", "0", {el("li", {text("a")})});
        CHECK(LF::encode_tree(el("div", {zero_start})) == "1. a");

        LF::RichNode ul = el("ul", {el("li", {text("a"), el("br", {}), el("br", {}), text("b")}), text("ignored"), el("li", {})});
        CHECK(LF::encode_tree(el("div", {ul})) == "- a #linebreak() b\n-");
    }
    TEST_CASE("Blank lines") {
        LF::RichNode root = el("div", {el("div", {text("a")}), el("div", {el("br", {})}), el("div", {text("b")})});
        CHECK(LF::encode_tree(root) == "a\n\nb");

        root = el("div", {el("div", {el("br", {})}), el("p", {text("x")}), el("div", {el("br", {})})});
        CHECK(LF::encode_tree(root) == "x");
        CHECK(LF::encode_tree(el("div", std::vector<LF::RichNode>())) == "");
    }
    TEST_CASE("Math pill") {
        LF::Attributes attributes;
        attributes["class"] = "inline-math-pill";
        attributes["data-native-expr"] = "  ";
        attributes["data-latex-expr"] = "\\frac{1}{2}";
        LF::RichNode pill = LF::make_element("span", attributes, {text("\xE2\x88\x91")});

        TagTranspiler transpiler;
        LF::Options options;
        options.transpiler = &transpiler;
        CHECK(LF::encode_tree(line({pill}), options) == "$N(\\frac{1}{2})$/*LF_LATEX:XGZyYWN7MX17Mn0=*/");

        attributes["data-native-expr"] = " x ";
        attributes["data-latex-expr"] = "";
        CHECK(LF::encode_inline(LF::make_element("span", attributes, {}), options) == "$x$");
    }
    TEST_CASE("Single line cells") {
        CHECK(LF::inline_to_single_line("a\\nb\nc") == "a #linebreak() b #linebreak() c");
        CHECK(LF::inline_to_single_line("x\r\ny") == "x #linebreak() y");
    }
}

TEST_SUITE("Round trip") {
    TEST_CASE("Styled text") {
        std::string markup = "Hello *bold* _it_ #strike[s] #text(fill: rgb(\"#ff0000\"))[red]\nsecond";
        CHECK(round_trip(markup) == markup);
        CHECK(round_trip("- *a*\n- b") == "- *a*\n- b");
        CHECK(round_trip("#strike[a\nb]") == "#strike[a\nb]");
        CHECK(round_trip("a\n\nb") == "a\n\nb");
    }
    TEST_CASE("Hard break inside bold") {
        LF::RichNode tree = line({el("strong", {text("a"), el("br", {}), text("b")})});
        std::string markup = LF::encode_tree(tree);
        LF::Document doc = LF::parse_document(markup);
        CHECK(LF::to_plain_text(doc) == "a\nb");
        REQUIRE(doc.size() == 1);
        REQUIRE(doc[0].lines.size() == 2);
        CHECK(doc[0].lines[0].spans[0].type == LF::SPAN_STRONG);
        CHECK(doc[0].lines[1].spans[0].type == LF::SPAN_STRONG);
    }
    TEST_CASE("Formula") {
        CHECK(round_trip("$x$/*LF_LATEX:eA==*/") == "$x$/*LF_LATEX:eA==*/");
    }
    TEST_CASE("Unbalanced bracket in bold with a hard break") {
        std::string markup = LF::encode_tree(line({el("strong", {text("f(x"), el("br", {}), text("y")})}));
        CHECK(markup == "*f(x*\n*y*");
        LF::Document doc = LF::parse_document(markup);
        CHECK(LF::to_plain_text(doc) == "f(x\ny");
        REQUIRE(doc.size() == 1);
        REQUIRE(doc[0].lines.size() == 2);
        CHECK(doc[0].lines[0].spans[0].type == LF::SPAN_STRONG);
        CHECK(doc[0].lines[1].spans[0].type == LF::SPAN_STRONG);

        markup = LF::encode_tree(line({el("em", {text("a[b"), el("br", {}), text("c")})}));
        CHECK(markup == "_a[b_\n_c_");
    }
    TEST_CASE("Formula inside bold") {
        LF::Attributes attributes;
        attributes["class"] = "inline-math-pill";
        attributes["data-native-expr"] = "frac(1,2)";
        attributes["data-latex-expr"] = "\\frac{1}{2}";
        LF::RichNode pill = LF::make_element("span", attributes, {text("\xE2\x88\x91")});

        std::string markup = LF::encode_tree(line({el("strong", {text("half "), pill})}));
        CHECK(markup == "*half $frac(1,2)$/*LF_LATEX:XGZyYWN7MX17Mn0=*/*");
        CHECK(LF::to_plain_text(LF::parse_document(markup)) == "half frac(1,2)");
        CHECK(round_trip(markup) == markup);

        markup = LF::encode_tree(line({text("2 * 3 = "), pill}));
        CHECK(LF::to_plain_text(LF::parse_document(markup)) == "2 * 3 = frac(1,2)");
        CHECK(round_trip(markup) == markup);
    }
    TEST_CASE("Rendered tree") {
        std::string markup = "*a* #text(fill: rgb(\"#123456\"))[_b_]\n- c";
        LF::RichNode first = LF::render_tree(LF::parse_document(markup));
        LF::RichNode second = LF::render_tree(LF::parse_document(LF::encode_tree(first)));
        CHECK(LF::render_html(first) == LF::render_html(second));
    }
}

TEST_SUITE("Renderer") {
    TEST_CASE("HTML") {
        CHECK(LF::markup_to_html("") == "<div><br/></div>");
        CHECK(LF::markup_to_html("<b>") == "<div>&lt;b&gt;</div>");
        CHECK(LF::render_html(LF::render_tree(LF::parse_document("x"))) == "<div><div>x</div></div>");
        CHECK(LF::escape_html("'&'") == "&#39;&amp;&#39;");
    }
}
