#pragma once

#include <unordered_map>
#include <vector>
#include <functional>
#include <string>
#include <memory>

namespace LF {
    typedef unsigned int SIZE;
    typedef int OFFSET;
    typedef char CHAR;

#define RECURSE_LIMIT 32

    /* ==================
     * Inline wire tokens
     * ================== */

    static const char LINEBREAK_TOKEN[] = "#linebreak()";
    static const char STRIKE_OPENER[] = "#strike[";
    static const char TEXT_OPENER[] = "#text(";
    static const char LATEX_MARKER[] = "/*LF_LATEX:";
    static const char COMMENT_CLOSE[] = "*/";
    static const char DEFAULT_COLOR[] = "#000000";

    /* Class of the element that stands for an inline formula in the editable tree */
    static const char MATH_PILL_CLASS[] = "inline-math-pill";
    static const char MATH_PILL_GLYPH[] = "\xE2\x88\x91";

    /* A block is a line-level container of the decoded document */
    enum BLOCK_TYPE {
        BLOCK_DOC = 0,

        BLOCK_P,

        BLOCK_UL,
        BLOCK_OL,
        BLOCK_LI
    };

    /*
     * A sequence of spans constitute a line
     */
    enum SPAN_TYPE {
        SPAN_TEXT = 0,
        SPAN_BR,
        SPAN_STRONG,
        SPAN_EM,
        SPAN_DEL,
        SPAN_COLOR,
        SPAN_LATEXMATH
    };

    enum TEXT_TYPE {
        TEXT_NORMAL = 0,
        /* Native expression of an inline formula */
        TEXT_LATEX,
        /* Hard line break, carries no text */
        TEXT_BR
    };

    enum LINE_KIND {
        LINE_TEXT = 0,
        LINE_BULLET,
        LINE_ORDERED
    };

    enum MATH_FORMAT {
        MATH_LATEX = 0,
        MATH_NATIVE
    };

    const char* block_to_name(BLOCK_TYPE type);
    const char* block_to_html(BLOCK_TYPE type);
    const char* span_to_name(SPAN_TYPE type);
    const char* span_to_html(SPAN_TYPE type);
    const char* text_to_name(TEXT_TYPE type);
    const char* line_kind_to_name(LINE_KIND kind);
    const char* math_format_to_name(MATH_FORMAT format);

    typedef std::unordered_map<std::string, std::string> Attributes;

    /* ======================
     * Block and span details
     * ====================== */

    struct BlockDetail {
        virtual ~BlockDetail() = default;
    };
    typedef std::shared_ptr<BlockDetail> BlockDetailPtr;

    struct BlockOlDetail: public BlockDetail {
        int start = 1;
    };

    struct BlockLiDetail: public BlockDetail {
        /* Displayed number for ordered items, 0 for bullets */
        int number = 0;
    };

    struct SpanDetail {
        virtual ~SpanDetail() = default;
    };
    typedef std::shared_ptr<SpanDetail> SpanDetailPtr;

    struct SpanColorDetail: public SpanDetail {
        std::string color;
    };

    /**
     * native_expr is what sits between the `$` delimiters and is always
     * present. latex_expr is the original authoring source, either carried
     * by the LF_LATEX comment or derived from native_expr.
     */
    struct SpanMathDetail: public SpanDetail {
        std::string id;
        MATH_FORMAT format = MATH_NATIVE;
        std::string native_expr;
        std::string latex_expr;
        bool display_mode = false;
    };

    /* ===============
     * Decoded content
     * =============== */

    struct InlineSpan {
        SPAN_TYPE type = SPAN_TEXT;
        /* Only for SPAN_TEXT */
        std::string text;
        std::vector<InlineSpan> children;
        SpanDetailPtr detail;
    };

    struct Line {
        std::vector<InlineSpan> spans;
    };

    struct Segment {
        LINE_KIND kind = LINE_TEXT;
        /* First number of an ordered list */
        int start = 1;
        std::vector<Line> lines;
    };

    typedef std::vector<Segment> Document;

    /* ==================
     * Editable text tree
     * ================== */

    enum NODE_TYPE {
        NODE_TEXT = 0,
        NODE_ELEMENT
    };

    struct RichNode {
        NODE_TYPE type = NODE_ELEMENT;
        /* Lower case tag name of an element */
        std::string tag;
        /* Content of a text node */
        std::string text;
        Attributes attributes;
        std::vector<RichNode> children;
    };

    RichNode make_text_node(const std::string& text);
    RichNode make_element(const std::string& tag, const Attributes& attributes = {}, const std::vector<RichNode>& children = {});

    /* Returns the attribute value or an empty string */
    std::string get_attribute(const RichNode& node, const std::string& name);
    bool has_attribute(const RichNode& node, const std::string& name);
    /* True if the whitespace separated `class` attribute contains name */
    bool has_class(const RichNode& node, const std::string& name);

    /* ==================
     * External services
     * ================== */

    /**
     * Converter between LaTeX and the native math syntax of the markup.
     * Conversions are best effort and may be lossy in both directions.
     */
    class MathTranspiler {
    public:
        virtual ~MathTranspiler() = default;
        virtual std::string to_native(const std::string& latex) const = 0;
        virtual std::string to_latex(const std::string& native) const = 0;
    };

    /* Returns its input unchanged in both directions */
    class IdentityTranspiler: public MathTranspiler {
    public:
        std::string to_native(const std::string& latex) const override;
        std::string to_latex(const std::string& native) const override;
    };

    class IdGenerator {
    public:
        virtual ~IdGenerator() = default;
        virtual std::string next() = 0;
    };

    /* Produces `<prefix>1`, `<prefix>2`, ... */
    class CounterIdGenerator: public IdGenerator {
    public:
        explicit CounterIdGenerator(const std::string& prefix = "im-");
        std::string next() override;
    private:
        std::string m_prefix;
        unsigned long m_counter = 0;
    };

    /**
     * Options shared by the decoding and encoding entry points
     *
     * transpiler
     *     used to derive the missing side of an inline formula,
     *     nullptr behaves like IdentityTranspiler
     * ids
     *     source of inline formula ids, nullptr means a fresh
     *     CounterIdGenerator for each call
     */
    struct Options {
        const MathTranspiler* transpiler = nullptr;
        IdGenerator* ids = nullptr;
    };

    /* =================
     * Parsing functions
     * ================= */

    typedef std::function<bool(BLOCK_TYPE type, BlockDetailPtr detail)> BlockFct;
    typedef std::function<bool(BLOCK_TYPE type)> LeaveBlockFct;
    typedef std::function<bool(SPAN_TYPE type, SpanDetailPtr detail)> SpanFct;
    typedef std::function<bool(SPAN_TYPE type)> LeaveSpanFct;
    typedef std::function<bool(TEXT_TYPE type, const std::string& text)> TextFct;

    struct Parser {
        BlockFct enter_block;
        LeaveBlockFct leave_block;
        SpanFct enter_span;
        LeaveSpanFct leave_span;
        TextFct text;
    };

}
