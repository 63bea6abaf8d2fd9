#include "parse_spans.h"
#include "parse_commons.h"
#include "math_codec.h"

namespace LF {
    static void flush_text(std::vector<InlineSpan>& out, std::string& acc) {
        if (acc.empty())
            return;
        if (!out.empty() && out.back().type == SPAN_TEXT) {
            out.back().text += acc;
        }
        else {
            InlineSpan span;
            span.type = SPAN_TEXT;
            span.text = acc;
            out.push_back(span);
        }
        acc.clear();
    }

    static inline bool match_word_ci(Context* ctx, OFFSET off, OFFSET end, const char* word) {
        OFFSET len = (OFFSET)strlen(word);
        if (off + len > end)
            return false;
        for (OFFSET i = 0;i < len;i++) {
            char ch = CH(off + i);
            if (ISUPPER_(ch))
                ch = (char)(ch - 'A' + 'a');
            if (ch != word[i])
                return false;
        }
        return true;
    }

    static inline bool expect_char(Context* ctx, OFFSET* off, OFFSET end, char ch) {
        skip_whitespace(ctx, off, end);
        if (*off >= end || CH(*off) != ch)
            return false;
        (*off)++;
        return true;
    }

    /**
     * Matches `fill : rgb ( "<color>" )` exactly at *off, whitespaces allowed
     * between the tokens. Advances off after the closing parenthesis.
    */
    static bool scan_fill_rgb(Context* ctx, OFFSET* off, OFFSET end, std::string& color) {
        OFFSET cursor = *off;
        if (!match_word_ci(ctx, cursor, end, "fill"))
            return false;
        cursor += 4;
        if (!expect_char(ctx, &cursor, end, ':'))
            return false;
        skip_whitespace(ctx, &cursor, end);
        if (!match_word_ci(ctx, cursor, end, "rgb"))
            return false;
        cursor += 3;
        if (!expect_char(ctx, &cursor, end, '('))
            return false;
        if (!expect_char(ctx, &cursor, end, '"'))
            return false;
        OFFSET color_beg = cursor;
        while (cursor < end && CH(cursor) != '"')
            cursor++;
        if (cursor >= end || cursor == color_beg)
            return false;
        std::string found = to_string(ctx, color_beg, cursor);
        cursor++;
        if (!expect_char(ctx, &cursor, end, ')'))
            return false;
        color = found;
        *off = cursor;
        return true;
    }

    bool extract_fill_color(Context* ctx, OFFSET beg, OFFSET end, std::string& color) {
        for (OFFSET off = beg;off < end;off++) {
            OFFSET cursor = off;
            if (scan_fill_rgb(ctx, &cursor, end, color))
                return true;
        }
        return false;
    }

    /**
     * Legacy colour syntax `#text(fill: rgb("#RRGGBB"), [body])`
     *
     * The body ends at the first `]` followed by optional whitespace
     * and the closing `)`.
    */
    static bool match_legacy_color(Context* ctx, OFFSET off, OFFSET end, std::string& color, OFFSET* body_beg, OFFSET* body_end, OFFSET* post) {
        OFFSET cursor = off + (OFFSET)strlen(TEXT_OPENER);
        skip_whitespace(ctx, &cursor, end);
        if (!scan_fill_rgb(ctx, &cursor, end, color))
            return false;
        if (!expect_char(ctx, &cursor, end, ','))
            return false;
        if (!expect_char(ctx, &cursor, end, '['))
            return false;
        *body_beg = cursor;
        for (OFFSET close = cursor;close < end;close++) {
            if (CH(close) != ']')
                continue;
            OFFSET after = close + 1;
            skip_whitespace(ctx, &after, end);
            if (after < end && CH(after) == ')') {
                *body_end = close;
                *post = after + 1;
                return true;
            }
        }
        return false;
    }

    /**
     * Closing `*` or `_` of the run opened before off
     *
     * A formula with its LaTeX comment is skipped as a whole, the `*`
     * of the comment never closes a run.
    */
    static OFFSET find_run_close(Context* ctx, OFFSET off, OFFSET end, char delimiter) {
        while (off < end) {
            if (CH(off) == '\\') {
                off += 2;
                continue;
            }
            if (CH(off) == delimiter)
                return off;
            if (CH(off) == '$') {
                OFFSET next = skip_math(ctx, off, end);
                if (next != -1) {
                    off = next;
                    continue;
                }
            }
            off++;
        }
        return -1;
    }

    /**
     * Tries to decode a `#strike[...]` or `#text(...)` wrapper at off
     *
     * Returns the offset after the wrapper, or off if nothing was decoded
    */
    static OFFSET parse_wrapper(Context* ctx, OFFSET off, OFFSET end, std::vector<InlineSpan>& out, std::string& acc) {
        ZoneScoped;
        if (match_token(ctx, off, end, STRIKE_OPENER)) {
            OFFSET bracket_start = off + (OFFSET)strlen(STRIKE_OPENER) - 1;
            OFFSET bracket_end = find_matching(ctx, bracket_start, end, '[', ']');
            if (bracket_end == -1) {
                PLOGD << "lf:spans unterminated strike at " << off;
                return off;
            }
            flush_text(out, acc);
            InlineSpan span;
            span.type = SPAN_DEL;
            parse_spans(ctx, bracket_start + 1, bracket_end, span.children);
            out.push_back(span);
            return bracket_end + 1;
        }

        if (!match_token(ctx, off, end, TEXT_OPENER))
            return off;

        OFFSET paren_start = off + (OFFSET)strlen(TEXT_OPENER) - 1;
        OFFSET paren_end = find_matching(ctx, paren_start, end, '(', ')');
        if (paren_end == -1) {
            PLOGD << "lf:spans unterminated text arguments at " << off;
            return off;
        }

        auto detail = std::make_shared<SpanColorDetail>();
        OFFSET body_beg = -1;
        OFFSET body_end = -1;
        OFFSET post = off;
        if (paren_end + 1 < end && CH(paren_end + 1) == '[') {
            OFFSET bracket_end = find_matching(ctx, paren_end + 1, end, '[', ']');
            if (bracket_end != -1) {
                if (!extract_fill_color(ctx, paren_start + 1, paren_end, detail->color))
                    detail->color = DEFAULT_COLOR;
                body_beg = paren_end + 2;
                body_end = bracket_end;
                post = bracket_end + 1;
            }
        }
        if (body_beg == -1 && !match_legacy_color(ctx, off, end, detail->color, &body_beg, &body_end, &post)) {
            PLOGD << "lf:spans text call without body at " << off;
            return off;
        }

        flush_text(out, acc);
        InlineSpan span;
        span.type = SPAN_COLOR;
        span.detail = detail;
        parse_spans(ctx, body_beg, body_end, span.children);
        out.push_back(span);
        return post;
    }

    bool parse_spans(Context* ctx, OFFSET beg, OFFSET end, std::vector<InlineSpan>& out) {
        ZoneScoped;
        std::string acc;

        if (ctx->depth >= RECURSE_LIMIT) {
            PLOGD << "lf:spans nesting limit reached, keeping text as is";
            acc = to_string(ctx, beg, end);
            flush_text(out, acc);
            return true;
        }
        ctx->depth++;

        for (OFFSET off = beg;off < end;) {
            char ch = CH(off);

            if (match_token(ctx, off, end, LINEBREAK_TOKEN) || ch == '\n') {
                flush_text(out, acc);
                InlineSpan span;
                span.type = SPAN_BR;
                out.push_back(span);
                off += (ch == '\n') ? 1 : (OFFSET)strlen(LINEBREAK_TOKEN);
                continue;
            }
            else if (ch == '\\' && off + 1 < end) {
                acc += CH(off + 1);
                off += 2;
                continue;
            }
            else if (ch == '#') {
                OFFSET next = parse_wrapper(ctx, off, end, out, acc);
                if (next != off) {
                    off = next;
                    continue;
                }
            }
            else if (ch == '*' || ch == '_') {
                OFFSET close = find_run_close(ctx, off + 1, end, ch);
                if (close != -1) {
                    flush_text(out, acc);
                    InlineSpan span;
                    span.type = (ch == '*') ? SPAN_STRONG : SPAN_EM;
                    parse_spans(ctx, off + 1, close, span.children);
                    out.push_back(span);
                    off = close + 1;
                    continue;
                }
                PLOGD << "lf:spans unterminated " << ch << " at " << off;
            }
            else if (ch == '$') {
                InlineSpan span;
                OFFSET next = decode_math(ctx, off, end, &span);
                if (next != -1) {
                    flush_text(out, acc);
                    out.push_back(span);
                    off = next;
                    continue;
                }
                PLOGD << "lf:spans unterminated formula at " << off;
            }

            acc += ch;
            off++;
        }
        flush_text(out, acc);

        ctx->depth--;
        return true;
    }

    std::vector<InlineSpan> parse_spans(const std::string& line, const Options& options) {
        IdentityTranspiler identity;
        CounterIdGenerator ids;
        Context ctx;
        setup_context(&ctx, line, options, &identity, &ids);

        std::vector<InlineSpan> spans;
        parse_spans(&ctx, 0, (OFFSET)ctx.size, spans);
        return spans;
    }
}
