/*
 * Part of this code is taken and inspired from MD4C: Markdown parser for C, http://github.com/mity/md4c
 * The licence for md4c is given below:
 *
 * Copyright (c) 2016-2020 Martin Mitas
 *
 * Permission is hereby granted, free of charge, to any person obtaining a
 * copy of this software and associated documentation files (the "Software"),
 * to deal in the Software without restriction, including without limitation
 * the rights to use, copy, modify, merge, publish, distribute, sublicense,
 * and/or sell copies of the Software, and to permit persons to whom the
 * Software is furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS
 * OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING
 * FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS
 * IN THE SOFTWARE.
 */

#include "parser.h"
#include "internal.h"
#include "definitions.h"
#include "parse_lines.h"
#include "parse_spans.h"
#include "parse_commons.h"

#include <memory>

namespace LF {
    static inline bool call_enter_block(const Parser* parser, BLOCK_TYPE type, BlockDetailPtr detail) {
        return !parser->enter_block || parser->enter_block(type, detail);
    }
    static inline bool call_leave_block(const Parser* parser, BLOCK_TYPE type) {
        return !parser->leave_block || parser->leave_block(type);
    }
    static inline bool call_enter_span(const Parser* parser, SPAN_TYPE type, SpanDetailPtr detail) {
        return !parser->enter_span || parser->enter_span(type, detail);
    }
    static inline bool call_leave_span(const Parser* parser, SPAN_TYPE type) {
        return !parser->leave_span || parser->leave_span(type);
    }
    static inline bool call_text(const Parser* parser, TEXT_TYPE type, const std::string& text) {
        return !parser->text || parser->text(type, text);
    }

    static bool enter_span(const Parser* parser, const InlineSpan& span) {
        bool ret = true;
        switch (span.type) {
        case SPAN_TEXT:
            CHECK_AND_RET(call_text(parser, TEXT_NORMAL, span.text));
            break;
        case SPAN_BR:
            CHECK_AND_RET(call_text(parser, TEXT_BR, ""));
            break;
        case SPAN_LATEXMATH:
        {
            auto info = std::static_pointer_cast<SpanMathDetail>(span.detail);
            CHECK_AND_RET(call_enter_span(parser, span.type, span.detail));
            CHECK_AND_RET(call_text(parser, TEXT_LATEX, info ? info->native_expr : ""));
            CHECK_AND_RET(call_leave_span(parser, span.type));
            break;
        }
        default:
            CHECK_AND_RET(call_enter_span(parser, span.type, span.detail));
            for (auto& child : span.children) {
                CHECK_AND_RET(enter_span(parser, child));
            }
            CHECK_AND_RET(call_leave_span(parser, span.type));
        }
        return ret;
    abort:
        return ret;
    }

    static bool enter_line(const Parser* parser, BLOCK_TYPE type, BlockDetailPtr detail, const Line& line) {
        bool ret = true;
        CHECK_AND_RET(call_enter_block(parser, type, detail));
        for (auto& span : line.spans) {
            CHECK_AND_RET(enter_span(parser, span));
        }
        CHECK_AND_RET(call_leave_block(parser, type));
        return ret;
    abort:
        return ret;
    }

    static bool enter_segment(const Parser* parser, const Segment& seg) {
        bool ret = true;
        int number = seg.start;
        if (seg.kind == LINE_TEXT) {
            for (auto& line : seg.lines) {
                CHECK_AND_RET(enter_line(parser, BLOCK_P, nullptr, line));
            }
            return ret;
        }

        if (seg.kind == LINE_ORDERED) {
            auto detail = std::make_shared<BlockOlDetail>();
            detail->start = seg.start;
            CHECK_AND_RET(call_enter_block(parser, BLOCK_OL, detail));
        }
        else {
            CHECK_AND_RET(call_enter_block(parser, BLOCK_UL, nullptr));
        }
        for (auto& line : seg.lines) {
            auto li = std::make_shared<BlockLiDetail>();
            li->number = (seg.kind == LINE_ORDERED) ? number++ : 0;
            CHECK_AND_RET(enter_line(parser, BLOCK_LI, li, line));
        }
        CHECK_AND_RET(call_leave_block(parser, seg.kind == LINE_ORDERED ? BLOCK_OL : BLOCK_UL));
        return ret;
    abort:
        return ret;
    }

    bool emit_document(const Document& doc, const Parser* parser) {
        bool ret = true;
        CHECK_AND_RET(call_enter_block(parser, BLOCK_DOC, nullptr));
        for (auto& seg : doc) {
            CHECK_AND_RET(enter_segment(parser, seg));
        }
        CHECK_AND_RET(call_leave_block(parser, BLOCK_DOC));
        return ret;
    abort:
        return ret;
    }

    Document parse_document(const std::string& markup, const Options& options) {
        ZoneScoped;
        /* Formula ids stay unique across the lines of one document */
        IdentityTranspiler identity;
        CounterIdGenerator ids;
        Options resolved;
        resolved.transpiler = options.transpiler ? options.transpiler : &identity;
        resolved.ids = options.ids ? options.ids : &ids;

        Document doc;
        std::vector<std::string> lines = split_into_lines(markup);
        for (auto& raw : segment_lines(lines)) {
            Segment seg;
            seg.kind = raw.kind;
            if (raw.kind == LINE_ORDERED)
                seg.start = list_start(raw.lines.front());
            for (auto& text : raw.lines) {
                Line line;
                line.spans = parse_spans(strip_list_prefix(text, raw.kind), resolved);
                seg.lines.push_back(line);
            }
            doc.push_back(seg);
        }
        return doc;
    }

    bool parse(const std::string& markup, const Parser* parser, const Options& options) {
        ZoneScoped;
        Document doc = parse_document(markup, options);
        return emit_document(doc, parser);
    }

    static void append_plain_text(const std::vector<InlineSpan>& spans, std::string& out) {
        for (auto& span : spans) {
            switch (span.type) {
            case SPAN_TEXT:
                out += span.text;
                break;
            case SPAN_BR:
                out += '\n';
                break;
            case SPAN_LATEXMATH:
            {
                auto info = std::static_pointer_cast<SpanMathDetail>(span.detail);
                if (info)
                    out += info->native_expr;
                break;
            }
            default:
                append_plain_text(span.children, out);
            }
        }
    }

    std::string to_plain_text(const Document& doc) {
        std::string out;
        bool first = true;
        for (auto& seg : doc) {
            for (auto& line : seg.lines) {
                if (!first)
                    out += '\n';
                first = false;
                append_plain_text(line.spans, out);
            }
        }
        return out;
    }
}
