#pragma once
#include <string>
#include <vector>

#include "internal.h"
#include "definitions.h"

namespace LF {
    /**
     * Location of a styled run `#text(args)[body]` or `#strike[body]`
     *
     * pre: first char of the wrapper (`#`)
     * beg: first char of the body
     * end: closing `]` of the body
     * post: first char after the run
     */
    struct Boundaries {
        OFFSET pre = 0;
        OFFSET beg = 0;
        OFFSET end = 0;
        OFFSET post = 0;
    };

    enum RUN_MATCH {
        /* Not a styled run, scanning can resume at bounds.post */
        RUN_NONE = 0,
        RUN_FOUND,
        /* A wrapper was opened but never closed */
        RUN_UNTERMINATED
    };

    /**
     * Finds the closing delimiter matching text[start] (assumed to be `open`)
     *
     * Returns the index where the nesting depth goes back to zero,
     * or -1 if the end is reached first
    */
    OFFSET find_matching(const std::string& text, OFFSET start, char open, char close);
    OFFSET find_matching(Context* ctx, OFFSET start, OFFSET end, char open, char close);

    /**
     * Returns the index of the first `ch` in [off, end) not escaped
     * by a backslash, or -1
    */
    OFFSET find_unescaped(Context* ctx, OFFSET off, OFFSET end, char ch);

    /* Returns the index of the first occurence of token in [off, end), or -1 */
    OFFSET find_token(Context* ctx, OFFSET off, OFFSET end, const char* token);

    /* True if token is found at off */
    bool match_token(Context* ctx, OFFSET off, OFFSET end, const char* token);
    bool starts_with(const std::string& text, OFFSET off, const char* token);

    /**
     * Skips until the first non-whitespace character or end
    */
    void skip_whitespace(Context* ctx, OFFSET* off, OFFSET end);

    /**
     * Recognizes a styled run starting at off
     *
     * Only `#text(` and `#strike[` are considered, the body must
     * follow the argument list immediately
    */
    RUN_MATCH match_styled_run(const std::string& text, OFFSET off, Boundaries* bounds);

    /**
     * True if the trimmed text is exactly one styled run, in which case
     * prefix receives the wrapper up to and including `[` and body the
     * content between the brackets
    */
    bool split_styled_run(const std::string& text, std::string& prefix, std::string& body);

    std::string to_string(Context* ctx, OFFSET start, OFFSET end);
    std::string trim(const std::string& str);
    std::string trim_end(const std::string& str);
    std::string to_lower(const std::string& str);
    std::string join(const std::vector<std::string>& parts, const std::string& separator);
}
