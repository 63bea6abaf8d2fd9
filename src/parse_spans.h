#pragma once
#include <string>
#include <vector>

#include "definitions.h"
#include "internal.h"

namespace LF {
    /**
     * Decodes the inline spans of [beg, end) and appends them to out
     *
     * Unterminated markers are kept as literal text
    */
    bool parse_spans(Context* ctx, OFFSET beg, OFFSET end, std::vector<InlineSpan>& out);

    /* Decodes a whole line of inline markup */
    std::vector<InlineSpan> parse_spans(const std::string& line, const Options& options = Options());

    /**
     * Looks for `fill: rgb("<color>")` inside [beg, end), case insensitive
     *
     * Returns true and fills color if found
    */
    bool extract_fill_color(Context* ctx, OFFSET beg, OFFSET end, std::string& color);
}
