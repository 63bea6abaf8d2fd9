#pragma once
#include <string>

#include "definitions.h"

namespace LF {
    /**
     * Encodes the children of an editable tree root into inline markup
     *
     * `div`/`p` children become lines, `ol`/`ul` children one line
     * per `li` with a `N. ` or `- ` prefix. Leading and trailing
     * blank lines are removed.
    */
    std::string encode_tree(const RichNode& root, const Options& options = Options());

    /**
     * Encodes one node without the block pass, hard breaks
     * come out as LF
    */
    std::string encode_inline(const RichNode& node, const Options& options = Options());

    /**
     * Converts `rgb(r, g, b)` to `#rrggbb`, channels clamped to [0, 255]
     *
     * Any other color is returned unchanged
    */
    std::string rgb_to_hex(const std::string& color);

    /* Turns LFs and literal `\n` sequences into ` #linebreak() ` */
    std::string inline_to_single_line(const std::string& text);
}
