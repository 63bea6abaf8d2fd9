#pragma once
#include <string>

#include "definitions.h"

namespace LF {
    /**
     * Builds the editable tree of a decoded document
     *
     * The root is a `div`. Text lines become `div` children, lists become
     * `ol`/`ul` with one `li` per line. Empty lines hold a single `br`
     * so that a cursor can be placed on them.
    */
    RichNode render_tree(const Document& doc);

    /* Serializes a node and its descendants, attributes in sorted order */
    std::string render_html(const RichNode& node);
    std::string render_inner_html(const RichNode& node);

    std::string escape_html(const std::string& text);

    /* Decodes markup and renders the children of the root as HTML */
    std::string markup_to_html(const std::string& markup, const Options& options = Options());
}
