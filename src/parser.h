#pragma once
#include <string>
#include <functional>
#include <memory>
#include <vector>
#include <unordered_map>

#include "definitions.h"


// The callback interface is inspired from http://github.com/mity/md4c
namespace LF {
    /**
     * Decodes inline markup into text paragraphs and lists
    */
    Document parse_document(const std::string& markup, const Options& options = Options());

    /**
     * Decodes inline markup and reports the document to parser
     *
     * Returns false if a callback asked to stop
    */
    bool parse(const std::string& markup, const Parser* parser, const Options& options = Options());

    /* Reports an already decoded document to parser */
    bool emit_document(const Document& doc, const Parser* parser);

    /**
     * Visible text of the document, one line per line,
     * formulas replaced by their native expression
    */
    std::string to_plain_text(const Document& doc);
};
