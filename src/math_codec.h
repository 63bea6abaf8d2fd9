#pragma once
#include <string>

#include "definitions.h"
#include "internal.h"

namespace LF {
    /**
     * Standard base64 (RFC 4648) with `=` padding
    */
    std::string base64_encode(const std::string& bytes);

    /**
     * Decodes standard base64, ASCII whitespace is ignored
     *
     * Returns false (out is left untouched) on characters outside
     * the alphabet or on an impossible length
    */
    bool base64_decode(const std::string& input, std::string& out);

    /* True if bytes is well formed UTF-8 (no overlongs, no surrogates) */
    bool is_valid_utf8(const std::string& bytes);

    /**
     * Encodes an inline formula as `$native$`, followed by
     * `/\*LF_LATEX:<base64>*\/` when latex is not empty
    */
    std::string encode_math(const std::string& native_expr, const std::string& latex_expr);

    /**
     * Decodes the inline formula starting at CH(off) == '$'
     *
     * Returns the offset after the formula (and its LaTeX comment if any),
     * or -1 if no closing `$` is found before end. span is filled only on success.
    */
    OFFSET decode_math(Context* ctx, OFFSET off, OFFSET end, InlineSpan* span);

    /**
     * Offset after the formula starting at CH(off) == '$' and its LaTeX
     * comment, or -1 if it is not closed before end
    */
    OFFSET skip_math(Context* ctx, OFFSET off, OFFSET end);

    /* Convenience version working on a whole string */
    OFFSET decode_math(const std::string& text, OFFSET off, InlineSpan* span, const Options& options = Options());
}
