#include "math_codec.h"
#include "parse_commons.h"

namespace LF {
    static const char BASE64_ALPHABET[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    static int base64_value(char ch) {
        if (ch >= 'A' && ch <= 'Z')
            return ch - 'A';
        if (ch >= 'a' && ch <= 'z')
            return ch - 'a' + 26;
        if (ch >= '0' && ch <= '9')
            return ch - '0' + 52;
        if (ch == '+')
            return 62;
        if (ch == '/')
            return 63;
        return -1;
    }

    std::string base64_encode(const std::string& bytes) {
        ZoneScoped;
        std::string out;
        out.reserve(((bytes.length() + 2) / 3) * 4);
        size_t i = 0;
        for (;i + 2 < bytes.length();i += 3) {
            unsigned int chunk = ((unsigned char)bytes[i] << 16) | ((unsigned char)bytes[i + 1] << 8) | (unsigned char)bytes[i + 2];
            out += BASE64_ALPHABET[(chunk >> 18) & 0x3F];
            out += BASE64_ALPHABET[(chunk >> 12) & 0x3F];
            out += BASE64_ALPHABET[(chunk >> 6) & 0x3F];
            out += BASE64_ALPHABET[chunk & 0x3F];
        }
        size_t rest = bytes.length() - i;
        if (rest == 1) {
            unsigned int chunk = (unsigned char)bytes[i] << 16;
            out += BASE64_ALPHABET[(chunk >> 18) & 0x3F];
            out += BASE64_ALPHABET[(chunk >> 12) & 0x3F];
            out += "==";
        }
        else if (rest == 2) {
            unsigned int chunk = ((unsigned char)bytes[i] << 16) | ((unsigned char)bytes[i + 1] << 8);
            out += BASE64_ALPHABET[(chunk >> 18) & 0x3F];
            out += BASE64_ALPHABET[(chunk >> 12) & 0x3F];
            out += BASE64_ALPHABET[(chunk >> 6) & 0x3F];
            out += '=';
        }
        return out;
    }

    bool base64_decode(const std::string& input, std::string& out) {
        ZoneScoped;
        std::string clean;
        clean.reserve(input.length());
        for (char ch : input) {
            if (ISWHITESPACE_(ch))
                continue;
            clean += ch;
        }
        if (clean.length() % 4 == 0 && !clean.empty() && clean.back() == '=') {
            clean.pop_back();
            if (clean.back() == '=')
                clean.pop_back();
        }
        if (clean.length() % 4 == 1)
            return false;

        std::string decoded;
        decoded.reserve(clean.length() * 3 / 4);
        unsigned int buffer = 0;
        int bits = 0;
        for (char ch : clean) {
            int value = base64_value(ch);
            if (value < 0)
                return false;
            buffer = (buffer << 6) | (unsigned int)value;
            bits += 6;
            if (bits >= 8) {
                bits -= 8;
                decoded += (char)((buffer >> bits) & 0xFF);
            }
        }
        out = decoded;
        return true;
    }

    bool is_valid_utf8(const std::string& bytes) {
        size_t i = 0;
        size_t n = bytes.length();
        while (i < n) {
            unsigned char c = (unsigned char)bytes[i];
            int len = 0;
            unsigned int cp = 0;
            if (c < 0x80) {
                i++;
                continue;
            }
            else if ((c & 0xE0) == 0xC0) {
                len = 2;
                cp = c & 0x1F;
            }
            else if ((c & 0xF0) == 0xE0) {
                len = 3;
                cp = c & 0x0F;
            }
            else if ((c & 0xF8) == 0xF0) {
                len = 4;
                cp = c & 0x07;
            }
            else
                return false;
            if (i + len > n)
                return false;
            for (int k = 1;k < len;k++) {
                unsigned char cc = (unsigned char)bytes[i + k];
                if ((cc & 0xC0) != 0x80)
                    return false;
                cp = (cp << 6) | (cc & 0x3F);
            }
            if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000))
                return false;
            if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
                return false;
            i += len;
        }
        return true;
    }

    std::string encode_math(const std::string& native_expr, const std::string& latex_expr) {
        std::string out = "$" + native_expr + "$";
        if (!latex_expr.empty()) {
            out += LATEX_MARKER;
            out += base64_encode(latex_expr);
            out += COMMENT_CLOSE;
        }
        return out;
    }

    OFFSET skip_math(Context* ctx, OFFSET off, OFFSET end) {
        OFFSET close = find_unescaped(ctx, off + 1, end, '$');
        if (close == -1)
            return -1;
        OFFSET next = close + 1;
        if (match_token(ctx, next, end, LATEX_MARKER)) {
            OFFSET payload_end = find_token(ctx, next + (OFFSET)strlen(LATEX_MARKER), end, COMMENT_CLOSE);
            if (payload_end != -1)
                next = payload_end + (OFFSET)strlen(COMMENT_CLOSE);
        }
        return next;
    }

    OFFSET decode_math(Context* ctx, OFFSET off, OFFSET end, InlineSpan* span) {
        ZoneScoped;
        OFFSET close = find_unescaped(ctx, off + 1, end, '$');
        if (close == -1)
            return -1;

        auto detail = std::make_shared<SpanMathDetail>();
        detail->native_expr = to_string(ctx, off + 1, close);
        OFFSET next = close + 1;

        /* Optional lossless copy of the LaTeX source */
        if (match_token(ctx, next, end, LATEX_MARKER)) {
            OFFSET payload_beg = next + (OFFSET)strlen(LATEX_MARKER);
            OFFSET payload_end = find_token(ctx, payload_beg, end, COMMENT_CLOSE);
            if (payload_end != -1) {
                std::string decoded;
                if (base64_decode(to_string(ctx, payload_beg, payload_end), decoded) && is_valid_utf8(decoded)) {
                    detail->latex_expr = decoded;
                }
                else {
                    PLOGW << "lf:math dropping undecodable LaTeX payload after $" << detail->native_expr << "$";
                }
                next = payload_end + (OFFSET)strlen(COMMENT_CLOSE);
            }
        }

        if (!detail->latex_expr.empty()) {
            detail->format = MATH_LATEX;
        }
        else {
            detail->format = MATH_NATIVE;
            if (ctx->transpiler)
                detail->latex_expr = ctx->transpiler->to_latex(detail->native_expr);
            else
                detail->latex_expr = detail->native_expr;
        }
        if (ctx->ids)
            detail->id = ctx->ids->next();

        span->type = SPAN_LATEXMATH;
        span->text.clear();
        span->children.clear();
        span->detail = detail;
        return next;
    }

    OFFSET decode_math(const std::string& text, OFFSET off, InlineSpan* span, const Options& options) {
        if (off < 0 || off >= (OFFSET)text.length() || text[off] != '$')
            return -1;
        IdentityTranspiler identity;
        CounterIdGenerator ids;
        Context ctx;
        setup_context(&ctx, text, options, &identity, &ids);
        return decode_math(&ctx, off, (OFFSET)ctx.size, span);
    }
}
