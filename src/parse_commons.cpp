#include "parse_commons.h"
#include "internal.h"

namespace LF {
    OFFSET find_matching(const std::string& text, OFFSET start, char open, char close) {
        Context ctx;
        ctx.text = text.c_str();
        ctx.size = (SIZE)text.length();
        ctx.transpiler = nullptr;
        ctx.ids = nullptr;
        return find_matching(&ctx, start, (OFFSET)ctx.size, open, close);
    }

    OFFSET find_matching(Context* ctx, OFFSET start, OFFSET end, char open, char close) {
        ZoneScoped;
        if (start < 0)
            return -1;
        int depth = 0;
        for (OFFSET off = start;off < end && off < (OFFSET)ctx->size;off++) {
            if (CH(off) == open)
                depth++;
            else if (CH(off) == close) {
                depth--;
                if (depth == 0)
                    return off;
            }
        }
        return -1;
    }

    OFFSET find_unescaped(Context* ctx, OFFSET off, OFFSET end, char ch) {
        while (off < end) {
            if (CH(off) == '\\') {
                off += 2;
                continue;
            }
            if (CH(off) == ch)
                return off;
            off++;
        }
        return -1;
    }

    OFFSET find_token(Context* ctx, OFFSET off, OFFSET end, const char* token) {
        for (;off < end;off++) {
            if (match_token(ctx, off, end, token))
                return off;
        }
        return -1;
    }

    bool match_token(Context* ctx, OFFSET off, OFFSET end, const char* token) {
        OFFSET len = (OFFSET)strlen(token);
        if (off < 0 || off + len > end)
            return false;
        return strncmp(STR(off), token, len) == 0;
    }

    bool starts_with(const std::string& text, OFFSET off, const char* token) {
        if (off < 0 || off > (OFFSET)text.length())
            return false;
        return text.compare(off, strlen(token), token) == 0;
    }

    void skip_whitespace(Context* ctx, OFFSET* off, OFFSET end) {
        while (*off < end) {
            if (!ISWHITESPACE(*off))
                break;
            (*off)++;
        }
    }

    RUN_MATCH match_styled_run(const std::string& text, OFFSET off, Boundaries* bounds) {
        ZoneScoped;
        bounds->pre = off;
        OFFSET bracket_start = -1;
        if (starts_with(text, off, STRIKE_OPENER)) {
            bracket_start = off + (OFFSET)strlen(STRIKE_OPENER) - 1;
        }
        else if (starts_with(text, off, TEXT_OPENER)) {
            OFFSET paren_start = off + (OFFSET)strlen(TEXT_OPENER) - 1;
            OFFSET paren_end = find_matching(text, paren_start, '(', ')');
            if (paren_end == -1)
                return RUN_UNTERMINATED;
            if (paren_end + 1 >= (OFFSET)text.length() || text[paren_end + 1] != '[') {
                bounds->post = paren_end + 1;
                return RUN_NONE;
            }
            bracket_start = paren_end + 1;
        }
        else {
            bounds->post = off + 1;
            return RUN_NONE;
        }

        OFFSET bracket_end = find_matching(text, bracket_start, '[', ']');
        if (bracket_end == -1)
            return RUN_UNTERMINATED;
        bounds->beg = bracket_start + 1;
        bounds->end = bracket_end;
        bounds->post = bracket_end + 1;
        return RUN_FOUND;
    }

    bool split_styled_run(const std::string& text, std::string& prefix, std::string& body) {
        std::string trimmed = trim(text);
        Boundaries bounds;
        if (match_styled_run(trimmed, 0, &bounds) != RUN_FOUND)
            return false;
        if (bounds.post != (OFFSET)trimmed.length())
            return false;
        prefix = trimmed.substr(0, bounds.beg);
        body = trimmed.substr(bounds.beg, bounds.end - bounds.beg);
        return true;
    }

    std::string to_string(Context* ctx, OFFSET start, OFFSET end) {
        if (start >= end)
            return "";
        return std::string(STR(start), end - start);
    }

    std::string trim(const std::string& str) {
        size_t beg = 0;
        size_t end = str.length();
        while (beg < end && ISWHITESPACE_(str[beg]))
            beg++;
        while (end > beg && ISWHITESPACE_(str[end - 1]))
            end--;
        return str.substr(beg, end - beg);
    }

    std::string trim_end(const std::string& str) {
        size_t end = str.length();
        while (end > 0 && ISWHITESPACE_(str[end - 1]))
            end--;
        return str.substr(0, end);
    }

    std::string to_lower(const std::string& str) {
        std::string out(str);
        for (auto& ch : out) {
            if (ISUPPER_(ch))
                ch = (char)(ch - 'A' + 'a');
        }
        return out;
    }

    std::string join(const std::vector<std::string>& parts, const std::string& separator) {
        std::string out;
        for (size_t i = 0;i < parts.size();i++) {
            if (i > 0)
                out += separator;
            out += parts[i];
        }
        return out;
    }
}
