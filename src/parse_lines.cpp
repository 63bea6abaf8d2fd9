#include "parse_lines.h"
#include "parse_commons.h"
#include "internal.h"

#include <climits>

namespace LF {
    static std::string normalize_newlines(const std::string& text) {
        std::string out;
        out.reserve(text.length());
        for (size_t i = 0;i < text.length();i++) {
            if (text[i] == '\r' && i + 1 < text.length() && text[i + 1] == '\n')
                continue;
            out += text[i];
        }
        return out;
    }

    /**
     * Cuts the body [beg, end) of a run at the `#linebreak()` tokens that
     * are not nested in another bracket pair. Pieces are trimmed.
     *
     * Returns false if there is no such token
    */
    static bool split_body_at_breaks(const std::string& text, OFFSET beg, OFFSET end, std::vector<std::string>& pieces) {
        const OFFSET token_len = (OFFSET)strlen(LINEBREAK_TOKEN);
        int depth = 0;
        bool found = false;
        OFFSET piece_beg = beg;
        for (OFFSET off = beg;off < end;) {
            char ch = text[off];
            if (ch == '[')
                depth++;
            else if (ch == ']')
                depth--;
            else if (depth == 0 && starts_with(text, off, LINEBREAK_TOKEN) && off + token_len <= end) {
                pieces.push_back(trim(text.substr(piece_beg, off - piece_beg)));
                off += token_len;
                piece_beg = off;
                found = true;
                continue;
            }
            off++;
        }
        if (!found)
            return false;
        pieces.push_back(trim(text.substr(piece_beg, end - piece_beg)));
        return true;
    }

    static bool ends_with_boundary(const std::string& text) {
        if (!text.empty() && text.back() == '\n')
            return true;
        std::string trimmed = trim_end(text);
        size_t len = strlen(LINEBREAK_TOKEN);
        return trimmed.length() >= len && trimmed.compare(trimmed.length() - len, len, LINEBREAK_TOKEN) == 0;
    }

    std::vector<std::string> split_into_lines(const std::string& markup) {
        ZoneScoped;
        std::string text = normalize_newlines(markup);
        const OFFSET size = (OFFSET)text.length();
        std::vector<std::string> lines;
        std::string acc; /* Accumulator */

        auto flush = [&]() {
            lines.push_back(trim(acc));
            acc.clear();
        };

        OFFSET off = 0;
        while (off < size) {
            if (starts_with(text, off, LINEBREAK_TOKEN)) {
                flush();
                off += (OFFSET)strlen(LINEBREAK_TOKEN);
                continue;
            }
            if (text[off] == '\n') {
                flush();
                off++;
                continue;
            }
            if (text[off] == '#') {
                Boundaries bounds;
                RUN_MATCH match = match_styled_run(text, off, &bounds);
                if (match == RUN_UNTERMINATED) {
                    PLOGD << "lf:lines unterminated run at " << off << ", keeping the rest as text";
                    acc.append(text, off, std::string::npos);
                    break;
                }
                if (match == RUN_FOUND) {
                    std::vector<std::string> pieces;
                    if (split_body_at_breaks(text, bounds.beg, bounds.end, pieces)) {
                        std::string prefix = text.substr(bounds.pre, bounds.beg - bounds.pre);
                        for (size_t i = 0;i < pieces.size();i++) {
                            if (i > 0)
                                flush();
                            acc += prefix + pieces[i] + "]";
                        }
                    }
                    else {
                        acc.append(text, bounds.pre, bounds.post - bounds.pre);
                    }
                    off = bounds.post;
                    continue;
                }
                acc.append(text, off, bounds.post - off);
                off = bounds.post;
                continue;
            }
            acc += text[off];
            off++;
        }

        if (!trim(acc).empty())
            flush();
        /* A trailing empty line only survives if the input ends with a boundary */
        while (!lines.empty() && lines.back().empty() && !ends_with_boundary(text)) {
            lines.pop_back();
        }
        if (lines.empty())
            lines.push_back("");
        return lines;
    }

    std::string visible_leading_text(const std::string& line) {
        std::string prefix;
        std::string body;
        if (split_styled_run(line, prefix, body))
            return trim(body);
        return trim(line);
    }

    /* Length of the `N. ` / `N) ` marker at the start of str, 0 if none */
    static size_t ordered_marker_length(const std::string& str) {
        size_t i = 0;
        while (i < str.length() && ISWHITESPACE_(str[i]))
            i++;
        size_t digits_beg = i;
        while (i < str.length() && ISDIGIT_(str[i]))
            i++;
        if (i == digits_beg || i >= str.length() || (str[i] != '.' && str[i] != ')'))
            return 0;
        i++;
        if (i < str.length() && !ISWHITESPACE_(str[i]))
            return 0;
        while (i < str.length() && ISWHITESPACE_(str[i]))
            i++;
        return i;
    }

    /* Length of the `- ` / `* ` marker at the start of str, 0 if none */
    static size_t bullet_marker_length(const std::string& str) {
        size_t i = 0;
        while (i < str.length() && ISWHITESPACE_(str[i]))
            i++;
        if (i >= str.length() || (str[i] != '-' && str[i] != '*'))
            return 0;
        i++;
        if (i < str.length() && !ISWHITESPACE_(str[i]))
            return 0;
        while (i < str.length() && ISWHITESPACE_(str[i]))
            i++;
        return i;
    }

    LINE_KIND classify_line(const std::string& line) {
        std::string inner = visible_leading_text(line);
        if (bullet_marker_length(inner) > 0)
            return LINE_BULLET;
        if (ordered_marker_length(inner) > 0)
            return LINE_ORDERED;
        return LINE_TEXT;
    }

    std::vector<RawSegment> segment_lines(const std::vector<std::string>& lines) {
        ZoneScoped;
        std::vector<RawSegment> segments;
        for (auto& line : lines) {
            LINE_KIND kind = classify_line(line);
            if (segments.empty() || segments.back().kind != kind) {
                RawSegment seg;
                seg.kind = kind;
                segments.push_back(seg);
            }
            segments.back().lines.push_back(line);
        }
        return segments;
    }

    static std::string strip_marker(const std::string& str, LINE_KIND kind) {
        size_t len = 0;
        if (kind == LINE_ORDERED)
            len = ordered_marker_length(str);
        else if (kind == LINE_BULLET)
            len = bullet_marker_length(str);
        return str.substr(len);
    }

    std::string strip_list_prefix(const std::string& line, LINE_KIND kind) {
        if (kind == LINE_TEXT)
            return line;
        std::string prefix;
        std::string body;
        if (split_styled_run(line, prefix, body))
            return prefix + trim(strip_marker(body, kind)) + "]";
        return trim(strip_marker(trim(line), kind));
    }

    int list_start(const std::string& first_line) {
        std::string visible = visible_leading_text(first_line);
        int number = 0;
        bool has_digits = false;
        for (size_t i = 0;i < visible.length() && ISDIGIT_(visible[i]);i++) {
            has_digits = true;
            int digit = visible[i] - '0';
            if (number > (INT_MAX - digit) / 10) {
                number = INT_MAX;
                break;
            }
            number = number * 10 + digit;
        }
        if (!has_digits || number < 1)
            return 1;
        return number;
    }

    LINE_KIND detect_list_kind(const std::string& content) {
        std::vector<std::string> non_empty;
        std::string current;
        std::string text = normalize_newlines(content);
        for (size_t i = 0;i <= text.length();i++) {
            if (i == text.length() || text[i] == '\n') {
                std::string trimmed = trim(current);
                if (!trimmed.empty())
                    non_empty.push_back(trimmed);
                current.clear();
            }
            else {
                current += text[i];
            }
        }
        if (non_empty.empty())
            return LINE_TEXT;

        bool all_bullets = true;
        bool all_ordered = true;
        for (auto& line : non_empty) {
            if (bullet_marker_length(line) == 0)
                all_bullets = false;
            if (ordered_marker_length(line) == 0)
                all_ordered = false;
        }
        if (all_bullets)
            return LINE_BULLET;
        if (all_ordered)
            return LINE_ORDERED;
        return LINE_TEXT;
    }
}
