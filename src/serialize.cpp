#include "serialize.h"
#include "math_codec.h"
#include "parse_commons.h"
#include "profiling.h"

#include <vector>
#include <cstdlib>

namespace LF {
    /* Splits at the LFs that are not inside a styled run, the way the line splitter reads them */
    static std::vector<std::string> split_top_level_lines(const std::string& text) {
        std::vector<std::string> pieces;
        std::string current;
        const OFFSET size = (OFFSET)text.length();
        OFFSET off = 0;
        while (off < size) {
            if (text[off] == '\n') {
                pieces.push_back(current);
                current.clear();
                off++;
                continue;
            }
            if (text[off] == '#') {
                Boundaries bounds;
                if (match_styled_run(text, off, &bounds) == RUN_UNTERMINATED) {
                    current.append(text, off, std::string::npos);
                    break;
                }
                current.append(text, off, bounds.post - off);
                off = bounds.post;
                continue;
            }
            current += text[off];
            off++;
        }
        pieces.push_back(current);
        return pieces;
    }

    /* Wraps every line of inner so that no delimiter pair spans a line break */
    static std::string wrap_lines(const std::string& inner, const char* delimiter) {
        std::vector<std::string> pieces = split_top_level_lines(inner);
        for (auto& piece : pieces) {
            if (!piece.empty())
                piece = delimiter + piece + delimiter;
        }
        return join(pieces, "\n");
    }

    static std::string style_color(const std::string& style) {
        std::string color;
        size_t pos = 0;
        while (pos <= style.length()) {
            size_t end = style.find(';', pos);
            if (end == std::string::npos)
                end = style.length();
            std::string decl = style.substr(pos, end - pos);
            size_t colon = decl.find(':');
            if (colon != std::string::npos && trim(decl.substr(0, colon)) == "color") {
                std::string value = trim(decl.substr(colon + 1));
                if (!value.empty())
                    color = value;
            }
            pos = end + 1;
        }
        return color;
    }

    std::string rgb_to_hex(const std::string& color) {
        if (!starts_with(color, 0, "rgb"))
            return color;
        std::vector<long> channels;
        size_t i = 0;
        while (i < color.length() && channels.size() < 3) {
            if (color[i] >= '0' && color[i] <= '9') {
                size_t j = i;
                while (j < color.length() && color[j] >= '0' && color[j] <= '9' && j - i < 9)
                    j++;
                channels.push_back(std::strtol(color.substr(i, j - i).c_str(), nullptr, 10));
                while (j < color.length() && color[j] >= '0' && color[j] <= '9')
                    j++;
                i = j;
            }
            else {
                i++;
            }
        }
        if (channels.size() < 3)
            return color;

        static const char digits[] = "0123456789abcdef";
        std::string hex = "#";
        for (long channel : channels) {
            if (channel > 255)
                channel = 255;
            hex += digits[(channel >> 4) & 0xF];
            hex += digits[channel & 0xF];
        }
        return hex;
    }

    static std::string encode_math_pill(const RichNode& node, const Options& options) {
        std::string native = trim(get_attribute(node, "data-native-expr"));
        std::string latex = trim(get_attribute(node, "data-latex-expr"));
        if (native.empty() && !latex.empty()) {
            IdentityTranspiler identity;
            const MathTranspiler* transpiler = options.transpiler ? options.transpiler : &identity;
            native = transpiler->to_native(latex);
        }
        return encode_math(native, latex);
    }

    static std::string encode_children(const RichNode& node, const Options& options) {
        std::string out;
        for (auto& child : node.children)
            out += encode_inline(child, options);
        return out;
    }

    std::string encode_inline(const RichNode& node, const Options& options) {
        if (node.type == NODE_TEXT)
            return node.text;

        const std::string tag = to_lower(node.tag);
        if (tag == "br")
            return "\n";
        if (tag == "li")
            return encode_children(node, options);
        if (has_class(node, MATH_PILL_CLASS))
            return encode_math_pill(node, options);

        std::string inner = encode_children(node, options);
        if (tag == "strong" || tag == "b")
            return wrap_lines(inner, "*");
        if (tag == "em" || tag == "i")
            return wrap_lines(inner, "_");
        if (tag == "s" || tag == "strike" || tag == "del")
            return STRIKE_OPENER + inner + "]";

        std::string style = to_lower(get_attribute(node, "style"));
        std::string color = style_color(style);
        if (tag == "font" && has_attribute(node, "color"))
            color = trim(get_attribute(node, "color"));

        std::string out = inner;
        if (!color.empty())
            out = std::string(TEXT_OPENER) + "fill: rgb(\"" + rgb_to_hex(color) + "\"))[" + out + "]";
        if (style.find("line-through") != std::string::npos)
            out = STRIKE_OPENER + out + "]";
        return out;
    }

    /* Strict positive integer, anything else gives 1 */
    static int parse_list_start(const std::string& value) {
        std::string text = trim(value);
        if (text.empty() || text.length() > 9)
            return 1;
        for (char c : text) {
            if (c < '0' || c > '9')
                return 1;
        }
        int start = std::atoi(text.c_str());
        return start > 0 ? start : 1;
    }

    static std::string replace_newline_runs(const std::string& text) {
        std::string out;
        size_t i = 0;
        while (i < text.length()) {
            if (text[i] == '\n') {
                while (i < text.length() && text[i] == '\n')
                    i++;
                out += " ";
                out += LINEBREAK_TOKEN;
                out += " ";
                continue;
            }
            out += text[i++];
        }
        return out;
    }

    static std::string normalize_block(const RichNode& node, const Options& options);

    static std::string normalize_list(const RichNode& node, const Options& options) {
        bool ordered = to_lower(node.tag) == "ol";
        int number = ordered ? parse_list_start(get_attribute(node, "start")) : 1;
        std::vector<std::string> items;
        for (auto& child : node.children) {
            if (child.type != NODE_ELEMENT || to_lower(child.tag) != "li")
                continue;
            std::string inner;
            for (auto& grandchild : child.children)
                inner += normalize_block(grandchild, options);
            std::string item = trim(replace_newline_runs(inner));
            std::string prefix = ordered ? std::to_string(number++) + ". " : "- ";
            items.push_back(trim_end(prefix + item));
        }
        return "\n" + join(items, "\n");
    }

    static std::string normalize_block(const RichNode& node, const Options& options) {
        if (node.type != NODE_ELEMENT)
            return encode_inline(node, options);

        const std::string tag = to_lower(node.tag);
        if (tag == "ol" || tag == "ul")
            return normalize_list(node, options);

        if (tag == "div" || tag == "p") {
            std::string text;
            for (auto& child : node.children)
                text += normalize_block(child, options);
            /* A trailing br only holds the line open */
            const RichNode* last = node.children.empty() ? nullptr : &node.children.back();
            if (last && last->type == NODE_ELEMENT && to_lower(last->tag) == "br"
                && !text.empty() && text.back() == '\n')
                text.pop_back();
            return "\n" + text;
        }
        return encode_inline(node, options);
    }

    std::string encode_tree(const RichNode& root, const Options& options) {
        ZoneScoped;
        std::string raw;
        for (auto& child : root.children)
            raw += normalize_block(child, options);

        size_t beg = raw.find_first_not_of('\n');
        if (beg == std::string::npos)
            return "";
        size_t end = raw.find_last_not_of('\n');
        return raw.substr(beg, end - beg + 1);
    }

    std::string inline_to_single_line(const std::string& text) {
        std::string unescaped;
        for (size_t i = 0; i < text.length(); i++) {
            if (text[i] == '\\' && i + 1 < text.length() && text[i + 1] == 'n') {
                unescaped += '\n';
                i++;
            }
            else {
                unescaped += text[i];
            }
        }

        std::string out;
        for (size_t i = 0; i < unescaped.length(); i++) {
            if (unescaped[i] == '\r' && i + 1 < unescaped.length() && unescaped[i + 1] == '\n')
                continue;
            if (unescaped[i] == '\n') {
                out += " ";
                out += LINEBREAK_TOKEN;
                out += " ";
            }
            else {
                out += unescaped[i];
            }
        }
        return out;
    }
}
