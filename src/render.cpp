#include "render.h"
#include "parser.h"
#include "profiling.h"

#include <map>
#include <vector>

namespace LF {
    static RichNode* push_child(std::vector<RichNode*>& stack, RichNode node) {
        RichNode* parent = stack.back();
        parent->children.push_back(std::move(node));
        RichNode* child = &parent->children.back();
        stack.push_back(child);
        return child;
    }

    static RichNode math_pill(SpanMathDetail* info) {
        RichNode pill = make_element("span");
        pill.attributes["class"] = MATH_PILL_CLASS;
        pill.attributes["contenteditable"] = "false";
        if (info) {
            pill.attributes["data-inline-math-id"] = info->id;
            pill.attributes["data-format"] = math_format_to_name(info->format);
            pill.attributes["data-native-expr"] = info->native_expr;
            pill.attributes["data-latex-expr"] = info->latex_expr;
        }
        return pill;
    }

    RichNode render_tree(const Document& doc) {
        ZoneScoped;
        RichNode root = make_element("div");
        /* Only the innermost node is ever modified, the pointers stay valid */
        std::vector<RichNode*> stack;
        stack.push_back(&root);

        Parser parser;
        parser.enter_block = [&](BLOCK_TYPE b_type, BlockDetailPtr detail) -> bool {
            if (b_type == BLOCK_DOC)
                return true;
            RichNode* node = push_child(stack, make_element(block_to_html(b_type)));
            if (b_type == BLOCK_OL) {
                auto info = std::static_pointer_cast<BlockOlDetail>(detail);
                if (info && info->start != 1)
                    node->attributes["start"] = std::to_string(info->start);
            }
            return true;
        };
        parser.leave_block = [&](BLOCK_TYPE b_type) -> bool {
            if (b_type == BLOCK_DOC)
                return true;
            RichNode* node = stack.back();
            if ((b_type == BLOCK_P || b_type == BLOCK_LI) && node->children.empty())
                node->children.push_back(make_element("br"));
            stack.pop_back();
            return true;
        };
        parser.enter_span = [&](SPAN_TYPE s_type, SpanDetailPtr detail) -> bool {
            RichNode node = make_element(span_to_html(s_type));
            if (s_type == SPAN_DEL) {
                node.attributes["style"] = "text-decoration: line-through;";
            }
            else if (s_type == SPAN_COLOR) {
                auto info = std::static_pointer_cast<SpanColorDetail>(detail);
                node.attributes["style"] = "color: " + (info ? info->color : std::string(DEFAULT_COLOR)) + ";";
            }
            else if (s_type == SPAN_LATEXMATH) {
                node = math_pill(static_cast<SpanMathDetail*>(detail.get()));
            }
            push_child(stack, std::move(node));
            return true;
        };
        parser.leave_span = [&](SPAN_TYPE) -> bool {
            stack.pop_back();
            return true;
        };
        parser.text = [&](TEXT_TYPE t_type, const std::string& text) -> bool {
            RichNode* parent = stack.back();
            if (t_type == TEXT_BR)
                parent->children.push_back(make_element("br"));
            else if (t_type == TEXT_LATEX)
                parent->children.push_back(make_text_node(MATH_PILL_GLYPH));
            else
                parent->children.push_back(make_text_node(text));
            return true;
        };

        emit_document(doc, &parser);
        return root;
    }

    std::string escape_html(const std::string& text) {
        std::string out;
        out.reserve(text.length());
        for (char c : text) {
            switch (c) {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            case '"':
                out += "&quot;";
                break;
            case '\'':
                out += "&#39;";
                break;
            default:
                out += c;
            }
        }
        return out;
    }

    static void write_node(const RichNode& node, std::string& out) {
        if (node.type == NODE_TEXT) {
            out += escape_html(node.text);
            return;
        }
        out += "<" + node.tag;
        std::map<std::string, std::string> ordered_attrs(node.attributes.begin(), node.attributes.end());
        for (auto& pair : ordered_attrs) {
            out += " " + pair.first + "=\"" + escape_html(pair.second) + "\"";
        }
        if (node.tag == "br") {
            out += "/>";
            return;
        }
        out += ">";
        for (auto& child : node.children)
            write_node(child, out);
        out += "</" + node.tag + ">";
    }

    std::string render_html(const RichNode& node) {
        std::string out;
        write_node(node, out);
        return out;
    }

    std::string render_inner_html(const RichNode& node) {
        std::string out;
        for (auto& child : node.children)
            write_node(child, out);
        return out;
    }

    std::string markup_to_html(const std::string& markup, const Options& options) {
        ZoneScoped;
        return render_inner_html(render_tree(parse_document(markup, options)));
    }
}
