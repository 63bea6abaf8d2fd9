#include "definitions.h"

namespace LF {
    const char* block_to_name(BLOCK_TYPE type) {
        switch (type) {
        case BLOCK_DOC:
            return "DOCUMENT";
        case BLOCK_P:
            return "B_P";
        case BLOCK_UL:
            return "B_UL";
        case BLOCK_OL:
            return "B_OL";
        case BLOCK_LI:
            return "B_LI";
        };
        return "";
    }
    const char* block_to_html(BLOCK_TYPE type) {
        switch (type) {
        case BLOCK_DOC:
            return "doc";
        case BLOCK_P:
            return "div";
        case BLOCK_UL:
            return "ul";
        case BLOCK_OL:
            return "ol";
        case BLOCK_LI:
            return "li";
        };
        return "";
    }
    const char* span_to_name(SPAN_TYPE type) {
        switch (type) {
        case SPAN_TEXT:
            return "S_TEXT";
        case SPAN_BR:
            return "S_BR";
        case SPAN_STRONG:
            return "S_STRONG";
        case SPAN_EM:
            return "S_EM";
        case SPAN_DEL:
            return "S_DEL";
        case SPAN_COLOR:
            return "S_COLOR";
        case SPAN_LATEXMATH:
            return "S_LATEXMATH";
        };
        return "";
    }
    const char* span_to_html(SPAN_TYPE type) {
        switch (type) {
        case SPAN_TEXT:
            return "";
        case SPAN_BR:
            return "br";
        case SPAN_STRONG:
            return "strong";
        case SPAN_EM:
            return "em";
        case SPAN_DEL:
        case SPAN_COLOR:
        case SPAN_LATEXMATH:
            return "span";
        };
        return "";
    }
    const char* text_to_name(TEXT_TYPE type) {
        switch (type) {
        case TEXT_NORMAL:
            return "T_NORMAL";
        case TEXT_LATEX:
            return "T_LATEX";
        case TEXT_BR:
            return "T_BR";
        };
        return "";
    }
    const char* line_kind_to_name(LINE_KIND kind) {
        switch (kind) {
        case LINE_TEXT:
            return "text";
        case LINE_BULLET:
            return "bullet";
        case LINE_ORDERED:
            return "ordered";
        };
        return "";
    }
    const char* math_format_to_name(MATH_FORMAT format) {
        switch (format) {
        case MATH_LATEX:
            return "latex";
        case MATH_NATIVE:
            return "native";
        };
        return "";
    }

    RichNode make_text_node(const std::string& text) {
        RichNode node;
        node.type = NODE_TEXT;
        node.text = text;
        return node;
    }
    RichNode make_element(const std::string& tag, const Attributes& attributes, const std::vector<RichNode>& children) {
        RichNode node;
        node.type = NODE_ELEMENT;
        node.tag = tag;
        node.attributes = attributes;
        node.children = children;
        return node;
    }

    std::string get_attribute(const RichNode& node, const std::string& name) {
        auto it = node.attributes.find(name);
        if (it == node.attributes.end())
            return "";
        return it->second;
    }
    bool has_attribute(const RichNode& node, const std::string& name) {
        return node.attributes.find(name) != node.attributes.end();
    }
    bool has_class(const RichNode& node, const std::string& name) {
        auto it = node.attributes.find("class");
        if (it == node.attributes.end() || name.empty())
            return false;
        const std::string& classes = it->second;
        size_t pos = 0;
        while (pos < classes.length()) {
            while (pos < classes.length() && (classes[pos] == ' ' || classes[pos] == '\t'))
                pos++;
            size_t end = pos;
            while (end < classes.length() && classes[end] != ' ' && classes[end] != '\t')
                end++;
            if (end > pos && classes.compare(pos, end - pos, name) == 0)
                return true;
            pos = end;
        }
        return false;
    }

    std::string IdentityTranspiler::to_native(const std::string& latex) const {
        return latex;
    }
    std::string IdentityTranspiler::to_latex(const std::string& native) const {
        return native;
    }

    CounterIdGenerator::CounterIdGenerator(const std::string& prefix): m_prefix(prefix) {
    }
    std::string CounterIdGenerator::next() {
        m_counter++;
        return m_prefix + std::to_string(m_counter);
    }
}
