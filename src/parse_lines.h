#pragma once
#include <string>
#include <vector>

#include "definitions.h"

namespace LF {
    /* Consecutive raw lines of the same kind */
    struct RawSegment {
        LINE_KIND kind = LINE_TEXT;
        std::vector<std::string> lines;
    };

    /**
     * Splits inline markup into logical lines
     *
     * `#linebreak()` and LF end a line, except inside the body of a styled
     * run. A run whose body holds `#linebreak()` tokens is cut into one
     * re-wrapped run per piece. Never returns an empty vector.
    */
    std::vector<std::string> split_into_lines(const std::string& markup);

    /**
     * Leading text a reader sees: the trimmed body of a line made of
     * one styled run, otherwise the trimmed line
    */
    std::string visible_leading_text(const std::string& line);

    LINE_KIND classify_line(const std::string& line);

    std::vector<RawSegment> segment_lines(const std::vector<std::string>& lines);

    /**
     * Removes the list marker of a line of the given kind, inside
     * the styled run wrapper when there is one
    */
    std::string strip_list_prefix(const std::string& line, LINE_KIND kind);

    /* Number of the first item of an ordered list, at least 1 */
    int list_start(const std::string& first_line);

    /**
     * Kind shared by every non-empty line of content,
     * LINE_TEXT if they differ or if there is no such line
    */
    LINE_KIND detect_list_kind(const std::string& content);
}
