#include "table.h"
#include "parse_commons.h"
#include "profiling.h"

#include <plog/Log.h>
#include <algorithm>

namespace LF {
    const char* table_style_to_name(TABLE_STYLE style) {
        switch (style) {
        case STYLE_NORMAL:
            return "normal";
        case STYLE_THREE_LINE:
            return "three-line";
        };
        return "";
    }

    bool TableCell::operator==(const TableCell& other) const {
        return content == other.content && rowspan == other.rowspan
            && colspan == other.colspan && hidden == other.hidden;
    }

    bool TablePayload::operator==(const TablePayload& other) const {
        return caption == other.caption && style == other.style
            && rows == other.rows && cols == other.cols && cells == other.cells;
    }

    int row_span(const TableCell& cell) {
        return std::max(1, cell.rowspan);
    }
    int col_span(const TableCell& cell) {
        return std::max(1, cell.colspan);
    }

    TablePayload default_table(int rows, int cols) {
        TablePayload payload;
        payload.rows = std::max(1, rows);
        payload.cols = std::max(1, cols);
        payload.cells.assign(payload.rows, std::vector<TableCell>(payload.cols));
        return payload;
    }

    static bool in_range(const TablePayload& payload, int r, int c) {
        return r >= 0 && c >= 0 && r < payload.rows && c < payload.cols;
    }

    static bool is_covered(const std::vector<std::vector<TableCell>>& cells, int r, int c) {
        for (int cc = c - 1; cc >= 0; cc--) {
            const TableCell& left = cells[r][cc];
            if (left.hidden)
                continue;
            if (col_span(left) > c - cc)
                return true;
            break;
        }
        for (int rr = r - 1; rr >= 0; rr--) {
            const TableCell& above = cells[rr][c];
            if (above.hidden)
                continue;
            if (row_span(above) > r - rr)
                return true;
            break;
        }
        return false;
    }

    /* A master never reaches past the last row or column */
    static void clamp_spans(std::vector<std::vector<TableCell>>& cells, int rows, int cols) {
        for (int r = 0; r < rows; r++) {
            for (int c = 0; c < cols; c++) {
                TableCell& cell = cells[r][c];
                if (cell.rowspan > rows - r)
                    cell.rowspan = rows - r;
                if (cell.colspan > cols - c)
                    cell.colspan = cols - c;
            }
        }
    }

    static void infer_missing_spans(std::vector<std::vector<TableCell>>& cells, int rows, int cols) {
        for (int r = 0; r < rows; r++) {
            for (int c = 0; c < cols; c++) {
                if (!cells[r][c].hidden || is_covered(cells, r, c))
                    continue;

                int left_col = -1;
                for (int cc = c - 1; cc >= 0; cc--) {
                    if (!cells[r][cc].hidden) {
                        left_col = cc;
                        break;
                    }
                }
                if (left_col >= 0) {
                    TableCell& master = cells[r][left_col];
                    int needed = c - left_col + 1;
                    if (needed > col_span(master))
                        master.colspan = needed;
                    continue;
                }

                int above_row = -1;
                for (int rr = r - 1; rr >= 0; rr--) {
                    if (!cells[rr][c].hidden) {
                        above_row = rr;
                        break;
                    }
                }
                if (above_row >= 0) {
                    TableCell& master = cells[above_row][c];
                    int needed = r - above_row + 1;
                    if (needed > row_span(master))
                        master.rowspan = needed;
                }
            }
        }
    }

    TablePayload normalize_table(const TablePayload& payload) {
        ZoneScoped;
        TablePayload n = default_table(payload.rows, payload.cols);
        n.caption = payload.caption;
        n.style = payload.style;
        for (int r = 0; r < n.rows && r < (int)payload.cells.size(); r++) {
            const auto& row = payload.cells[r];
            for (int c = 0; c < n.cols && c < (int)row.size(); c++)
                n.cells[r][c] = row[c];
        }
        clamp_spans(n.cells, n.rows, n.cols);
        infer_missing_spans(n.cells, n.rows, n.cols);
        return n;
    }

    TablePayload flatten_merges(const TablePayload& payload) {
        TablePayload n = normalize_table(payload);
        for (auto& row : n.cells) {
            for (auto& cell : row) {
                cell.rowspan = 0;
                cell.colspan = 0;
                cell.hidden = false;
            }
        }
        return n;
    }

    TablePayload merge_rect(const TablePayload& payload, int r1, int c1, int r2, int c2) {
        ZoneScoped;
        TablePayload n = normalize_table(payload);
        if (!in_range(n, r1, c1) || !in_range(n, r2, c2)) {
            PLOGD << "merge of (" << r1 << ", " << c1 << ")-(" << r2 << ", " << c2 << ") out of range";
            return n;
        }
        int top = std::min(r1, r2);
        int left = std::min(c1, c2);
        int bottom = std::max(r1, r2);
        int right = std::max(c1, c2);

        for (int r = top; r <= bottom; r++) {
            for (int c = left; c <= right; c++) {
                const TableCell& cell = n.cells[r][c];
                if (cell.hidden || row_span(cell) > 1 || col_span(cell) > 1) {
                    PLOGD << "merge rejected, cell (" << r << ", " << c << ") is already merged";
                    return n;
                }
            }
        }

        std::string content;
        for (int r = top; r <= bottom; r++) {
            for (int c = left; c <= right; c++) {
                std::string txt = trim(n.cells[r][c].content);
                if (txt.empty())
                    continue;
                if (!content.empty())
                    content += '\n';
                content += txt;
            }
        }

        TableCell& master = n.cells[top][left];
        master.content = content;
        master.rowspan = bottom - top + 1;
        master.colspan = right - left + 1;
        master.hidden = false;

        for (int r = top; r <= bottom; r++) {
            for (int c = left; c <= right; c++) {
                if (r == top && c == left)
                    continue;
                TableCell& cell = n.cells[r][c];
                cell.hidden = true;
                cell.content.clear();
                cell.rowspan = 0;
                cell.colspan = 0;
            }
        }
        return n;
    }

    TablePayload unmerge_cell(const TablePayload& payload, int r, int c) {
        TablePayload n = normalize_table(payload);
        if (!in_range(n, r, c)) {
            PLOGD << "unmerge of (" << r << ", " << c << ") out of range";
            return n;
        }
        TableCell& cell = n.cells[r][c];
        int rs = row_span(cell);
        int cs = col_span(cell);
        if (rs == 1 && cs == 1) {
            PLOGD << "unmerge ignored, cell (" << r << ", " << c << ") is not merged";
            return n;
        }
        cell.rowspan = 0;
        cell.colspan = 0;
        cell.hidden = false;
        for (int rr = r; rr - r < rs && rr < n.rows; rr++) {
            for (int cc = c; cc - c < cs && cc < n.cols; cc++) {
                if (rr == r && cc == c)
                    continue;
                n.cells[rr][cc].hidden = false;
            }
        }
        return n;
    }

    TablePayload resize_table(const TablePayload& payload, int rows, int cols) {
        TablePayload flat = flatten_merges(payload);
        TablePayload n = default_table(rows, cols);
        n.caption = flat.caption;
        n.style = flat.style;
        for (int r = 0; r < n.rows && r < flat.rows; r++) {
            for (int c = 0; c < n.cols && c < flat.cols; c++)
                n.cells[r][c].content = flat.cells[r][c].content;
        }
        return n;
    }

    TablePayload set_cell_content(const TablePayload& payload, int r, int c, const std::string& content) {
        TablePayload n = normalize_table(payload);
        if (!in_range(n, r, c) || n.cells[r][c].hidden) {
            PLOGD << "cell (" << r << ", " << c << ") is not editable";
            return n;
        }
        n.cells[r][c].content = content;
        return n;
    }
}
