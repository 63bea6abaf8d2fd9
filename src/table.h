#pragma once
#include <string>
#include <vector>

namespace LF {
    enum TABLE_STYLE {
        STYLE_NORMAL = 0,
        STYLE_THREE_LINE
    };

    const char* table_style_to_name(TABLE_STYLE style);

    /**
     * A cell of a table grid
     *
     * rowspan and colspan use 0 for "not set", which counts as 1.
     * A hidden cell is covered by the span of another cell and
     * renders nothing.
     */
    struct TableCell {
        std::string content;
        int rowspan = 0;
        int colspan = 0;
        bool hidden = false;

        bool operator==(const TableCell& other) const;
        bool operator!=(const TableCell& other) const { return !(*this == other); }
    };

    struct TablePayload {
        std::string caption;
        TABLE_STYLE style = STYLE_NORMAL;
        int rows = 1;
        int cols = 1;
        std::vector<std::vector<TableCell>> cells;

        bool operator==(const TablePayload& other) const;
        bool operator!=(const TablePayload& other) const { return !(*this == other); }
    };

    /* Effective spans, never below 1 */
    int row_span(const TableCell& cell);
    int col_span(const TableCell& cell);

    /* Empty table of rows x cols cells, dimensions at least 1 */
    TablePayload default_table(int rows = 1, int cols = 1);

    /**
     * Resizes the grid to exactly rows x cols (padding with empty cells
     * or truncating), cuts spans at the grid edges, then repairs the
     * spans of hidden cells that no master covers
     *
     * A hidden cell is covered when the nearest visible cell on its left
     * reaches it with its colspan, or the nearest visible cell above with
     * its rowspan. Otherwise the colspan of the nearest visible cell on the
     * left is extended, and only if there is none the rowspan of the nearest
     * visible cell above.
    */
    TablePayload normalize_table(const TablePayload& payload);

    /* Normalized copy with every span and hidden flag cleared */
    TablePayload flatten_merges(const TablePayload& payload);

    /**
     * Merges the rectangle spanned by (r1, c1) and (r2, c2)
     *
     * The top-left cell becomes the master and receives the non-empty
     * trimmed contents of the rectangle joined by LF. If a cell of the
     * rectangle is hidden or already spans more than one cell, or if a
     * corner is out of range, the normalized payload is returned unchanged.
    */
    TablePayload merge_rect(const TablePayload& payload, int r1, int c1, int r2, int c2);

    /**
     * Clears the spans of the cell at (r, c) and shows the cells it covered
     *
     * The contents of the uncovered cells are not restored.
    */
    TablePayload unmerge_cell(const TablePayload& payload, int r, int c);

    /**
     * Changes the grid dimensions
     *
     * Merges are flattened, contents of the overlapping cells
     * are kept along with the caption and style
    */
    TablePayload resize_table(const TablePayload& payload, int rows, int cols);

    /* Sets the content of a visible cell, hidden or out of range cells are left as is */
    TablePayload set_cell_content(const TablePayload& payload, int r, int c, const std::string& content);
}
