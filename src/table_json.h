#pragma once
#include <string>

#include <json/json.h>

#include "table.h"

namespace LF {
    /* Largest number of rows or columns accepted from a storage record */
    static const int MAX_TABLE_DIMENSION = 1000;

    /**
     * Reads a table storage record
     *
     * Accepts `{caption?, style?, rows, cols, cells: [[{content, rowspan?,
     * colspan?, hidden?}]]}` and the older `{rows: [["text", ...], ...]}`.
     * A record that cannot be read gives default_table(rows, cols).
     * The result is normalized.
    */
    TablePayload parse_table_json(const std::string& text, int rows = 1, int cols = 1);
    TablePayload table_from_value(const Json::Value& value, int rows = 1, int cols = 1);

    /* Storage record of payload, spans and hidden are only written when set */
    Json::Value table_to_value(const TablePayload& payload);
    std::string table_to_json(const TablePayload& payload);
}
