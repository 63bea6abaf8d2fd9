#include "table_json.h"
#include "parse_commons.h"
#include "profiling.h"

#include <plog/Log.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <memory>

namespace LF {
    /* Number() of a record field, NaN when it does not convert */
    static double to_number(const Json::Value& value) {
        const double nan = std::numeric_limits<double>::quiet_NaN();
        if (value.isNumeric())
            return value.asDouble();
        if (value.isNull())
            return 0.;
        if (value.isString()) {
            std::string text = trim(value.asString());
            if (text.empty())
                return 0.;
            char* end = nullptr;
            double number = std::strtod(text.c_str(), &end);
            if (end != text.c_str() + text.length())
                return nan;
            return number;
        }
        return nan;
    }

    /* Truncated integer value, 0 when it is not a finite number */
    static long long to_count(const Json::Value& value) {
        double number = to_number(value);
        if (!std::isfinite(number))
            return 0;
        if (number > (double)std::numeric_limits<int>::max())
            return std::numeric_limits<int>::max();
        if (number < (double)std::numeric_limits<int>::min())
            return std::numeric_limits<int>::min();
        return (long long)number;
    }

    static bool is_truthy(const Json::Value& value) {
        switch (value.type()) {
        case Json::nullValue:
            return false;
        case Json::booleanValue:
            return value.asBool();
        case Json::intValue:
        case Json::uintValue:
        case Json::realValue:
        {
            double number = value.asDouble();
            return number != 0. && !std::isnan(number);
        }
        case Json::stringValue:
            return !value.asString().empty();
        default:
            return true;
        }
    }

    static std::string number_to_string(double number) {
        if (std::floor(number) == number && std::fabs(number) < 1e15)
            return std::to_string((long long)number);
        char buffer[32];
        for (int precision = 1; precision <= 17; precision++) {
            std::snprintf(buffer, sizeof(buffer), "%.*g", precision, number);
            if (std::strtod(buffer, nullptr) == number)
                break;
        }
        return buffer;
    }

    /* Text of a cell given as a plain value */
    static std::string value_to_text(const Json::Value& value) {
        if (value.isString())
            return value.asString();
        if (value.isBool())
            return value.asBool() ? "true" : "false";
        if (value.isNumeric())
            return number_to_string(value.asDouble());
        return "";
    }

    static bool is_dimension(long long n) {
        return n <= MAX_TABLE_DIMENSION;
    }

    static TablePayload from_rows_of_text(const Json::Value& rows_value) {
        int rows = 0;
        int cols = 1;
        for (const auto& row : rows_value) {
            rows++;
            cols = std::max(cols, (int)row.size());
        }
        TablePayload payload = default_table(rows, cols);
        int r = 0;
        for (const auto& row : rows_value) {
            int c = 0;
            for (const auto& cell : row)
                payload.cells[r][c++].content = value_to_text(cell);
            r++;
        }
        return payload;
    }

    /* Span of a cell, 0 when unset, never more than a grid can hold */
    static int read_span(const Json::Value& value) {
        if (!is_truthy(value))
            return 0;
        long long span = to_count(value);
        if (span > MAX_TABLE_DIMENSION) {
            PLOGD << "span of " << span << " cut to " << MAX_TABLE_DIMENSION;
            span = MAX_TABLE_DIMENSION;
        }
        return (int)std::max(0LL, span);
    }

    static TableCell read_cell(const Json::Value& value) {
        TableCell cell;
        if (value.isObject()) {
            cell.content = value_to_text(value["content"]);
            cell.rowspan = read_span(value["rowspan"]);
            cell.colspan = read_span(value["colspan"]);
            cell.hidden = is_truthy(value["hidden"]);
        }
        else {
            cell.content = value_to_text(value);
        }
        return cell;
    }

    TablePayload table_from_value(const Json::Value& value, int rows, int cols) {
        ZoneScoped;
        if (!value.isObject()) {
            PLOGW << "table record is not an object";
            return default_table(rows, cols);
        }

        const Json::Value& rows_value = value["rows"];
        if (rows_value.isArray()) {
            bool all_rows = true;
            for (const auto& row : rows_value)
                all_rows = all_rows && row.isArray();
            if (all_rows) {
                if (!is_dimension(rows_value.size())) {
                    PLOGW << "table record has too many rows";
                    return default_table(rows, cols);
                }
                return normalize_table(from_rows_of_text(rows_value));
            }
        }

        const Json::Value& cells = value["cells"];
        if (!cells.isArray()) {
            PLOGW << "table record has no cells";
            return default_table(rows, cols);
        }

        long long n_rows = to_count(value["rows"]);
        if (n_rows == 0)
            n_rows = cells.size();
        long long n_cols = to_count(value["cols"]);
        if (n_cols == 0)
            n_cols = (cells.size() > 0 && cells[0].isArray()) ? cells[0].size() : 1;
        n_rows = std::max(1LL, n_rows);
        n_cols = std::max(1LL, n_cols);
        if (!is_dimension(n_rows) || !is_dimension(n_cols)) {
            PLOGW << "table record of " << n_rows << "x" << n_cols << " is too large";
            return default_table(rows, cols);
        }

        TablePayload payload = default_table((int)n_rows, (int)n_cols);
        if (value["caption"].isString())
            payload.caption = value["caption"].asString();
        if (value["style"].isString() && value["style"].asString() == "three-line")
            payload.style = STYLE_THREE_LINE;

        for (int r = 0; r < payload.rows && r < (int)cells.size(); r++) {
            const Json::Value& row = cells[r];
            if (!row.isArray())
                continue;
            for (int c = 0; c < payload.cols && c < (int)row.size(); c++)
                payload.cells[r][c] = read_cell(row[c]);
        }
        return normalize_table(payload);
    }

    TablePayload parse_table_json(const std::string& text, int rows, int cols) {
        Json::CharReaderBuilder builder;
        std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
        Json::Value root;
        std::string errors;
        try {
            if (!reader->parse(text.data(), text.data() + text.length(), &root, &errors)) {
                PLOGW << "invalid table record: " << errors;
                return default_table(rows, cols);
            }
            return table_from_value(root, rows, cols);
        }
        catch (const Json::Exception& e) {
            PLOGW << "invalid table record: " << e.what();
            return default_table(rows, cols);
        }
    }

    Json::Value table_to_value(const TablePayload& payload) {
        Json::Value root(Json::objectValue);
        root["caption"] = payload.caption;
        root["style"] = table_style_to_name(payload.style);
        root["rows"] = payload.rows;
        root["cols"] = payload.cols;

        Json::Value cells(Json::arrayValue);
        for (const auto& row : payload.cells) {
            Json::Value out_row(Json::arrayValue);
            for (const auto& cell : row) {
                Json::Value out_cell(Json::objectValue);
                out_cell["content"] = cell.content;
                if (cell.rowspan > 0)
                    out_cell["rowspan"] = cell.rowspan;
                if (cell.colspan > 0)
                    out_cell["colspan"] = cell.colspan;
                if (cell.hidden)
                    out_cell["hidden"] = true;
                out_row.append(out_cell);
            }
            cells.append(out_row);
        }
        root["cells"] = cells;
        return root;
    }

    std::string table_to_json(const TablePayload& payload) {
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "";
        return Json::writeString(builder, table_to_value(payload));
    }
}
