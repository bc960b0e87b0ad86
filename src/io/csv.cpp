#include <fanout/io/csv.hpp>

#include <fmt/format.h>
#include <rapidcsv.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <istream>
#include <ostream>
#include <string>
#include <utility>

namespace fanout::io {

namespace {

auto trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

auto try_parse_int(std::string_view text, std::int64_t& out) -> bool {
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto result = std::from_chars(begin, end, out);
    return !text.empty() && result.ec == std::errc() && result.ptr == end;
}

auto try_parse_double(std::string_view text, double& out) -> bool {
    std::string owned(text);
    char* end = nullptr;
    out = std::strtod(owned.c_str(), &end);
    return end != owned.c_str() && *end == '\0';
}

auto parse_vector(std::string_view text, std::size_t length) -> Result<Cell> {
    auto body = trim(text);
    if (body.starts_with('[') && body.ends_with(']')) {
        body = body.substr(1, body.size() - 2);
    }
    Vector values;
    std::size_t pos = 0;
    while (pos < body.size()) {
        std::size_t stop = body.find_first_of(", \t", pos);
        if (stop == std::string_view::npos) {
            stop = body.size();
        }
        auto piece = body.substr(pos, stop - pos);
        pos = stop + 1;
        if (piece.empty()) {
            continue;
        }
        double value = 0.0;
        if (!try_parse_double(piece, value)) {
            return type_coercion_error(
                fmt::format("'{}' is not a number in vector '{}'", piece, text));
        }
        values.push_back(value);
    }
    if (values.size() != length) {
        return type_coercion_error(
            fmt::format("vector '{}' has {} elements, expected {}", text, values.size(), length));
    }
    return Cell{std::move(values)};
}

auto infer_type(const std::vector<std::string>& values) -> DataType {
    if (values.empty()) {
        return DataType::string();
    }
    bool all_int = true;
    bool all_double = true;
    for (const auto& value : values) {
        std::int64_t int_value = 0;
        double double_value = 0.0;
        if (all_int && try_parse_int(value, int_value)) {
            continue;
        }
        all_int = false;
        if (try_parse_double(value, double_value)) {
            continue;
        }
        all_double = false;
        break;
    }
    if (all_int) {
        return DataType::int64();
    }
    if (all_double) {
        return DataType::float64();
    }
    return DataType::string();
}

auto needs_quotes(std::string_view field, char separator) -> bool {
    return field.find_first_of(std::string{separator, '"', '\n', '\r'}) != std::string_view::npos;
}

void write_field(std::ostream& out, std::string_view field, char separator) {
    if (!needs_quotes(field, separator)) {
        out << field;
        return;
    }
    out << '"';
    for (char ch : field) {
        if (ch == '"') {
            out << '"';
        }
        out << ch;
    }
    out << '"';
}

auto build_frame(rapidcsv::Document& doc, const CsvReadOptions& options) -> Result<Frame> {
    auto names = doc.GetColumnNames();
    if (names.empty()) {
        return io_error("csv has no headers");
    }

    Schema declared;
    for (const auto& column : options.column_types) {
        auto added = declared.add_column(column.name, column.type);
        if (!added) {
            return std::unexpected(added.error());
        }
    }

    std::vector<std::vector<std::string>> raw;
    raw.reserve(names.size());
    Schema schema;
    for (const auto& name : names) {
        auto values = doc.GetColumn<std::string>(name);
        DataType type = infer_type(values);
        if (auto pos = declared.find(name)) {
            type = declared.column(*pos).type;
        }
        auto added = schema.add_column(name, type);
        if (!added) {
            return std::unexpected(added.error());
        }
        raw.push_back(std::move(values));
    }
    for (const auto& column : options.column_types) {
        if (!schema.find(column.name)) {
            return invalid_argument(fmt::format("declared column '{}' is not in the csv header",
                                                column.name));
        }
    }

    const std::size_t rows = doc.GetRowCount();
    std::vector<Row> data(rows, Row(names.size()));
    for (std::size_t c = 0; c < names.size(); ++c) {
        const DataType& type = schema.column(c).type;
        if (raw[c].size() != rows) {
            return io_error(fmt::format("csv column '{}' has {} values, expected {}", names[c],
                                        raw[c].size(), rows));
        }
        for (std::size_t r = 0; r < rows; ++r) {
            auto cell = parse_cell(raw[c][r], type);
            if (!cell) {
                return type_coercion_error(
                    fmt::format("row {}, column '{}': {}", r + 1, names[c], cell.error().message));
            }
            data[r][c] = std::move(*cell);
        }
    }
    spdlog::debug("read_csv: {} rows x {} columns", rows, names.size());
    return Frame::make(std::move(schema), std::move(data));
}

}  // namespace

auto parse_schema_spec(std::string_view spec) -> Result<std::vector<ColumnSchema>> {
    std::vector<ColumnSchema> columns;
    std::size_t pos = 0;
    while (pos <= spec.size()) {
        std::size_t comma = spec.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = spec.size();
        }
        auto entry = trim(spec.substr(pos, comma - pos));
        pos = comma + 1;
        if (entry.empty()) {
            continue;
        }
        auto colon = entry.rfind(':');
        if (colon == std::string_view::npos) {
            return invalid_argument(fmt::format("schema entry '{}' is not name:type", entry));
        }
        auto name = trim(entry.substr(0, colon));
        if (name.empty()) {
            return invalid_argument(fmt::format("schema entry '{}' has no column name", entry));
        }
        auto type = parse_data_type(entry.substr(colon + 1));
        if (!type) {
            return std::unexpected(type.error());
        }
        columns.push_back(ColumnSchema{.name = std::string(name), .type = *type});
    }
    return columns;
}

auto parse_cell(std::string_view text, const DataType& type) -> Result<Cell> {
    switch (type.kind) {
        case TypeKind::String:
            return Cell{std::string(text)};
        case TypeKind::Int64: {
            std::int64_t value = 0;
            if (!try_parse_int(trim(text), value)) {
                return type_coercion_error(fmt::format("'{}' is not an int64", text));
            }
            return Cell{value};
        }
        case TypeKind::Float64: {
            double value = 0.0;
            if (!try_parse_double(trim(text), value)) {
                return type_coercion_error(fmt::format("'{}' is not a float64", text));
            }
            return Cell{value};
        }
        case TypeKind::Bool: {
            auto word = trim(text);
            if (word == "true" || word == "True" || word == "1") {
                return Cell{true};
            }
            if (word == "false" || word == "False" || word == "0") {
                return Cell{false};
            }
            return type_coercion_error(fmt::format("'{}' is not a bool", text));
        }
        case TypeKind::Vector:
            return parse_vector(text, type.length);
    }
    return type_coercion_error(fmt::format("cannot parse '{}' as {}", text, type.name()));
}

auto read_csv(std::istream& input, const CsvReadOptions& options) -> Result<Frame> {
    try {
        // Quoted line breaks stay inside the field, matching what write_csv emits.
        rapidcsv::Document doc(input,
                               rapidcsv::LabelParams(0, -1),  // row 0 = header, no row-index column
                               rapidcsv::SeparatorParams(options.separator, false,
                                                         rapidcsv::sPlatformHasCR, true));
        return build_frame(doc, options);
    } catch (const std::exception& e) {
        return io_error(fmt::format("failed to read csv: {}", e.what()));
    }
}

auto read_csv(std::string_view path, const CsvReadOptions& options) -> Result<Frame> {
    std::ifstream input{std::string(path)};
    if (!input) {
        return io_error(fmt::format("failed to open csv: {}", path));
    }
    return read_csv(input, options);
}

auto write_csv(const Frame& frame, std::ostream& out, const CsvWriteOptions& options)
    -> Result<void> {
    const auto& columns = frame.schema().columns();
    for (std::size_t c = 0; c < columns.size(); ++c) {
        if (c > 0) {
            out << options.separator;
        }
        write_field(out, columns[c].name, options.separator);
    }
    out << '\n';
    for (const auto& row : frame.rows()) {
        for (std::size_t c = 0; c < row.size(); ++c) {
            if (c > 0) {
                out << options.separator;
            }
            write_field(out, format_cell(row[c]), options.separator);
        }
        out << '\n';
    }
    if (!out) {
        return io_error("failed to write csv");
    }
    return {};
}

auto write_csv(const Frame& frame, std::string_view path, const CsvWriteOptions& options)
    -> Result<std::size_t> {
    std::ofstream out{std::string(path)};
    if (!out) {
        return io_error(fmt::format("failed to open '{}' for writing", path));
    }
    auto written = write_csv(frame, out, options);
    if (!written) {
        return std::unexpected(written.error());
    }
    spdlog::debug("write_csv: {} rows to {}", frame.num_rows(), path);
    return frame.num_rows();
}

}  // namespace fanout::io
