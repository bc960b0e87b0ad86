#pragma once

#include <fanout/core/error.hpp>
#include <fanout/core/frame.hpp>
#include <fanout/core/schema.hpp>

#include <cstddef>
#include <iosfwd>
#include <string_view>
#include <vector>

namespace fanout::io {

struct CsvReadOptions {
    char separator = ',';
    /// Declared column types. Columns not listed are inferred: int64 if every
    /// field parses as one, then float64, otherwise string.
    std::vector<ColumnSchema> column_types;
};

struct CsvWriteOptions {
    char separator = ',';
};

/// Parse "name:type,name:type,..." (types as in parse_data_type()).
[[nodiscard]] auto parse_schema_spec(std::string_view spec) -> Result<std::vector<ColumnSchema>>;

/// Parse a single field as `type`. Vectors accept "[1, 2, 3]" or "1 2 3".
[[nodiscard]] auto parse_cell(std::string_view text, const DataType& type) -> Result<Cell>;

/// Read a CSV with a header row (RFC 4180 quoting).
[[nodiscard]] auto read_csv(std::string_view path, const CsvReadOptions& options = {})
    -> Result<Frame>;
[[nodiscard]] auto read_csv(std::istream& input, const CsvReadOptions& options = {})
    -> Result<Frame>;

/// Write a frame with a header row; fields are quoted when needed.
[[nodiscard]] auto write_csv(const Frame& frame, std::ostream& out,
                             const CsvWriteOptions& options = {}) -> Result<void>;

/// Write to `path`; returns the number of data rows written.
[[nodiscard]] auto write_csv(const Frame& frame, std::string_view path,
                             const CsvWriteOptions& options = {}) -> Result<std::size_t>;

}  // namespace fanout::io
