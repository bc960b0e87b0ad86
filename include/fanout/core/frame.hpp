#pragma once

#include <fanout/core/error.hpp>
#include <fanout/core/schema.hpp>
#include <fanout/core/types.hpp>

#include <cstddef>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace fanout {

/// One record: a fixed-arity, positionally indexed sequence of cells.
using Row = std::vector<Cell>;

/// A schema plus the rows conforming to it.
///
/// Every row has exactly schema().size() cells. Cell types are not checked
/// here; the operators that depend on a column's type check it per row.
class Frame {
   public:
    Frame() = default;

    /// Build a frame; InvalidArgument if any row's arity differs from the schema.
    [[nodiscard]] static auto make(Schema schema, std::vector<Row> rows) -> Result<Frame>;

    /// Append a row; InvalidArgument on arity mismatch.
    [[nodiscard]] auto add_row(Row row) -> Result<void>;

    [[nodiscard]] auto schema() const noexcept -> const Schema& { return schema_; }
    [[nodiscard]] auto rows() const noexcept -> std::span<const Row> { return rows_; }
    [[nodiscard]] auto row(std::size_t idx) const -> const Row& { return rows_.at(idx); }

    [[nodiscard]] auto num_rows() const noexcept -> std::size_t { return rows_.size(); }
    [[nodiscard]] auto num_columns() const noexcept -> std::size_t { return schema_.size(); }

    /// Cell at (row, column name); InvalidArgument for an unknown column.
    [[nodiscard]] auto at(std::size_t row, const std::string& column) const -> Result<Cell>;

   private:
    Frame(Schema schema, std::vector<Row> rows)
        : schema_(std::move(schema)), rows_(std::move(rows)) {}

    Schema schema_;
    std::vector<Row> rows_;
};

}  // namespace fanout
