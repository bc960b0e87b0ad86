#include <fanout/core/frame.hpp>

#include <fmt/format.h>

#include <utility>

namespace fanout {

auto Frame::make(Schema schema, std::vector<Row> rows) -> Result<Frame> {
    for (std::size_t r = 0; r < rows.size(); ++r) {
        if (rows[r].size() != schema.size()) {
            return invalid_argument(fmt::format("row {} has {} cells, schema has {} columns", r,
                                                rows[r].size(), schema.size()));
        }
    }
    return Frame{std::move(schema), std::move(rows)};
}

auto Frame::add_row(Row row) -> Result<void> {
    if (row.size() != schema_.size()) {
        return invalid_argument(fmt::format("row has {} cells, schema has {} columns", row.size(),
                                            schema_.size()));
    }
    rows_.push_back(std::move(row));
    return {};
}

auto Frame::at(std::size_t row, const std::string& column) const -> Result<Cell> {
    auto pos = schema_.column_index(column);
    if (!pos) {
        return std::unexpected(pos.error());
    }
    return rows_.at(row)[*pos];
}

}  // namespace fanout
