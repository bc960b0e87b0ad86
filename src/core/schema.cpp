#include <fanout/core/schema.hpp>

#include <fmt/format.h>

#include <utility>

namespace fanout {

auto Schema::from(std::vector<ColumnSchema> columns) -> Result<Schema> {
    Schema schema;
    schema.columns_.reserve(columns.size());
    for (auto& column : columns) {
        auto added = schema.add_column(std::move(column.name), column.type);
        if (!added) {
            return std::unexpected(added.error());
        }
    }
    return schema;
}

auto Schema::add_column(std::string name, DataType type) -> Result<void> {
    if (index_.contains(name)) {
        return invalid_argument(fmt::format("duplicate column '{}'", name));
    }
    std::size_t pos = columns_.size();
    columns_.push_back(ColumnSchema{.name = std::move(name), .type = type});
    index_[columns_.back().name] = pos;
    return {};
}

auto Schema::find(const std::string& name) const -> std::optional<std::size_t> {
    if (auto it = index_.find(name); it != index_.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto Schema::column_index(const std::string& name) const -> Result<std::size_t> {
    if (auto pos = find(name)) {
        return *pos;
    }
    return invalid_argument(fmt::format("column not found: {}", name));
}

auto Schema::column_type(const std::string& name) const -> Result<DataType> {
    auto pos = column_index(name);
    if (!pos) {
        return std::unexpected(pos.error());
    }
    return columns_[*pos].type;
}

auto Schema::convert_type(const std::string& name, DataType type) const -> Result<Schema> {
    auto pos = column_index(name);
    if (!pos) {
        return std::unexpected(pos.error());
    }
    Schema converted = *this;
    converted.columns_[*pos].type = type;
    return converted;
}

auto Schema::names() const -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(columns_.size());
    for (const auto& column : columns_) {
        out.push_back(column.name);
    }
    return out;
}

}  // namespace fanout
