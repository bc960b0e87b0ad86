#pragma once

#include <fanout/core/error.hpp>
#include <fanout/core/types.hpp>

#include <robin_hood.h>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace fanout {

struct ColumnSchema {
    std::string name;
    DataType type;

    auto operator==(const ColumnSchema&) const -> bool = default;
};

/// Ordered column name -> type mapping with lookup by name.
class Schema {
   public:
    Schema() = default;

    /// Build a schema from an ordered column list; duplicate names are rejected.
    [[nodiscard]] static auto from(std::vector<ColumnSchema> columns) -> Result<Schema>;

    /// Append a column. Fails with InvalidArgument if the name is taken.
    [[nodiscard]] auto add_column(std::string name, DataType type) -> Result<void>;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return columns_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return columns_.empty(); }

    [[nodiscard]] auto columns() const noexcept -> const std::vector<ColumnSchema>& {
        return columns_;
    }
    [[nodiscard]] auto column(std::size_t idx) const -> const ColumnSchema& {
        return columns_.at(idx);
    }

    /// Position of `name`, or nullopt.
    [[nodiscard]] auto find(const std::string& name) const -> std::optional<std::size_t>;

    /// Position of `name`; InvalidArgument if the column does not exist.
    [[nodiscard]] auto column_index(const std::string& name) const -> Result<std::size_t>;

    /// Declared type of `name`; InvalidArgument if the column does not exist.
    [[nodiscard]] auto column_type(const std::string& name) const -> Result<DataType>;

    /// Copy of this schema with the type of `name` replaced by `type`.
    [[nodiscard]] auto convert_type(const std::string& name, DataType type) const
        -> Result<Schema>;

    [[nodiscard]] auto names() const -> std::vector<std::string>;

    auto operator==(const Schema& other) const -> bool { return columns_ == other.columns_; }

   private:
    std::vector<ColumnSchema> columns_;
    robin_hood::unordered_flat_map<std::string, std::size_t> index_;
};

}  // namespace fanout
