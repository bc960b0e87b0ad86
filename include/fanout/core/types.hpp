#pragma once

#include <fanout/core/error.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace fanout {

enum class TypeKind : std::uint8_t {
    Int64,
    Float64,
    String,
    Bool,
    Vector,
};

/// Semantic column type. `length` is only meaningful for vectors.
struct DataType {
    TypeKind kind = TypeKind::String;
    std::size_t length = 0;

    [[nodiscard]] static constexpr auto int64() noexcept -> DataType {
        return DataType{.kind = TypeKind::Int64};
    }
    [[nodiscard]] static constexpr auto float64() noexcept -> DataType {
        return DataType{.kind = TypeKind::Float64};
    }
    [[nodiscard]] static constexpr auto string() noexcept -> DataType {
        return DataType{.kind = TypeKind::String};
    }
    [[nodiscard]] static constexpr auto boolean() noexcept -> DataType {
        return DataType{.kind = TypeKind::Bool};
    }
    [[nodiscard]] static constexpr auto vector(std::size_t length) noexcept -> DataType {
        return DataType{.kind = TypeKind::Vector, .length = length};
    }

    [[nodiscard]] constexpr auto is_text() const noexcept -> bool {
        return kind == TypeKind::String;
    }
    [[nodiscard]] constexpr auto is_vector() const noexcept -> bool {
        return kind == TypeKind::Vector;
    }

    /// Type name as accepted by parse_data_type(), e.g. "vector(3)".
    [[nodiscard]] auto name() const -> std::string;

    auto operator==(const DataType&) const -> bool = default;
};

/// Parse "int64", "float64", "string", "bool" or "vector(L)".
/// A few aliases ("int", "double", "str", ...) are accepted as well.
[[nodiscard]] auto parse_data_type(std::string_view text) -> Result<DataType>;

/// Fixed-length numeric vector cell payload.
using Vector = std::vector<double>;

/// A single typed cell.
using Cell = std::variant<std::int64_t, double, std::string, bool, Vector>;

/// True if `cell` holds a value of `type` (vectors must also match in length).
[[nodiscard]] auto cell_matches(const Cell& cell, const DataType& type) noexcept -> bool;

/// Render a cell as text. Vectors render as "[v0, v1, ...]".
[[nodiscard]] auto format_cell(const Cell& cell) -> std::string;

}  // namespace fanout
