#include <fanout/core/types.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <type_traits>

namespace fanout {

namespace {

auto to_lower(std::string_view text) -> std::string {
    std::string out(text);
    std::ranges::transform(out, out.begin(),
                           [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return out;
}

auto trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t");
    return text.substr(begin, end - begin + 1);
}

auto format_double(double v) -> std::string {
    if (std::isnan(v)) {
        return "nan";
    }
    if (std::isinf(v)) {
        return v > 0 ? "inf" : "-inf";
    }
    return fmt::format("{}", v);
}

}  // namespace

auto DataType::name() const -> std::string {
    switch (kind) {
        case TypeKind::Int64:
            return "int64";
        case TypeKind::Float64:
            return "float64";
        case TypeKind::String:
            return "string";
        case TypeKind::Bool:
            return "bool";
        case TypeKind::Vector:
            return fmt::format("vector({})", length);
    }
    return "unknown";
}

auto parse_data_type(std::string_view text) -> Result<DataType> {
    auto name = to_lower(trim(text));
    if (name == "int64" || name == "int" || name == "int32") {
        return DataType::int64();
    }
    if (name == "float64" || name == "float" || name == "float32" || name == "double") {
        return DataType::float64();
    }
    if (name == "string" || name == "str" || name == "unicode") {
        return DataType::string();
    }
    if (name == "bool" || name == "boolean") {
        return DataType::boolean();
    }
    constexpr std::string_view kVectorPrefix = "vector(";
    if (name.starts_with(kVectorPrefix) && name.ends_with(')')) {
        auto digits = trim(std::string_view(name).substr(
            kVectorPrefix.size(), name.size() - kVectorPrefix.size() - 1));
        std::size_t length = 0;
        const char* end = digits.data() + digits.size();
        auto parsed = std::from_chars(digits.data(), end, length);
        if (digits.empty() || parsed.ec != std::errc() || parsed.ptr != end || length == 0) {
            return invalid_argument(fmt::format("invalid vector length in type '{}'", text));
        }
        return DataType::vector(length);
    }
    return invalid_argument(fmt::format("unknown column type '{}'", text));
}

auto cell_matches(const Cell& cell, const DataType& type) noexcept -> bool {
    switch (type.kind) {
        case TypeKind::Int64:
            return std::holds_alternative<std::int64_t>(cell);
        case TypeKind::Float64:
            return std::holds_alternative<double>(cell);
        case TypeKind::String:
            return std::holds_alternative<std::string>(cell);
        case TypeKind::Bool:
            return std::holds_alternative<bool>(cell);
        case TypeKind::Vector: {
            const auto* vec = std::get_if<Vector>(&cell);
            return vec != nullptr && vec->size() == type.length;
        }
    }
    return false;
}

auto format_cell(const Cell& cell) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, double>) {
                return format_double(v);
            } else if constexpr (std::is_same_v<T, Vector>) {
                std::string out = "[";
                for (std::size_t i = 0; i < v.size(); ++i) {
                    if (i > 0) {
                        out.append(", ");
                    }
                    out.append(format_double(v[i]));
                }
                out.push_back(']');
                return out;
            } else {
                return std::to_string(v);
            }
        },
        cell);
}

}  // namespace fanout
