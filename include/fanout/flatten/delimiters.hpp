#pragma once

#include <fanout/core/error.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fanout::flatten {

/// Delimiter used for every column when the caller supplies none.
inline constexpr std::string_view kDefaultDelimiter = ",";

/// Produce exactly one delimiter per requested column.
///
/// - no delimiters (nullopt or empty list): kDefaultDelimiter for every column
/// - one delimiter per column: used position-for-position
/// - a single delimiter: broadcast to every column
///
/// Any other count, an empty column list or an empty delimiter string is
/// InvalidArgument.
[[nodiscard]] auto resolve_delimiters(const std::vector<std::string>& columns,
                                      const std::optional<std::vector<std::string>>& delimiters)
    -> Result<std::vector<std::string>>;

}  // namespace fanout::flatten
