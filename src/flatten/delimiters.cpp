#include <fanout/flatten/delimiters.hpp>

#include <fmt/format.h>

namespace fanout::flatten {

auto resolve_delimiters(const std::vector<std::string>& columns,
                        const std::optional<std::vector<std::string>>& delimiters)
    -> Result<std::vector<std::string>> {
    if (columns.empty()) {
        return invalid_argument("at least one column is required");
    }
    if (!delimiters.has_value() || delimiters->empty()) {
        return std::vector<std::string>(columns.size(), std::string(kDefaultDelimiter));
    }
    for (const auto& delimiter : *delimiters) {
        if (delimiter.empty()) {
            return invalid_argument("delimiter must not be empty");
        }
    }
    if (delimiters->size() == columns.size()) {
        return *delimiters;
    }
    if (delimiters->size() == 1) {
        return std::vector<std::string>(columns.size(), delimiters->front());
    }
    return invalid_argument(
        fmt::format("delimiter count does not match column count ({} delimiters, {} columns)",
                    delimiters->size(), columns.size()));
}

}  // namespace fanout::flatten
