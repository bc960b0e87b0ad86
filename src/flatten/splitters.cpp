#include <fanout/flatten/splitters.hpp>

#include <fmt/format.h>

#include <type_traits>
#include <utility>

namespace fanout::flatten {

namespace {

auto cell_at(const Row& row, const TargetColumnSpec& target) -> Result<const Cell*> {
    if (target.index >= row.size()) {
        return invalid_argument(fmt::format(
            "column '{}' (index {}) is out of range for a row of {} cells", target.name,
            target.index, row.size()));
    }
    return &row[target.index];
}

auto text_at(const Row& row, const TargetColumnSpec& target) -> Result<const std::string*> {
    auto cell = cell_at(row, target);
    if (!cell) {
        return std::unexpected(cell.error());
    }
    const auto* text = std::get_if<std::string>(*cell);
    if (text == nullptr) {
        return type_coercion_error(
            fmt::format("column '{}' is declared string but holds {}", target.name,
                        format_cell(**cell)));
    }
    return text;
}

}  // namespace

auto split_literal(std::string_view value, std::string_view delimiter)
    -> std::vector<std::string> {
    std::vector<std::string> tokens;
    if (delimiter.empty()) {
        tokens.emplace_back(value);
        return tokens;
    }
    std::size_t pos = 0;
    while (true) {
        std::size_t hit = value.find(delimiter, pos);
        if (hit == std::string_view::npos) {
            tokens.emplace_back(value.substr(pos));
            break;
        }
        tokens.emplace_back(value.substr(pos, hit - pos));
        pos = hit + delimiter.size();
    }
    while (!tokens.empty() && tokens.back().empty()) {
        tokens.pop_back();
    }
    if (tokens.empty()) {
        tokens.emplace_back(value);
    }
    return tokens;
}

auto VectorSplitter::expand(const Row& row, std::vector<Row>& out) const -> Result<void> {
    auto cell = cell_at(row, target_);
    if (!cell) {
        return std::unexpected(cell.error());
    }
    const auto* vec = std::get_if<Vector>(*cell);
    if (vec == nullptr) {
        return type_coercion_error(fmt::format("column '{}' is declared {} but holds {}",
                                               target_.name, target_.type.name(),
                                               format_cell(**cell)));
    }
    if (vec->size() != target_.type.length) {
        return type_coercion_error(fmt::format("column '{}' is declared {} but holds {} elements",
                                               target_.name, target_.type.name(), vec->size()));
    }
    for (double element : *vec) {
        Row& produced = out.emplace_back(row);
        produced[target_.index] = element;
    }
    return {};
}

auto TextSplitter::expand(const Row& row, std::vector<Row>& out) const -> Result<void> {
    auto text = text_at(row, target_);
    if (!text) {
        return std::unexpected(text.error());
    }
    auto tokens = split_literal(**text, target_.delimiter);
    if (tokens.size() <= 1) {
        out.push_back(row);
        return {};
    }
    for (auto& token : tokens) {
        Row& produced = out.emplace_back(row);
        produced[target_.index] = std::move(token);
    }
    return {};
}

auto AlignedTextSplitter::expand(const Row& row, std::vector<Row>& out) const -> Result<void> {
    // Rows for this input live at out[base + p]; p is the token position.
    const std::size_t base = out.size();
    auto produced = [&]() { return out.size() - base; };

    for (std::size_t i = 0; i < targets_.size(); ++i) {
        const auto& target = targets_[i];
        auto text = text_at(row, target);
        if (!text) {
            out.erase(out.begin() + static_cast<std::ptrdiff_t>(base), out.end());
            return std::unexpected(text.error());
        }
        auto tokens = split_literal(**text, target.delimiter);

        if (tokens.size() > 1) {
            for (std::size_t p = 0; p < tokens.size(); ++p) {
                if (p < produced()) {
                    out[base + p][target.index] = std::move(tokens[p]);
                    continue;
                }
                Row& fresh = out.emplace_back(row);
                fresh[target.index] = std::move(tokens[p]);
                for (std::size_t j = 0; j < targets_.size(); ++j) {
                    if (j != i) {
                        fresh[targets_[j].index] = std::string{};
                    }
                }
            }
        } else if (produced() == 0) {
            out.push_back(row);
        } else {
            out[base][target.index] = std::move(tokens.front());
        }
    }
    return {};
}

auto expand_row(const Splitter& splitter, const Row& row, std::vector<Row>& out) -> Result<void> {
    return std::visit([&](const auto& s) { return s.expand(row, out); }, splitter);
}

auto expand_row(const Splitter& splitter, const Row& row) -> Result<std::vector<Row>> {
    std::vector<Row> out;
    auto status = expand_row(splitter, row, out);
    if (!status) {
        return std::unexpected(status.error());
    }
    return out;
}

auto splitter_name(const Splitter& splitter) -> std::string_view {
    return std::visit(
        [](const auto& s) -> std::string_view {
            using S = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<S, VectorSplitter>) {
                return "vector";
            } else if constexpr (std::is_same_v<S, TextSplitter>) {
                return "text";
            } else {
                return "aligned-text";
            }
        },
        splitter);
}

}  // namespace fanout::flatten
