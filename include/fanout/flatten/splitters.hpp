#pragma once

#include <fanout/core/error.hpp>
#include <fanout/core/frame.hpp>
#include <fanout/core/types.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace fanout::flatten {

/// A requested column resolved against a schema for one invocation.
struct TargetColumnSpec {
    std::string name;
    std::size_t index = 0;
    DataType type;
    /// Text columns only.
    std::string delimiter;
};

/// Split `value` on every literal occurrence of `delimiter`.
///
/// Leading and interior empty tokens are kept, trailing empty tokens are
/// dropped. When nothing would remain (e.g. "," split on ","), the result is
/// the single token `value`, so the result is never empty.
[[nodiscard]] auto split_literal(std::string_view value, std::string_view delimiter)
    -> std::vector<std::string>;

// ─── Splitters ────────────────────────────────────────────────────────────────
//  Each splitter is an immutable value closed over its resolved targets. The
//  expand() overloads append the rows produced from one input row to `out`;
//  on failure nothing is appended.

/// Expands a fixed-length vector cell into one float64 row per element.
class VectorSplitter {
   public:
    explicit VectorSplitter(TargetColumnSpec target) : target_(std::move(target)) {}

    [[nodiscard]] auto expand(const Row& row, std::vector<Row>& out) const -> Result<void>;

    [[nodiscard]] auto target() const noexcept -> const TargetColumnSpec& { return target_; }

   private:
    TargetColumnSpec target_;
};

/// Expands one delimited text cell into one row per token.
class TextSplitter {
   public:
    explicit TextSplitter(TargetColumnSpec target) : target_(std::move(target)) {}

    [[nodiscard]] auto expand(const Row& row, std::vector<Row>& out) const -> Result<void>;

    [[nodiscard]] auto target() const noexcept -> const TargetColumnSpec& { return target_; }

   private:
    TargetColumnSpec target_;
};

/// Expands several delimited text cells at once, aligning tokens by position.
///
/// Targets are processed in the order given, each against the input row's
/// original value. A target that splits overwrites position p of the output
/// when a row already exists there; otherwise it appends a copy of the input
/// row in which every other target cell is blanked. A target that does not
/// split only rewrites position 0 (or seeds it with the unchanged input row
/// when the output is still empty). The output therefore depends on target
/// order.
class AlignedTextSplitter {
   public:
    explicit AlignedTextSplitter(std::vector<TargetColumnSpec> targets)
        : targets_(std::move(targets)) {}

    [[nodiscard]] auto expand(const Row& row, std::vector<Row>& out) const -> Result<void>;

    [[nodiscard]] auto targets() const noexcept -> const std::vector<TargetColumnSpec>& {
        return targets_;
    }

   private:
    std::vector<TargetColumnSpec> targets_;
};

using Splitter = std::variant<VectorSplitter, TextSplitter, AlignedTextSplitter>;

/// Dispatch to the active splitter's expand().
[[nodiscard]] auto expand_row(const Splitter& splitter, const Row& row, std::vector<Row>& out)
    -> Result<void>;

/// Rows produced from a single input row.
[[nodiscard]] auto expand_row(const Splitter& splitter, const Row& row)
    -> Result<std::vector<Row>>;

[[nodiscard]] auto splitter_name(const Splitter& splitter) -> std::string_view;

}  // namespace fanout::flatten
