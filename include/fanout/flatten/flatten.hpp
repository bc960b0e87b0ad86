#pragma once

#include <fanout/core/error.hpp>
#include <fanout/core/frame.hpp>
#include <fanout/core/schema.hpp>
#include <fanout/flatten/splitters.hpp>
#include <fanout/runtime/row_stream.hpp>

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace fanout::flatten {

/// Arguments of one flatten invocation.
struct FlattenArgs {
    /// Target column names, in processing order.
    std::vector<std::string> columns;
    /// Optional delimiters; see resolve_delimiters().
    std::optional<std::vector<std::string>> delimiters;
};

/// Everything resolved before the first row is touched.
struct FlattenPlan {
    /// Input schema with vector targets narrowed to float64.
    Schema output_schema;
    std::vector<TargetColumnSpec> targets;
    Splitter splitter;
};

/// Resolve columns and delimiters against `schema` and pick the splitter.
///
/// All targets must be text, or there must be exactly one vector target.
/// Unknown or repeated columns, a mix of text and vector targets, several
/// vector targets and bad delimiter counts are InvalidArgument; any other
/// column type is UnsupportedType.
[[nodiscard]] auto plan_flatten(const Schema& schema, const FlattenArgs& args)
    -> Result<FlattenPlan>;

/// Expand `rows` with the plan's splitter.
[[nodiscard]] auto flatten_rows(const FlattenPlan& plan, std::span<const Row> rows,
                                const runtime::TransformOptions& options = {})
    -> Result<std::vector<Row>>;

/// Plan and run a flatten over a whole frame.
[[nodiscard]] auto flatten_frame(const Frame& frame, const FlattenArgs& args,
                                 const runtime::TransformOptions& options = {})
    -> Result<Frame>;

}  // namespace fanout::flatten
