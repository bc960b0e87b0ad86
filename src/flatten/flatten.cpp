#include <fanout/flatten/delimiters.hpp>
#include <fanout/flatten/flatten.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <utility>

namespace fanout::flatten {

auto plan_flatten(const Schema& schema, const FlattenArgs& args) -> Result<FlattenPlan> {
    auto delimiters = resolve_delimiters(args.columns, args.delimiters);
    if (!delimiters) {
        return std::unexpected(delimiters.error());
    }

    std::vector<TargetColumnSpec> targets;
    targets.reserve(args.columns.size());
    std::size_t text_targets = 0;
    std::size_t vector_targets = 0;
    for (std::size_t i = 0; i < args.columns.size(); ++i) {
        const auto& name = args.columns[i];
        auto index = schema.column_index(name);
        if (!index) {
            return std::unexpected(index.error());
        }
        for (const auto& seen : targets) {
            if (seen.index == *index) {
                return invalid_argument(fmt::format("column '{}' requested more than once", name));
            }
        }
        const DataType type = schema.column(*index).type;
        if (type.is_text()) {
            ++text_targets;
        } else if (type.is_vector()) {
            ++vector_targets;
        } else {
            return unsupported_type(
                fmt::format("flatten does not support column '{}' of type {}", name, type.name()));
        }
        targets.push_back(TargetColumnSpec{
            .name = name,
            .index = *index,
            .type = type,
            .delimiter = type.is_text() ? (*delimiters)[i] : std::string{},
        });
    }

    if (text_targets > 0 && vector_targets > 0) {
        return invalid_argument("cannot flatten text and vector columns in the same call");
    }
    if (vector_targets > 1) {
        return invalid_argument("only one vector column can be flattened per call");
    }

    if (vector_targets == 1) {
        const auto& target = targets.front();
        auto narrowed = schema.convert_type(target.name, DataType::float64());
        if (!narrowed) {
            return std::unexpected(narrowed.error());
        }
        spdlog::debug("flatten: vector column '{}' of length {}", target.name, target.type.length);
        return FlattenPlan{.output_schema = std::move(*narrowed),
                           .targets = targets,
                           .splitter = Splitter{VectorSplitter{target}}};
    }

    if (targets.size() == 1) {
        spdlog::debug("flatten: text column '{}' split on '{}'", targets.front().name,
                      targets.front().delimiter);
        return FlattenPlan{.output_schema = schema,
                           .targets = targets,
                           .splitter = Splitter{TextSplitter{targets.front()}}};
    }

    spdlog::debug("flatten: aligned text columns {} split on {}", args.columns, *delimiters);
    return FlattenPlan{.output_schema = schema,
                       .targets = targets,
                       .splitter = Splitter{AlignedTextSplitter{targets}}};
}

auto flatten_rows(const FlattenPlan& plan, std::span<const Row> rows,
                  const runtime::TransformOptions& options) -> Result<std::vector<Row>> {
    const Splitter& splitter = plan.splitter;
    return runtime::transform_rows(
        rows,
        [&splitter](const Row& row, std::vector<Row>& out) {
            return expand_row(splitter, row, out);
        },
        options);
}

auto flatten_frame(const Frame& frame, const FlattenArgs& args,
                   const runtime::TransformOptions& options) -> Result<Frame> {
    auto plan = plan_flatten(frame.schema(), args);
    if (!plan) {
        return std::unexpected(plan.error());
    }
    auto rows = flatten_rows(*plan, frame.rows(), options);
    if (!rows) {
        return std::unexpected(rows.error());
    }
    spdlog::debug("flatten: {} rows -> {} rows using {} splitter", frame.num_rows(), rows->size(),
                  splitter_name(plan->splitter));
    return Frame::make(std::move(plan->output_schema), std::move(*rows));
}

}  // namespace fanout::flatten
