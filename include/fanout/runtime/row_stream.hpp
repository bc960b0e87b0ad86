#pragma once

#include <fanout/core/error.hpp>
#include <fanout/core/frame.hpp>

#include <cstddef>
#include <functional>
#include <span>
#include <vector>

namespace fanout::runtime {

/// Appends the rows produced from one input row to the output vector.
/// Must not touch shared mutable state: it may run on several threads at once.
using RowExpander = std::function<Result<void>(const Row&, std::vector<Row>&)>;

struct TransformOptions {
    /// Worker threads; 0 means std::thread::hardware_concurrency().
    std::size_t threads = 0;
    /// Inputs smaller than this per worker are not split any further.
    std::size_t min_rows_per_thread = 4096;
};

/// Number of partitions transform_rows() will use for `rows` input rows.
[[nodiscard]] auto partition_count(std::size_t rows, const TransformOptions& options)
    -> std::size_t;

/// Apply `expand` to every row and concatenate the results in input order.
///
/// Rows are cut into contiguous partitions that run concurrently; partition
/// outputs are concatenated in partition order. If any row fails, the error
/// of the first failing row (in input order) is returned and no rows are.
[[nodiscard]] auto transform_rows(std::span<const Row> rows, const RowExpander& expand,
                                  const TransformOptions& options = {})
    -> Result<std::vector<Row>>;

}  // namespace fanout::runtime
