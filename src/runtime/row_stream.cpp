#include <fanout/runtime/row_stream.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <optional>
#include <system_error>
#include <thread>
#include <utility>

namespace fanout::runtime {

namespace {

struct Partition {
    std::size_t begin = 0;
    std::size_t end = 0;
    std::vector<Row> output;
    std::optional<Error> error;
};

void run_partition(std::span<const Row> rows, const RowExpander& expand, Partition& part) {
    part.output.reserve(part.end - part.begin);
    for (std::size_t r = part.begin; r < part.end; ++r) {
        auto status = expand(rows[r], part.output);
        if (!status) {
            part.error = std::move(status.error());
            part.output.clear();
            return;
        }
    }
}

}  // namespace

auto partition_count(std::size_t rows, const TransformOptions& options) -> std::size_t {
    if (rows == 0) {
        return 1;
    }
    std::size_t threads = options.threads;
    if (threads == 0) {
        threads = std::max<unsigned>(1, std::thread::hardware_concurrency());
    }
    const std::size_t min_rows = std::max<std::size_t>(1, options.min_rows_per_thread);
    const std::size_t by_size = (rows + min_rows - 1) / min_rows;
    return std::clamp<std::size_t>(by_size, 1, threads);
}

auto transform_rows(std::span<const Row> rows, const RowExpander& expand,
                    const TransformOptions& options) -> Result<std::vector<Row>> {
    const std::size_t parts = partition_count(rows.size(), options);
    const std::size_t chunk = (rows.size() + parts - 1) / std::max<std::size_t>(1, parts);

    std::vector<Partition> partitions;
    partitions.reserve(parts);
    for (std::size_t start = 0; start < rows.size() || partitions.empty(); start += chunk) {
        partitions.push_back(
            Partition{.begin = start, .end = std::min(rows.size(), start + chunk)});
        if (chunk == 0) {
            break;
        }
    }
    spdlog::debug("transform_rows: {} rows in {} partitions of up to {} rows", rows.size(),
                  partitions.size(), chunk);

    if (partitions.size() == 1) {
        run_partition(rows, expand, partitions.front());
    } else {
        std::vector<std::thread> workers;
        workers.reserve(partitions.size());
        std::size_t started = 0;
        for (; started < partitions.size(); ++started) {
            auto& part = partitions[started];
            try {
                workers.emplace_back(
                    [&rows, &expand, &part] { run_partition(rows, expand, part); });
            } catch (const std::system_error& e) {
                spdlog::warn("transform_rows: cannot start a worker thread ({}), running {} "
                             "partitions on the calling thread",
                             e.what(), partitions.size() - started);
                break;
            }
        }
        for (std::size_t p = started; p < partitions.size(); ++p) {
            run_partition(rows, expand, partitions[p]);
        }
        for (auto& worker : workers) {
            worker.join();
        }
    }

    std::size_t total = 0;
    for (auto& part : partitions) {
        if (part.error.has_value()) {
            spdlog::debug("transform_rows: partition [{}, {}) failed: {}", part.begin, part.end,
                          part.error->message);
            return std::unexpected(std::move(*part.error));
        }
        total += part.output.size();
    }

    if (partitions.size() == 1) {
        return std::move(partitions.front().output);
    }
    std::vector<Row> output;
    output.reserve(total);
    for (auto& part : partitions) {
        std::ranges::move(part.output, std::back_inserter(output));
    }
    return output;
}

}  // namespace fanout::runtime
