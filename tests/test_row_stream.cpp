#include <fanout/runtime/row_stream.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

using fanout::Row;
using fanout::runtime::TransformOptions;

namespace {

auto numbered_rows(std::size_t count) -> std::vector<Row> {
    std::vector<Row> rows;
    rows.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        rows.push_back(Row{static_cast<std::int64_t>(i)});
    }
    return rows;
}

// Emits each row (n % 3) + 1 times, tagging copies with their ordinal.
auto repeat_expander(const Row& row, std::vector<Row>& out) -> fanout::Result<void> {
    auto n = std::get<std::int64_t>(row[0]);
    for (std::int64_t copy = 0; copy <= n % 3; ++copy) {
        out.push_back(Row{n, copy});
    }
    return {};
}

}  // namespace

TEST_CASE("partition_count respects thread and size limits", "[runtime][row_stream]") {
    REQUIRE(fanout::runtime::partition_count(0, {.threads = 8, .min_rows_per_thread = 1}) == 1);
    REQUIRE(fanout::runtime::partition_count(10, {.threads = 8, .min_rows_per_thread = 100}) ==
            1);
    REQUIRE(fanout::runtime::partition_count(1000, {.threads = 4, .min_rows_per_thread = 10}) ==
            4);
    REQUIRE(fanout::runtime::partition_count(25, {.threads = 8, .min_rows_per_thread = 10}) == 3);
    REQUIRE(fanout::runtime::partition_count(5, {.threads = 1, .min_rows_per_thread = 0}) == 1);
}

TEST_CASE("transform_rows concatenates results in input order", "[runtime][row_stream]") {
    auto rows = numbered_rows(1000);

    auto sequential = fanout::runtime::transform_rows(rows, repeat_expander, {.threads = 1});
    REQUIRE(sequential.has_value());
    // 334 ids emit one row, 333 emit two and 333 emit three.
    REQUIRE(sequential->size() == 1999);

    std::int64_t expected_id = 0;
    std::int64_t expected_copy = 0;
    for (const auto& row : *sequential) {
        REQUIRE(std::get<std::int64_t>(row[0]) == expected_id);
        REQUIRE(std::get<std::int64_t>(row[1]) == expected_copy);
        if (expected_copy == expected_id % 3) {
            ++expected_id;
            expected_copy = 0;
        } else {
            ++expected_copy;
        }
    }
    REQUIRE(expected_id == 1000);
}

TEST_CASE("transform_rows parallel output matches sequential output", "[runtime][row_stream]") {
    auto rows = numbered_rows(5000);

    auto sequential = fanout::runtime::transform_rows(rows, repeat_expander, {.threads = 1});
    auto parallel = fanout::runtime::transform_rows(
        rows, repeat_expander, {.threads = 7, .min_rows_per_thread = 64});
    REQUIRE(sequential.has_value());
    REQUIRE(parallel.has_value());
    REQUIRE(*parallel == *sequential);
}

TEST_CASE("transform_rows on empty input", "[runtime][row_stream]") {
    std::vector<Row> rows;
    auto result = fanout::runtime::transform_rows(rows, repeat_expander, {.threads = 4});
    REQUIRE(result.has_value());
    REQUIRE(result->empty());
}

TEST_CASE("transform_rows reports the first failing row", "[runtime][row_stream]") {
    auto rows = numbered_rows(2000);
    auto failing = [](const Row& row, std::vector<Row>& out) -> fanout::Result<void> {
        auto n = std::get<std::int64_t>(row[0]);
        if (n == 700 || n == 1900) {
            return fanout::type_coercion_error("bad row " + std::to_string(n));
        }
        out.push_back(row);
        return {};
    };

    for (std::size_t threads : {1U, 3U, 8U}) {
        auto result = fanout::runtime::transform_rows(
            rows, failing, {.threads = threads, .min_rows_per_thread = 50});
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == fanout::ErrorKind::TypeCoercionError);
        REQUIRE(result.error().message == "bad row 700");
    }
}
