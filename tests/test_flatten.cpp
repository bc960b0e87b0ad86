#include <fanout/flatten/flatten.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

using fanout::DataType;
using fanout::ErrorKind;
using fanout::Frame;
using fanout::Row;
using fanout::flatten::FlattenArgs;
using fanout::flatten::flatten_frame;
using fanout::flatten::plan_flatten;
using Strings = std::vector<std::string>;

namespace {

auto make_schema() -> fanout::Schema {
    auto schema = fanout::Schema::from({
        {.name = "id", .type = DataType::int64()},
        {.name = "a", .type = DataType::string()},
        {.name = "b", .type = DataType::string()},
        {.name = "v", .type = DataType::vector(3)},
        {.name = "flag", .type = DataType::boolean()},
    });
    REQUIRE(schema.has_value());
    return std::move(*schema);
}

auto make_frame(std::vector<Row> rows) -> Frame {
    auto frame = Frame::make(make_schema(), std::move(rows));
    REQUIRE(frame.has_value());
    return std::move(*frame);
}

auto row(std::int64_t id, std::string a, std::string b, fanout::Vector v = {0.0, 0.0, 0.0})
    -> Row {
    return Row{id, std::move(a), std::move(b), std::move(v), false};
}

auto text_column(const Frame& frame, const std::string& name) -> Strings {
    auto idx = frame.schema().column_index(name).value();
    Strings out;
    for (const auto& r : frame.rows()) {
        out.push_back(std::get<std::string>(r[idx]));
    }
    return out;
}

auto id_column(const Frame& frame) -> std::vector<std::int64_t> {
    std::vector<std::int64_t> out;
    for (const auto& r : frame.rows()) {
        out.push_back(std::get<std::int64_t>(r[0]));
    }
    return out;
}

auto require_error(const fanout::Result<Frame>& result, ErrorKind kind) {
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == kind);
}

}  // namespace

TEST_CASE("Flatten a single text column", "[flatten][frame]") {
    auto frame = make_frame({row(1, "a,b,c", "keep"), row(2, "d", "keep")});

    auto result = flatten_frame(frame, {.columns = {"a"}});
    REQUIRE(result.has_value());
    REQUIRE(result->num_rows() == 4);
    REQUIRE(text_column(*result, "a") == Strings{"a", "b", "c", "d"});
    REQUIRE(text_column(*result, "b") == Strings{"keep", "keep", "keep", "keep"});
    REQUIRE(id_column(*result) == std::vector<std::int64_t>{1, 1, 1, 2});
    REQUIRE(result->schema() == frame.schema());
}

TEST_CASE("Flatten a vector column narrows it to float64", "[flatten][frame]") {
    auto frame =
        make_frame({row(1, "x", "y", {1.0, 2.0, 3.0}), row(2, "x", "y", {4.0, 5.0, 6.0})});

    auto result = flatten_frame(frame, {.columns = {"v"}});
    REQUIRE(result.has_value());
    REQUIRE(result->schema().column_type("v").value() == DataType::float64());
    REQUIRE(result->schema().column_type("a").value() == DataType::string());
    REQUIRE(result->num_rows() == 6);
    for (std::size_t i = 0; i < result->num_rows(); ++i) {
        REQUIRE(std::get<double>(result->row(i)[3]) == static_cast<double>(i + 1));
        REQUIRE(std::get<std::string>(result->row(i)[1]) == "x");
    }
    REQUIRE(id_column(*result) == std::vector<std::int64_t>{1, 1, 1, 2, 2, 2});
}

TEST_CASE("Flatten two text columns together", "[flatten][frame]") {
    auto frame = make_frame({row(1, "x,y", "p")});

    for (const auto& columns : {Strings{"a", "b"}, Strings{"b", "a"}}) {
        auto result = flatten_frame(frame, {.columns = columns});
        REQUIRE(result.has_value());
        REQUIRE(result->num_rows() == 2);
        REQUIRE(text_column(*result, "a") == Strings{"x", "y"});
        REQUIRE(text_column(*result, "b") == Strings{"p", ""});
    }
}

TEST_CASE("Flatten honours per-column and broadcast delimiters", "[flatten][frame]") {
    auto frame = make_frame({row(1, "x|y", "p;q")});

    SECTION("one delimiter per column") {
        auto result =
            flatten_frame(frame, {.columns = {"a", "b"}, .delimiters = Strings{"|", ";"}});
        REQUIRE(result.has_value());
        REQUIRE(text_column(*result, "a") == Strings{"x", "y"});
        REQUIRE(text_column(*result, "b") == Strings{"p", "q"});
    }

    SECTION("broadcast delimiter") {
        auto result = flatten_frame(frame, {.columns = {"a", "b"}, .delimiters = Strings{"|"}});
        REQUIRE(result.has_value());
        REQUIRE(text_column(*result, "a") == Strings{"x", "y"});
        REQUIRE(text_column(*result, "b") == Strings{"p;q", ""});
    }
}

TEST_CASE("Rows without delimiters come back unchanged", "[flatten][frame]") {
    auto frame = make_frame({row(1, "x", "p"), row(2, "y", "q")});

    for (const auto& columns : {Strings{"a"}, Strings{"a", "b"}}) {
        auto result = flatten_frame(frame, {.columns = columns});
        REQUIRE(result.has_value());
        REQUIRE(result->num_rows() == frame.num_rows());
        for (std::size_t i = 0; i < frame.num_rows(); ++i) {
            REQUIRE(result->row(i) == frame.row(i));
        }
    }
}

TEST_CASE("Flattening an already flattened frame is a no-op", "[flatten][frame]") {
    auto frame = make_frame({row(1, "a,b", "p,q,r"), row(2, "c", "s")});
    FlattenArgs args{.columns = {"a", "b"}};

    auto once = flatten_frame(frame, args);
    REQUIRE(once.has_value());
    auto twice = flatten_frame(*once, args);
    REQUIRE(twice.has_value());
    REQUIRE(twice->num_rows() == once->num_rows());
    for (std::size_t i = 0; i < once->num_rows(); ++i) {
        REQUIRE(twice->row(i) == once->row(i));
    }
}

TEST_CASE("Flatten argument errors", "[flatten][frame]") {
    auto frame = make_frame({row(1, "a,b", "c")});

    SECTION("delimiter count mismatch") {
        require_error(
            flatten_frame(frame, {.columns = {"a", "b", "id"}, .delimiters = Strings{",", "|"}}),
            ErrorKind::InvalidArgument);
    }

    SECTION("unsupported column type") {
        require_error(flatten_frame(frame, {.columns = {"flag"}}), ErrorKind::UnsupportedType);
        require_error(flatten_frame(frame, {.columns = {"a", "id"}}), ErrorKind::UnsupportedType);
    }

    SECTION("unknown column") {
        require_error(flatten_frame(frame, {.columns = {"missing"}}), ErrorKind::InvalidArgument);
    }

    SECTION("repeated column") {
        require_error(flatten_frame(frame, {.columns = {"a", "a"}}), ErrorKind::InvalidArgument);
    }

    SECTION("no columns") {
        require_error(flatten_frame(frame, {.columns = {}}), ErrorKind::InvalidArgument);
    }

    SECTION("text and vector columns together") {
        require_error(flatten_frame(frame, {.columns = {"a", "v"}}), ErrorKind::InvalidArgument);
        require_error(flatten_frame(frame, {.columns = {"v", "a"}}), ErrorKind::InvalidArgument);
    }
}

TEST_CASE("Unsupported types fail before any row is processed", "[flatten][frame]") {
    // The text cell in "a" is malformed; planning must fail first.
    auto frame = make_frame({Row{std::int64_t{1}, std::int64_t{5}, std::string("b"),
                                 fanout::Vector{0.0, 0.0, 0.0}, true}});
    require_error(flatten_frame(frame, {.columns = {"a", "flag"}}), ErrorKind::UnsupportedType);

    auto result = flatten_frame(frame, {.columns = {"a"}});
    require_error(result, ErrorKind::TypeCoercionError);
}

TEST_CASE("plan_flatten picks the splitter", "[flatten][plan]") {
    auto schema = make_schema();

    auto single = plan_flatten(schema, {.columns = {"a"}});
    REQUIRE(single.has_value());
    REQUIRE(std::holds_alternative<fanout::flatten::TextSplitter>(single->splitter));
    REQUIRE(single->targets.front().delimiter == ",");

    auto multi = plan_flatten(schema, {.columns = {"b", "a"}, .delimiters = Strings{"|", ";"}});
    REQUIRE(multi.has_value());
    REQUIRE(std::holds_alternative<fanout::flatten::AlignedTextSplitter>(multi->splitter));
    REQUIRE(multi->targets.size() == 2);
    REQUIRE(multi->targets[0].index == 2);
    REQUIRE(multi->targets[0].delimiter == "|");
    REQUIRE(multi->targets[1].index == 1);
    REQUIRE(multi->targets[1].delimiter == ";");

    auto vec = plan_flatten(schema, {.columns = {"v"}});
    REQUIRE(vec.has_value());
    REQUIRE(std::holds_alternative<fanout::flatten::VectorSplitter>(vec->splitter));
    REQUIRE(vec->output_schema.column_type("v").value() == DataType::float64());
    REQUIRE(vec->targets.front().type == DataType::vector(3));
}

TEST_CASE("Parallel flatten matches sequential flatten", "[flatten][frame]") {
    std::vector<Row> rows;
    for (std::int64_t i = 0; i < 3000; ++i) {
        std::string a = std::to_string(i);
        for (std::int64_t k = 0; k < i % 4; ++k) {
            a += "," + std::to_string(k);
        }
        rows.push_back(row(i, a, i % 5 == 0 ? "u,v" : "w"));
    }
    auto frame = make_frame(std::move(rows));
    FlattenArgs args{.columns = {"a", "b"}};

    auto sequential = flatten_frame(frame, args, {.threads = 1});
    auto parallel = flatten_frame(frame, args, {.threads = 6, .min_rows_per_thread = 100});
    REQUIRE(sequential.has_value());
    REQUIRE(parallel.has_value());
    REQUIRE(parallel->num_rows() == sequential->num_rows());
    for (std::size_t i = 0; i < sequential->num_rows(); ++i) {
        REQUIRE(parallel->row(i) == sequential->row(i));
    }
}
