#include <fanout/flatten/flatten.hpp>
#include <fanout/io/csv.hpp>
#include <fanout/io/print.hpp>

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <spdlog/sinks/stderr_color_sinks.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

auto fail(const fanout::Error& error) -> int {
    fmt::print(stderr, "error: {}\n", error.format());
    return 1;
}

auto threads_from_env() -> std::optional<std::size_t> {
    const char* env = std::getenv("FANOUT_THREADS");
    if (env == nullptr) {
        return std::nullopt;
    }
    std::string_view text{env};
    std::size_t value = 0;
    auto parsed = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || parsed.ec != std::errc() || parsed.ptr != text.data() + text.size()) {
        spdlog::warn("ignoring FANOUT_THREADS='{}': not a thread count", text);
        return std::nullopt;
    }
    return value;
}

}  // namespace

auto main(int argc, char** argv) -> int {
    CLI::App app{"fanout — spread delimited text or vector cells over multiple rows"};
    app.set_version_flag("--version", "fanout 0.1.0");

    std::string input_path;
    std::string output_path;
    std::vector<std::string> columns;
    std::vector<std::string> delimiters;
    std::string schema_spec;
    std::size_t threads = 0;
    std::size_t min_rows_per_thread = fanout::runtime::TransformOptions{}.min_rows_per_thread;
    bool pretty = false;
    bool verbose = false;

    app.add_option("input", input_path, "Input CSV file ('-' reads stdin)")->required();
    app.add_option("-c,--columns", columns, "Columns to flatten, in processing order")
        ->required()
        ->delimiter(',');
    app.add_option("-d,--delimiter", delimiters,
                   "Delimiter for each column (repeatable). A single delimiter is used for "
                   "every column; the default is a comma.");
    app.add_option("--schema", schema_spec,
                   "Column types as name:type,... (int64, float64, string, bool, vector(N)). "
                   "Undeclared columns are inferred.");
    app.add_option("-o,--output", output_path, "Output CSV file (default: stdout)");
    auto* threads_opt =
        app.add_option("-j,--threads", threads,
                       "Worker threads (0 = hardware concurrency). Defaults to FANOUT_THREADS.");
    app.add_option("--min-rows-per-thread", min_rows_per_thread,
                   "Smallest partition handed to a worker thread");
    app.add_flag("--pretty", pretty, "Print the result as a table instead of CSV");
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");

    CLI11_PARSE(app, argc, argv);

    // Logs go to stderr so that CSV written to stdout stays clean.
    spdlog::set_default_logger(spdlog::stderr_color_mt("fanout"));
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);

    if (threads_opt->count() == 0) {
        if (auto env = threads_from_env()) {
            threads = *env;
        }
    }

    fanout::io::CsvReadOptions read_options;
    if (!schema_spec.empty()) {
        auto declared = fanout::io::parse_schema_spec(schema_spec);
        if (!declared) {
            return fail(declared.error());
        }
        read_options.column_types = std::move(*declared);
    }

    auto input = input_path == "-" ? fanout::io::read_csv(std::cin, read_options)
                                   : fanout::io::read_csv(input_path, read_options);
    if (!input) {
        return fail(input.error());
    }

    fanout::flatten::FlattenArgs args;
    args.columns = columns;
    if (!delimiters.empty()) {
        args.delimiters = delimiters;
    }
    fanout::runtime::TransformOptions options{.threads = threads,
                                              .min_rows_per_thread = min_rows_per_thread};

    auto output = fanout::flatten::flatten_frame(*input, args, options);
    if (!output) {
        return fail(output.error());
    }
    spdlog::info("flattened {} rows into {} rows", input->num_rows(), output->num_rows());

    if (pretty) {
        fanout::io::print(*output, std::cout);
        return 0;
    }
    if (output_path.empty()) {
        auto written = fanout::io::write_csv(*output, std::cout);
        if (!written) {
            return fail(written.error());
        }
        return 0;
    }
    auto written = fanout::io::write_csv(*output, output_path);
    if (!written) {
        return fail(written.error());
    }
    spdlog::debug("wrote {} rows to {}", *written, output_path);
    return 0;
}
