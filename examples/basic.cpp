#include <fanout/fanout.hpp>

#include <fmt/core.h>

#include <cstdint>
#include <string>
#include <vector>

auto main() -> int {
    using fanout::DataType;

    auto schema = fanout::Schema::from({
        {.name = "id", .type = DataType::int64()},
        {.name = "animals", .type = DataType::string()},
        {.name = "sounds", .type = DataType::string()},
        {.name = "weights", .type = DataType::vector(3)},
    });
    if (!schema) {
        fmt::print("error: {}\n", schema.error().format());
        return 1;
    }

    auto frame = fanout::Frame::make(*schema, {
                                                  {std::int64_t{1}, std::string("dog,cat"),
                                                   std::string("woof|meow"),
                                                   fanout::Vector{0.5, 1.5, 2.5}},
                                                  {std::int64_t{2}, std::string("cow"),
                                                   std::string("moo"),
                                                   fanout::Vector{3.0, 4.0, 5.0}},
                                              });
    if (!frame) {
        fmt::print("error: {}\n", frame.error().format());
        return 1;
    }

    fmt::print("=== Input ===\n");
    fanout::io::print(*frame);

    // Both text columns are split in one pass and aligned by token position.
    fmt::print("\n=== Flatten animals (',') and sounds ('|') ===\n");
    fanout::flatten::FlattenArgs text_args{.columns = {"animals", "sounds"},
                                           .delimiters = std::vector<std::string>{",", "|"}};
    auto text = fanout::flatten::flatten_frame(*frame, text_args);
    if (!text) {
        fmt::print("error: {}\n", text.error().format());
        return 1;
    }
    fanout::io::print(*text);

    // A vector column becomes one float64 row per element.
    fmt::print("\n=== Flatten weights ===\n");
    auto vec = fanout::flatten::flatten_frame(*frame, {.columns = {"weights"}});
    if (!vec) {
        fmt::print("error: {}\n", vec.error().format());
        return 1;
    }
    fanout::io::print(*vec);

    return 0;
}
