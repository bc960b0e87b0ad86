#include <fanout/io/print.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <string>
#include <vector>

namespace fanout::io {

void print(const Frame& frame, std::ostream& out, std::size_t max_rows) {
    const auto& columns = frame.schema().columns();
    if (columns.empty()) {
        out << "(empty frame)\n";
        return;
    }

    const std::size_t shown = std::min(frame.num_rows(), max_rows);

    // Collect all cell strings and compute column widths.
    std::vector<std::vector<std::string>> cells(columns.size());
    std::vector<std::string> types(columns.size());
    std::vector<std::size_t> widths(columns.size());

    for (std::size_t c = 0; c < columns.size(); ++c) {
        types[c] = columns[c].type.name();
        widths[c] = std::max(columns[c].name.size(), types[c].size());
        cells[c].reserve(shown);
        for (std::size_t r = 0; r < shown; ++r) {
            auto s = format_cell(frame.row(r)[c]);
            widths[c] = std::max(widths[c], s.size());
            cells[c].push_back(std::move(s));
        }
    }

    auto print_line = [&](auto&& text_at) {
        for (std::size_t c = 0; c < columns.size(); ++c) {
            if (c > 0)
                out << "  ";
            out << fmt::format("{:<{}}", text_at(c), widths[c]);
        }
        out << "\n";
    };

    print_line([&](std::size_t c) -> const std::string& { return columns[c].name; });
    print_line([&](std::size_t c) -> const std::string& { return types[c]; });
    for (std::size_t c = 0; c < columns.size(); ++c) {
        if (c > 0)
            out << "  ";
        out << std::string(widths[c], '-');
    }
    out << "\n";
    for (std::size_t r = 0; r < shown; ++r) {
        print_line([&](std::size_t c) -> const std::string& { return cells[c][r]; });
    }
    if (shown < frame.num_rows()) {
        out << fmt::format("... ({} more rows)\n", frame.num_rows() - shown);
    }
}

}  // namespace fanout::io
