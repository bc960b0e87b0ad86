#pragma once

#include <fanout/core/frame.hpp>

#include <cstddef>
#include <iostream>
#include <limits>

namespace fanout::io {

/// Render a frame as an aligned text table with a header, a "name:type" line
/// and at most `max_rows` data rows.
void print(const Frame& frame, std::ostream& out = std::cout,
           std::size_t max_rows = std::numeric_limits<std::size_t>::max());

}  // namespace fanout::io
