#pragma once

/// Convenience umbrella header for the fanout library.

#include <fanout/core/error.hpp>
#include <fanout/core/frame.hpp>
#include <fanout/core/schema.hpp>
#include <fanout/core/types.hpp>
#include <fanout/flatten/delimiters.hpp>
#include <fanout/flatten/flatten.hpp>
#include <fanout/flatten/splitters.hpp>
#include <fanout/io/csv.hpp>
#include <fanout/io/print.hpp>
#include <fanout/runtime/row_stream.hpp>
