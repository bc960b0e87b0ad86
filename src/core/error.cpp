#include <fanout/core/error.hpp>

#include <fmt/format.h>

namespace fanout {

auto to_string(ErrorKind kind) -> std::string_view {
    switch (kind) {
        case ErrorKind::InvalidArgument:
            return "invalid argument";
        case ErrorKind::UnsupportedType:
            return "unsupported type";
        case ErrorKind::TypeCoercionError:
            return "type coercion error";
        case ErrorKind::IoError:
            return "io error";
    }
    return "unknown error";
}

auto Error::format() const -> std::string {
    return fmt::format("{}: {}", to_string(kind), message);
}

}  // namespace fanout
