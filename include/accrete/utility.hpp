#pragma once

#include <cstdint>
#include <expected>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace accrete {

enum class ErrorKind : uint8_t {
    MissingField,
    MalformedCache,
    EmptyIdentifier,
    InvalidPath,
    InvalidEncoding,
    DuplicateRuleName,
    DuplicateOutput,
    DependencyCycle,
    ConcurrentModification,
    Io,
    Usage,
};

std::string_view to_string(ErrorKind kind);

/**
 * @brief Error value carried by `Result`.
 *
 * `kind` drives the process exit status, `message` is what gets printed.
 */
struct Error {
    ErrorKind kind;
    std::string message;
};

template <typename T>
using Result = std::expected<T, Error>;

inline std::unexpected<Error> fail(ErrorKind kind, std::string message) {
    return std::unexpected(Error{kind, std::move(message)});
}

} // namespace accrete

template <>
struct std::formatter<accrete::Error> : std::formatter<std::string_view> {
    auto format(const accrete::Error &err, std::format_context &ctx) const {
        return std::format_to(ctx.out(), "[{}] {}", accrete::to_string(err.kind), err.message);
    }
};
