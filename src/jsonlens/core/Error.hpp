#pragma once
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace JL {

struct Error {
    enum class Code {
        UnknownError = 0,
        MalformedInput,
        DepthExceeded,
        SizeExceeded,
        IoError,
        NoSuchPath,
        InvalidPath,
        Timeout,
        InvalidPattern,
        Cancelled,
        InvalidConfig,
        NotSupported,
        ShuttingDown
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}
    Error(Code c, std::string m, std::size_t offset)
        : code(c), message(std::move(m)), byteOffset(offset) {}

    Code                       code;
    std::optional<std::string> message;
    // Position in the source text, only known for parse failures.
    std::optional<std::size_t> byteOffset;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::DepthExceeded:
        return "depth_exceeded";
    case Error::Code::SizeExceeded:
        return "size_exceeded";
    case Error::Code::IoError:
        return "io_error";
    case Error::Code::NoSuchPath:
        return "no_such_path";
    case Error::Code::InvalidPath:
        return "invalid_path";
    case Error::Code::Timeout:
        return "timeout";
    case Error::Code::InvalidPattern:
        return "invalid_pattern";
    case Error::Code::Cancelled:
        return "cancelled";
    case Error::Code::InvalidConfig:
        return "invalid_config";
    case Error::Code::NotSupported:
        return "not_supported";
    case Error::Code::ShuttingDown:
        return "shutting_down";
    }
    return "unknown_error";
}

// Parse-class errors abort an open attempt; everything else is local to one operation.
[[nodiscard]] inline auto isParseError(Error const& error) -> bool {
    switch (error.code) {
    case Error::Code::MalformedInput:
    case Error::Code::DepthExceeded:
    case Error::Code::SizeExceeded:
    case Error::Code::IoError:
        return true;
    default:
        return false;
    }
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    std::string description{label};
    if (error.message && !error.message->empty()) {
        description.reserve(label.size() + 1 + error.message->size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
    }
    if (error.byteOffset) {
        description.append(" (at byte ");
        description.append(std::to_string(*error.byteOffset));
        description.push_back(')');
    }
    return description;
}

} // namespace JL
