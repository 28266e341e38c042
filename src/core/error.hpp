#pragma once

#include <string>
#include <string_view>

namespace chunkdump {

/// Failure categories of the chunk engine
enum class ErrorCode {
    NotFound,            // group key has no records at all
    Exhausted,           // group key exists, every record already read
    UnsupportedAddress,  // chunk type has no group key derivation
    Decode,              // record could not be parsed
    Io,                  // seek, read or write failure
    InvalidArgument
};

[[nodiscard]] constexpr std::string_view error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NotFound: return "not found";
        case ErrorCode::Exhausted: return "exhausted";
        case ErrorCode::UnsupportedAddress: return "unsupported address";
        case ErrorCode::Decode: return "decode error";
        case ErrorCode::Io: return "i/o error";
        case ErrorCode::InvalidArgument: return "invalid argument";
    }
    return "unknown";
}

/// Error value carried by Result
struct Error {
    ErrorCode code;
    std::string message;

    [[nodiscard]] bool is(ErrorCode c) const noexcept {
        return code == c;
    }

    /// "<code name>: <message>"
    [[nodiscard]] std::string to_string() const {
        std::string out(error_code_name(code));
        if (!message.empty()) {
            out += ": ";
            out += message;
        }
        return out;
    }
};

}  // namespace chunkdump
