#pragma once

#include <expected>
#include <string>
#include <utility>

enum class ErrorKind {
    BadRequest,      // missing filename, disallowed extension, malformed body
    PayloadTooLarge, // upload above the configured maximum
    ModelLoad,       // primary and fallback model initialization both failed
    Transcription,   // decoding or inference failed
    Download,        // remote fetch failed (status, network, timeout)
    Internal,        // local I/O failures (temp dir not writable, ...)
};

struct Error {
    ErrorKind kind = ErrorKind::Internal;
    std::string message;

    // Request-shape violations are answered with an HTTP error status;
    // everything else becomes a structured failure payload.
    bool is_client_error() const {
        return kind == ErrorKind::BadRequest || kind == ErrorKind::PayloadTooLarge;
    }

    int http_status() const {
        switch (kind) {
            case ErrorKind::BadRequest: return 400;
            case ErrorKind::PayloadTooLarge: return 413;
            default: return 200;
        }
    }
};

template <typename T>
using Result = std::expected<T, Error>;

inline std::unexpected<Error> make_error(ErrorKind kind, std::string message) {
    return std::unexpected(Error{kind, std::move(message)});
}

const char* to_string(ErrorKind kind);
