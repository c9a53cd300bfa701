#include "error.hpp"

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::BadRequest: return "bad_request";
        case ErrorKind::PayloadTooLarge: return "payload_too_large";
        case ErrorKind::ModelLoad: return "model_load";
        case ErrorKind::Transcription: return "transcription";
        case ErrorKind::Download: return "download";
        case ErrorKind::Internal: return "internal";
    }
    return "unknown";
}
