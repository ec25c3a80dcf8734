#pragma once

#include <string>
#include <string_view>

enum class ErrorKind {
    Construction, // script load, entry point lookup or new_model() failed
    Invocation,   // transcribe_audio() raised or returned a non-sequence
    Decoding,     // a returned segment tuple has the wrong shape
};

struct TranscribeError {
    ErrorKind kind;
    std::string message;
};

inline std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Construction: return "construction";
        case ErrorKind::Invocation: return "invocation";
        case ErrorKind::Decoding: return "decoding";
    }
    return "unknown";
}
