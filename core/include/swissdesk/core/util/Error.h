#pragma once

#include <string>

namespace swissdesk::core::util {

enum class ErrorKind {
    None,
    Validation,
    Sequence,
    PairingExhausted,
    Decode,
    Io
};

struct Error {
    ErrorKind kind = ErrorKind::None;
    std::string message;
};

std::string ErrorKindToString(ErrorKind kind);

// Fills |error| when non-null and returns false so callers can write
// `return Fail(error, ErrorKind::Validation, "...");`.
bool Fail(Error* error, ErrorKind kind, const std::string& message);

}  // namespace swissdesk::core::util
