#include "swissdesk/core/util/Error.h"

namespace swissdesk::core::util {

std::string ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return "none";
        case ErrorKind::Validation:
            return "validation";
        case ErrorKind::Sequence:
            return "sequence";
        case ErrorKind::PairingExhausted:
            return "pairing_exhausted";
        case ErrorKind::Decode:
            return "decode";
        case ErrorKind::Io:
            return "io";
    }
    return "unknown";
}

bool Fail(Error* error, ErrorKind kind, const std::string& message) {
    if (error) {
        error->kind = kind;
        error->message = message;
    }
    return false;
}

}  // namespace swissdesk::core::util
