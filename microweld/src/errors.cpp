#include "microweld/errors.h"

namespace microweld {
namespace core {

std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:                     return "none";
        case ErrorKind::FILENAME_TOO_LONG:        return "filename-too-long";
        case ErrorKind::MALFORMED_EVENT_SEQUENCE: return "malformed-event-sequence";
        case ErrorKind::DEGENERATE_GEOMETRY:      return "degenerate-geometry";
        case ErrorKind::IO_FAILURE:               return "io-failure";
        case ErrorKind::INVALID_CONFIG:           return "invalid-config";
    }
    return "unknown";
}

FilenameError::FilenameError(const std::string& filename, size_t length, size_t limit)
    : Error(ErrorKind::FILENAME_TOO_LONG,
            "G-code filename '" + filename + "' is " + std::to_string(length) +
            " characters long, which exceeds the " + std::to_string(limit) +
            " character limit (extension included)"),
      m_filename(filename),
      m_length(length),
      m_limit(limit) {}

} // namespace core
} // namespace microweld
