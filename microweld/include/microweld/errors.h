#ifndef MICROWELD_ERRORS_H
#define MICROWELD_ERRORS_H

#include <stdexcept>
#include <string>

namespace microweld {
namespace core {

/**
 * Failure kinds reported to callers of the conversion pipeline. Each kind
 * maps to a different remedy (input, file name, configuration, disk).
 */
enum class ErrorKind {
    NONE,
    FILENAME_TOO_LONG,
    MALFORMED_EVENT_SEQUENCE,
    DEGENERATE_GEOMETRY,
    IO_FAILURE,
    INVALID_CONFIG
};

std::string errorKindToString(ErrorKind kind);

/**
 * Base class of every error thrown by the library
 */
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

// Unusable geometry: non-positive spacing or radius, or nothing left to emit
class GeometryError : public Error {
public:
    explicit GeometryError(const std::string& message)
        : Error(ErrorKind::DEGENERATE_GEOMETRY, message) {}
};

// Broken event producer: events out of PathStart -> PointAdded* -> PathComplete order
class SequenceError : public Error {
public:
    explicit SequenceError(const std::string& message)
        : Error(ErrorKind::MALFORMED_EVENT_SEQUENCE, message) {}
};

// Output file name rejected before anything is written
class FilenameError : public Error {
public:
    FilenameError(const std::string& filename, size_t length, size_t limit);

    const std::string& filename() const { return m_filename; }
    size_t length() const { return m_length; }
    size_t limit() const { return m_limit; }

private:
    std::string m_filename;
    size_t m_length;
    size_t m_limit;
};

class IoError : public Error {
public:
    explicit IoError(const std::string& message)
        : Error(ErrorKind::IO_FAILURE, message) {}
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message)
        : Error(ErrorKind::INVALID_CONFIG, message) {}
};

} // namespace core
} // namespace microweld

#endif // MICROWELD_ERRORS_H
