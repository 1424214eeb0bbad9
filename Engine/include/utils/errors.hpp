#pragma once

#include <stdexcept>
#include <string>

namespace ChainReplay {

// Error kinds raised by the replay pipeline. All derive from std::runtime_error
// so callers that only care about "something failed" can catch that.

/** Log, cache or preorg file could not be opened, read or written. */
class IoError : public std::runtime_error {
public:
    explicit IoError(const std::string& msg) : std::runtime_error(msg) {}
};

/** Malformed line or payload, or a payload that does not match its path's schema. */
class ParseError : public std::runtime_error {
public:
    explicit ParseError(const std::string& msg) : std::runtime_error(msg) {}
};

/** Database failure: connection loss, rejected statement, failed COPY. */
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& msg) : std::runtime_error(msg) {}
};

/** A uniqueness or referential constraint rejected data; the message names the key. */
class ConstraintViolation : public StorageError {
public:
    explicit ConstraintViolation(const std::string& msg) : StorageError(msg) {}
};

} // namespace ChainReplay
