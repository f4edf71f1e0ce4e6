#pragma once

#include <stdexcept>
#include <string>

namespace imm {

enum class ErrorKind {
    InvalidHeight,
    CapacityExceeded,
    DuplicateKey,
    KeyNotFound,
    KeyPresent,
    IndexOutOfRange,
};

const char* toString(ErrorKind kind);

// Base of every failure raised by the stateful map. A throwing mutation leaves the map unchanged.
class MapError : public std::runtime_error {
public:
    MapError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class InvalidHeightError : public MapError {
public:
    explicit InvalidHeightError(const std::string& message)
        : MapError(ErrorKind::InvalidHeight, message) {}
};

class CapacityExceededError : public MapError {
public:
    explicit CapacityExceededError(const std::string& message)
        : MapError(ErrorKind::CapacityExceeded, message) {}
};

class DuplicateKeyError : public MapError {
public:
    explicit DuplicateKeyError(const std::string& message)
        : MapError(ErrorKind::DuplicateKey, message) {}
};

class KeyNotFoundError : public MapError {
public:
    explicit KeyNotFoundError(const std::string& message)
        : MapError(ErrorKind::KeyNotFound, message) {}
};

class KeyPresentError : public MapError {
public:
    explicit KeyPresentError(const std::string& message)
        : MapError(ErrorKind::KeyPresent, message) {}
};

class IndexOutOfRangeError : public MapError {
public:
    explicit IndexOutOfRangeError(const std::string& message)
        : MapError(ErrorKind::IndexOutOfRange, message) {}
};

// Outcome of stateless witness verification. Only Ok means the transition is accepted.
enum class VerifyStatus {
    Ok,
    OldRootMismatch,
    NewRootMismatch,
    OrderingViolation,
    InvalidWitness,
    ChainBroken,
};

const char* toString(VerifyStatus status);

class CodecError : public std::runtime_error {
public:
    explicit CodecError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace imm
