#include "errors.hpp"

namespace imm {

const char* toString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::InvalidHeight:
        return "InvalidHeight";
    case ErrorKind::CapacityExceeded:
        return "CapacityExceeded";
    case ErrorKind::DuplicateKey:
        return "DuplicateKey";
    case ErrorKind::KeyNotFound:
        return "KeyNotFound";
    case ErrorKind::KeyPresent:
        return "KeyPresent";
    case ErrorKind::IndexOutOfRange:
        return "IndexOutOfRange";
    }
    return "Unknown";
}

MapError::MapError(ErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(toString(kind)) + ": " + message)
    , kind_(kind) {}

const char* toString(VerifyStatus status) {
    switch (status) {
    case VerifyStatus::Ok:
        return "Ok";
    case VerifyStatus::OldRootMismatch:
        return "OldRootMismatch";
    case VerifyStatus::NewRootMismatch:
        return "NewRootMismatch";
    case VerifyStatus::OrderingViolation:
        return "OrderingViolation";
    case VerifyStatus::InvalidWitness:
        return "InvalidWitness";
    case VerifyStatus::ChainBroken:
        return "ChainBroken";
    }
    return "Unknown";
}

} // namespace imm
