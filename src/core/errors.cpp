#include "errors.h"

#include <utility>

namespace polyglot {

ErrorKind kind_of(ErrorCode code) noexcept {
    switch (code) {
    case ErrorCode::BadSignature:
    case ErrorCode::Truncated:
    case ErrorCode::InconsistentDirectory:
        return ErrorKind::MalformedInput;
    case ErrorCode::ChecksumMismatch:
        return ErrorKind::IntegrityFailure;
    case ErrorCode::TrailerNotFound:
    case ErrorCode::EntryNotFound:
    case ErrorCode::MissingChunk:
    case ErrorCode::PayloadNotFound:
        return ErrorKind::StructuralNotFound;
    case ErrorCode::Unsupported64Bit:
    case ErrorCode::UnsupportedMethod:
    case ErrorCode::MultiVolume:
        return ErrorKind::UnsupportedVariant;
    case ErrorCode::OffsetOverflow:
    case ErrorCode::SizeOverflow:
        return ErrorKind::CapacityExceeded;
    case ErrorCode::AlreadyRelocated:
    case ErrorCode::AlreadyConsumed:
    case ErrorCode::StrategyMismatch:
        return ErrorKind::SequencingViolation;
    case ErrorCode::IoFailure:
        return ErrorKind::Io;
    }
    return ErrorKind::MalformedInput;
}

const char *to_string(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::MalformedInput: return "MalformedInput";
    case ErrorKind::IntegrityFailure: return "IntegrityFailure";
    case ErrorKind::StructuralNotFound: return "StructuralNotFound";
    case ErrorKind::UnsupportedVariant: return "UnsupportedVariant";
    case ErrorKind::CapacityExceeded: return "CapacityExceeded";
    case ErrorKind::SequencingViolation: return "SequencingViolation";
    case ErrorKind::Io: return "Io";
    }
    return "Unknown";
}

const char *to_string(ErrorCode code) noexcept {
    switch (code) {
    case ErrorCode::BadSignature: return "BadSignature";
    case ErrorCode::Truncated: return "Truncated";
    case ErrorCode::InconsistentDirectory: return "InconsistentDirectory";
    case ErrorCode::ChecksumMismatch: return "ChecksumMismatch";
    case ErrorCode::TrailerNotFound: return "TrailerNotFound";
    case ErrorCode::EntryNotFound: return "EntryNotFound";
    case ErrorCode::MissingChunk: return "MissingChunk";
    case ErrorCode::PayloadNotFound: return "PayloadNotFound";
    case ErrorCode::Unsupported64Bit: return "Unsupported64Bit";
    case ErrorCode::UnsupportedMethod: return "UnsupportedMethod";
    case ErrorCode::MultiVolume: return "MultiVolume";
    case ErrorCode::OffsetOverflow: return "OffsetOverflow";
    case ErrorCode::SizeOverflow: return "SizeOverflow";
    case ErrorCode::AlreadyRelocated: return "AlreadyRelocated";
    case ErrorCode::AlreadyConsumed: return "AlreadyConsumed";
    case ErrorCode::StrategyMismatch: return "StrategyMismatch";
    case ErrorCode::IoFailure: return "IoFailure";
    }
    return "Unknown";
}

PolyglotError::PolyglotError(ErrorCode code, const std::string &message,
                             std::string subject)
    : std::runtime_error(message), _code(code), _subject(std::move(subject)) {}

ExtractionError::ExtractionError(const PolyglotError &cause)
    : PolyglotError(cause.code(), cause.what(), cause.subject()) {}

} // namespace polyglot
