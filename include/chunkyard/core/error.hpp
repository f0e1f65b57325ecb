#pragma once

#include <string>

namespace chunkyard {

/**
 * @brief Failure kinds reported by the storage engine and its boundary layers
 *
 * The first five mirror the storage-root probe steps; they are also reused by
 * the chunk store and the reassembler for the matching I/O failures.
 */
enum class ErrorCode {
    NoRootDirectory,
    CannotCreateDirectory,
    CannotWriteFile,
    CannotReadFile,
    CannotDelete,
    IoError,
    InvalidDescriptor,
    InvalidConfig,
    MalformedRequest
};

inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::NoRootDirectory: return "NoRootDirectory";
        case ErrorCode::CannotCreateDirectory: return "CannotCreateDirectory";
        case ErrorCode::CannotWriteFile: return "CannotWriteFile";
        case ErrorCode::CannotReadFile: return "CannotReadFile";
        case ErrorCode::CannotDelete: return "CannotDelete";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::InvalidDescriptor: return "InvalidDescriptor";
        case ErrorCode::InvalidConfig: return "InvalidConfig";
        case ErrorCode::MalformedRequest: return "MalformedRequest";
    }
    return "Unknown";
}

struct Error {
    ErrorCode code = ErrorCode::IoError;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    bool operator==(const Error& other) const {
        return code == other.code && message == other.message;
    }
    bool operator!=(const Error& other) const { return !(*this == other); }
};

/**
 * @brief Canonical error for a storage-root probe failure
 *
 * Messages carry the "chunkyard:" prefix so they read sensibly when surfaced
 * verbatim to an HTTP client.
 */
inline Error root_error(ErrorCode code) {
    switch (code) {
        case ErrorCode::NoRootDirectory:
            return {code, "chunkyard: the storage root directory doesn't exist"};
        case ErrorCode::CannotCreateDirectory:
            return {code, "chunkyard: can't create a directory under the storage root"};
        case ErrorCode::CannotWriteFile:
            return {code, "chunkyard: can't write to a file under the storage root"};
        case ErrorCode::CannotReadFile:
            return {code, "chunkyard: can't read a file under the storage root (or got back bad data)"};
        case ErrorCode::CannotDelete:
            return {code, "chunkyard: can't delete a file/directory under the storage root"};
        default:
            return {code, std::string("chunkyard: ") + error_code_name(code)};
    }
}

} // namespace chunkyard
