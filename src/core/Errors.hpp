#pragma once
#include <stdexcept>
#include <string>

class SwarmError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Descriptor arithmetic that cannot describe a download.
class InvalidGeometry : public SwarmError {
public:
    using SwarmError::SwarmError;
};

// An output file already exists and overwriting was not requested.
class FileConflict : public SwarmError {
public:
    using SwarmError::SwarmError;
};

enum class IoErrorKind { NotFound, Permission, DiskFull, Truncated, Other };

const char* to_string(IoErrorKind kind);

class IoError : public SwarmError {
public:
    IoError(IoErrorKind kind, const std::string& message);

    IoErrorKind get_kind() const { return kind; }

    // maps errno values onto IoErrorKind
    static IoError from_errno(int err, const std::string& context);

private:
    IoErrorKind kind;
};

// Offsets or indices outside the torrent. Indicates a caller bug.
class OutOfRange : public SwarmError {
public:
    using SwarmError::SwarmError;
};

class TrackerError : public SwarmError {
public:
    using SwarmError::SwarmError;
};

class DecodeError : public SwarmError {
public:
    using SwarmError::SwarmError;
};
