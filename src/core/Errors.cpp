#include "Errors.hpp"
#include <cerrno>
#include <cstring>

const char* to_string(IoErrorKind kind) {
    switch (kind) {
        case IoErrorKind::NotFound: return "not found";
        case IoErrorKind::Permission: return "permission denied";
        case IoErrorKind::DiskFull: return "disk full";
        case IoErrorKind::Truncated: return "truncated";
        case IoErrorKind::Other: return "i/o error";
    }
    return "i/o error";
}

IoError::IoError(IoErrorKind kind, const std::string& message)
    : SwarmError(message + " (" + to_string(kind) + ")"), kind(kind) {}

IoError IoError::from_errno(int err, const std::string& context) {
    IoErrorKind kind = IoErrorKind::Other;
    switch (err) {
        case ENOENT:
        case ENOTDIR:
            kind = IoErrorKind::NotFound;
            break;
        case EACCES:
        case EPERM:
        case EROFS:
            kind = IoErrorKind::Permission;
            break;
        case ENOSPC:
        case EDQUOT:
        case EFBIG:
            kind = IoErrorKind::DiskFull;
            break;
        default:
            break;
    }
    return IoError(kind, context + ": " + std::strerror(err));
}
