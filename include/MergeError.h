#pragma once
#include <string>
#include <stdexcept>

enum class ErrorKind {
    UnreadableArchive,    // cannot open/parse a source
    EmptyArchive,         // no qualifying entries
    CorruptEntry,         // one entry unreadable mid-stream
    PathRejected,         // traversal / unsafe name
    NoFormatsSelected,
    OperationInProgress,
    Cancelled,
    IOFailure,            // disk full, permission denied on write
    InvalidOutput,        // destination path rejected before any work
    InvalidChapter        // chapter number below 1
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::UnreadableArchive:   return "UnreadableArchive";
    case ErrorKind::EmptyArchive:        return "EmptyArchive";
    case ErrorKind::CorruptEntry:        return "CorruptEntry";
    case ErrorKind::PathRejected:        return "PathRejected";
    case ErrorKind::NoFormatsSelected:   return "NoFormatsSelected";
    case ErrorKind::OperationInProgress: return "OperationInProgress";
    case ErrorKind::Cancelled:           return "Cancelled";
    case ErrorKind::IOFailure:           return "IOFailure";
    case ErrorKind::InvalidOutput:       return "InvalidOutput";
    case ErrorKind::InvalidChapter:      return "InvalidChapter";
    }
    return "Unknown";
}

class MergeError : public std::runtime_error {
public:
    MergeError(ErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), m_kind(kind) {}

    ErrorKind kind() const noexcept { return m_kind; }

private:
    ErrorKind m_kind;
};

// Skipped entry or source with the reason it was skipped.
struct Issue {
    ErrorKind kind;
    std::string subject;   // entry name or source path
    std::string reason;
};
