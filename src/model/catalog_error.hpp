#pragma once

#include <string>

namespace mangashelf {

enum class ErrorKind {
    kNone,
    kValidation,       // record fails structural invariants
    kMetadata,         // sidecar read/decode/write failure, unreadable directory
    kSeriesNotFound,
    kChapterNotFound,
    kPageNotFound,
    kAlreadyExists,    // admin create of an existing series id
};

// Typed failure filled in by engine operations that return false.
struct CatalogError {
    ErrorKind kind = ErrorKind::kNone;
    std::string message;

    bool ok() const { return kind == ErrorKind::kNone; }
    void clear() { kind = ErrorKind::kNone; message.clear(); }

    // Sets kind and message; returns false so callers can
    // `return err.set(...)`.
    bool set(ErrorKind k, const std::string& msg) {
        kind = k;
        message = msg;
        return false;
    }

    bool is_not_found() const {
        return kind == ErrorKind::kSeriesNotFound ||
               kind == ErrorKind::kChapterNotFound ||
               kind == ErrorKind::kPageNotFound;
    }

    // "<kind label>: <message>", e.g. "manga not found: no manga with ID: x"
    std::string what() const;
};

const char* error_kind_label(ErrorKind kind);

} // namespace mangashelf
