#pragma once

#include <string>
#include <utility>

namespace wordpulse {

/// Failure categories reported across the configuration and export boundaries
enum class ErrorKind {
    None,
    Configuration,  // Rejected before any scheduler starts
    Resource,       // Encoder or output path unavailable
    Interrupted     // User stop/cancel: a normal terminal transition
};

inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:          return "ok";
        case ErrorKind::Configuration: return "configuration error";
        case ErrorKind::Resource:      return "resource error";
        case ErrorKind::Interrupted:   return "interrupted";
    }
    return "unknown";
}

/// Result of an operation that can fail at a boundary.
struct Status {
    ErrorKind kind = ErrorKind::None;
    std::string message;

    bool ok() const { return kind == ErrorKind::None; }

    static Status success() { return {}; }

    static Status configuration(std::string msg) {
        return {ErrorKind::Configuration, std::move(msg)};
    }
    static Status resource(std::string msg) {
        return {ErrorKind::Resource, std::move(msg)};
    }
    static Status interrupted(std::string msg = "cancelled") {
        return {ErrorKind::Interrupted, std::move(msg)};
    }

    /// "configuration error: bpm must be positive"
    std::string describe() const {
        if (ok()) return errorKindName(kind);
        return std::string(errorKindName(kind)) + ": " + message;
    }
};

} // namespace wordpulse
