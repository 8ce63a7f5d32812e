#pragma once

#include <string>
#include <string_view>

enum class ErrorKind {
    ResourceProbeFailure,
    LoadFailed,
    TranscribeFailed,
    FileNotFound,
    AlreadyRunning,
    NotReady,
    IndexOutOfRange,
    PersistFailed,
    WriteFailed,
};

struct Error {
    ErrorKind kind;
    std::string detail;
};

// Stable machine-readable code, e.g. "load_failed". Used on the IPC wire.
std::string_view to_string(ErrorKind kind);

// Human-readable message for display, with the detail appended when present.
std::string describe(const Error& err);
