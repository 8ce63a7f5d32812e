#include "error.hpp"

#include <format>

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ResourceProbeFailure: return "resource_probe_failure";
        case ErrorKind::LoadFailed: return "load_failed";
        case ErrorKind::TranscribeFailed: return "transcribe_failed";
        case ErrorKind::FileNotFound: return "file_not_found";
        case ErrorKind::AlreadyRunning: return "already_running";
        case ErrorKind::NotReady: return "not_ready";
        case ErrorKind::IndexOutOfRange: return "index_out_of_range";
        case ErrorKind::PersistFailed: return "persist_failed";
        case ErrorKind::WriteFailed: return "write_failed";
    }
    return "unknown";
}

std::string describe(const Error& err) {
    std::string_view summary;
    switch (err.kind) {
        case ErrorKind::ResourceProbeFailure:
            summary = "Could not inspect system resources, using defaults";
            break;
        case ErrorKind::LoadFailed:
            summary = "Failed to load model";
            break;
        case ErrorKind::TranscribeFailed:
            summary = "Transcription failed";
            break;
        case ErrorKind::FileNotFound:
            summary = "Audio file not found";
            break;
        case ErrorKind::AlreadyRunning:
            summary = "Another job is already running";
            break;
        case ErrorKind::NotReady:
            summary = "Model not loaded, load a model first";
            break;
        case ErrorKind::IndexOutOfRange:
            summary = "No history entry at that index";
            break;
        case ErrorKind::PersistFailed:
            summary = "Could not save history";
            break;
        case ErrorKind::WriteFailed:
            summary = "Could not write export file";
            break;
    }

    if (err.detail.empty()) return std::string(summary);
    return std::format("{}: {}", summary, err.detail);
}
