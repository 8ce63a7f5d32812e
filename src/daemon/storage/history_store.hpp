#pragma once

#include "error.hpp"
#include "whisper/backend.hpp"

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <vector>

struct HistoryEntry {
    size_t index = 0;
    TranscriptResult result;

    bool operator==(const HistoryEntry&) const = default;
};

// Ordered transcription history kept in one JSON file. The whole file is
// read on construction and rewritten on every mutation. Persist failures are
// returned to the caller but the in-memory mutation is kept.
//
// Not thread-safe; owned by the control thread.
class HistoryStore {
public:
    explicit HistoryStore(std::string path);

    HistoryStore(const HistoryStore&) = delete;
    HistoryStore& operator=(const HistoryStore&) = delete;

    // Re-reads the backing file. A missing file is an empty history; a
    // malformed one is logged and discarded.
    void load();

    // Stamps created_at if unset and appends. Returns the new index. On
    // PersistFailed the entry is still present at size() - 1.
    std::expected<size_t, Error> add(TranscriptResult result);

    std::vector<HistoryEntry> list() const;
    std::optional<HistoryEntry> get(size_t index) const;
    size_t size() const { return entries_.size(); }

    // false (and no change) if index is out of range. Later indices shift down.
    std::expected<bool, Error> remove(size_t index);
    std::expected<void, Error> clear();

    std::expected<void, Error> export_entry(size_t index, const std::string& destination) const;

    const std::string& path() const { return path_; }

private:
    std::expected<void, Error> persist() const;

    std::string path_;
    std::vector<TranscriptResult> entries_;
};

// Local time as "YYYY-MM-DD HH:MM:SS", or "Unknown" when created_at is unset.
std::string format_created_at(const TranscriptResult& result);
