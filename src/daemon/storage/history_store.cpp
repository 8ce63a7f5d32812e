#include "history_store.hpp"

#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

json entry_to_json(const TranscriptResult& r) {
    json segments = json::array();
    for (const auto& s : r.segments) {
        segments.push_back({{"start", s.start}, {"end", s.end}, {"text", s.text}});
    }

    return {
        {"text", r.text},
        {"language", r.language},
        {"segments", std::move(segments)},
        {"file_path", r.source_path},
        {"file_name", r.source_name},
        {"timestamp", std::chrono::duration<double>(r.created_at.time_since_epoch()).count()},
        {"date", format_created_at(r)},
    };
}

// Throws json::exception on anything that isn't an entry object.
TranscriptResult entry_from_json(const json& j) {
    TranscriptResult r;
    r.text = j.value("text", "");
    r.language = j.value("language", "");
    if (r.language.empty()) r.language = "unknown";
    r.source_path = j.value("file_path", "");
    r.source_name = j.value("file_name", "");

    if (j.contains("segments")) {
        for (const auto& s : j.at("segments")) {
            r.segments.push_back(Segment{
                .start = s.value("start", 0.0),
                .end = s.value("end", 0.0),
                .text = s.value("text", ""),
            });
        }
    }

    double seconds = j.value("timestamp", 0.0);
    auto ms = std::chrono::milliseconds(std::llround(seconds * 1000.0));
    r.created_at = std::chrono::system_clock::time_point(ms);
    return r;
}

} // namespace

HistoryStore::HistoryStore(std::string path) : path_(std::move(path)) {
    load();
}

void HistoryStore::load() {
    entries_.clear();

    std::ifstream f(path_);
    if (!f.is_open()) return;

    try {
        auto doc = json::parse(f);
        if (!doc.is_array()) {
            std::println(stderr, "history: {} does not hold a list, starting empty", path_);
            return;
        }

        std::vector<TranscriptResult> loaded;
        loaded.reserve(doc.size());
        for (const auto& item : doc) {
            loaded.push_back(entry_from_json(item));
        }
        entries_ = std::move(loaded);
    } catch (const json::exception& e) {
        std::println(stderr, "history: failed to parse {}: {}, starting empty", path_, e.what());
    }
}

std::expected<size_t, Error> HistoryStore::add(TranscriptResult result) {
    if (!result.has_created_at()) {
        result.created_at = std::chrono::floor<std::chrono::milliseconds>(
            std::chrono::system_clock::now());
    }

    entries_.push_back(std::move(result));
    size_t index = entries_.size() - 1;

    if (auto saved = persist(); !saved) {
        return std::unexpected(saved.error());
    }
    return index;
}

std::vector<HistoryEntry> HistoryStore::list() const {
    std::vector<HistoryEntry> out;
    out.reserve(entries_.size());
    for (size_t i = 0; i < entries_.size(); ++i) {
        out.push_back({.index = i, .result = entries_[i]});
    }
    return out;
}

std::optional<HistoryEntry> HistoryStore::get(size_t index) const {
    if (index >= entries_.size()) return std::nullopt;
    return HistoryEntry{.index = index, .result = entries_[index]};
}

std::expected<bool, Error> HistoryStore::remove(size_t index) {
    if (index >= entries_.size()) return false;

    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(index));
    if (auto saved = persist(); !saved) {
        return std::unexpected(saved.error());
    }
    return true;
}

std::expected<void, Error> HistoryStore::clear() {
    entries_.clear();
    return persist();
}

std::expected<void, Error>
HistoryStore::export_entry(size_t index, const std::string& destination) const {
    if (index >= entries_.size()) {
        return std::unexpected(Error{ErrorKind::IndexOutOfRange, std::to_string(index)});
    }

    std::ofstream f(destination, std::ios::trunc);
    if (!f.is_open()) {
        return std::unexpected(Error{ErrorKind::WriteFailed,
                                     destination + ": " + std::strerror(errno)});
    }

    const auto& e = entries_[index];
    f << "File: " << (e.source_name.empty() ? "Unknown" : e.source_name) << '\n';
    f << "Language: " << (e.language.empty() ? "Unknown" : e.language) << '\n';
    f << "Date: " << format_created_at(e) << '\n';
    if (!e.source_path.empty()) {
        f << "Path: " << e.source_path << '\n';
    }
    f << "\nTranscription:\n";
    f << e.text;

    f.flush();
    if (!f) {
        return std::unexpected(Error{ErrorKind::WriteFailed, destination + ": write failed"});
    }
    return {};
}

std::expected<void, Error> HistoryStore::persist() const {
    json doc = json::array();
    for (const auto& e : entries_) {
        doc.push_back(entry_to_json(e));
    }

    fs::path p(path_);
    std::error_code ec;
    if (p.has_parent_path()) {
        fs::create_directories(p.parent_path(), ec);
        if (ec) {
            return std::unexpected(Error{ErrorKind::PersistFailed,
                                         p.parent_path().string() + ": " + ec.message()});
        }
    }

    // Write beside the target and rename so a failed write never truncates history.
    fs::path tmp = p;
    tmp += ".tmp";
    {
        std::ofstream f(tmp, std::ios::trunc);
        if (!f.is_open()) {
            return std::unexpected(Error{ErrorKind::PersistFailed,
                                         tmp.string() + ": " + std::strerror(errno)});
        }
        // Filenames are arbitrary bytes; invalid UTF-8 is stored as U+FFFD.
        f << doc.dump(2, ' ', false, json::error_handler_t::replace);
        f.flush();
        if (!f) {
            return std::unexpected(Error{ErrorKind::PersistFailed, tmp.string() + ": write failed"});
        }
    }

    fs::rename(tmp, p, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return std::unexpected(Error{ErrorKind::PersistFailed, path_ + ": " + ec.message()});
    }
    return {};
}

std::string format_created_at(const TranscriptResult& result) {
    if (!result.has_created_at()) return "Unknown";

    std::time_t t = std::chrono::system_clock::to_time_t(result.created_at);
    std::tm tm{};
    localtime_r(&t, &tm);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}
