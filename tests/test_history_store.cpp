#include <catch2/catch.hpp>

#include "storage/history_store.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

struct TmpDir {
    fs::path path;

    TmpDir() {
        path = fs::temp_directory_path() / ("scribe_test_history_" + std::to_string(getpid()));
        fs::remove_all(path);
        fs::create_directories(path);
    }

    ~TmpDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

TranscriptResult make_result(const std::string& name, const std::string& text) {
    TranscriptResult r;
    r.text = text;
    r.language = "en";
    r.source_path = "/home/user/audio/" + name;
    r.source_name = name;
    r.segments = {{.start = 0.0, .end = 1.5, .text = text}};
    return r;
}

std::string slurp(const fs::path& p) {
    std::ifstream f(p);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

void write_file(const fs::path& p, const std::string& content) {
    std::ofstream(p) << content;
}

} // namespace

TEST_CASE("HistoryStore", "[history]") {
    TmpDir tmp;
    auto file = tmp.path / "nested" / "transcription_history.json";

    SECTION("MissingFileIsEmpty") {
        HistoryStore store(file.string());
        REQUIRE(store.size() == 0);
        REQUIRE(store.list().empty());
        REQUIRE_FALSE(store.get(0));
    }

    SECTION("AddStampsAndPersists") {
        HistoryStore store(file.string());
        auto index = store.add(make_result("a.wav", "first"));
        REQUIRE(index);
        REQUIRE(*index == 0);
        REQUIRE(fs::exists(file));
        REQUIRE_FALSE(fs::exists(file.string() + ".tmp"));

        auto entry = store.get(0);
        REQUIRE(entry);
        REQUIRE(entry->index == 0);
        REQUIRE(entry->result.text == "first");
        REQUIRE(entry->result.has_created_at());
        REQUIRE(format_created_at(entry->result).size() == 19);
    }

    SECTION("AddKeepsExistingTimestamp") {
        HistoryStore store(file.string());
        auto r = make_result("a.wav", "first");
        r.created_at = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123));
        REQUIRE(store.add(r));
        REQUIRE(store.get(0)->result.created_at == r.created_at);
    }

    SECTION("ReloadReproducesEntries") {
        {
            HistoryStore store(file.string());
            REQUIRE(store.add(make_result("a.wav", "first")));
            REQUIRE(store.add(make_result("b.wav", "second")));
            REQUIRE(store.add(make_result("c.wav", "third")));
        }

        HistoryStore first(file.string());
        HistoryStore second(file.string());
        REQUIRE(first.size() == 3);
        REQUIRE(first.list() == second.list());
        REQUIRE(first.get(1)->result.source_name == "b.wav");
        REQUIRE(first.get(2)->result.segments.size() == 1);
    }

    SECTION("RemoveShiftsLaterEntries") {
        HistoryStore store(file.string());
        REQUIRE(store.add(make_result("a.wav", "first")));
        REQUIRE(store.add(make_result("b.wav", "second")));
        REQUIRE(store.add(make_result("c.wav", "third")));

        auto removed = store.remove(1);
        REQUIRE(removed);
        REQUIRE(*removed);

        auto entries = store.list();
        REQUIRE(entries.size() == 2);
        REQUIRE(entries[0].result.text == "first");
        REQUIRE(entries[1].result.text == "third");
        REQUIRE(entries[1].index == 1);

        HistoryStore reopened(file.string());
        REQUIRE(reopened.size() == 2);
    }

    SECTION("RemoveOutOfRangeIsNoop") {
        HistoryStore store(file.string());
        REQUIRE(store.add(make_result("a.wav", "first")));

        auto removed = store.remove(5);
        REQUIRE(removed);
        REQUIRE_FALSE(*removed);
        REQUIRE(store.size() == 1);
    }

    SECTION("ClearEmptiesFile") {
        HistoryStore store(file.string());
        REQUIRE(store.add(make_result("a.wav", "first")));
        REQUIRE(store.clear());
        REQUIRE(store.size() == 0);

        HistoryStore reopened(file.string());
        REQUIRE(reopened.size() == 0);
        REQUIRE(slurp(file).find('[') != std::string::npos);
    }

    SECTION("ListReturnsCopies") {
        HistoryStore store(file.string());
        REQUIRE(store.add(make_result("a.wav", "first")));

        auto entries = store.list();
        entries[0].result.text = "edited";
        REQUIRE(store.get(0)->result.text == "first");
    }

    SECTION("MalformedFileStartsEmpty") {
        fs::create_directories(file.parent_path());
        write_file(file, "{ not json");

        HistoryStore store(file.string());
        REQUIRE(store.size() == 0);

        REQUIRE(store.add(make_result("a.wav", "first")));
        HistoryStore reopened(file.string());
        REQUIRE(reopened.size() == 1);
    }

    SECTION("NonListDocumentStartsEmpty") {
        fs::create_directories(file.parent_path());
        write_file(file, R"({"text": "not a list"})");

        HistoryStore store(file.string());
        REQUIRE(store.size() == 0);
    }

    SECTION("ReadsEntriesWithMissingKeys") {
        fs::create_directories(file.parent_path());
        write_file(file, R"([{"text": "only text"}])");

        HistoryStore store(file.string());
        REQUIRE(store.size() == 1);
        auto entry = store.get(0);
        REQUIRE(entry->result.text == "only text");
        REQUIRE(entry->result.language == "unknown");
        REQUIRE_FALSE(entry->result.has_created_at());
        REQUIRE(format_created_at(entry->result) == "Unknown");
    }

    SECTION("PersistFailureKeepsMutation") {
        auto blocker = tmp.path / "blocker";
        write_file(blocker, "regular file");

        HistoryStore store((blocker / "history.json").string());
        auto index = store.add(make_result("a.wav", "first"));
        REQUIRE_FALSE(index);
        REQUIRE(index.error().kind == ErrorKind::PersistFailed);
        REQUIRE(store.size() == 1);
        REQUIRE(store.get(store.size() - 1)->result.text == "first");

        auto cleared = store.clear();
        REQUIRE_FALSE(cleared);
        REQUIRE(store.size() == 0);
    }

    SECTION("NonUtf8FilenamePersists") {
        HistoryStore store(file.string());
        auto r = make_result("caf\xe9.wav", "bonjour");
        r.source_path = "/tmp/caf\xe9.wav";

        auto index = store.add(r);
        REQUIRE(index);
        REQUIRE(*index == 0);
        REQUIRE(store.remove(5));

        HistoryStore reopened(file.string());
        REQUIRE(reopened.size() == 1);
        REQUIRE(reopened.get(0)->result.source_name == "caf\xef\xbf\xbd.wav");
        REQUIRE(reopened.get(0)->result.text == "bonjour");
    }

    SECTION("Export") {
        HistoryStore store(file.string());
        REQUIRE(store.add(make_result("talk.wav", "hello world")));
        auto out = tmp.path / "talk.txt";

        REQUIRE(store.export_entry(0, out.string()));

        std::ifstream f(out);
        std::string line;
        std::getline(f, line);
        REQUIRE(line == "File: talk.wav");
        std::getline(f, line);
        REQUIRE(line == "Language: en");
        std::getline(f, line);
        REQUIRE(line == "Date: " + format_created_at(store.get(0)->result));
        std::getline(f, line);
        REQUIRE(line == "Path: /home/user/audio/talk.wav");
        std::getline(f, line);
        REQUIRE(line.empty());
        std::getline(f, line);
        REQUIRE(line == "Transcription:");
        std::getline(f, line);
        REQUIRE(line == "hello world");
    }

    SECTION("ExportWithoutPathOmitsLine") {
        HistoryStore store(file.string());
        auto r = make_result("", "no provenance");
        r.source_path.clear();
        REQUIRE(store.add(r));
        auto out = tmp.path / "bare.txt";

        REQUIRE(store.export_entry(0, out.string()));
        auto text = slurp(out);
        REQUIRE(text.starts_with("File: Unknown\n"));
        REQUIRE(text.find("Path:") == std::string::npos);
    }

    SECTION("ExportErrors") {
        HistoryStore store(file.string());

        auto missing = store.export_entry(0, (tmp.path / "x.txt").string());
        REQUIRE_FALSE(missing);
        REQUIRE(missing.error().kind == ErrorKind::IndexOutOfRange);

        REQUIRE(store.add(make_result("a.wav", "first")));
        auto unwritable = store.export_entry(0, (tmp.path / "no" / "such" / "dir.txt").string());
        REQUIRE_FALSE(unwritable);
        REQUIRE(unwritable.error().kind == ErrorKind::WriteFailed);
    }
}
