#include <catch2/catch.hpp>

#include "error.hpp"

#include <set>
#include <string>
#include <vector>

TEST_CASE("Error", "[error]") {
    const std::vector<ErrorKind> kinds = {
        ErrorKind::ResourceProbeFailure, ErrorKind::LoadFailed,     ErrorKind::TranscribeFailed,
        ErrorKind::FileNotFound,         ErrorKind::AlreadyRunning, ErrorKind::NotReady,
        ErrorKind::IndexOutOfRange,      ErrorKind::PersistFailed,  ErrorKind::WriteFailed,
    };

    SECTION("DistinctMessagesAndCodes") {
        std::set<std::string> messages;
        std::set<std::string> codes;
        for (auto kind : kinds) {
            messages.insert(describe(Error{kind, {}}));
            codes.insert(std::string(to_string(kind)));
        }
        REQUIRE(messages.size() == kinds.size());
        REQUIRE(codes.size() == kinds.size());
    }

    SECTION("DetailIsAppended") {
        Error err{ErrorKind::FileNotFound, "/tmp/missing.wav"};
        auto msg = describe(err);
        REQUIRE(msg.starts_with(describe(Error{ErrorKind::FileNotFound, {}})));
        REQUIRE(msg.ends_with(": /tmp/missing.wav"));
    }

    SECTION("StableCodes") {
        REQUIRE(to_string(ErrorKind::LoadFailed) == "load_failed");
        REQUIRE(to_string(ErrorKind::NotReady) == "not_ready");
        REQUIRE(to_string(ErrorKind::IndexOutOfRange) == "index_out_of_range");
    }
}
