#include <catch2/catch.hpp>

#include "copyem/acknowledgment.hpp"

#include <optional>
#include <string>
#include <vector>

namespace
{
    auto planned_files() -> std::vector<copyem::file_entry>
    {
        return {
            {"big.mkv", 1000, std::nullopt},
            {"sub/small.txt", 10, std::nullopt},
            {"sub/other.txt", 20, std::nullopt},
        };
    }
} // anonymous namespace

TEST_CASE("acknowledgment_tracker")
{
    copyem::acknowledgment_tracker tracker{planned_files()};

    SECTION("a file is confirmed once the consumer names the next one")
    {
        CHECK_FALSE(tracker.on_line("big.mkv"));
        REQUIRE(tracker.pending());
        CHECK(*tracker.pending() == "big.mkv");
        CHECK(tracker.acknowledged().empty());

        const auto confirmed = tracker.on_line("sub/small.txt");
        REQUIRE(confirmed);
        CHECK(*confirmed == "big.mkv");
        CHECK(tracker.acknowledged_bytes() == 1000);
        CHECK(*tracker.pending() == "sub/small.txt");
    }

    SECTION("clean consumer exit confirms the last file")
    {
        tracker.on_line("big.mkv");
        tracker.on_line("sub/small.txt");

        const auto confirmed = tracker.on_consumer_success();
        REQUIRE(confirmed);
        CHECK(*confirmed == "sub/small.txt");
        CHECK_FALSE(tracker.pending());
        CHECK(tracker.acknowledged() == std::vector<std::string>{"big.mkv", "sub/small.txt"});
        CHECK(tracker.acknowledged_bytes() == 1010);

        CHECK_FALSE(tracker.on_consumer_success());
    }

    SECTION("the file in flight is never confirmed without a clean exit")
    {
        tracker.on_line("big.mkv");
        CHECK(tracker.acknowledged().empty());
        CHECK(tracker.acknowledged_bytes() == 0);
    }

    SECTION("leading ./ and trailing carriage returns are ignored")
    {
        tracker.on_line("./big.mkv\r");
        tracker.on_line("./sub/other.txt");

        CHECK(tracker.acknowledged() == std::vector<std::string>{"big.mkv"});
        CHECK(*tracker.pending() == "sub/other.txt");
    }

    SECTION("unplanned names, directories and repeats are ignored")
    {
        tracker.on_line("big.mkv");
        CHECK_FALSE(tracker.on_line("sub/"));
        CHECK_FALSE(tracker.on_line("tar: Removing leading `/' from member names"));
        CHECK_FALSE(tracker.on_line("big.mkv"));
        CHECK(*tracker.pending() == "big.mkv");

        tracker.on_line("sub/small.txt");
        CHECK_FALSE(tracker.on_line("big.mkv"));
        CHECK(tracker.acknowledged() == std::vector<std::string>{"big.mkv"});
        CHECK(*tracker.pending() == "sub/small.txt");
    }

    SECTION("a member the consumer failed to write is never confirmed")
    {
        tracker.on_line("big.mkv");

        const auto failed = tracker.on_error_line("tar: big.mkv: Cannot write: No space left on device");
        REQUIRE(failed);
        CHECK(*failed == "big.mkv");
        CHECK_FALSE(tracker.pending());

        CHECK_FALSE(tracker.on_line("sub/small.txt"));
        CHECK(tracker.on_consumer_success() == std::optional<std::string>{"sub/small.txt"});
        CHECK(tracker.acknowledged() == std::vector<std::string>{"sub/small.txt"});
        CHECK(tracker.acknowledged_bytes() == 10);
    }

    SECTION("an error reported after the next member was named withdraws the confirmation")
    {
        tracker.on_line("big.mkv");
        tracker.on_line("sub/small.txt");
        tracker.on_line("sub/other.txt");
        REQUIRE(tracker.acknowledged() == std::vector<std::string>{"big.mkv", "sub/small.txt"});

        CHECK(tracker.on_error_line("tar: ./sub/small.txt: Cannot open: Not a directory") ==
              std::optional<std::string>{"sub/small.txt"});

        CHECK(tracker.acknowledged() == std::vector<std::string>{"big.mkv"});
        CHECK(tracker.acknowledged_bytes() == 1000);
        CHECK(*tracker.pending() == "sub/other.txt");
    }

    SECTION("an error reported before the member is named blocks its confirmation")
    {
        tracker.on_line("big.mkv");
        tracker.on_error_line("tar: sub/small.txt: Cannot open: Permission denied");

        CHECK(tracker.on_line("sub/small.txt") == std::optional<std::string>{"big.mkv"});
        CHECK_FALSE(tracker.on_line("sub/other.txt"));
        CHECK(tracker.acknowledged() == std::vector<std::string>{"big.mkv"});
    }

    SECTION("error lines that name no planned member are ignored")
    {
        tracker.on_line("big.mkv");

        CHECK_FALSE(tracker.on_error_line("tar: Exiting with failure status due to previous errors"));
        CHECK_FALSE(tracker.on_error_line("tar: sub: Cannot mkdir: Not a directory"));
        CHECK_FALSE(tracker.on_error_line("ssh: connect to host nas port 22: Connection refused"));
        CHECK_FALSE(tracker.on_error_line("no separator here"));

        CHECK(*tracker.pending() == "big.mkv");
    }
}
