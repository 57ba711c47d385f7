#include <catch2/catch.hpp>

#include "copyem/progress.hpp"

#include <cstdio>
#include <memory>
#include <string>
#include <vector>

TEST_CASE("parse_buffer_status")
{
    SECTION("typical status line")
    {
        const auto status =
            copyem::parse_buffer_status("in @  2.0 MiB/s, out @  1.5 MiB/s, 1024 MiB total, buffer  50% full");

        REQUIRE(status);
        CHECK(status->in_rate == Approx(2.0 * 1024 * 1024));
        CHECK(status->out_rate == Approx(1.5 * 1024 * 1024));
        CHECK(status->total_bytes == 1024LL * 1024 * 1024);
        CHECK(status->fill_percent == 50);
    }

    SECTION("lowercase units and a bare byte total")
    {
        const auto status = copyem::parse_buffer_status("in @  512 kiB/s, out @  0.0 kiB/s, 300 B total, buffer 100% full");

        REQUIRE(status);
        CHECK(status->in_rate == Approx(512.0 * 1024));
        CHECK(status->out_rate == Approx(0.0));
        CHECK(status->total_bytes == 300);
        CHECK(status->fill_percent == 100);
    }

    SECTION("other output is not a status report")
    {
        CHECK_FALSE(copyem::parse_buffer_status(""));
        CHECK_FALSE(copyem::parse_buffer_status("mbuffer: warning: HOME environment variable not set"));
        CHECK_FALSE(copyem::parse_buffer_status("summary: 1024 MiByte in 10.0sec - average of 102 MiB/s"));
    }
}

TEST_CASE("line_splitter")
{
    SECTION("lines can span several reads")
    {
        copyem::line_splitter splitter;

        CHECK(splitter.feed("sub/a.mkv\nsub/") == std::vector<std::string>{"sub/a.mkv"});
        CHECK(splitter.feed("b.mkv").empty());

        const auto lines = splitter.feed("\nc.mkv\n");
        CHECK(lines == std::vector<std::string>{"sub/b.mkv", "c.mkv"});
        CHECK_FALSE(splitter.flush());
    }

    SECTION("empty lines are dropped")
    {
        copyem::line_splitter splitter;
        CHECK(splitter.feed("\n\na\n\nb\n") == std::vector<std::string>{"a", "b"});
    }

    SECTION("several delimiters")
    {
        copyem::line_splitter splitter{"\r\n"};

        CHECK(splitter.feed("in @ 1 MiB/s\rin @ 2 MiB/s\r\nsummary") ==
              std::vector<std::string>{"in @ 1 MiB/s", "in @ 2 MiB/s"});

        const auto rest = splitter.flush();
        REQUIRE(rest);
        CHECK(*rest == "summary");
        CHECK_FALSE(splitter.flush());
    }
}

TEST_CASE("console_progress_sink")
{
    std::unique_ptr<std::FILE, decltype(&std::fclose)> out{std::tmpfile(), &std::fclose};
    REQUIRE(out);

    copyem::console_progress_sink sink{1000, 3, out.get()};

    sink.on_progress({0, 400, std::string{"a"}});
    sink.on_progress({1, 100, std::nullopt});
    sink.on_progress({1, 0, std::string{"b"}});

    CHECK(sink.bytes() == 500);
    CHECK(sink.files() == 2);

    sink.finish();

    std::rewind(out.get());

    std::string text;
    char buffer[512];

    while (const auto n = std::fread(buffer, 1, sizeof(buffer), out.get())) {
        text.append(buffer, n);
    }

    CHECK(text.find("50.0%") != std::string::npos);
    CHECK(text.find("2/3 files") != std::string::npos);
    CHECK(text.back() == '\n');
}
