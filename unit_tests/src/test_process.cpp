#include <catch2/catch.hpp>

#include "copyem_error_code_matcher.hpp"
#include "unit_test_utils.hpp"

#include "copyem/process.hpp"

#include <boost/filesystem.hpp>

#include <signal.h>
#include <unistd.h>

#include <string>

namespace fs = boost::filesystem;

namespace
{
    auto run(std::vector<std::string> _argv) -> copyem::exit_status
    {
        copyem::spawn_options opts;
        opts.argv = std::move(_argv);

        auto child = copyem::child_process::spawn(opts);
        const auto status = child.wait();

        REQUIRE(status);
        return *status;
    }

    auto read_all(copyem::file_descriptor& _fd) -> std::string
    {
        std::string text;
        char buffer[256];

        while (true) {
            const auto n = ::read(_fd.get(), buffer, sizeof(buffer));

            if (n <= 0) {
                return text;
            }

            text.append(buffer, static_cast<std::size_t>(n));
        }
    }
} // anonymous namespace

TEST_CASE("child_process exit status")
{
    CHECK(run({"true"}).success());

    const auto failed = run({"false"});
    CHECK_FALSE(failed.success());
    CHECK(failed.code == 1);
    CHECK(failed.to_string() == "exit status 1");

    CHECK(run({"sh", "-c", "exit 3"}).code == 3);

    SECTION("a program that cannot be executed exits with 127")
    {
        CHECK(run({"copyem-no-such-program"}).code == 127);
    }

    SECTION("an empty argument list is rejected")
    {
        CHECK_THROWS_MATCHES(copyem::child_process::spawn({}),
                             copyem::exception,
                             has_error_code(copyem::PROCESS_SPAWN_ERROR));
    }
}

TEST_CASE("child_process can be signalled")
{
    copyem::spawn_options opts;
    opts.argv = {"sleep", "30"};

    auto child = copyem::child_process::spawn(opts);

    CHECK(child.running());
    CHECK_FALSE(child.try_wait());

    REQUIRE(child.send_signal(SIGTERM));

    const auto status = child.wait();
    REQUIRE(status);
    CHECK(status->signal == SIGTERM);
    CHECK_FALSE(status->success());
    CHECK(status->to_string().find("killed by signal 15") == 0);

    CHECK_FALSE(child.running());
    CHECK_FALSE(child.send_signal(SIGTERM));
}

TEST_CASE("child_process redirects descriptors and working directory")
{
    unit_test_utils::scratch_directory dir{"process"};

    auto out = copyem::make_pipe();

    copyem::spawn_options opts;
    opts.argv = {"pwd"};
    opts.working_directory = dir.string();
    opts.stdout_fd = out.write_end.get();

    auto child = copyem::child_process::spawn(opts);
    out.write_end.close();

    const auto text = read_all(out.read_end);
    const auto status = child.wait();

    REQUIRE(status);
    CHECK(status->success());
    CHECK(fs::equivalent(fs::path{text.substr(0, text.find('\n'))}, dir.path()));
}

TEST_CASE("shell_quote")
{
    CHECK(copyem::shell_quote("plain") == "'plain'");
    CHECK(copyem::shell_quote("with space") == "'with space'");
    CHECK(copyem::shell_quote("it's") == "'it'\\''s'");
    CHECK(copyem::shell_quote("") == "''");

    SECTION("quoted text survives the shell unchanged")
    {
        const std::string tricky = "a 'b' $HOME `c` \"d\"";

        auto out = copyem::make_pipe();

        copyem::spawn_options opts;
        opts.argv = {"sh", "-c", "printf '%s' " + copyem::shell_quote(tricky)};
        opts.stdout_fd = out.write_end.get();

        auto child = copyem::child_process::spawn(opts);
        out.write_end.close();

        CHECK(read_all(out.read_end) == tricky);
        CHECK(child.wait()->success());
    }
}

TEST_CASE("shell_quote_path")
{
    CHECK(copyem::shell_quote_path("/backup/my videos") == "'/backup/my videos'");
    CHECK(copyem::shell_quote_path("~") == "\"$HOME\"");
    CHECK(copyem::shell_quote_path("~/") == "\"$HOME\"/");
    CHECK(copyem::shell_quote_path("~/my backup") == "\"$HOME\"/'my backup'");
    CHECK(copyem::shell_quote_path("~other/backup") == "'~other/backup'");
    CHECK(copyem::shell_quote_path("a/~/b") == "'a/~/b'");

    SECTION("the home directory is expanded by the shell")
    {
        auto out = copyem::make_pipe();

        copyem::spawn_options opts;
        opts.argv = {"sh", "-c", "HOME=/home/copyem; printf '%s' " + copyem::shell_quote_path("~/my backup")};
        opts.stdout_fd = out.write_end.get();

        auto child = copyem::child_process::spawn(opts);
        out.write_end.close();

        CHECK(read_all(out.read_end) == "/home/copyem/my backup");
        CHECK(child.wait()->success());
    }
}

TEST_CASE("temporary_file")
{
    std::string path;

    {
        copyem::temporary_file file{"copyem_test_", std::string{"a\0b", 3}};
        path = file.path();

        REQUIRE(fs::exists(path));
        CHECK(fs::file_size(path) == 3);
        CHECK(unit_test_utils::read_file(path) == std::string{"a\0b", 3});
    }

    CHECK_FALSE(fs::exists(path));
}

TEST_CASE("file_descriptor ownership moves")
{
    auto ends = copyem::make_pipe();
    const auto raw = ends.read_end.get();

    copyem::file_descriptor moved{std::move(ends.read_end)};

    CHECK(moved.get() == raw);
    CHECK_FALSE(ends.read_end.valid());

    moved.close();
    CHECK_FALSE(moved);
}
