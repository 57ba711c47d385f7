#include <catch2/catch.hpp>

#include "unit_test_utils.hpp"

#include "copyem/pipeline.hpp"

#include <boost/filesystem.hpp>

#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

namespace fs = boost::filesystem;

using namespace std::chrono_literals;

using unit_test_utils::write_file;

namespace
{
    auto local_config(const unit_test_utils::scratch_directory& _dir) -> copyem::transfer_config
    {
        copyem::transfer_config config;
        config.source_root = (_dir.path() / "src").string();
        config.destination_root = (_dir.path() / "dst").string();
        config.buffer_program.clear();
        config.poll_interval = 20ms;
        config.termination_grace = 500ms;
        return config;
    }

    auto run_to_completion(copyem::pipeline& _pipeline) -> std::vector<std::string>
    {
        std::vector<std::string> acknowledged;

        while (!_pipeline.finished()) {
            auto activity = _pipeline.poll(20ms);
            std::move(std::begin(activity.acknowledged), std::end(activity.acknowledged), std::back_inserter(acknowledged));
        }

        return acknowledged;
    }
} // anonymous namespace

TEST_CASE("build_stage_specs")
{
    copyem::transfer_config config;
    config.source_root = "/data/videos";
    config.destination_root = "/backup/my videos";
    config.remote = "user@nas";
    config.ssh_options = {"-p", "2222"};
    config.buffer_size = 1024;

    SECTION("producer, buffer and transport")
    {
        const auto specs = copyem::build_stage_specs(config, "/tmp/list");

        REQUIRE(specs.size() == 3);

        CHECK(specs[0].kind == copyem::stage_kind::producer);
        CHECK(specs[0].argv ==
              std::vector<std::string>{"tar", "-cf", "-", "--no-recursion", "--null", "-T", "/tmp/list"});
        CHECK(specs[0].working_directory == "/data/videos");

        CHECK(specs[1].kind == copyem::stage_kind::buffer);
        CHECK(specs[1].argv == std::vector<std::string>{"mbuffer", "-m", "1024b"});

        CHECK(specs[2].kind == copyem::stage_kind::transport);
        REQUIRE(specs[2].argv.size() == 5);
        CHECK(specs[2].argv[0] == "ssh");
        CHECK(specs[2].argv[1] == "-p");
        CHECK(specs[2].argv[2] == "2222");
        CHECK(specs[2].argv[3] == "user@nas");
        CHECK(specs[2].argv[4] ==
              "mkdir -p '/backup/my videos' && 'tar' -xvf - -C '/backup/my videos' --quoting-style=literal");
    }

    SECTION("without a buffer program")
    {
        config.buffer_program.clear();

        const auto specs = copyem::build_stage_specs(config, "/tmp/list");

        REQUIRE(specs.size() == 2);
        CHECK(specs[0].kind == copyem::stage_kind::producer);
        CHECK(specs[1].kind == copyem::stage_kind::transport);
    }

    SECTION("a destination under the home directory is expanded remotely")
    {
        config.destination_root = "~/backup";

        const auto specs = copyem::build_stage_specs(config, "/tmp/list");

        CHECK(specs.back().argv.back() ==
              "mkdir -p \"$HOME\"/'backup' && 'tar' -xvf - -C \"$HOME\"/'backup' --quoting-style=literal");
    }

    SECTION("local destination")
    {
        config.remote.clear();

        const auto specs = copyem::build_stage_specs(config, "/tmp/list");

        CHECK(specs.back().argv.at(0) == "sh");
        CHECK(specs.back().argv.at(1) == "-c");
    }
}

TEST_CASE("pipeline copies a plan to a local destination")
{
    unit_test_utils::scratch_directory dir{"pipeline"};
    auto config = local_config(dir);

    write_file(dir.path() / "src" / "big.bin", 300000, 'b');
    write_file(dir.path() / "src" / "sub" / "small.txt", "small");
    write_file(dir.path() / "src" / "sub" / "name with spaces.txt", "spaces");

    copyem::stream_plan plan;
    plan.files = {
        {"big.bin", 300000, std::nullopt},
        {"sub/small.txt", 5, std::nullopt},
        {"sub/name with spaces.txt", 6, std::nullopt},
    };

    SECTION("every file is delivered and confirmed")
    {
        copyem::pipeline p{0, plan, config};

        const auto acknowledged = run_to_completion(p);

        CHECK(p.succeeded());
        CHECK_FALSE(p.terminated());
        CHECK(acknowledged == std::vector<std::string>{"big.bin", "sub/small.txt", "sub/name with spaces.txt"});
        CHECK(p.tracker().acknowledged_bytes() == 300011);

        CHECK(fs::file_size(dir.path() / "dst" / "big.bin") == 300000);
        CHECK(unit_test_utils::read_file(dir.path() / "dst" / "sub" / "small.txt") == "small");
        CHECK(unit_test_utils::read_file(dir.path() / "dst" / "sub" / "name with spaces.txt") == "spaces");
    }

    SECTION("a missing source file fails the producer but not the files around it")
    {
        plan.files.insert(std::next(std::begin(plan.files)), copyem::file_entry{"vanished.txt", 10, std::nullopt});

        copyem::pipeline p{3, plan, config};

        const auto acknowledged = run_to_completion(p);

        CHECK_FALSE(p.succeeded());
        CHECK(acknowledged == std::vector<std::string>{"big.bin", "sub/small.txt", "sub/name with spaces.txt"});

        const auto description = p.failure_description();
        CHECK(description.find("Stream 3 producer stage failed with exit status") == 0);
        CHECK(description.find("vanished.txt") != std::string::npos);
    }

    SECTION("members the consumer cannot write are not confirmed")
    {
        // "sub" exists on the destination as a regular file.
        write_file(dir.path() / "dst" / "sub", "in the way");

        copyem::pipeline p{4, plan, config};

        const auto acknowledged = run_to_completion(p);

        CHECK_FALSE(p.succeeded());
        CHECK(p.tracker().acknowledged() == std::vector<std::string>{"big.bin"});
        CHECK(p.tracker().acknowledged_bytes() == 300000);
        CHECK_FALSE(p.tracker().pending());
        CHECK(std::find(std::begin(acknowledged), std::end(acknowledged), "big.bin") != std::end(acknowledged));

        CHECK(fs::file_size(dir.path() / "dst" / "big.bin") == 300000);
        CHECK(fs::is_regular_file(dir.path() / "dst" / "sub"));
        CHECK(p.failure_description().find("Stream 4 transport stage failed") == 0);
    }

    SECTION("an unwritable destination fails the transport")
    {
        write_file(dir.path() / "blocker", "not a directory");
        config.destination_root = (dir.path() / "blocker" / "dst").string();

        copyem::pipeline p{1, plan, config};

        const auto acknowledged = run_to_completion(p);

        CHECK_FALSE(p.succeeded());
        CHECK(acknowledged.empty());
        CHECK(p.tracker().acknowledged().empty());
        CHECK_FALSE(p.failure_description().empty());
    }

    SECTION("termination stops a stalled pipeline")
    {
        // The transport never reads its input, so the producer blocks on a full pipe.
        config.remote = "user@nas";
        config.ssh_program = "sh";
        config.ssh_options = {"-c", "sleep 30", "stalled-transport"};

        copyem::pipeline p{2, plan, config};

        const auto start = std::chrono::steady_clock::now();
        p.terminate("cancelled");
        const auto acknowledged = run_to_completion(p);

        CHECK(std::chrono::steady_clock::now() - start < 10s);
        CHECK(p.terminated());
        CHECK_FALSE(p.succeeded());
        CHECK(acknowledged.empty());
        CHECK(p.failure_description().find("Stream 2 was terminated (cancelled).") == 0);
    }
}
