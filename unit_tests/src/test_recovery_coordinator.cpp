#include <catch2/catch.hpp>

#include "unit_test_utils.hpp"

#include "copyem/recovery_coordinator.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

using unit_test_utils::make_entries;

namespace
{
    using script_type = std::function<std::vector<copyem::stream_outcome>(int, const std::vector<copyem::stream_plan>&)>;

    // Replays a scripted result for every attempt.
    class scripted_executor : public copyem::stream_executor
    {
    public:
        explicit scripted_executor(script_type _script)
            : script_{std::move(_script)}
        {
        }

        auto execute(const std::vector<copyem::stream_plan>& _plans, const std::atomic<bool>&)
            -> std::vector<copyem::stream_outcome> override
        {
            plans_seen.push_back(_plans);
            return script_(static_cast<int>(plans_seen.size()), _plans);
        }

        std::vector<std::vector<copyem::stream_plan>> plans_seen;

    private:
        script_type script_;
    };

    // Every stream confirms its first _count files. Streams that confirm everything succeed.
    auto deliver_first(const copyem::stream_plan& _plan, std::size_t _count) -> copyem::stream_outcome
    {
        copyem::stream_outcome outcome;
        outcome.stream_id = _plan.stream_id;

        const auto n = std::min(_count, _plan.files.size());

        for (std::size_t i = 0; i < n; ++i) {
            outcome.acknowledged.push_back(_plan.files[i].path);
            outcome.acknowledged_bytes += _plan.files[i].size;
        }

        outcome.success = (n == _plan.files.size());

        if (!outcome.success) {
            outcome.error = fmt::format("Stream {} transport stage failed with exit status 255.", _plan.stream_id);
        }

        return outcome;
    }

    auto deliver_all(const std::vector<copyem::stream_plan>& _plans) -> std::vector<copyem::stream_outcome>
    {
        std::vector<copyem::stream_outcome> outcomes;

        for (const auto& p : _plans) {
            outcomes.push_back(deliver_first(p, p.files.size()));
        }

        return outcomes;
    }

    auto deliver_nothing(const std::vector<copyem::stream_plan>& _plans) -> std::vector<copyem::stream_outcome>
    {
        std::vector<copyem::stream_outcome> outcomes;

        for (const auto& p : _plans) {
            outcomes.push_back(deliver_first(p, 0));
        }

        return outcomes;
    }

    auto planned_files(const std::vector<copyem::stream_plan>& _plans) -> std::size_t
    {
        std::size_t n = 0;

        for (const auto& p : _plans) {
            n += p.files.size();
        }

        return n;
    }

    auto test_config(int _parallelism, int _max_retries) -> copyem::transfer_config
    {
        copyem::transfer_config config;
        config.parallelism = _parallelism;
        config.max_retries = _max_retries;
        config.retry_delay = 0;
        config.poll_interval = 10ms;
        return config;
    }
} // anonymous namespace

TEST_CASE("recovery after a partially failed attempt")
{
    // 100 files of 10 MB, 1 GB in total, over four streams.
    const copyem::manifest m{make_entries(std::vector<std::int64_t>(100, 10000000))};
    std::atomic<bool> cancel{false};

    scripted_executor executor{[](int _attempt, const auto& _plans) {
        if (_attempt > 1) {
            return deliver_all(_plans);
        }

        // The connection drops early. Stream 2 confirms ten files before it goes down,
        // the others confirm nothing.
        std::vector<copyem::stream_outcome> outcomes;

        for (const auto& p : _plans) {
            outcomes.push_back(deliver_first(p, p.stream_id == 2 ? 10 : 0));
        }

        return outcomes;
    }};

    copyem::recovery_coordinator coordinator{test_config(4, 3), executor};
    const auto outcome = coordinator.run(m, cancel);

    CHECK(outcome.status == copyem::run_status::success);
    CHECK(outcome.files_attempted == 100);
    CHECK(outcome.files_succeeded == 100);
    CHECK(outcome.unresolved.empty());
    CHECK(outcome.bytes_delivered == 1000000000);
    CHECK(outcome.error.empty());
    CHECK(outcome.stream_success == std::vector<bool>{true, true, true, true});

    REQUIRE(outcome.attempts.size() == 2);
    REQUIRE(executor.plans_seen.size() == 2);

    const auto& first = executor.plans_seen[0];
    REQUIRE(first.size() == 4);

    for (const auto& p : first) {
        CHECK(p.files.size() == 25);
    }

    CHECK(outcome.attempts[0].residual_files == 100);
    CHECK(outcome.attempts[0].confirmed_files == 10);

    // The retry keeps four streams and schedules only the residual.
    const auto& second = executor.plans_seen[1];
    CHECK(second.size() == 4);
    CHECK(planned_files(second) == 90);
    CHECK(outcome.attempts[1].residual_files == 90);
    CHECK(outcome.attempts[1].residual_bytes == 900000000);
    CHECK(outcome.attempts[1].confirmed_files == 90);

    std::set<std::string> retried;

    for (const auto& p : second) {
        for (const auto& f : p.files) {
            retried.insert(f.path);
        }
    }

    for (std::size_t i = 0; i < 10; ++i) {
        CHECK(retried.count(first[2].files[i].path) == 0);
    }
}

TEST_CASE("a run that confirms everything needs one attempt")
{
    const copyem::manifest m{make_entries({5, 10, 15})};
    std::atomic<bool> cancel{false};

    scripted_executor executor{[](int, const auto& _plans) { return deliver_all(_plans); }};
    copyem::recovery_coordinator coordinator{test_config(2, 3), executor};

    const auto outcome = coordinator.run(m, cancel);

    CHECK(outcome.status == copyem::run_status::success);
    CHECK(outcome.attempts.size() == 1);
    CHECK(outcome.files_succeeded == 3);
    CHECK(outcome.bytes_delivered == 30);
}

TEST_CASE("files confirmed by a failed stream are not retried")
{
    const copyem::manifest m{make_entries({1, 2, 3, 4})};
    std::atomic<bool> cancel{false};

    SECTION("a failed attempt that confirmed everything ends the run")
    {
        scripted_executor executor{[](int, const auto& _plans) {
            auto outcomes = deliver_all(_plans);
            outcomes[0].success = false;
            outcomes[0].error = "Stream 0 transport stage failed with exit status 255.";
            return outcomes;
        }};

        copyem::recovery_coordinator coordinator{test_config(2, 3), executor};
        const auto outcome = coordinator.run(m, cancel);

        CHECK(outcome.status == copyem::run_status::success);
        CHECK(outcome.attempts.size() == 1);
        CHECK(outcome.stream_success == std::vector<bool>{false, true});
        CHECK(outcome.error.empty());
    }

    SECTION("confirmations accumulate across failed attempts")
    {
        // Each attempt confirms one file per stream and then fails.
        scripted_executor executor{[](int, const auto& _plans) {
            std::vector<copyem::stream_outcome> outcomes;

            for (const auto& p : _plans) {
                auto o = deliver_first(p, 1);
                o.success = false;
                outcomes.push_back(o);
            }

            return outcomes;
        }};

        copyem::recovery_coordinator coordinator{test_config(2, 5), executor};
        const auto outcome = coordinator.run(m, cancel);

        CHECK(outcome.status == copyem::run_status::success);
        CHECK(outcome.attempts.size() == 2);
        CHECK(outcome.files_succeeded == 4);
        CHECK(outcome.bytes_delivered == 10);
    }

    SECTION("confirmations for files outside the residual are ignored")
    {
        scripted_executor executor{[](int, const auto& _plans) {
            auto outcomes = deliver_all(_plans);
            outcomes[0].acknowledged.push_back("not_planned.txt");
            return outcomes;
        }};

        copyem::recovery_coordinator coordinator{test_config(2, 0), executor};
        const auto outcome = coordinator.run(m, cancel);

        CHECK(outcome.status == copyem::run_status::success);
        CHECK(outcome.files_succeeded == 4);
        CHECK(outcome.bytes_delivered == 10);
    }
}

TEST_CASE("retries stop after max_retries + 1 attempts")
{
    const copyem::manifest m{make_entries({100, 200, 300, 400, 500})};
    std::atomic<bool> cancel{false};

    SECTION("nothing delivered")
    {
        scripted_executor executor{[](int, const auto& _plans) { return deliver_nothing(_plans); }};

        copyem::recovery_coordinator coordinator{test_config(2, 2), executor};
        const auto outcome = coordinator.run(m, cancel);

        CHECK(outcome.status == copyem::run_status::failure);
        CHECK(outcome.attempts.size() == 3);
        CHECK(executor.plans_seen.size() == 3);
        CHECK(outcome.files_succeeded == 0);
        CHECK(outcome.files_unresolved() == 5);
        CHECK(outcome.unresolved ==
              std::vector<std::string>{"file_000", "file_001", "file_002", "file_003", "file_004"});
        CHECK(outcome.error.find("transport stage failed") != std::string::npos);
        CHECK(outcome.stream_success == std::vector<bool>{false, false});
    }

    SECTION("some files delivered")
    {
        scripted_executor executor{[](int _attempt, const auto& _plans) {
            if (_attempt == 1) {
                std::vector<copyem::stream_outcome> outcomes;

                for (const auto& p : _plans) {
                    outcomes.push_back(deliver_first(p, p.stream_id == 0 ? 1 : 0));
                }

                return outcomes;
            }

            return deliver_nothing(_plans);
        }};

        copyem::recovery_coordinator coordinator{test_config(2, 1), executor};
        const auto outcome = coordinator.run(m, cancel);

        CHECK(outcome.status == copyem::run_status::partial_success);
        CHECK(outcome.attempts.size() == 2);
        CHECK(outcome.files_succeeded == 1);
        CHECK(outcome.files_unresolved() == 4);

        // The largest file goes first on stream 0.
        CHECK(outcome.bytes_delivered == 500);
        CHECK(std::find(std::begin(outcome.unresolved), std::end(outcome.unresolved), "file_004") ==
              std::end(outcome.unresolved));
    }

    SECTION("no retries")
    {
        scripted_executor executor{[](int, const auto& _plans) { return deliver_nothing(_plans); }};

        copyem::recovery_coordinator coordinator{test_config(3, 0), executor};
        const auto outcome = coordinator.run(m, cancel);

        CHECK(outcome.status == copyem::run_status::failure);
        CHECK(outcome.attempts.size() == 1);
    }
}

TEST_CASE("cancellation")
{
    const copyem::manifest m{make_entries({1, 2, 3, 4, 5, 6})};
    std::atomic<bool> cancel{false};

    SECTION("during an attempt")
    {
        scripted_executor executor{[&cancel](int, const auto& _plans) {
            cancel = true;

            std::vector<copyem::stream_outcome> outcomes;

            for (const auto& p : _plans) {
                auto o = deliver_first(p, 1);
                o.success = false;
                o.terminated = true;
                outcomes.push_back(o);
            }

            return outcomes;
        }};

        copyem::recovery_coordinator coordinator{test_config(2, 5), executor};
        const auto outcome = coordinator.run(m, cancel);

        CHECK(outcome.status == copyem::run_status::cancelled);
        CHECK(outcome.attempts.size() == 1);
        CHECK(outcome.files_succeeded == 2);
        CHECK(outcome.files_unresolved() == 4);
        CHECK(outcome.error == "Transfer cancelled.");
    }

    SECTION("during the wait before a retry")
    {
        auto config = test_config(2, 5);
        config.retry_delay = 60;

        scripted_executor executor{[](int, const auto& _plans) { return deliver_nothing(_plans); }};
        copyem::recovery_coordinator coordinator{config, executor};

        std::thread canceller{[&cancel] {
            std::this_thread::sleep_for(100ms);
            cancel = true;
        }};

        const auto start = std::chrono::steady_clock::now();
        const auto outcome = coordinator.run(m, cancel);
        const auto elapsed = std::chrono::steady_clock::now() - start;

        canceller.join();

        CHECK(elapsed < 10s);
        CHECK(outcome.status == copyem::run_status::cancelled);
        CHECK(outcome.attempts.size() == 1);
        CHECK(outcome.files_unresolved() == 6);
    }

    SECTION("before the first attempt")
    {
        cancel = true;

        scripted_executor executor{[](int, const auto& _plans) { return deliver_all(_plans); }};
        copyem::recovery_coordinator coordinator{test_config(2, 5), executor};

        const auto outcome = coordinator.run(m, cancel);

        CHECK(outcome.status == copyem::run_status::cancelled);
        CHECK(outcome.attempts.empty());
        CHECK(executor.plans_seen.empty());
        CHECK(outcome.files_unresolved() == 6);
    }
}

TEST_CASE("an empty manifest succeeds without any attempt")
{
    std::atomic<bool> cancel{false};

    scripted_executor executor{[](int, const auto& _plans) { return deliver_all(_plans); }};
    copyem::recovery_coordinator coordinator{test_config(3, 3), executor};

    const auto outcome = coordinator.run(copyem::manifest{}, cancel);

    CHECK(outcome.status == copyem::run_status::success);
    CHECK(outcome.attempts.empty());
    CHECK(executor.plans_seen.empty());
    CHECK(outcome.files_attempted == 0);
    CHECK(outcome.stream_success == std::vector<bool>{true, true, true});
}

TEST_CASE("run outcome report")
{
    const copyem::manifest m{make_entries({1, 2})};
    std::atomic<bool> cancel{false};

    scripted_executor executor{[](int, const auto& _plans) { return deliver_all(_plans); }};
    copyem::recovery_coordinator coordinator{test_config(2, 0), executor};

    const nlohmann::json report = coordinator.run(m, cancel);

    CHECK(report.at("status") == "success");
    CHECK(report.at("files_attempted") == 2);
    CHECK(report.at("files_succeeded") == 2);
    CHECK(report.at("bytes_delivered") == 3);
    CHECK(report.at("attempts").size() == 1);
    CHECK(report.at("attempts").at(0).at("streams").size() == 2);

    CHECK(copyem::exit_code(copyem::run_status::success) == 0);
    CHECK(copyem::exit_code(copyem::run_status::partial_success) == 2);
    CHECK(copyem::exit_code(copyem::run_status::failure) == 2);
    CHECK(copyem::exit_code(copyem::run_status::fatal_abort) == 1);
    CHECK(copyem::exit_code(copyem::run_status::cancelled) == 130);
}
