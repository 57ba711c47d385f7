#include "copyem/recovery_coordinator.hpp"

#include "copyem/logger.hpp"
#include "copyem/scheduler.hpp"
#include "copyem/units.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <thread>
#include <unordered_map>
#include <utility>

namespace
{
    using log_recovery = copyem::log::recovery;

    using clock_type = std::chrono::steady_clock;

    auto seconds_since(clock_type::time_point _start) -> double
    {
        return std::chrono::duration<double>(clock_type::now() - _start).count();
    } // seconds_since

    auto summarize(const std::vector<copyem::stream_plan>& _plans) -> std::vector<copyem::stream_plan_summary>
    {
        std::vector<copyem::stream_plan_summary> summaries;
        summaries.reserve(_plans.size());

        for (const auto& p : _plans) {
            summaries.push_back({p.stream_id, p.files.size(), p.total_bytes(), p.estimated_completion});
        }

        return summaries;
    } // summarize

    auto first_error(const std::vector<copyem::stream_outcome>& _streams) -> std::string
    {
        const auto it = std::find_if(std::begin(_streams), std::end(_streams), [](const auto& _s) {
            return !_s.success;
        });

        return it == std::end(_streams) ? std::string{} : it->error;
    } // first_error
} // anonymous namespace

namespace copyem
{
    recovery_coordinator::recovery_coordinator(transfer_config _config, stream_executor& _executor)
        : config_{std::move(_config)}
        , executor_{_executor}
    {
    }

    auto recovery_coordinator::run(const manifest& _manifest, const std::atomic<bool>& _cancel) -> run_outcome
    {
        const auto start = clock_type::now();

        run_outcome outcome;
        outcome.files_attempted = _manifest.size();

        if (_manifest.empty()) {
            log_recovery::info("{}: Nothing to transfer.", __func__);
            outcome.status = run_status::success;
            outcome.stream_success.assign(static_cast<std::size_t>(std::max(config_.parallelism, 0)), true);
            return outcome;
        }

        std::unordered_map<std::string, std::int64_t> sizes;
        sizes.reserve(_manifest.size());

        for (const auto& f : _manifest) {
            sizes.emplace(f.path, f.size);
        }

        const auto model = config_.cost();
        const schedule_options options{config_.ordering, config_.buffer_size};
        const auto max_attempts = config_.max_retries + 1;

        std::unordered_set<std::string> delivered;
        auto residual = _manifest;
        auto cancelled = false;

        for (int attempt = 1; attempt <= max_attempts; ++attempt) {
            if (_cancel.load()) {
                cancelled = true;
                break;
            }

            const auto attempt_start = clock_type::now();

            log_recovery::info("{}: Attempt [{}] of [{}]: [{}] files, [{}].",
                               __func__,
                               attempt,
                               max_attempts,
                               residual.size(),
                               format_size(static_cast<double>(residual.total_bytes())));

            // The stream count stays fixed across attempts.
            const auto plans = schedule(residual, config_.parallelism, model, options);

            attempt_record record;
            record.number = attempt;
            record.residual_files = residual.size();
            record.residual_bytes = residual.total_bytes();
            record.plans = summarize(plans);
            record.streams = executor_.execute(plans, _cancel);

            const auto confirmed = confirmed_files(residual, record.streams);

            for (const auto& path : confirmed) {
                delivered.insert(path);
                outcome.bytes_delivered += sizes.at(path);
            }

            record.confirmed_files = confirmed.size();
            record.elapsed_seconds = seconds_since(attempt_start);

            outcome.stream_success.clear();

            for (const auto& s : record.streams) {
                outcome.stream_success.push_back(s.success);
            }

            const auto all_succeeded = std::all_of(std::begin(record.streams), std::end(record.streams), [](const auto& _s) {
                return _s.success;
            });

            outcome.error = first_error(record.streams);
            outcome.attempts.push_back(std::move(record));

            residual = residual.without(confirmed);

            log_recovery::info("{}: Attempt [{}] confirmed [{}] files. [{}] remain.",
                               __func__,
                               attempt,
                               confirmed.size(),
                               residual.size());

            if (residual.empty()) {
                if (!all_succeeded) {
                    log_recovery::info("{}: Every file was confirmed despite a stream failure.", __func__);
                }

                break;
            }

            if (_cancel.load()) {
                cancelled = true;
                break;
            }

            if (all_succeeded) {
                log_recovery::warn("{}: All streams succeeded but [{}] files were not confirmed.", __func__, residual.size());
            }

            if (attempt < max_attempts) {
                log_recovery::info("{}: Retrying in [{}] seconds.", __func__, config_.retry_delay);

                if (!wait_before_retry(_cancel)) {
                    cancelled = true;
                    break;
                }
            }
        }

        outcome.files_succeeded = delivered.size();
        outcome.elapsed_seconds = seconds_since(start);

        for (const auto& f : residual) {
            outcome.unresolved.push_back(f.path);
        }

        if (residual.empty()) {
            outcome.status = run_status::success;
            outcome.error.clear();
        }
        else if (cancelled) {
            outcome.status = run_status::cancelled;
            outcome.error = "Transfer cancelled.";
        }
        else {
            outcome.status = delivered.empty() ? run_status::failure : run_status::partial_success;
        }

        log_recovery::info("{}: Run finished with status [{}] after [{}] attempts. [{}] of [{}] files delivered.",
                           __func__,
                           to_string(outcome.status),
                           outcome.attempts.size(),
                           outcome.files_succeeded,
                           outcome.files_attempted);

        return outcome;
    } // run

    auto recovery_coordinator::wait_before_retry(const std::atomic<bool>& _cancel) const -> bool
    {
        const auto deadline = clock_type::now() + std::chrono::duration_cast<clock_type::duration>(
                                                      std::chrono::duration<double>(config_.retry_delay));

        while (clock_type::now() < deadline) {
            if (_cancel.load()) {
                return false;
            }

            std::this_thread::sleep_for(std::min<clock_type::duration>(config_.poll_interval, deadline - clock_type::now()));
        }

        return !_cancel.load();
    } // wait_before_retry

    auto confirmed_files(const manifest& _residual, const std::vector<stream_outcome>& _streams)
        -> std::unordered_set<std::string>
    {
        std::unordered_set<std::string> confirmed;

        for (const auto& s : _streams) {
            for (const auto& path : s.acknowledged) {
                if (_residual.contains(path)) {
                    confirmed.insert(path);
                }
            }
        }

        return confirmed;
    } // confirmed_files
} // namespace copyem
