#include "copyem/orchestrator.hpp"

#include "copyem/exception.hpp"
#include "copyem/logger.hpp"
#include "copyem/pipeline.hpp"
#include "copyem/thread_pool.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <utility>

namespace
{
    using log_pipeline = copyem::log::pipeline;
} // anonymous namespace

namespace copyem
{
    pipeline_orchestrator::pipeline_orchestrator(transfer_config _config, progress_sink* _sink)
        : config_{std::move(_config)}
        , sink_{_sink}
    {
    }

    auto pipeline_orchestrator::execute(const std::vector<stream_plan>& _plans, const std::atomic<bool>& _cancel)
        -> std::vector<stream_outcome>
    {
        std::vector<stream_outcome> outcomes(_plans.size());

        for (std::size_t i = 0; i < _plans.size(); ++i) {
            outcomes[i].stream_id = _plans[i].stream_id;
            outcomes[i].success = _plans[i].empty();
        }

        const auto active = std::count_if(std::begin(_plans), std::end(_plans), [](const auto& _p) {
            return !_p.empty();
        });

        if (active == 0) {
            return outcomes;
        }

        log_pipeline::info("{}: Starting [{}] of [{}] streams.", __func__, active, _plans.size());

        thread_pool pool{static_cast<int>(active)};

        // Each task writes only its own slot.
        for (std::size_t i = 0; i < _plans.size(); ++i) {
            if (_plans[i].empty()) {
                continue;
            }

            thread_pool::post(pool, [this, &_plans, &outcomes, &_cancel, i] {
                outcomes[i] = supervise(_plans[i], _cancel);
            });
        }

        pool.finish();
        pool.join();

        return outcomes;
    } // execute

    auto pipeline_orchestrator::supervise(const stream_plan& _plan, const std::atomic<bool>& _cancel) -> stream_outcome
    {
        using clock = std::chrono::steady_clock;

        stream_outcome outcome;
        outcome.stream_id = _plan.stream_id;

        try {
            pipeline p{_plan.stream_id, _plan, config_};

            const auto bytes_from_buffer = !config_.buffer_program.empty();

            std::vector<progress_event> queued;
            std::int64_t pending_bytes = 0;
            auto last_publish = clock::now();
            auto last_progress = last_publish;

            const auto flush = [&] {
                if (pending_bytes > 0 && queued.empty()) {
                    queued.push_back(progress_event{_plan.stream_id, 0, std::nullopt});
                }

                if (!queued.empty()) {
                    queued.front().bytes_delta += pending_bytes;
                    publish(queued);
                }

                queued.clear();
                pending_bytes = 0;
            };

            while (!p.finished()) {
                if (_cancel.load() && !p.terminated()) {
                    p.terminate("cancelled");
                }

                auto activity = p.poll(config_.poll_interval);
                const auto now = clock::now();

                if (!activity.acknowledged.empty() || activity.buffered_bytes > 0) {
                    last_progress = now;
                }

                for (auto& path : activity.acknowledged) {
                    queued.push_back(progress_event{_plan.stream_id, 0, std::move(path)});
                }

                pending_bytes += bytes_from_buffer ? activity.buffered_bytes : activity.acknowledged_bytes;

                if (config_.stall_timeout.count() > 0 && !p.terminated() && now - last_progress > config_.stall_timeout) {
                    log_pipeline::warn("{}: Stream [{}] made no progress for [{}] ms.",
                                       __func__,
                                       _plan.stream_id,
                                       config_.stall_timeout.count());
                    p.terminate(fmt::format("stalled for {} ms", config_.stall_timeout.count()));
                }

                if (now - last_publish >= config_.progress_interval) {
                    flush();
                    last_publish = now;
                }
            }

            flush();

            outcome.success = p.succeeded();
            outcome.terminated = p.terminated();
            outcome.acknowledged = p.tracker().acknowledged();
            outcome.acknowledged_bytes = p.tracker().acknowledged_bytes();
            outcome.buffered_bytes = p.buffered_bytes();
            outcome.diagnostics = p.diagnostics();

            if (!outcome.success) {
                outcome.error = p.failure_description();
            }
        }
        catch (const copyem::exception& e) {
            outcome.success = false;
            outcome.error = e.client_display_what();
        }
        catch (const std::exception& e) {
            outcome.success = false;
            outcome.error = fmt::format("Stream {} failed: {}", _plan.stream_id, e.what());
        }

        if (outcome.success) {
            log_pipeline::info("{}: Stream [{}] completed. [{}] of [{}] files confirmed.",
                               __func__,
                               _plan.stream_id,
                               outcome.acknowledged.size(),
                               _plan.files.size());
        }
        else {
            log_pipeline::error("{}: Stream [{}] failed after confirming [{}] of [{}] files. {}",
                                __func__,
                                _plan.stream_id,
                                outcome.acknowledged.size(),
                                _plan.files.size(),
                                outcome.error);
        }

        return outcome;
    } // supervise

    auto pipeline_orchestrator::publish(const std::vector<progress_event>& _events) -> void
    {
        if (!sink_) {
            return;
        }

        std::lock_guard lock{sink_mutex_};

        for (const auto& e : _events) {
            sink_->on_progress(e);
        }
    } // publish
} // namespace copyem
