#include "copyem/scheduler.hpp"

#include "copyem/error_codes.hpp"
#include "copyem/exception.hpp"
#include "copyem/logger.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <numeric>

namespace
{
    using log_scheduler = copyem::log::scheduler;

    auto validate_inputs(int _stream_count, const copyem::cost_model& _model) -> void
    {
        if (_stream_count < 1) {
            COPYEM_THROW(copyem::SYS_INVALID_INPUT_PARAM,
                         fmt::format("schedule: Stream count [{}] must be at least 1.", _stream_count));
        }

        if (!(_model.assumed_speed > 0) || !std::isfinite(_model.assumed_speed)) {
            COPYEM_THROW(copyem::SYS_INVALID_INPUT_PARAM,
                         fmt::format("schedule: Assumed speed [{}] must be greater than 0.", _model.assumed_speed));
        }

        if (_model.per_file_latency < 0 || !std::isfinite(_model.per_file_latency)) {
            COPYEM_THROW(copyem::SYS_INVALID_INPUT_PARAM,
                         fmt::format("schedule: Per-file latency [{}] cannot be negative.", _model.per_file_latency));
        }
    } // validate_inputs
} // anonymous namespace

namespace copyem
{
    auto stream_plan::total_bytes() const noexcept -> std::int64_t
    {
        return std::accumulate(std::begin(files), std::end(files), std::int64_t{}, [](auto _sum, const auto& _f) {
            return _sum + _f.size;
        });
    } // stream_plan::total_bytes

    auto schedule(const manifest& _manifest,
                  int _stream_count,
                  const cost_model& _model,
                  const schedule_options& _options) -> std::vector<stream_plan>
    {
        validate_inputs(_stream_count, _model);

        std::vector<stream_plan> plans(_stream_count);

        for (int i = 0; i < _stream_count; ++i) {
            plans[i].stream_id = i;
        }

        const auto& entries = _manifest.entries();

        std::vector<double> costs;
        costs.reserve(entries.size());
        std::transform(std::begin(entries), std::end(entries), std::back_inserter(costs), [&_model](const auto& _e) {
            return _model.cost_of(_e);
        });

        std::vector<std::size_t> order(entries.size());
        std::iota(std::begin(order), std::end(order), std::size_t{});

        // Stable, so equal costs keep manifest order.
        std::stable_sort(std::begin(order), std::end(order), [&costs](auto _lhs, auto _rhs) {
            return costs[_lhs] > costs[_rhs];
        });

        std::vector<double> loads(_stream_count, 0.0);

        for (const auto index : order) {
            // min_element returns the first minimum, i.e. the lowest stream id on ties.
            const auto target = std::distance(std::begin(loads), std::min_element(std::begin(loads), std::end(loads)));

            plans[target].files.push_back(entries[index]);
            loads[target] += costs[index];
        }

        for (auto& plan : plans) {
            plan.estimated_completion = loads[plan.stream_id];
            plan.buffered_estimate = plan.estimated_completion;

            if (_options.ordering == order_policy::buffer_interleaved && !plan.files.empty()) {
                auto [files, estimate] = interleave_for_buffer(std::move(plan.files), _model, _options.buffer_size);
                plan.files = std::move(files);
                plan.buffered_estimate = estimate;
            }

            log_scheduler::debug("{}: Stream [{}] holds [{}] files, [{}] bytes, estimated completion [{:.2f}s].",
                                 __func__,
                                 plan.stream_id,
                                 plan.files.size(),
                                 plan.total_bytes(),
                                 plan.estimated_completion);
        }

        log_scheduler::info("{}: Scheduled [{}] files across [{}] streams. Makespan estimate [{:.2f}s].",
                            __func__,
                            entries.size(),
                            _stream_count,
                            makespan(plans));

        return plans;
    } // schedule

    auto interleave_for_buffer(std::vector<file_entry> _files,
                               const cost_model& _model,
                               std::int64_t _buffer_size) -> std::pair<std::vector<file_entry>, double>
    {
        std::stable_sort(std::begin(_files), std::end(_files), [](const auto& _lhs, const auto& _rhs) {
            return _lhs.size < _rhs.size;
        });

        const auto speed = _model.assumed_speed;
        const auto latency = _model.per_file_latency;
        const auto buffer_max_delay = static_cast<double>(_buffer_size) / speed;

        std::vector<file_entry> ordered;
        ordered.reserve(_files.size());

        double estimate = 0;

        // Both indices point at the next file to take. Signed so that the loop
        // condition holds when the large-file index runs below zero.
        std::int64_t small = 0;
        std::int64_t large = static_cast<std::int64_t>(_files.size()) - 1;

        while (small <= large) {
            const auto& big = _files[large--];
            const auto big_time = static_cast<double>(big.size) / speed;

            ordered.push_back(big);
            estimate += big_time + latency;

            // How long the large file keeps the buffer busy.
            auto buffer_time = std::min(big_time, buffer_max_delay);

            while (small <= large && buffer_time > latency) {
                const auto& f = _files[small++];
                const auto small_time = static_cast<double>(f.size) / speed;

                ordered.push_back(f);
                estimate += small_time;
                buffer_time = std::min(buffer_time + small_time - latency, buffer_max_delay);
            }
        }

        return {std::move(ordered), estimate};
    } // interleave_for_buffer

    auto makespan(const std::vector<stream_plan>& _plans) noexcept -> double
    {
        double result = 0;

        for (const auto& p : _plans) {
            result = std::max(result, p.estimated_completion);
        }

        return result;
    } // makespan
} // namespace copyem
