#ifndef COPYEM_SCHEDULER_HPP
#define COPYEM_SCHEDULER_HPP

#include "copyem/cost_model.hpp"
#include "copyem/manifest.hpp"

#include <cstdint>
#include <utility>
#include <vector>

namespace copyem
{
    struct stream_plan
    {
        int stream_id = 0;
        std::vector<file_entry> files;

        // Sum of the per-file costs. This is the quantity balanced across streams.
        double estimated_completion = 0;

        // Completion estimate that accounts for latency hidden behind buffered data.
        double buffered_estimate = 0;

        auto total_bytes() const noexcept -> std::int64_t;
        auto empty() const noexcept -> bool { return files.empty(); }
    }; // struct stream_plan

    struct schedule_options
    {
        order_policy ordering = order_policy::largest_first;
        std::int64_t buffer_size = 1024LL * 1024 * 1024;
    }; // struct schedule_options

    /// Partitions a manifest into exactly \p _stream_count plans.
    ///
    /// Files are sorted by descending cost (ties keep manifest order) and each file is
    /// assigned to the stream holding the least accumulated cost (ties go to the lowest
    /// stream id). This is longest-processing-time-first list scheduling, which bounds the
    /// makespan by (4/3 - 1/(3N)) times the optimum. The result is deterministic.
    ///
    /// \param[in] _manifest     The files to distribute.
    /// \param[in] _stream_count The number of streams. Must be at least 1.
    /// \param[in] _model        The cost model.
    /// \param[in] _options      Intra-stream ordering and the buffer size used by it.
    ///
    /// \throws copyem::exception SYS_INVALID_INPUT_PARAM if the stream count is less than 1
    ///                           or the cost model is invalid.
    ///
    /// \returns One plan per stream. Plans may be empty.
    auto schedule(const manifest& _manifest,
                  int _stream_count,
                  const cost_model& _model,
                  const schedule_options& _options = {}) -> std::vector<stream_plan>;

    /// Reorders the files of one stream for buffered transfer.
    ///
    /// Each large file is followed by small files for as long as the time the large file
    /// occupies the buffer exceeds the per-file latency.
    ///
    /// \returns The reordered files and the overlap-aware completion estimate.
    auto interleave_for_buffer(std::vector<file_entry> _files,
                               const cost_model& _model,
                               std::int64_t _buffer_size) -> std::pair<std::vector<file_entry>, double>;

    // The completion time of the slowest plan.
    auto makespan(const std::vector<stream_plan>& _plans) noexcept -> double;
} // namespace copyem

#endif // COPYEM_SCHEDULER_HPP
