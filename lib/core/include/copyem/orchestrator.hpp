#ifndef COPYEM_ORCHESTRATOR_HPP
#define COPYEM_ORCHESTRATOR_HPP

#include "copyem/configuration.hpp"
#include "copyem/progress.hpp"
#include "copyem/run_outcome.hpp"
#include "copyem/scheduler.hpp"

#include <atomic>
#include <mutex>
#include <vector>

namespace copyem
{
    /// Runs a set of stream plans concurrently.
    class stream_executor
    {
    public:
        virtual ~stream_executor() = default;

        /// Runs every plan and waits for all of them.
        ///
        /// Stream faults are reported in the outcomes and never thrown. Empty plans
        /// succeed without starting anything.
        ///
        /// \param[in] _plans  One plan per stream.
        /// \param[in] _cancel Once set, every live stream is terminated.
        ///
        /// \returns One outcome per plan, in the same order.
        virtual auto execute(const std::vector<stream_plan>& _plans, const std::atomic<bool>& _cancel)
            -> std::vector<stream_outcome> = 0;
    }; // class stream_executor

    /// Runs each plan as a producer, buffer and transport process pipeline. One worker
    /// thread supervises each pipeline.
    class pipeline_orchestrator : public stream_executor
    {
    public:
        /// \param[in] _config The transfer settings.
        /// \param[in] _sink   Receives progress events. May be null.
        pipeline_orchestrator(transfer_config _config, progress_sink* _sink);

        auto execute(const std::vector<stream_plan>& _plans, const std::atomic<bool>& _cancel)
            -> std::vector<stream_outcome> override;

    private:
        auto supervise(const stream_plan& _plan, const std::atomic<bool>& _cancel) -> stream_outcome;
        auto publish(const std::vector<progress_event>& _events) -> void;

        transfer_config config_;
        progress_sink* sink_;
        std::mutex sink_mutex_;
    }; // class pipeline_orchestrator
} // namespace copyem

#endif // COPYEM_ORCHESTRATOR_HPP
