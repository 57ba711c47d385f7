#ifndef COPYEM_RECOVERY_COORDINATOR_HPP
#define COPYEM_RECOVERY_COORDINATOR_HPP

#include "copyem/configuration.hpp"
#include "copyem/manifest.hpp"
#include "copyem/orchestrator.hpp"
#include "copyem/run_outcome.hpp"

#include <atomic>
#include <string>
#include <unordered_set>
#include <vector>

namespace copyem
{
    /// Drives a run as a sequence of attempts.
    ///
    /// Each attempt schedules the residual manifest across the configured number of
    /// streams and executes it. Files confirmed by any stream are removed from the
    /// residual. The run ends when the residual is empty, when max_retries + 1 attempts
    /// have been made, or when it is cancelled.
    ///
    /// All state of a run lives in the call to run(). One coordinator may run several
    /// manifests in turn.
    class recovery_coordinator
    {
    public:
        recovery_coordinator(transfer_config _config, stream_executor& _executor);

        /// \throws copyem::exception SYS_INVALID_INPUT_PARAM if the configuration cannot
        ///                           be used for scheduling.
        auto run(const manifest& _manifest, const std::atomic<bool>& _cancel) -> run_outcome;

    private:
        // Returns false if the wait was cut short by cancellation.
        auto wait_before_retry(const std::atomic<bool>& _cancel) const -> bool;

        transfer_config config_;
        stream_executor& executor_;
    }; // class recovery_coordinator

    /// Collects the files confirmed by an attempt that are still part of \p _residual.
    auto confirmed_files(const manifest& _residual, const std::vector<stream_outcome>& _streams)
        -> std::unordered_set<std::string>;
} // namespace copyem

#endif // COPYEM_RECOVERY_COORDINATOR_HPP
