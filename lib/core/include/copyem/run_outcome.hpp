#ifndef COPYEM_RUN_OUTCOME_HPP
#define COPYEM_RUN_OUTCOME_HPP

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace copyem
{
    /// The result of running one stream plan.
    struct stream_outcome
    {
        int stream_id = 0;
        bool success = false;

        // Relative paths confirmed by the consumer, in delivery order.
        std::vector<std::string> acknowledged;
        std::int64_t acknowledged_bytes = 0;

        // Bytes that passed the buffer stage. Zero without a buffer stage.
        std::int64_t buffered_bytes = 0;

        bool terminated = false;
        std::string error;
        std::vector<std::string> diagnostics;
    }; // struct stream_outcome

    struct stream_plan_summary
    {
        int stream_id = 0;
        std::size_t files = 0;
        std::int64_t bytes = 0;
        double estimated_completion = 0;
    }; // struct stream_plan_summary

    struct attempt_record
    {
        int number = 0; // 1-based
        std::size_t residual_files = 0;
        std::int64_t residual_bytes = 0;
        std::vector<stream_plan_summary> plans;
        std::vector<stream_outcome> streams;
        std::size_t confirmed_files = 0;
        double elapsed_seconds = 0;
    }; // struct attempt_record

    enum class run_status
    {
        success,
        partial_success, // Retries exhausted. Some files were delivered.
        failure,         // Retries exhausted. Nothing was delivered.
        fatal_abort,     // A setup error stopped the run before any transfer.
        cancelled
    };

    auto to_string(run_status _status) -> std::string_view;

    struct run_outcome
    {
        run_status status = run_status::success;

        std::size_t files_attempted = 0;
        std::size_t files_succeeded = 0;
        std::vector<std::string> unresolved;

        std::int64_t bytes_delivered = 0;
        double elapsed_seconds = 0;

        // One flag per stream of the last attempt.
        std::vector<bool> stream_success;

        std::string error;
        std::vector<attempt_record> attempts;

        auto files_unresolved() const noexcept -> std::size_t { return unresolved.size(); }
    }; // struct run_outcome

    auto to_json(nlohmann::json& _json, const stream_outcome& _outcome) -> void;
    auto to_json(nlohmann::json& _json, const attempt_record& _attempt) -> void;
    auto to_json(nlohmann::json& _json, const run_outcome& _outcome) -> void;

    // Maps a run status to the process exit code of the command-line client.
    auto exit_code(run_status _status) noexcept -> int;
} // namespace copyem

#endif // COPYEM_RUN_OUTCOME_HPP
