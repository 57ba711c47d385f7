#include "copyem/run_outcome.hpp"

namespace copyem
{
    auto to_string(run_status _status) -> std::string_view
    {
        switch (_status) {
            case run_status::success:
                return "success";
            case run_status::partial_success:
                return "partial_success";
            case run_status::failure:
                return "failure";
            case run_status::fatal_abort:
                return "fatal_abort";
            case run_status::cancelled:
                return "cancelled";
        }

        return "unknown";
    } // to_string

    auto to_json(nlohmann::json& _json, const stream_outcome& _outcome) -> void
    {
        _json = nlohmann::json{
            {"stream_id", _outcome.stream_id},
            {"success", _outcome.success},
            {"acknowledged_files", _outcome.acknowledged.size()},
            {"acknowledged_bytes", _outcome.acknowledged_bytes},
            {"buffered_bytes", _outcome.buffered_bytes},
            {"terminated", _outcome.terminated},
            {"error", _outcome.error},
            {"diagnostics", _outcome.diagnostics}
        };
    } // to_json

    auto to_json(nlohmann::json& _json, const attempt_record& _attempt) -> void
    {
        auto plans = nlohmann::json::array();

        for (const auto& p : _attempt.plans) {
            plans.push_back({
                {"stream_id", p.stream_id},
                {"files", p.files},
                {"bytes", p.bytes},
                {"estimated_completion", p.estimated_completion}
            });
        }

        _json = nlohmann::json{
            {"attempt", _attempt.number},
            {"residual_files", _attempt.residual_files},
            {"residual_bytes", _attempt.residual_bytes},
            {"confirmed_files", _attempt.confirmed_files},
            {"elapsed_seconds", _attempt.elapsed_seconds},
            {"plans", plans},
            {"streams", _attempt.streams}
        };
    } // to_json

    auto to_json(nlohmann::json& _json, const run_outcome& _outcome) -> void
    {
        _json = nlohmann::json{
            {"status", std::string{to_string(_outcome.status)}},
            {"files_attempted", _outcome.files_attempted},
            {"files_succeeded", _outcome.files_succeeded},
            {"files_unresolved", _outcome.files_unresolved()},
            {"unresolved", _outcome.unresolved},
            {"bytes_delivered", _outcome.bytes_delivered},
            {"elapsed_seconds", _outcome.elapsed_seconds},
            {"stream_success", _outcome.stream_success},
            {"error", _outcome.error},
            {"attempts", _outcome.attempts}
        };
    } // to_json

    auto exit_code(run_status _status) noexcept -> int
    {
        switch (_status) {
            case run_status::success:
                return 0;
            case run_status::partial_success:
            case run_status::failure:
                return 2;
            case run_status::fatal_abort:
                return 1;
            case run_status::cancelled:
                return 130;
        }

        return 1;
    } // exit_code
} // namespace copyem
