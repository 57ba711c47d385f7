#ifndef COPYEM_PIPELINE_HPP
#define COPYEM_PIPELINE_HPP

#include "copyem/acknowledgment.hpp"
#include "copyem/configuration.hpp"
#include "copyem/process.hpp"
#include "copyem/progress.hpp"
#include "copyem/scheduler.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace copyem
{
    enum class stage_kind
    {
        producer, ///< Archives the planned files in order.
        buffer,   ///< Smooths the rate mismatch between producer and transport.
        transport ///< Carries the archive to the destination and unpacks it there.
    };

    auto to_string(stage_kind _kind) -> std::string_view;

    struct stage_spec
    {
        stage_kind kind;
        std::vector<std::string> argv;
        std::string working_directory;
    }; // struct stage_spec

    /// Builds the command lines of one stream.
    ///
    /// \param[in] _config    The transfer settings.
    /// \param[in] _list_file A file holding the NUL-separated relative paths to archive.
    ///
    /// \returns The stages in data-flow order. The buffer stage is left out if no buffer
    ///          program is configured.
    auto build_stage_specs(const transfer_config& _config, const std::string& _list_file) -> std::vector<stage_spec>;

    /// What one call to pipeline::poll() observed.
    struct pipeline_activity
    {
        std::vector<std::string> acknowledged;
        std::int64_t acknowledged_bytes = 0;
        std::int64_t buffered_bytes = 0; // Growth of the buffer stage's byte counter.
        std::optional<buffer_status> latest_buffer_status;
    }; // struct pipeline_activity

    /// The running processes of one stream, chained by pipes.
    ///
    /// The object owns the processes, the parent-side descriptors and the temporary file
    /// list. Destroying it terminates any stage that is still running.
    class pipeline
    {
    public:
        /// Starts every stage of the stream.
        ///
        /// \throws copyem::exception TEMPORARY_FILE_ERROR, PIPE_CREATE_ERROR or PROCESS_SPAWN_ERROR.
        ///                           Stages started before the failure are killed.
        pipeline(int _stream_id, const stream_plan& _plan, const transfer_config& _config);

        pipeline(const pipeline&) = delete;
        auto operator=(const pipeline&) -> pipeline& = delete;

        ~pipeline();

        /// Waits up to \p _timeout for output, processes it and reaps exited stages.
        auto poll(std::chrono::milliseconds _timeout) -> pipeline_activity;

        // True once every stage has been reaped and its output drained.
        auto finished() const noexcept -> bool;

        /// Sends SIGTERM to every live stage, waits up to the grace period and sends
        /// SIGKILL to what remains. Never throws.
        auto terminate(std::string_view _reason) noexcept -> void;

        auto terminated() const noexcept -> bool { return termination_reason_.has_value(); }

        // True if every stage exited with status 0 and the pipeline was not terminated.
        auto succeeded() const noexcept -> bool;

        /// Names the first failing stage, its exit status and the last diagnostic lines.
        auto failure_description() const -> std::string;

        auto tracker() const noexcept -> const acknowledgment_tracker& { return tracker_; }
        auto diagnostics() const -> std::vector<std::string>;
        auto buffered_bytes() const noexcept -> std::int64_t { return buffer_total_; }

    private:
        struct stage
        {
            stage_kind kind;
            child_process process;
        };

        enum class channel_kind
        {
            diagnostics,
            buffer_status,
            acknowledgments
        };

        struct channel
        {
            channel_kind kind;
            stage_kind source;
            file_descriptor fd;
            line_splitter lines;
        };

        auto start_stages(const std::vector<stage_spec>& _specs) -> void;
        auto read_channel(channel& _channel, pipeline_activity& _activity) -> void;
        auto handle_line(const channel& _channel, const std::string& _line, pipeline_activity& _activity) -> void;
        auto reap() noexcept -> void;
        auto drain(pipeline_activity& _activity) -> void;
        auto add_diagnostic(stage_kind _source, const std::string& _line) -> void;

        int stream_id_;
        transfer_config config_;
        std::unique_ptr<temporary_file> list_file_;
        std::vector<stage> stages_;
        std::vector<channel> channels_;
        acknowledgment_tracker tracker_;
        std::deque<std::string> diagnostics_;
        std::int64_t buffer_total_ = 0;
        std::optional<std::string> termination_reason_;
        bool consumer_confirmed_ = false;
    }; // class pipeline
} // namespace copyem

#endif // COPYEM_PIPELINE_HPP
