#ifndef COPYEM_PROGRESS_HPP
#define COPYEM_PROGRESS_HPP

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace copyem
{
    struct progress_event
    {
        int stream_id = 0;
        std::int64_t bytes_delta = 0;

        // Set when the event reports one acknowledged file.
        std::optional<std::string> file_completed;

        std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
    }; // struct progress_event

    /// Receives progress events from every stream.
    ///
    /// Calls are serialized by the caller. Implementations must not block.
    class progress_sink
    {
    public:
        virtual ~progress_sink() = default;

        virtual auto on_progress(const progress_event& _event) -> void = 0;
    }; // class progress_sink

    /// One status report of the buffering stage, e.g.
    /// "in @ 14.0 MiB/s, out @ 24.0 MiB/s,  656 MiB total, buffer  99% full".
    struct buffer_status
    {
        double in_rate = 0;  // bytes per second
        double out_rate = 0; // bytes per second
        std::int64_t total_bytes = 0;
        int fill_percent = 0;
    }; // struct buffer_status

    // Returns std::nullopt if the text is not a status report.
    auto parse_buffer_status(std::string_view _text) -> std::optional<buffer_status>;

    /// Splits a byte stream into lines.
    ///
    /// Every character in the delimiter set ends a line. Empty lines are dropped.
    class line_splitter
    {
    public:
        explicit line_splitter(std::string _delimiters = "\n");

        auto feed(std::string_view _data) -> std::vector<std::string>;

        // Returns the unterminated remainder, if any, and clears it.
        auto flush() -> std::optional<std::string>;

    private:
        std::string delimiters_;
        std::string partial_;
    }; // class line_splitter

    /// Renders one status line on a terminal: current rate, average rate, elapsed
    /// time, ETA and percentage.
    class console_progress_sink : public progress_sink
    {
    public:
        console_progress_sink(std::int64_t _total_bytes, std::size_t _total_files, std::FILE* _out = stdout);

        auto on_progress(const progress_event& _event) -> void override;

        // Ends the status line.
        auto finish() -> void;

        auto bytes() const -> std::int64_t;
        auto files() const -> std::size_t;

    private:
        auto render(std::chrono::steady_clock::time_point _now) -> void;

        mutable std::mutex mutex_;
        std::FILE* out_;
        std::int64_t total_bytes_;
        std::size_t total_files_;
        std::int64_t bytes_ = 0;
        std::size_t files_ = 0;
        std::chrono::steady_clock::time_point start_;
        std::chrono::steady_clock::time_point last_render_;
        std::int64_t bytes_at_last_render_ = 0;
        double current_rate_ = 0;
    }; // class console_progress_sink
} // namespace copyem

#endif // COPYEM_PROGRESS_HPP
