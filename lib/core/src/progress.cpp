#include "copyem/progress.hpp"

#include "copyem/units.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <regex>
#include <stdexcept>
#include <utility>

namespace
{
    using namespace std::chrono_literals;

    constexpr auto render_interval = 250ms;

    auto unit_multiplier(const std::string& _prefix) -> double
    {
        if (_prefix.empty()) {
            return 1;
        }

        switch (std::toupper(static_cast<unsigned char>(_prefix[0]))) {
            case 'K': return 1024.0;
            case 'M': return 1024.0 * 1024;
            case 'G': return 1024.0 * 1024 * 1024;
            case 'T': return 1024.0 * 1024 * 1024 * 1024;
            default:  return 1;
        }
    } // unit_multiplier
} // anonymous namespace

namespace copyem
{
    auto parse_buffer_status(std::string_view _text) -> std::optional<buffer_status>
    {
        // Units may be lowercase ("kiB") and the "iB" of the total may be missing.
        static const std::regex pattern{
            R"(in\s+@\s+([\d.]+)\s+([kmgt]?)i?B/s.*out\s+@\s+([\d.]+)\s+([kmgt]?)i?B/s.*?([\d.]+)\s+([kmgt]?)i?B?\s+total.*buffer\s+(\d+)%)",
            std::regex::ECMAScript | std::regex::icase};

        std::match_results<std::string_view::const_iterator> m;

        if (!std::regex_search(std::begin(_text), std::end(_text), m, pattern)) {
            return std::nullopt;
        }

        try {
            buffer_status status;
            status.in_rate = std::stod(m[1].str()) * unit_multiplier(m[2].str());
            status.out_rate = std::stod(m[3].str()) * unit_multiplier(m[4].str());
            status.total_bytes = static_cast<std::int64_t>(std::stod(m[5].str()) * unit_multiplier(m[6].str()));
            status.fill_percent = std::stoi(m[7].str());
            return status;
        }
        catch (const std::logic_error&) {
            // "." alone matches [\d.]+ but is not a number.
            return std::nullopt;
        }
    } // parse_buffer_status

    line_splitter::line_splitter(std::string _delimiters)
        : delimiters_{std::move(_delimiters)}
    {
    }

    auto line_splitter::feed(std::string_view _data) -> std::vector<std::string>
    {
        std::vector<std::string> lines;

        for (const auto c : _data) {
            if (delimiters_.find(c) == std::string::npos) {
                partial_ += c;
                continue;
            }

            if (!partial_.empty()) {
                lines.push_back(std::move(partial_));
                partial_.clear();
            }
        }

        return lines;
    } // line_splitter::feed

    auto line_splitter::flush() -> std::optional<std::string>
    {
        if (partial_.empty()) {
            return std::nullopt;
        }

        auto rest = std::move(partial_);
        partial_.clear();

        return rest;
    } // line_splitter::flush

    console_progress_sink::console_progress_sink(std::int64_t _total_bytes, std::size_t _total_files, std::FILE* _out)
        : out_{_out}
        , total_bytes_{_total_bytes}
        , total_files_{_total_files}
        , start_{std::chrono::steady_clock::now()}
        , last_render_{start_}
    {
    }

    auto console_progress_sink::on_progress(const progress_event& _event) -> void
    {
        std::lock_guard lock{mutex_};

        bytes_ += _event.bytes_delta;

        if (_event.file_completed) {
            ++files_;
        }

        const auto now = std::chrono::steady_clock::now();

        if (now - last_render_ >= render_interval) {
            render(now);
        }
    } // console_progress_sink::on_progress

    auto console_progress_sink::finish() -> void
    {
        std::lock_guard lock{mutex_};

        render(std::chrono::steady_clock::now());
        std::fputc('\n', out_);
        std::fflush(out_);
    } // console_progress_sink::finish

    auto console_progress_sink::bytes() const -> std::int64_t
    {
        std::lock_guard lock{mutex_};
        return bytes_;
    }

    auto console_progress_sink::files() const -> std::size_t
    {
        std::lock_guard lock{mutex_};
        return files_;
    }

    auto console_progress_sink::render(std::chrono::steady_clock::time_point _now) -> void
    {
        const auto since_last = std::chrono::duration<double>(_now - last_render_).count();
        const auto elapsed = std::chrono::duration<double>(_now - start_).count();

        if (since_last > 0) {
            current_rate_ = static_cast<double>(bytes_ - bytes_at_last_render_) / since_last;
        }

        const auto average_rate = elapsed > 0 ? static_cast<double>(bytes_) / elapsed : 0.0;
        const auto remaining = std::max<std::int64_t>(total_bytes_ - bytes_, 0);
        const auto eta = average_rate > 0 ? format_duration(static_cast<double>(remaining) / average_rate) : std::string{"--"};
        const auto percent =
            total_bytes_ > 0 ? std::min(100.0, 100.0 * static_cast<double>(bytes_) / static_cast<double>(total_bytes_)) : 100.0;

        // The padding clears leftovers of a longer previous line.
        const auto line = fmt::format("{:5.1f}% | {} of {} | {}/{} files | {}/s (avg {}/s) | elapsed {} | ETA {}",
                                      percent,
                                      format_size(static_cast<double>(bytes_)),
                                      format_size(static_cast<double>(total_bytes_)),
                                      files_,
                                      total_files_,
                                      format_size(current_rate_),
                                      format_size(average_rate),
                                      format_duration(elapsed),
                                      eta);

        fmt::print(out_, "\r{:<100}", line);
        std::fflush(out_);

        last_render_ = _now;
        bytes_at_last_render_ = bytes_;
    } // console_progress_sink::render
} // namespace copyem
