#include "copyem/pipeline.hpp"

#include "copyem/exception.hpp"
#include "copyem/logger.hpp"

#include <boost/algorithm/string/join.hpp>
#include <fmt/format.h>

#include <poll.h>
#include <signal.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <iterator>
#include <thread>
#include <utility>

namespace
{
    using log_pipeline = copyem::log::pipeline;

    using namespace std::chrono_literals;

    constexpr std::size_t max_diagnostic_lines = 20;
    constexpr std::size_t diagnostic_tail_lines = 5;
    constexpr auto reap_interval = 20ms;
} // anonymous namespace

namespace copyem
{
    auto to_string(stage_kind _kind) -> std::string_view
    {
        switch (_kind) {
            case stage_kind::producer:
                return "producer";
            case stage_kind::buffer:
                return "buffer";
            case stage_kind::transport:
                return "transport";
        }

        return "unknown";
    } // to_string

    auto build_stage_specs(const transfer_config& _config, const std::string& _list_file) -> std::vector<stage_spec>
    {
        std::vector<stage_spec> specs;

        specs.push_back({stage_kind::producer,
                         {_config.tar_program, "-cf", "-", "--no-recursion", "--null", "-T", _list_file},
                         _config.source_root});

        if (!_config.buffer_program.empty()) {
            specs.push_back({stage_kind::buffer,
                             {_config.buffer_program, "-m", fmt::format("{}b", _config.buffer_size)},
                             std::string{}});
        }

        // The consumer names each member on stdout as it extracts it.
        const auto dst = shell_quote_path(_config.destination_root);
        const auto script = fmt::format("mkdir -p {0} && {1} -xvf - -C {0} --quoting-style=literal",
                                        dst,
                                        shell_quote(_config.tar_program));

        specs.push_back({stage_kind::transport, destination_shell_command(_config, script), std::string{}});

        return specs;
    } // build_stage_specs

    pipeline::pipeline(int _stream_id, const stream_plan& _plan, const transfer_config& _config)
        : stream_id_{_stream_id}
        , config_{_config}
        , tracker_{_plan.files}
    {
        std::string list;

        for (const auto& f : _plan.files) {
            list += f.path;
            list += '\0';
        }

        list_file_ = std::make_unique<temporary_file>(fmt::format("copyem_stream{}_", _stream_id), list);

        try {
            start_stages(build_stage_specs(config_, list_file_->path()));
        }
        catch (const copyem::exception& e) {
            log_pipeline::error("{}: Stream [{}] failed to start: {}", __func__, stream_id_, e.client_display_what());
            terminate("failed to start");
            throw;
        }

        log_pipeline::info("{}: Stream [{}] started with [{}] files, [{}] stages.",
                           __func__,
                           stream_id_,
                           _plan.files.size(),
                           stages_.size());
    } // pipeline

    pipeline::~pipeline()
    {
        const auto live = std::any_of(std::begin(stages_), std::end(stages_), [](const auto& _s) {
            return _s.process.running();
        });

        if (live) {
            terminate("released while running");
        }
    } // ~pipeline

    auto pipeline::start_stages(const std::vector<stage_spec>& _specs) -> void
    {
        // Input of the next stage. The producer reads its file list from disk.
        auto upstream = open_null_device();

        for (std::size_t i = 0; i < _specs.size(); ++i) {
            const auto& spec = _specs[i];
            const auto last = (i + 1 == _specs.size());

            auto out = make_pipe();
            auto err = make_pipe();

            spawn_options opts;
            opts.argv = spec.argv;
            opts.working_directory = spec.working_directory;
            opts.stdin_fd = upstream.get();
            opts.stdout_fd = out.write_end.get();
            opts.stderr_fd = err.write_end.get();

            stages_.push_back(stage{spec.kind, child_process::spawn(opts)});

            log_pipeline::debug("{}: Stream [{}] {} stage started. PID [{}], command [{}].",
                                __func__,
                                stream_id_,
                                to_string(spec.kind),
                                stages_.back().process.pid(),
                                boost::algorithm::join(spec.argv, " "));

            set_nonblocking(err.read_end);

            const auto status_kind = spec.kind == stage_kind::buffer ? channel_kind::buffer_status : channel_kind::diagnostics;

            // The buffer program rewrites its status line in place with carriage returns.
            channels_.push_back(channel{status_kind,
                                        spec.kind,
                                        std::move(err.read_end),
                                        line_splitter{spec.kind == stage_kind::buffer ? "\r\n" : "\n"}});

            if (last) {
                set_nonblocking(out.read_end);
                channels_.push_back(channel{channel_kind::acknowledgments, spec.kind, std::move(out.read_end), line_splitter{}});
            }
            else {
                // Releases this process' copy of the previous pipe.
                upstream = std::move(out.read_end);
            }
        }
    } // start_stages

    auto pipeline::poll(std::chrono::milliseconds _timeout) -> pipeline_activity
    {
        pipeline_activity activity;

        std::vector<pollfd> fds;
        std::vector<channel*> targets;

        for (auto& c : channels_) {
            if (c.fd) {
                fds.push_back({c.fd.get(), POLLIN, 0});
                targets.push_back(&c);
            }
        }

        if (fds.empty()) {
            std::this_thread::sleep_for(std::min<std::chrono::milliseconds>(_timeout, reap_interval));
        }
        else if (const auto rc = ::poll(fds.data(), fds.size(), static_cast<int>(_timeout.count())); rc > 0) {
            for (std::size_t i = 0; i < fds.size(); ++i) {
                if (fds[i].revents != 0) {
                    read_channel(*targets[i], activity);
                }
            }
        }
        else if (rc == -1 && errno != EINTR) {
            log_pipeline::error("{}: Stream [{}] poll failed: {}", __func__, stream_id_, std::strerror(errno));
        }

        reap();

        const auto all_exited = std::none_of(std::begin(stages_), std::end(stages_), [](const auto& _s) {
            return _s.process.running();
        });

        if (all_exited) {
            drain(activity);
        }

        return activity;
    } // poll

    auto pipeline::finished() const noexcept -> bool
    {
        const auto all_exited = std::none_of(std::begin(stages_), std::end(stages_), [](const auto& _s) {
            return _s.process.running();
        });

        const auto all_closed = std::none_of(std::begin(channels_), std::end(channels_), [](const auto& _c) {
            return _c.fd.valid();
        });

        return all_exited && all_closed;
    } // finished

    auto pipeline::terminate(std::string_view _reason) noexcept -> void
    {
        if (!termination_reason_) {
            termination_reason_ = std::string{_reason};
        }

        auto live = 0;

        for (auto& s : stages_) {
            if (s.process.running() && s.process.send_signal(SIGTERM)) {
                ++live;
            }
        }

        if (live == 0) {
            return;
        }

        log_pipeline::info("{}: Terminating stream [{}] ({}).", __func__, stream_id_, _reason);

        const auto deadline = std::chrono::steady_clock::now() + config_.termination_grace;

        while (std::chrono::steady_clock::now() < deadline) {
            reap();

            const auto any_running = std::any_of(std::begin(stages_), std::end(stages_), [](const auto& _s) {
                return _s.process.running();
            });

            if (!any_running) {
                return;
            }

            std::this_thread::sleep_for(reap_interval);
        }

        for (auto& s : stages_) {
            if (s.process.running()) {
                log_pipeline::warn("{}: Stream [{}] {} stage ignored SIGTERM. Sending SIGKILL.",
                                   __func__,
                                   stream_id_,
                                   to_string(s.kind));
                s.process.send_signal(SIGKILL);
                s.process.wait();
            }
        }
    } // terminate

    auto pipeline::succeeded() const noexcept -> bool
    {
        if (terminated()) {
            return false;
        }

        return std::all_of(std::begin(stages_), std::end(stages_), [](const auto& _s) {
            const auto& status = _s.process.status();
            return status && status->success();
        });
    } // succeeded

    auto pipeline::failure_description() const -> std::string
    {
        const auto recent = diagnostics();
        const auto tail_begin = recent.size() > diagnostic_tail_lines ? recent.size() - diagnostic_tail_lines : 0;
        const std::vector<std::string> tail(std::next(std::begin(recent), tail_begin), std::end(recent));
        const auto details = tail.empty() ? std::string{} : fmt::format(" Last diagnostics: [{}]", boost::algorithm::join(tail, "; "));

        if (termination_reason_) {
            return fmt::format("Stream {} was terminated ({}).{}", stream_id_, *termination_reason_, details);
        }

        const auto failed = [](const stage& _s) {
            const auto& status = _s.process.status();
            return !status || !status->success();
        };

        // A stage killed by SIGPIPE only reports that a later stage went away.
        auto culprit = std::find_if(std::begin(stages_), std::end(stages_), [&failed](const auto& _s) {
            return failed(_s) && !(_s.process.status() && _s.process.status()->signal == SIGPIPE);
        });

        if (culprit == std::end(stages_)) {
            culprit = std::find_if(std::begin(stages_), std::end(stages_), failed);
        }

        if (culprit == std::end(stages_)) {
            return fmt::format("Stream {} failed for an unknown reason.{}", stream_id_, details);
        }

        const auto& status = culprit->process.status();

        return fmt::format("Stream {} {} stage failed with {}.{}",
                           stream_id_,
                           to_string(culprit->kind),
                           status ? status->to_string() : std::string{"unknown status"},
                           details);
    } // failure_description

    auto pipeline::diagnostics() const -> std::vector<std::string>
    {
        return {std::begin(diagnostics_), std::end(diagnostics_)};
    } // diagnostics

    auto pipeline::read_channel(channel& _channel, pipeline_activity& _activity) -> void
    {
        std::array<char, 16384> buffer{};

        while (_channel.fd) {
            const auto n = ::read(_channel.fd.get(), buffer.data(), buffer.size());

            if (n > 0) {
                for (const auto& line : _channel.lines.feed({buffer.data(), static_cast<std::size_t>(n)})) {
                    handle_line(_channel, line, _activity);
                }

                continue;
            }

            if (n == -1 && errno == EINTR) {
                continue;
            }

            if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                return;
            }

            if (n == -1) {
                log_pipeline::warn("{}: Stream [{}] read from {} stage failed: {}",
                                   __func__,
                                   stream_id_,
                                   to_string(_channel.source),
                                   std::strerror(errno));
            }

            // End of stream.
            if (auto rest = _channel.lines.flush(); rest) {
                handle_line(_channel, *rest, _activity);
            }

            _channel.fd.close();
        }
    } // read_channel

    auto pipeline::handle_line(const channel& _channel, const std::string& _line, pipeline_activity& _activity) -> void
    {
        switch (_channel.kind) {
            case channel_kind::acknowledgments: {
                const auto before = tracker_.acknowledged_bytes();

                if (auto path = tracker_.on_line(_line); path) {
                    log_pipeline::trace("{}: Stream [{}] confirmed [{}].", __func__, stream_id_, *path);
                    _activity.acknowledged_bytes += tracker_.acknowledged_bytes() - before;
                    _activity.acknowledged.push_back(std::move(*path));
                }

                break;
            }

            case channel_kind::buffer_status:
                if (const auto status = parse_buffer_status(_line); status) {
                    if (status->total_bytes > buffer_total_) {
                        _activity.buffered_bytes += status->total_bytes - buffer_total_;
                        buffer_total_ = status->total_bytes;
                    }

                    _activity.latest_buffer_status = status;
                }
                else {
                    add_diagnostic(_channel.source, _line);
                }

                break;

            case channel_kind::diagnostics:
                add_diagnostic(_channel.source, _line);

                // The consumer reports members it could not write here and carries on.
                if (_channel.source == stage_kind::transport) {
                    if (auto path = tracker_.on_error_line(_line); path) {
                        log_pipeline::warn("{}: Stream [{}] consumer failed to write [{}].", __func__, stream_id_, *path);
                    }
                }

                break;
        }
    } // handle_line

    auto pipeline::reap() noexcept -> void
    {
        for (auto& s : stages_) {
            if (!s.process.running()) {
                continue;
            }

            if (const auto status = s.process.try_wait(); status) {
                const auto& st = *status;

                if (st.success()) {
                    log_pipeline::debug("{}: Stream [{}] {} stage exited.", __func__, stream_id_, to_string(s.kind));
                }
                else {
                    log_pipeline::debug("{}: Stream [{}] {} stage ended with {}.",
                                        __func__,
                                        stream_id_,
                                        to_string(s.kind),
                                        st.to_string());
                }
            }
        }
    } // reap

    auto pipeline::drain(pipeline_activity& _activity) -> void
    {
        // A grandchild may still hold a write end open. Everything that has been written
        // is read, then the channels are closed regardless.
        for (auto& c : channels_) {
            read_channel(c, _activity);

            if (c.fd) {
                if (auto rest = c.lines.flush(); rest) {
                    handle_line(c, *rest, _activity);
                }

                c.fd.close();
            }
        }

        if (consumer_confirmed_ || terminated() || stages_.empty()) {
            return;
        }

        const auto& consumer = stages_.back().process.status();

        if (consumer && consumer->success()) {
            consumer_confirmed_ = true;

            const auto before = tracker_.acknowledged_bytes();

            if (auto path = tracker_.on_consumer_success(); path) {
                _activity.acknowledged_bytes += tracker_.acknowledged_bytes() - before;
                _activity.acknowledged.push_back(std::move(*path));
            }
        }
    } // drain

    auto pipeline::add_diagnostic(stage_kind _source, const std::string& _line) -> void
    {
        log_pipeline::debug("[stream {}] [{}] {}", stream_id_, to_string(_source), _line);

        diagnostics_.push_back(fmt::format("{}: {}", to_string(_source), _line));

        if (diagnostics_.size() > max_diagnostic_lines) {
            diagnostics_.pop_front();
        }
    } // add_diagnostic
} // namespace copyem
