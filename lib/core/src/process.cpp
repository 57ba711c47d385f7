#include "copyem/process.hpp"

#include "copyem/error_codes.hpp"
#include "copyem/exception.hpp"
#include "copyem/logger.hpp"

#include <boost/filesystem.hpp>
#include <fmt/format.h>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <utility>

namespace fs = boost::filesystem;

namespace
{
    using log_pipeline = copyem::log::pipeline;

    auto write_all(int _fd, std::string_view _data) -> bool
    {
        while (!_data.empty()) {
            const auto n = ::write(_fd, _data.data(), _data.size());

            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }

                return false;
            }

            _data.remove_prefix(static_cast<std::size_t>(n));
        }

        return true;
    } // write_all
} // anonymous namespace

namespace copyem
{
    //
    // file_descriptor
    //

    file_descriptor::file_descriptor(int _fd) noexcept
        : fd_{_fd}
    {
    }

    file_descriptor::file_descriptor(file_descriptor&& _other) noexcept
        : fd_{_other.release()}
    {
    }

    auto file_descriptor::operator=(file_descriptor&& _other) noexcept -> file_descriptor&
    {
        if (this != &_other) {
            close();
            fd_ = _other.release();
        }

        return *this;
    }

    file_descriptor::~file_descriptor()
    {
        close();
    }

    auto file_descriptor::release() noexcept -> int
    {
        return std::exchange(fd_, -1);
    }

    auto file_descriptor::close() noexcept -> void
    {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    auto make_pipe() -> pipe_ends
    {
        int fds[2];

        if (::pipe2(fds, O_CLOEXEC) == -1) {
            COPYEM_THROW(PIPE_CREATE_ERROR, fmt::format("{}: pipe2 failed: {}", __func__, std::strerror(errno)));
        }

        return {file_descriptor{fds[0]}, file_descriptor{fds[1]}};
    } // make_pipe

    auto open_null_device() -> file_descriptor
    {
        const auto fd = ::open("/dev/null", O_RDONLY | O_CLOEXEC);

        if (fd == -1) {
            COPYEM_THROW(PIPE_CREATE_ERROR, fmt::format("{}: Could not open /dev/null: {}", __func__, std::strerror(errno)));
        }

        return file_descriptor{fd};
    } // open_null_device

    auto set_nonblocking(const file_descriptor& _fd) -> void
    {
        const auto flags = ::fcntl(_fd.get(), F_GETFL);

        if (flags == -1 || ::fcntl(_fd.get(), F_SETFL, flags | O_NONBLOCK) == -1) {
            COPYEM_THROW(PIPE_CREATE_ERROR,
                         fmt::format("{}: fcntl failed on descriptor [{}]: {}", __func__, _fd.get(), std::strerror(errno)));
        }
    } // set_nonblocking

    //
    // exit_status
    //

    auto exit_status::to_string() const -> std::string
    {
        if (signal != 0) {
            return fmt::format("killed by signal {} ({})", signal, ::strsignal(signal));
        }

        return fmt::format("exit status {}", code);
    } // exit_status::to_string

    //
    // child_process
    //

    child_process::child_process(pid_t _pid) noexcept
        : pid_{_pid}
    {
    }

    child_process::child_process(child_process&& _other) noexcept
        : pid_{std::exchange(_other.pid_, -1)}
        , status_{std::exchange(_other.status_, std::nullopt)}
    {
    }

    auto child_process::operator=(child_process&& _other) noexcept -> child_process&
    {
        if (this != &_other) {
            if (running()) {
                send_signal(SIGKILL);
                wait();
            }

            pid_ = std::exchange(_other.pid_, -1);
            status_ = std::exchange(_other.status_, std::nullopt);
        }

        return *this;
    }

    child_process::~child_process()
    {
        if (running()) {
            log_pipeline::warn("{}: Process [{}] still running. Sending SIGKILL.", __func__, pid_);
            send_signal(SIGKILL);
            wait();
        }
    }

    auto child_process::spawn(const spawn_options& _options) -> child_process
    {
        if (_options.argv.empty()) {
            COPYEM_THROW(PROCESS_SPAWN_ERROR, fmt::format("{}: Empty argument list.", __func__));
        }

        // Only async-signal-safe functions may be called between fork() and exec(), so
        // the argument list is built before forking.
        auto argv = _options.argv;
        std::vector<char*> args;
        args.reserve(argv.size() + 1);

        for (auto& a : argv) {
            args.push_back(a.data());
        }

        args.push_back(nullptr);

        const char* cwd = _options.working_directory.empty() ? nullptr : _options.working_directory.c_str();

        const auto pid = ::fork();

        if (pid == 0) {
            if (_options.stdin_fd >= 0 && ::dup2(_options.stdin_fd, STDIN_FILENO) == -1) {
                _exit(127);
            }

            if (_options.stdout_fd >= 0 && ::dup2(_options.stdout_fd, STDOUT_FILENO) == -1) {
                _exit(127);
            }

            if (_options.stderr_fd >= 0 && ::dup2(_options.stderr_fd, STDERR_FILENO) == -1) {
                _exit(127);
            }

            if (cwd && ::chdir(cwd) == -1) {
                _exit(127);
            }

            ::execvp(args[0], args.data());

            // _exit() avoids flushing stdio buffers and running destructors owned by the parent.
            _exit(127);
        }

        if (pid == -1) {
            COPYEM_THROW(PROCESS_SPAWN_ERROR,
                         fmt::format("{}: fork failed for [{}]: {}", __func__, _options.argv[0], std::strerror(errno)));
        }

        log_pipeline::trace("{}: Started [{}] with PID [{}].", __func__, _options.argv[0], pid);

        return child_process{pid};
    } // spawn

    auto child_process::try_wait() noexcept -> std::optional<exit_status>
    {
        if (!running()) {
            return status_;
        }

        int wstatus = 0;
        const auto rc = ::waitpid(pid_, &wstatus, WNOHANG);

        if (rc == pid_) {
            record(wstatus);
        }
        else if (rc == -1 && errno != EINTR) {
            log_pipeline::error("{}: waitpid failed for PID [{}]: {}", __func__, pid_, std::strerror(errno));
            status_ = exit_status{-1, 0};
        }

        return status_;
    } // try_wait

    auto child_process::wait() noexcept -> std::optional<exit_status>
    {
        while (running()) {
            int wstatus = 0;
            const auto rc = ::waitpid(pid_, &wstatus, 0);

            if (rc == pid_) {
                record(wstatus);
            }
            else if (rc == -1 && errno != EINTR) {
                log_pipeline::error("{}: waitpid failed for PID [{}]: {}", __func__, pid_, std::strerror(errno));
                status_ = exit_status{-1, 0};
            }
        }

        return status_;
    } // wait

    auto child_process::send_signal(int _signal) noexcept -> bool
    {
        if (!running()) {
            return false;
        }

        if (::kill(pid_, _signal) == -1) {
            log_pipeline::warn("{}: Could not send signal [{}] to PID [{}]: {}", __func__, _signal, pid_, std::strerror(errno));
            return false;
        }

        return true;
    } // send_signal

    auto child_process::record(int _wait_status) noexcept -> void
    {
        if (WIFSIGNALED(_wait_status)) {
            status_ = exit_status{0, WTERMSIG(_wait_status)};
        }
        else {
            status_ = exit_status{WEXITSTATUS(_wait_status), 0};
        }
    } // record

    auto shell_quote(std::string_view _arg) -> std::string
    {
        std::string quoted = "'";

        for (const auto c : _arg) {
            if (c == '\'') {
                quoted += "'\\''";
            }
            else {
                quoted += c;
            }
        }

        quoted += '\'';

        return quoted;
    } // shell_quote

    auto shell_quote_path(std::string_view _path) -> std::string
    {
        if (_path == "~") {
            return "\"$HOME\"";
        }

        if (_path.substr(0, 2) == "~/") {
            const auto rest = _path.substr(2);
            return rest.empty() ? std::string{"\"$HOME\"/"} : "\"$HOME\"/" + shell_quote(rest);
        }

        return shell_quote(_path);
    } // shell_quote_path

    //
    // temporary_file
    //

    temporary_file::temporary_file(std::string_view _prefix, std::string_view _contents)
    {
        boost::system::error_code ec;
        const auto dir = fs::temp_directory_path(ec);

        if (ec) {
            COPYEM_THROW(TEMPORARY_FILE_ERROR, fmt::format("{}: No temporary directory: {}", __func__, ec.message()));
        }

        auto path_template = (dir / fmt::format("{}XXXXXX", _prefix)).string();

        file_descriptor fd{::mkostemp(path_template.data(), O_CLOEXEC)};

        if (!fd) {
            COPYEM_THROW(TEMPORARY_FILE_ERROR,
                         fmt::format("{}: mkostemp failed for [{}]: {}", __func__, path_template, std::strerror(errno)));
        }

        path_ = std::move(path_template);

        if (!write_all(fd.get(), _contents)) {
            const auto msg = fmt::format("{}: Could not write [{}]: {}", __func__, path_, std::strerror(errno));
            fs::remove(path_, ec);
            COPYEM_THROW(TEMPORARY_FILE_ERROR, msg);
        }
    }

    temporary_file::temporary_file(temporary_file&& _other) noexcept
        : path_{std::exchange(_other.path_, std::string{})}
    {
    }

    temporary_file::~temporary_file()
    {
        if (path_.empty()) {
            return;
        }

        boost::system::error_code ec;

        if (!fs::remove(path_, ec) && ec) {
            log_pipeline::warn("{}: Could not remove temporary file [{}]: {}", __func__, path_, ec.message());
        }
    }
} // namespace copyem
