#ifndef COPYEM_PROCESS_HPP
#define COPYEM_PROCESS_HPP

#include <sys/types.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace copyem
{
    /// Owns a POSIX file descriptor and closes it on destruction.
    class file_descriptor
    {
    public:
        file_descriptor() = default;
        explicit file_descriptor(int _fd) noexcept;

        file_descriptor(const file_descriptor&) = delete;
        auto operator=(const file_descriptor&) -> file_descriptor& = delete;

        file_descriptor(file_descriptor&& _other) noexcept;
        auto operator=(file_descriptor&& _other) noexcept -> file_descriptor&;

        ~file_descriptor();

        auto get() const noexcept -> int { return fd_; }
        auto valid() const noexcept -> bool { return fd_ >= 0; }
        explicit operator bool() const noexcept { return valid(); }

        auto release() noexcept -> int;
        auto close() noexcept -> void;

    private:
        int fd_ = -1;
    }; // class file_descriptor

    struct pipe_ends
    {
        file_descriptor read_end;
        file_descriptor write_end;
    }; // struct pipe_ends

    /// Creates a pipe whose ends are closed on exec.
    ///
    /// \throws copyem::exception PIPE_CREATE_ERROR
    auto make_pipe() -> pipe_ends;

    /// Opens /dev/null for reading.
    ///
    /// \throws copyem::exception PIPE_CREATE_ERROR
    auto open_null_device() -> file_descriptor;

    /// \throws copyem::exception PIPE_CREATE_ERROR
    auto set_nonblocking(const file_descriptor& _fd) -> void;

    /// How a child process ended.
    struct exit_status
    {
        int code = 0;   // Valid if signal is 0.
        int signal = 0; // The terminating signal, or 0 for a normal exit.

        auto success() const noexcept -> bool { return signal == 0 && code == 0; }

        // e.g. "exit status 2" or "killed by signal 15 (Terminated)".
        auto to_string() const -> std::string;
    }; // struct exit_status

    struct spawn_options
    {
        // argv[0] is looked up in PATH.
        std::vector<std::string> argv;

        // An empty string keeps the working directory of the parent.
        std::string working_directory;

        // Descriptors installed as fd 0, 1 and 2 of the child. -1 inherits the parent's.
        int stdin_fd = -1;
        int stdout_fd = -1;
        int stderr_fd = -1;
    }; // struct spawn_options

    /// A child process started with fork and exec.
    ///
    /// A child that has not been reaped when the object is destroyed is killed
    /// with SIGKILL and reaped.
    class child_process
    {
    public:
        child_process() = default;

        child_process(const child_process&) = delete;
        auto operator=(const child_process&) -> child_process& = delete;

        child_process(child_process&& _other) noexcept;
        auto operator=(child_process&& _other) noexcept -> child_process&;

        ~child_process();

        /// Starts a child process.
        ///
        /// If exec fails the child exits with status 127.
        ///
        /// \throws copyem::exception PROCESS_SPAWN_ERROR if the argument list is empty or fork fails.
        static auto spawn(const spawn_options& _options) -> child_process;

        auto pid() const noexcept -> pid_t { return pid_; }

        // True while the child has been started and not yet reaped.
        auto running() const noexcept -> bool { return pid_ > 0 && !status_; }

        auto status() const noexcept -> const std::optional<exit_status>& { return status_; }

        // Reaps the child if it has exited. Never blocks.
        auto try_wait() noexcept -> std::optional<exit_status>;

        // Blocks until the child exits.
        auto wait() noexcept -> std::optional<exit_status>;

        // Returns false if the signal could not be delivered.
        auto send_signal(int _signal) noexcept -> bool;

    private:
        explicit child_process(pid_t _pid) noexcept;

        auto record(int _wait_status) noexcept -> void;

        pid_t pid_ = -1;
        std::optional<exit_status> status_;
    }; // class child_process

    /// Quotes \p _arg for a POSIX shell: 'it'\''s'.
    auto shell_quote(std::string_view _arg) -> std::string;

    /// Quotes a path for a POSIX shell, leaving a leading "~" or "~/" to expand to
    /// the home directory of the user running the shell.
    auto shell_quote_path(std::string_view _path) -> std::string;

    /// A file created under the temporary directory and removed on destruction.
    class temporary_file
    {
    public:
        /// Creates the file and writes \p _contents into it.
        ///
        /// \throws copyem::exception TEMPORARY_FILE_ERROR
        temporary_file(std::string_view _prefix, std::string_view _contents);

        temporary_file(const temporary_file&) = delete;
        auto operator=(const temporary_file&) -> temporary_file& = delete;

        temporary_file(temporary_file&& _other) noexcept;
        auto operator=(temporary_file&&) -> temporary_file& = delete;

        ~temporary_file();

        auto path() const noexcept -> const std::string& { return path_; }

    private:
        std::string path_;
    }; // class temporary_file
} // namespace copyem

#endif // COPYEM_PROCESS_HPP
