#include "copyem/inventory.hpp"

#include "copyem/error_codes.hpp"
#include "copyem/exception.hpp"
#include "copyem/logger.hpp"
#include "copyem/process.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include <fmt/format.h>

#include <fcntl.h>
#include <fnmatch.h>
#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <iterator>
#include <optional>
#include <utility>

namespace fs = boost::filesystem;

namespace
{
    using log_inventory = copyem::log::inventory;

    struct command_output
    {
        copyem::exit_status status;
        std::string out;
        std::string err;
    }; // struct command_output

    // Runs a command with stdin redirected from a file and collects stdout and stderr
    // until both reach end-of-file.
    auto run_and_capture(const std::vector<std::string>& _argv, const std::string& _stdin_path) -> command_output
    {
        copyem::file_descriptor input{::open(_stdin_path.c_str(), O_RDONLY | O_CLOEXEC)};

        if (!input) {
            COPYEM_THROW(copyem::REMOTE_QUERY_ERROR,
                         fmt::format("{}: Could not open [{}]: {}", __func__, _stdin_path, std::strerror(errno)));
        }

        auto out_pipe = copyem::make_pipe();
        auto err_pipe = copyem::make_pipe();

        copyem::spawn_options opts;
        opts.argv = _argv;
        opts.stdin_fd = input.get();
        opts.stdout_fd = out_pipe.write_end.get();
        opts.stderr_fd = err_pipe.write_end.get();

        auto child = copyem::child_process::spawn(opts);

        // The child holds its own copies now.
        input.close();
        out_pipe.write_end.close();
        err_pipe.write_end.close();

        command_output result;

        std::array<pollfd, 2> fds{{{out_pipe.read_end.get(), POLLIN, 0}, {err_pipe.read_end.get(), POLLIN, 0}}};
        std::array<std::string*, 2> sinks{&result.out, &result.err};
        std::array<char, 65536> buffer{};

        auto open_count = fds.size();

        while (open_count > 0) {
            if (::poll(fds.data(), fds.size(), -1) == -1) {
                if (errno == EINTR) {
                    continue;
                }

                COPYEM_THROW(copyem::REMOTE_QUERY_ERROR, fmt::format("{}: poll failed: {}", __func__, std::strerror(errno)));
            }

            for (std::size_t i = 0; i < fds.size(); ++i) {
                if (fds[i].fd < 0 || fds[i].revents == 0) {
                    continue;
                }

                const auto n = ::read(fds[i].fd, buffer.data(), buffer.size());

                if (n > 0) {
                    sinks[i]->append(buffer.data(), static_cast<std::size_t>(n));
                }
                else if (n == 0 || errno != EINTR) {
                    // A negative fd is skipped by poll.
                    fds[i].fd = -1;
                    --open_count;
                }
            }
        }

        if (const auto status = child.wait(); status) {
            result.status = *status;
        }

        return result;
    } // run_and_capture

    auto parse_stat_line(const std::string& _line) -> std::optional<std::pair<std::string, std::int64_t>>
    {
        const auto tab = _line.find('\t');

        if (tab == std::string::npos || tab == 0) {
            return std::nullopt;
        }

        try {
            const auto size = boost::lexical_cast<std::int64_t>(_line.substr(0, tab));
            return std::make_pair(_line.substr(tab + 1), size);
        }
        catch (const boost::bad_lexical_cast&) {
            return std::nullopt;
        }
    } // parse_stat_line
} // anonymous namespace

namespace copyem
{
    shell_remote_lister::shell_remote_lister(transfer_config _config, std::size_t _batch_size)
        : config_{std::move(_config)}
        , batch_size_{std::max<std::size_t>(_batch_size, 1)}
    {
    }

    auto shell_remote_lister::list(const std::vector<std::string>& _paths)
        -> std::unordered_map<std::string, std::int64_t>
    {
        std::unordered_map<std::string, std::int64_t> sizes;

        if (_paths.empty()) {
            return sizes;
        }

        log_inventory::info("{}: Querying [{}] file sizes on [{}].",
                            __func__,
                            _paths.size(),
                            config_.local() ? "localhost" : config_.remote);

        for (std::size_t first = 0; first < _paths.size(); first += batch_size_) {
            const auto last = std::min(first + batch_size_, _paths.size());
            sizes.merge(list_batch(_paths, first, last));
        }

        log_inventory::info("{}: [{}] files already exist on the destination.", __func__, sizes.size());

        return sizes;
    } // list

    auto shell_remote_lister::list_batch(const std::vector<std::string>& _paths, std::size_t _first, std::size_t _last)
        -> std::unordered_map<std::string, std::int64_t>
    {
        std::string input;

        for (auto i = _first; i < _last; ++i) {
            input += _paths[i];
            input += '\0';
        }

        temporary_file list_file{"copyem_query_", input};

        // A missing destination root means nothing has been copied yet. stat fails for
        // absent files, which is expected.
        const auto script = fmt::format("cd {} 2>/dev/null || exit 0; "
                                        "xargs -0 stat --format='%s\t%n' 2>/dev/null; "
                                        "exit 0",
                                        shell_quote_path(config_.destination_root));

        const auto output = run_and_capture(destination_shell_command(config_, script), list_file.path());

        if (!output.status.success()) {
            auto err = boost::algorithm::trim_copy(output.err);
            COPYEM_THROW(REMOTE_QUERY_ERROR,
                         fmt::format("{}: Destination query failed with {}: {}", __func__, output.status.to_string(), err));
        }

        std::unordered_map<std::string, std::int64_t> sizes;
        std::vector<std::string> lines;
        boost::algorithm::split(lines, output.out, boost::is_any_of("\n"));

        for (const auto& line : lines) {
            if (line.empty()) {
                continue;
            }

            if (auto entry = parse_stat_line(line); entry) {
                sizes.insert(std::move(*entry));
            }
            else {
                log_inventory::debug("{}: Ignoring unexpected line [{}].", __func__, line);
            }
        }

        return sizes;
    } // list_batch

    auto scan_source(const std::string& _source_root, const std::string& _include_pattern)
        -> std::vector<file_entry>
    {
        const fs::path root{_source_root};

        boost::system::error_code ec;

        if (!fs::is_directory(root, ec)) {
            COPYEM_THROW(SOURCE_PATH_ERROR, fmt::format("{}: Source [{}] is not a directory.", __func__, _source_root));
        }

        if (::access(_source_root.c_str(), R_OK | X_OK) != 0) {
            COPYEM_THROW(SOURCE_PATH_ERROR,
                         fmt::format("{}: Source [{}] is not readable: {}", __func__, _source_root, std::strerror(errno)));
        }

        log_inventory::info("{}: Scanning directory [{}].", __func__, _source_root);

        if (!_include_pattern.empty()) {
            log_inventory::info("{}: Include pattern [{}].", __func__, _include_pattern);
        }

        std::vector<file_entry> files;

        try {
            fs::recursive_directory_iterator it{root, fs::directory_options::skip_permission_denied};

            for (const auto& entry : it) {
                if (!fs::is_regular_file(entry.symlink_status(ec))) {
                    continue;
                }

                const auto relative = entry.path().lexically_relative(root).generic_string();

                if (!_include_pattern.empty() && ::fnmatch(_include_pattern.c_str(), relative.c_str(), 0) != 0) {
                    continue;
                }

                const auto size = fs::file_size(entry.path(), ec);

                if (ec) {
                    log_inventory::warn("{}: Skipping [{}]: {}", __func__, relative, ec.message());
                    continue;
                }

                files.push_back({relative, static_cast<std::int64_t>(size), std::nullopt});
            }
        }
        catch (const fs::filesystem_error& e) {
            COPYEM_THROW(SOURCE_PATH_ERROR, fmt::format("{}: Cannot read source [{}]: {}", __func__, _source_root, e.what()));
        }

        std::sort(std::begin(files), std::end(files), [](const auto& _lhs, const auto& _rhs) {
            return _lhs.path < _rhs.path;
        });

        log_inventory::info("{}: Found [{}] files.", __func__, files.size());

        return files;
    } // scan_source

    auto build_inventory(const std::string& _source_root, const std::string& _include_pattern, remote_lister& _lister)
        -> manifest
    {
        auto files = scan_source(_source_root, _include_pattern);

        if (files.empty()) {
            return manifest{};
        }

        std::vector<std::string> paths;
        paths.reserve(files.size());
        std::transform(std::begin(files), std::end(files), std::back_inserter(paths), [](const auto& _f) {
            return _f.path;
        });

        const auto remote_sizes = _lister.list(paths);

        std::vector<file_entry> eligible;
        eligible.reserve(files.size());

        for (auto& f : files) {
            if (const auto it = remote_sizes.find(f.path); it != std::end(remote_sizes)) {
                f.remote_size = it->second;
            }

            if (f.eligible()) {
                eligible.push_back(std::move(f));
            }
            else {
                log_inventory::trace("{}: Skipping [{}]. Remote size matches.", __func__, f.path);
            }
        }

        log_inventory::info("{}: [{}] of [{}] files need to be transferred.", __func__, eligible.size(), files.size());

        return manifest{std::move(eligible)};
    } // build_inventory
} // namespace copyem
