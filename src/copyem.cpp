#include "copyem/at_scope_exit.hpp"
#include "copyem/configuration.hpp"
#include "copyem/error_codes.hpp"
#include "copyem/exception.hpp"
#include "copyem/inventory.hpp"
#include "copyem/logger.hpp"
#include "copyem/orchestrator.hpp"
#include "copyem/progress.hpp"
#include "copyem/recovery_coordinator.hpp"
#include "copyem/run_outcome.hpp"
#include "copyem/scheduler.hpp"
#include "copyem/units.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/program_options.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <signal.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iostream>
#include <string>
#include <tuple>
#include <vector>

namespace po = boost::program_options;

using log_client = copyem::log::client;

namespace
{
    std::atomic<bool> g_cancel{false};

    auto handle_termination_signal(int) -> void
    {
        g_cancel.store(true);
    } // handle_termination_signal

    auto usage() -> void;

    auto check_input_arguments(const po::variables_map& _vm) -> std::tuple<bool, int>;

    auto make_configuration(const po::variables_map& _vm) -> copyem::transfer_config;

    auto default_log_file() -> std::string;

    auto install_signal_handlers() -> void;

    auto print_summary(const copyem::transfer_config& _config,
                       const copyem::manifest& _manifest,
                       const std::vector<copyem::stream_plan>& _plans) -> void;

    auto confirm_transfer() -> bool;

    auto print_outcome(const copyem::run_outcome& _outcome) -> void;

    auto write_report(const std::string& _path, const copyem::run_outcome& _outcome) -> void;
} // anonymous namespace

int main(int argc, char* argv[])
{
    po::options_description desc{""};
    desc.add_options()
        ("help,h", "")
        ("include", po::value<std::string>(), "")
        ("speed,s", po::value<std::string>(), "")
        ("latency,l", po::value<double>(), "")
        ("buffer-size,b", po::value<std::string>(), "")
        ("parallel,p", po::value<int>(), "")
        ("retries,r", po::value<int>(), "")
        ("retry-delay", po::value<double>(), "")
        ("order", po::value<std::string>(), "")
        ("ssh-option", po::value<std::vector<std::string>>()->composing(), "")
        ("no-buffer", po::bool_switch(), "")
        ("stall-timeout", po::value<double>(), "")
        ("config,c", po::value<std::string>(), "")
        ("log-file", po::value<std::string>(), "")
        ("log-level", po::value<std::string>()->default_value("info"), "")
        ("report", po::value<std::string>(), "")
        ("yes,y", po::bool_switch(), "")
        ("dry-run,n", po::bool_switch(), "")
        ("src_dir", po::value<std::string>(), "")
        ("remote", po::value<std::string>(), "")
        ("dst_dir", po::value<std::string>(), "");

    po::positional_options_description pod;
    pod.add("src_dir", 1);
    pod.add("remote", 1);
    pod.add("dst_dir", 1);

    po::variables_map vm;

    try {
        po::store(po::command_line_parser(argc, argv).options(desc).positional(pod).run(), vm);
        po::notify(vm);
    }
    catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << '\n';
        usage();
        return 1;
    }

    if (const auto [return_ec, ec] = check_input_arguments(vm); return_ec) {
        return ec;
    }

    const auto report_path = vm.count("report") ? vm["report"].as<std::string>() : std::string{};

    copyem::run_outcome outcome;
    outcome.status = copyem::run_status::fatal_abort;

    try {
        const auto log_file = vm.count("log-file") ? vm["log-file"].as<std::string>() : default_log_file();
        const auto level = copyem::log::to_level(vm["log-level"].as<std::string>());

        // The terminal shows warnings and errors. Everything else goes to the log file.
        copyem::log::init(true, log_file, std::max(level, copyem::log::level::warn));
        copyem::log::set_level(level);
    }
    catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Error: Could not initialize logging: " << e.what() << '\n';
        return 1;
    }

    copyem::at_scope_exit deinit_logger{[] { copyem::log::deinit(); }};

    try {
        auto config = make_configuration(vm);
        copyem::validate(config);

        log_client::info("{}: Copying [{}] to [{}:{}] with [{}] streams.",
                         __func__,
                         config.source_root,
                         config.local() ? "localhost" : config.remote,
                         config.destination_root,
                         config.parallelism);

        copyem::shell_remote_lister lister{config};
        const auto manifest = copyem::build_inventory(config.source_root, config.include_pattern, lister);

        if (manifest.empty()) {
            std::cout << "Nothing to transfer. The destination is up to date.\n";
            outcome.status = copyem::run_status::success;

            if (!report_path.empty()) {
                write_report(report_path, outcome);
            }

            return 0;
        }

        const auto plans = copyem::schedule(manifest,
                                            config.parallelism,
                                            config.cost(),
                                            copyem::schedule_options{config.ordering, config.buffer_size});

        print_summary(config, manifest, plans);

        if (vm["dry-run"].as<bool>()) {
            return 0;
        }

        if (!vm["yes"].as<bool>() && !confirm_transfer()) {
            std::cout << "Transfer cancelled by user.\n";
            return 0;
        }

        install_signal_handlers();

        copyem::console_progress_sink progress{manifest.total_bytes(), manifest.size()};
        copyem::pipeline_orchestrator orchestrator{config, &progress};
        copyem::recovery_coordinator coordinator{config, orchestrator};

        outcome = coordinator.run(manifest, g_cancel);
        progress.finish();
    }
    catch (const copyem::exception& e) {
        // The terminal gets the short form below.
        log_client::info("{}: Run aborted: {}", __func__, e.what());
        std::cerr << "Error: " << e.client_display_what() << '\n';
        outcome.status = copyem::run_status::fatal_abort;
        outcome.error = e.client_display_what();
    }
    catch (const std::exception& e) {
        log_client::critical("{}: {}", __func__, e.what());
        std::cerr << "Error: " << e.what() << '\n';
        outcome.status = copyem::run_status::fatal_abort;
        outcome.error = e.what();
    }

    print_outcome(outcome);

    if (!report_path.empty()) {
        try {
            write_report(report_path, outcome);
        }
        catch (const copyem::exception& e) {
            std::cerr << "Error: " << e.client_display_what() << '\n';
        }
    }

    return copyem::exit_code(outcome.status);
}

namespace
{
    auto usage() -> void
    {
        std::cout << "Usage: copyem [OPTION]... SRC_DIR REMOTE DST_DIR\n"
                     "\n"
                     "Copies the files under SRC_DIR to DST_DIR on REMOTE (user@host) through\n"
                     "parallel tar | mbuffer | ssh | tar pipelines. Pass '-' as REMOTE to copy to\n"
                     "a local directory. A DST_DIR starting with '~/' is relative to the home\n"
                     "directory on REMOTE; quote it so the local shell leaves it alone.\n"
                     "\n"
                     "Files that already exist on the destination with the same size are skipped.\n"
                     "Files are spread across the streams so that all streams finish at about the\n"
                     "same time. Files that were not confirmed by the destination are retried.\n"
                     "\n"
                     "Options:\n"
                     "      --include PATTERN   Only copy files whose relative path matches the\n"
                     "                          glob PATTERN (e.g. '*.mkv').\n"
                     "  -s, --speed SIZE        Assumed network speed per stream in bytes per\n"
                     "                          second (default: 20M).\n"
                     "  -l, --latency SECONDS   Assumed overhead per file (default: 0.15).\n"
                     "  -b, --buffer-size SIZE  Size of the buffer of each stream (default: 1G).\n"
                     "  -p, --parallel N        Number of parallel streams (default: 1).\n"
                     "  -r, --retries N         Number of retries for unconfirmed files (default: 3).\n"
                     "      --retry-delay SECONDS\n"
                     "                          Pause between attempts (default: 5).\n"
                     "      --order POLICY      Order of files inside a stream: largest-first\n"
                     "                          (default) or buffer-interleaved.\n"
                     "      --ssh-option OPT    Extra argument for ssh. May be repeated.\n"
                     "      --no-buffer         Do not use mbuffer.\n"
                     "      --stall-timeout SECONDS\n"
                     "                          Restart a stream that made no progress for this\n"
                     "                          long (default: 0, disabled).\n"
                     "  -c, --config FILE       Read settings from a JSON file. Options given on\n"
                     "                          the command line take precedence.\n"
                     "      --log-file FILE     Write the log to FILE (default:\n"
                     "                          copyem_YYYYmmdd_HHMMSS.log).\n"
                     "      --log-level LEVEL   trace, debug, info, warn, error or critical\n"
                     "                          (default: info).\n"
                     "      --report FILE       Write a JSON report of the run to FILE.\n"
                     "  -y, --yes               Do not ask for confirmation.\n"
                     "  -n, --dry-run           Print the transfer summary and exit.\n"
                     "  -h, --help              Show this message.\n"
                     "\n"
                     "SIZE accepts the suffixes B, K, M, G and T (powers of 1024).\n"
                     "\n"
                     "Exit status: 0 on success, 1 on usage or setup errors, 2 if files remain\n"
                     "unresolved, 130 if cancelled.\n";
    } // usage

    auto check_input_arguments(const po::variables_map& _vm) -> std::tuple<bool, int>
    {
        if (_vm.count("help")) {
            usage();
            return {true, 0};
        }

        if (_vm.count("src_dir") == 0 || _vm.count("remote") == 0 || _vm.count("dst_dir") == 0) {
            std::cerr << "Error: Missing SRC_DIR, REMOTE or DST_DIR.\n";
            usage();
            return {true, 1};
        }

        return {false, 0};
    } // check_input_arguments

    auto make_configuration(const po::variables_map& _vm) -> copyem::transfer_config
    {
        copyem::transfer_config config;

        if (_vm.count("config")) {
            config = copyem::load_configuration(_vm["config"].as<std::string>(), config);
        }

        config.source_root = _vm["src_dir"].as<std::string>();
        config.destination_root = _vm["dst_dir"].as<std::string>();

        if (const auto& remote = _vm["remote"].as<std::string>(); remote == "-") {
            config.remote.clear();
        }
        else {
            config.remote = remote;
        }

        if (_vm.count("include")) {
            config.include_pattern = _vm["include"].as<std::string>();
        }

        if (_vm.count("speed")) {
            config.assumed_speed = static_cast<double>(copyem::parse_size(_vm["speed"].as<std::string>()));
        }

        if (_vm.count("latency")) {
            config.per_file_latency = _vm["latency"].as<double>();
        }

        if (_vm.count("buffer-size")) {
            config.buffer_size = copyem::parse_size(_vm["buffer-size"].as<std::string>());
        }

        if (_vm.count("parallel")) {
            config.parallelism = _vm["parallel"].as<int>();
        }

        if (_vm.count("retries")) {
            config.max_retries = _vm["retries"].as<int>();
        }

        if (_vm.count("retry-delay")) {
            config.retry_delay = _vm["retry-delay"].as<double>();
        }

        if (_vm.count("order")) {
            config.ordering = copyem::to_order_policy(_vm["order"].as<std::string>());
        }

        if (_vm.count("ssh-option")) {
            const auto& options = _vm["ssh-option"].as<std::vector<std::string>>();
            config.ssh_options.insert(std::end(config.ssh_options), std::begin(options), std::end(options));
        }

        if (_vm["no-buffer"].as<bool>()) {
            config.buffer_program.clear();
        }

        if (_vm.count("stall-timeout")) {
            const auto seconds = _vm["stall-timeout"].as<double>();
            config.stall_timeout = std::chrono::milliseconds{static_cast<std::int64_t>(seconds * 1000)};
        }

        return config;
    } // make_configuration

    auto default_log_file() -> std::string
    {
        const auto now = std::time(nullptr);
        std::tm local{};
        localtime_r(&now, &local);

        char buffer[32];
        std::strftime(buffer, sizeof(buffer), "copyem_%Y%m%d_%H%M%S.log", &local);

        return buffer;
    } // default_log_file

    auto install_signal_handlers() -> void
    {
        struct sigaction action{};
        action.sa_handler = handle_termination_signal;
        sigemptyset(&action.sa_mask);

        if (sigaction(SIGINT, &action, nullptr) == -1 || sigaction(SIGTERM, &action, nullptr) == -1) {
            log_client::warn("{}: Could not install signal handlers. Ctrl-C will not stop the transfer cleanly.", __func__);
        }
    } // install_signal_handlers

    auto print_summary(const copyem::transfer_config& _config,
                       const copyem::manifest& _manifest,
                       const std::vector<copyem::stream_plan>& _plans) -> void
    {
        using copyem::format_duration;
        using copyem::format_size;

        const auto [smallest, largest] =
            std::minmax_element(std::begin(_manifest), std::end(_manifest), [](const auto& _lhs, const auto& _rhs) {
                return _lhs.size < _rhs.size;
            });

        const auto interleaved = _config.ordering == copyem::order_policy::buffer_interleaved;
        double eta = 0;

        for (const auto& p : _plans) {
            const auto plan_eta = interleaved ? p.buffered_estimate : p.estimated_completion;
            eta = std::max(eta, plan_eta);

            log_client::info("{}: Stream [{}]: [{}] files, [{}], eta [{}].",
                             __func__,
                             p.stream_id,
                             p.files.size(),
                             format_size(static_cast<double>(p.total_bytes())),
                             format_duration(plan_eta));
        }

        const auto total = static_cast<double>(_manifest.total_bytes());
        const auto average_speed = eta > 0 ? total / eta / 1024 / 1024 : 0.0;
        const std::string rule(60, '=');

        fmt::print("\n{}\n", rule);
        fmt::print("Transfer Summary:\n");
        fmt::print("  Source: {}\n", _config.source_root);
        fmt::print("  Destination: {}:{}\n", _config.local() ? "localhost" : _config.remote, _config.destination_root);
        fmt::print("  Total files: {}\n", _manifest.size());
        fmt::print("  Total size: {}\n", format_size(total));
        fmt::print("  Smallest file: {}\n", format_size(static_cast<double>(smallest->size)));
        fmt::print("  Largest file: {}\n", format_size(static_cast<double>(largest->size)));
        fmt::print("\nTransfer Settings:\n");
        fmt::print("  Parallel processes: {}\n", _config.parallelism);
        fmt::print("  Assumed speed: {}/s\n", format_size(_config.assumed_speed));
        fmt::print("  Buffer size: {}\n",
                   _config.buffer_program.empty() ? std::string{"disabled"}
                                                  : format_size(static_cast<double>(_config.buffer_size)));
        fmt::print("  File latency: {}s\n", _config.per_file_latency);
        fmt::print("  Ordering: {}\n", copyem::to_string(_config.ordering));
        fmt::print("  Retries: {}\n", _config.max_retries);
        fmt::print("\nEstimates:\n");
        fmt::print("  Transfer time: {}\n", format_duration(eta));
        fmt::print("  Average speed: {:.2f} MB/s\n", average_speed);
        fmt::print("{}\n\n", rule);
    } // print_summary

    auto confirm_transfer() -> bool
    {
        std::cout << "Proceed with transfer? (y/N): " << std::flush;

        std::string response;

        if (!std::getline(std::cin, response)) {
            return false;
        }

        return boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(response)) == "y";
    } // confirm_transfer

    auto print_outcome(const copyem::run_outcome& _outcome) -> void
    {
        fmt::print("\nResult: {}\n", copyem::to_string(_outcome.status));

        if (_outcome.status == copyem::run_status::fatal_abort) {
            return;
        }

        fmt::print("  Attempts: {}\n", _outcome.attempts.size());
        fmt::print("  Files: {} of {} delivered\n", _outcome.files_succeeded, _outcome.files_attempted);
        fmt::print("  Data: {}\n", copyem::format_size(static_cast<double>(_outcome.bytes_delivered)));
        fmt::print("  Elapsed: {}\n", copyem::format_duration(_outcome.elapsed_seconds));

        if (!_outcome.unresolved.empty()) {
            constexpr std::size_t max_listed = 20;

            fmt::print("  Unresolved files ({}):\n", _outcome.unresolved.size());

            for (std::size_t i = 0; i < std::min(max_listed, _outcome.unresolved.size()); ++i) {
                fmt::print("    {}\n", _outcome.unresolved[i]);
            }

            if (_outcome.unresolved.size() > max_listed) {
                fmt::print("    ... (see the log file or --report for the full list)\n");
            }

            for (const auto& path : _outcome.unresolved) {
                log_client::info("{}: Unresolved [{}].", __func__, path);
            }
        }

        if (!_outcome.error.empty()) {
            fmt::print("  Last error: {}\n", _outcome.error);
        }
    } // print_outcome

    auto write_report(const std::string& _path, const copyem::run_outcome& _outcome) -> void
    {
        std::ofstream out{_path};

        if (!out) {
            COPYEM_THROW(copyem::CONFIGURATION_ERROR, fmt::format("{}: Could not open report file [{}].", __func__, _path));
        }

        out << nlohmann::json(_outcome).dump(4) << '\n';

        log_client::info("{}: Report written to [{}].", __func__, _path);
    } // write_report
} // anonymous namespace
