#include "copyem/configuration.hpp"

#include "copyem/error_codes.hpp"
#include "copyem/exception.hpp"
#include "copyem/units.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <iterator>

namespace
{
    using json = nlohmann::json;

    auto read_size(const json& _value, const char* _key) -> std::int64_t
    {
        if (_value.is_number_integer() || _value.is_number_unsigned()) {
            return _value.get<std::int64_t>();
        }

        if (_value.is_number_float()) {
            return static_cast<std::int64_t>(_value.get<double>());
        }

        if (_value.is_string()) {
            try {
                return copyem::parse_size(_value.get_ref<const std::string&>());
            }
            catch (const copyem::exception& e) {
                COPYEM_THROW(copyem::CONFIGURATION_ERROR,
                             fmt::format("Invalid size for [{}]: {}", _key, e.client_display_what()));
            }
        }

        COPYEM_THROW(copyem::CONFIGURATION_ERROR, fmt::format("[{}] must be a number or a size string.", _key));
    } // read_size

    auto read_milliseconds(const json& _value, const char* _key) -> std::chrono::milliseconds
    {
        if (!_value.is_number()) {
            COPYEM_THROW(copyem::CONFIGURATION_ERROR, fmt::format("[{}] must be a number of milliseconds.", _key));
        }

        return std::chrono::milliseconds{_value.get<std::int64_t>()};
    } // read_milliseconds

    template <typename T>
    auto read_value(const json& _value, const char* _key) -> T
    {
        try {
            return _value.get<T>();
        }
        catch (const json::exception& e) {
            COPYEM_THROW(copyem::CONFIGURATION_ERROR, fmt::format("Invalid value for [{}]: {}", _key, e.what()));
        }
    } // read_value
} // anonymous namespace

namespace copyem
{
    auto load_configuration(const std::string& _path, transfer_config _defaults) -> transfer_config
    {
        json config;

        {
            std::ifstream in{_path};

            if (!in) {
                COPYEM_THROW(CONFIGURATION_ERROR, fmt::format("{}: Failed to open file [{}].", __func__, _path));
            }

            try {
                in >> config;
            }
            catch (const json::parse_error& e) {
                COPYEM_THROW(CONFIGURATION_ERROR,
                             fmt::format("{}: Failed to parse json [file={}, error={}].", __func__, _path, e.what()));
            }
        }

        if (!config.is_object()) {
            COPYEM_THROW(CONFIGURATION_ERROR,
                         fmt::format("{}: Configuration file [{}] did not contain a json object.", __func__, _path));
        }

        auto& c = _defaults;

        for (const auto& [key, value] : config.items()) {
            const auto* k = key.c_str();

            // clang-format off
            if      (key == "source_root")            { c.source_root       = read_value<std::string>(value, k); }
            else if (key == "destination_root")       { c.destination_root  = read_value<std::string>(value, k); }
            else if (key == "remote")                 { c.remote            = read_value<std::string>(value, k); }
            else if (key == "include_pattern")        { c.include_pattern   = read_value<std::string>(value, k); }
            else if (key == "parallelism")            { c.parallelism       = read_value<int>(value, k); }
            else if (key == "buffer_size")            { c.buffer_size       = read_size(value, k); }
            else if (key == "assumed_speed")          { c.assumed_speed     = static_cast<double>(read_size(value, k)); }
            else if (key == "per_file_latency")       { c.per_file_latency  = read_value<double>(value, k); }
            else if (key == "max_retries")            { c.max_retries       = read_value<int>(value, k); }
            else if (key == "retry_delay")            { c.retry_delay       = read_value<double>(value, k); }
            else if (key == "ordering")               { c.ordering          = to_order_policy(read_value<std::string>(value, k)); }
            else if (key == "ssh_program")            { c.ssh_program       = read_value<std::string>(value, k); }
            else if (key == "ssh_options")            { c.ssh_options       = read_value<std::vector<std::string>>(value, k); }
            else if (key == "tar_program")            { c.tar_program       = read_value<std::string>(value, k); }
            else if (key == "buffer_program")         { c.buffer_program    = read_value<std::string>(value, k); }
            else if (key == "progress_interval_ms")   { c.progress_interval = read_milliseconds(value, k); }
            else if (key == "poll_interval_ms")       { c.poll_interval     = read_milliseconds(value, k); }
            else if (key == "stall_timeout_ms")       { c.stall_timeout     = read_milliseconds(value, k); }
            else if (key == "termination_grace_ms")   { c.termination_grace = read_milliseconds(value, k); }
            // clang-format on
        }

        return c;
    } // load_configuration

    auto validate(const transfer_config& _config) -> void
    {
        const auto fail = [](const std::string& _msg) {
            COPYEM_THROW(CONFIGURATION_ERROR, fmt::format("validate: {}", _msg));
        };

        if (_config.source_root.empty()) {
            fail("Source root cannot be empty.");
        }

        if (_config.destination_root.empty()) {
            fail("Destination root cannot be empty.");
        }

        if (_config.parallelism < 1) {
            fail(fmt::format("Parallelism must be at least 1 [parallelism={}].", _config.parallelism));
        }

        if (_config.buffer_size <= 0) {
            fail(fmt::format("Buffer size must be greater than 0 [buffer_size={}].", _config.buffer_size));
        }

        if (!(_config.assumed_speed > 0)) {
            fail(fmt::format("Assumed speed must be greater than 0 [assumed_speed={}].", _config.assumed_speed));
        }

        if (_config.per_file_latency < 0) {
            fail(fmt::format("Per-file latency cannot be negative [per_file_latency={}].", _config.per_file_latency));
        }

        if (_config.max_retries < 0) {
            fail(fmt::format("Max retries cannot be negative [max_retries={}].", _config.max_retries));
        }

        if (_config.retry_delay < 0) {
            fail(fmt::format("Retry delay cannot be negative [retry_delay={}].", _config.retry_delay));
        }

        if (_config.tar_program.empty()) {
            fail("Tar program cannot be empty.");
        }

        if (!_config.local() && _config.ssh_program.empty()) {
            fail("Ssh program cannot be empty when a remote is given.");
        }

        if (_config.poll_interval.count() <= 0) {
            fail(fmt::format("Poll interval must be greater than 0 [poll_interval_ms={}].", _config.poll_interval.count()));
        }

        if (_config.progress_interval.count() < 0 || _config.stall_timeout.count() < 0 ||
            _config.termination_grace.count() < 0)
        {
            fail("Progress interval, stall timeout and termination grace cannot be negative.");
        }
    } // validate

    auto destination_shell_command(const transfer_config& _config, const std::string& _script)
        -> std::vector<std::string>
    {
        if (_config.local()) {
            return {"sh", "-c", _script};
        }

        std::vector<std::string> argv{_config.ssh_program};
        argv.insert(std::end(argv), std::begin(_config.ssh_options), std::end(_config.ssh_options));
        argv.push_back(_config.remote);
        argv.push_back(_script);

        return argv;
    } // destination_shell_command
} // namespace copyem
