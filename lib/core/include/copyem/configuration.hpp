#ifndef COPYEM_CONFIGURATION_HPP
#define COPYEM_CONFIGURATION_HPP

#include "copyem/cost_model.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace copyem
{
    /// Every setting of one transfer run.
    ///
    /// Durations in seconds are kept as doubles because they are also inputs of the
    /// cost model. Process supervision intervals are kept as chrono durations.
    struct transfer_config
    {
        std::string source_root;
        std::string destination_root;

        // user@host. An empty string runs the consumer on the local host.
        std::string remote;

        std::string include_pattern;

        int parallelism = 1;
        std::int64_t buffer_size = 1024LL * 1024 * 1024;
        double assumed_speed = 20.0 * 1024 * 1024;
        double per_file_latency = 0.15;
        int max_retries = 3;
        double retry_delay = 5.0;
        order_policy ordering = order_policy::largest_first;

        std::string ssh_program = "ssh";
        std::vector<std::string> ssh_options;
        std::string tar_program = "tar";

        // An empty string removes the buffering stage.
        std::string buffer_program = "mbuffer";

        std::chrono::milliseconds progress_interval{500};
        std::chrono::milliseconds poll_interval{100};
        std::chrono::milliseconds stall_timeout{0};
        std::chrono::milliseconds termination_grace{2000};

        auto local() const noexcept -> bool { return remote.empty(); }

        auto cost() const noexcept -> cost_model
        {
            return cost_model{assumed_speed, per_file_latency};
        }
    }; // struct transfer_config

    /// Reads a JSON configuration file and applies it on top of \p _defaults.
    ///
    /// Keys mirror the field names of transfer_config. Sizes and speeds may be given as
    /// numbers or as size strings ("1G"). Durations ending in "_ms" are milliseconds,
    /// retry_delay and per_file_latency are seconds. Unknown keys are ignored.
    ///
    /// \throws copyem::exception CONFIGURATION_ERROR if the file cannot be read or parsed,
    ///                           or a value has the wrong type.
    auto load_configuration(const std::string& _path, transfer_config _defaults = {}) -> transfer_config;

    /// \throws copyem::exception CONFIGURATION_ERROR describing the first invalid value.
    auto validate(const transfer_config& _config) -> void;

    // The argument list that runs a shell script on the destination host: ssh for a remote,
    // "sh -c" otherwise.
    auto destination_shell_command(const transfer_config& _config, const std::string& _script)
        -> std::vector<std::string>;
} // namespace copyem

#endif // COPYEM_CONFIGURATION_HPP
