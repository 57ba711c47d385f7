#ifndef COPYEM_LOGGER_HPP
#define COPYEM_LOGGER_HPP

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdio>
#include <exception>
#include <memory>
#include <string>
#include <utility>

namespace copyem
{
    /// A category-scoped logger facade over spdlog.
    ///
    /// Each category has its own level. Messages are fmt format strings:
    ///
    /// \code{.cpp}
    /// using log_pipeline = copyem::log::pipeline;
    /// log_pipeline::info("{}: Stream [{}] started.", __func__, stream_id);
    /// \endcode
    ///
    /// Logging is a no-op until init() has been called.
    class log
    {
    public:
        enum class level : std::uint8_t
        {
            trace,
            debug,
            info,
            warn,
            error,
            critical
        };

        struct category
        {
            struct client;
            struct inventory;
            struct scheduler;
            struct pipeline;
            struct recovery;
        };

        template <typename Category> class logger_config;
        template <typename Category> class logger;

        // clang-format off
        using client    = logger<category::client>;
        using inventory = logger<category::inventory>;
        using scheduler = logger<category::scheduler>;
        using pipeline  = logger<category::pipeline>;
        using recovery  = logger<category::recovery>;
        // clang-format on

        log() = delete;

        log(const log&) = delete;
        auto operator=(const log&) -> log& = delete;

        /// Installs the sinks.
        ///
        /// \param[in] _write_to_stderr Enables the colored stderr sink.
        /// \param[in] _log_file        Path of a log file. An empty string disables the file sink.
        /// \param[in] _stderr_level    Messages below this level only go to the file sink.
        ///
        /// \throws spdlog::spdlog_ex If the log file cannot be opened.
        static auto init(bool _write_to_stderr, const std::string& _log_file, level _stderr_level = level::trace)
            -> void;

        /// Flushes and releases the sinks. Logging becomes a no-op again.
        static auto deinit() noexcept -> void;

        static auto to_level(const std::string& _level) -> level;

        // Applies the same level to every category.
        static auto set_level(level _level) noexcept -> void;

        template <typename Category>
        class logger
        {
        public:
            template <level> class impl;

            logger() = delete;

            logger(const logger&) = delete;
            auto operator=(const logger&) -> logger& = delete;

            static auto set_level(level _level) noexcept -> void;

            // clang-format off
            inline static const auto trace    = impl<level::trace>{};
            inline static const auto debug    = impl<level::debug>{};
            inline static const auto info     = impl<level::info>{};
            inline static const auto warn     = impl<level::warn>{};
            inline static const auto error    = impl<level::error>{};
            inline static const auto critical = impl<level::critical>{};
            // clang-format on
        };

    private:
        inline static std::shared_ptr<spdlog::logger> log_{};
    }; // class log

#include "copyem/logger.tpp"
} // namespace copyem

#endif // COPYEM_LOGGER_HPP
