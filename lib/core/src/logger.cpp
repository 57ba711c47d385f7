#include "copyem/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <unordered_map>
#include <vector>

namespace copyem
{
    auto log::init(bool _write_to_stderr, const std::string& _log_file, level _stderr_level) -> void
    {
        std::vector<spdlog::sink_ptr> sinks;

        if (_write_to_stderr) {
            auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            sink->set_pattern("%^%l%$: %v");
            sink->set_level(static_cast<spdlog::level::level_enum>(static_cast<int>(_stderr_level)));
            sinks.push_back(std::move(sink));
        }

        if (!_log_file.empty()) {
            constexpr auto truncate = true;
            auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(_log_file, truncate);
            sink->set_pattern("%Y-%m-%dT%H:%M:%S.%e\t%P\t%l\t%v");
            sinks.push_back(std::move(sink));
        }

        auto logger = std::make_shared<spdlog::logger>("copyem", std::begin(sinks), std::end(sinks));
        logger->set_level(spdlog::level::trace); // Filtering happens per category.
        logger->flush_on(spdlog::level::warn);

        log_ = std::move(logger);
    } // init

    auto log::deinit() noexcept -> void
    {
        if (!log_) {
            return;
        }

        try {
            log_->flush();
        }
        catch (const spdlog::spdlog_ex& e) {
            std::fprintf(stderr, "copyem: could not flush log: %s\n", e.what());
        }

        log_.reset();
    } // deinit

    auto log::to_level(const std::string& _level) -> log::level
    {
        // clang-format off
        static const std::unordered_map<std::string, level> conv_table{
            {"trace",    level::trace},
            {"debug",    level::debug},
            {"info",     level::info},
            {"warn",     level::warn},
            {"warning",  level::warn},
            {"error",    level::error},
            {"critical", level::critical}
        };
        // clang-format on

        std::string lowered;
        lowered.reserve(_level.size());
        std::transform(std::begin(_level), std::end(_level), std::back_inserter(lowered), [](unsigned char _c) {
            return static_cast<char>(std::tolower(_c));
        });

        if (const auto iter = conv_table.find(lowered); iter != std::end(conv_table)) {
            return iter->second;
        }

        return level::info;
    } // to_level

    auto log::set_level(level _level) noexcept -> void
    {
        client::set_level(_level);
        inventory::set_level(_level);
        scheduler::set_level(_level);
        pipeline::set_level(_level);
        recovery::set_level(_level);
    } // set_level
} // namespace copyem
