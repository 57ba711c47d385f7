//
// Logger Configuration
//

template <>
class log::logger_config<log::category::client>
{
    static constexpr const char* name = "client";
    inline static log::level level = log::level::info;

    friend class logger<log::category::client>;
};

template <>
class log::logger_config<log::category::inventory>
{
    static constexpr const char* name = "inventory";
    inline static log::level level = log::level::info;

    friend class logger<log::category::inventory>;
};

template <>
class log::logger_config<log::category::scheduler>
{
    static constexpr const char* name = "scheduler";
    inline static log::level level = log::level::info;

    friend class logger<log::category::scheduler>;
};

template <>
class log::logger_config<log::category::pipeline>
{
    static constexpr const char* name = "pipeline";
    inline static log::level level = log::level::info;

    friend class logger<log::category::pipeline>;
};

template <>
class log::logger_config<log::category::recovery>
{
    static constexpr const char* name = "recovery";
    inline static log::level level = log::level::info;

    friend class logger<log::category::recovery>;
};

//
// Logger
//

template <typename Category>
auto log::logger<Category>::set_level(log::level _level) noexcept -> void
{
    logger_config<Category>::level = _level;
}

template <typename Category>
template <log::level Level>
class log::logger<Category>::impl
{
public:
    constexpr impl() = default;

    impl(const impl&) = delete;
    auto operator=(const impl&) -> impl& = delete;

    template <typename... Args>
    auto operator()(fmt::format_string<Args...> _format, Args&&... _args) const noexcept -> void
    {
        if (!should_log()) {
            return;
        }

        try {
            const auto msg = fmt::format(_format, std::forward<Args>(_args)...);
            log_->log(to_spdlog_level(), fmt::format("[{}] {}", logger_config<Category>::name, msg));
        }
        catch (const std::exception& e) {
            // The sinks are unusable at this point. stderr is the only place left to report to.
            std::fprintf(stderr, "copyem: logging failure: %s\n", e.what());
        }
    }

private:
    auto should_log() const noexcept -> bool
    {
        return log_ && Level >= logger_config<Category>::level;
    }

    static constexpr auto to_spdlog_level() noexcept -> spdlog::level::level_enum
    {
        // clang-format off
        if constexpr (Level == level::trace)    { return spdlog::level::trace; }
        if constexpr (Level == level::debug)    { return spdlog::level::debug; }
        if constexpr (Level == level::info)     { return spdlog::level::info; }
        if constexpr (Level == level::warn)     { return spdlog::level::warn; }
        if constexpr (Level == level::error)    { return spdlog::level::err; }
        if constexpr (Level == level::critical) { return spdlog::level::critical; }
        // clang-format on

        return spdlog::level::info;
    }
};
