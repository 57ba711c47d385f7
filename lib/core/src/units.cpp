#include "copyem/units.hpp"

#include "copyem/error_codes.hpp"
#include "copyem/exception.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <fmt/format.h>

#include <array>
#include <cmath>
#include <utility>

namespace
{
    constexpr std::int64_t kib = 1024;

    // clang-format off
    // Longest suffixes first so that "KB" is not mistaken for "B".
    constexpr std::array<std::pair<std::string_view, std::int64_t>, 9> size_units{{
        {"KB", kib},
        {"MB", kib * kib},
        {"GB", kib * kib * kib},
        {"TB", kib * kib * kib * kib},
        {"K",  kib},
        {"M",  kib * kib},
        {"G",  kib * kib * kib},
        {"T",  kib * kib * kib * kib},
        {"B",  1}
    }};
    // clang-format on
} // anonymous namespace

namespace copyem
{
    auto parse_size(std::string_view _size) -> std::int64_t
    {
        auto size = boost::algorithm::to_upper_copy(boost::algorithm::trim_copy(std::string{_size}));

        if (size.empty()) {
            COPYEM_THROW(SIZE_FORMAT_ERROR, "Size string cannot be empty.");
        }

        std::int64_t multiplier = 1;
        std::string_view number = size;

        for (const auto& [suffix, unit] : size_units) {
            if (boost::algorithm::ends_with(size, suffix)) {
                multiplier = unit;
                number.remove_suffix(suffix.size());
                break;
            }
        }

        double value = 1;

        if (!number.empty()) {
            try {
                value = boost::lexical_cast<double>(boost::algorithm::trim_copy(std::string{number}));
            }
            catch (const boost::bad_lexical_cast&) {
                COPYEM_THROW(SIZE_FORMAT_ERROR, fmt::format("Invalid size format: [{}].", _size));
            }
        }

        if (value < 0 || !std::isfinite(value)) {
            COPYEM_THROW(SIZE_FORMAT_ERROR, fmt::format("Size cannot be negative: [{}].", _size));
        }

        const auto bytes = value * static_cast<double>(multiplier);

        // 2^63 is the first double past the range of std::int64_t.
        if (bytes >= 9.2233720368547758e18) {
            COPYEM_THROW(SIZE_FORMAT_ERROR, fmt::format("Size is too large: [{}].", _size));
        }

        return static_cast<std::int64_t>(bytes);
    } // parse_size

    auto format_size(double _bytes) -> std::string
    {
        constexpr std::array units{"B", "KB", "MB", "GB", "TB"};

        for (const auto* unit : units) {
            if (_bytes < 1024.0) {
                return fmt::format("{:.2f} {}", _bytes, unit);
            }

            _bytes /= 1024.0;
        }

        return fmt::format("{:.2f} PB", _bytes);
    } // format_size

    auto format_duration(double _seconds) -> std::string
    {
        const auto seconds = static_cast<std::int64_t>(_seconds);

        if (seconds < 60) {
            return fmt::format("{:02d}s", seconds);
        }

        if (seconds < 3600) {
            return fmt::format("{:02d}m{:02d}s", seconds / 60, seconds % 60);
        }

        if (seconds < 86400) {
            return fmt::format("{}h{:02d}m{:02d}s", seconds / 3600, (seconds % 3600) / 60, seconds % 60);
        }

        return fmt::format("{}d{}h", seconds / 86400, (seconds % 86400) / 3600);
    } // format_duration
} // namespace copyem
