#ifndef COPYEM_UNITS_HPP
#define COPYEM_UNITS_HPP

#include <cstdint>
#include <string>
#include <string_view>

namespace copyem
{
    /// Converts a human-readable size string to a number of bytes.
    ///
    /// Accepted suffixes (case-insensitive, powers of 1024): B, K, KB, M, MB, G, GB, T, TB.
    /// A missing suffix means bytes. A suffix without a number means one unit.
    ///
    /// \throws copyem::exception SIZE_FORMAT_ERROR if the string is empty, negative or malformed.
    auto parse_size(std::string_view _size) -> std::int64_t;

    /// Formats a byte count with two decimals, e.g. "1.50 GB".
    auto format_size(double _bytes) -> std::string;

    /// Formats a duration as "SSs", "MMmSSs", "HhMMmSSs" or "DdHh".
    auto format_duration(double _seconds) -> std::string;
} // namespace copyem

#endif // COPYEM_UNITS_HPP
