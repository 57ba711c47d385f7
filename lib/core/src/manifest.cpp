#include "copyem/manifest.hpp"

#include "copyem/error_codes.hpp"
#include "copyem/exception.hpp"

#include <fmt/format.h>

#include <utility>

namespace copyem
{
    auto operator==(const file_entry& _lhs, const file_entry& _rhs) noexcept -> bool
    {
        return _lhs.path == _rhs.path && _lhs.size == _rhs.size && _lhs.remote_size == _rhs.remote_size;
    } // operator==

    manifest::manifest(std::vector<file_entry> _entries)
    {
        entries_.reserve(_entries.size());

        for (auto& e : _entries) {
            if (e.size < 0) {
                COPYEM_THROW(SYS_INVALID_INPUT_PARAM,
                             fmt::format("{}: File [{}] has a negative size [{}].", __func__, e.path, e.size));
            }

            if (!paths_.insert(e.path).second) {
                continue;
            }

            total_bytes_ += e.size;
            entries_.push_back(std::move(e));
        }
    } // manifest

    auto manifest::contains(const std::string& _path) const -> bool
    {
        return paths_.count(_path) > 0;
    } // contains

    auto manifest::without(const std::unordered_set<std::string>& _delivered) const -> manifest
    {
        std::vector<file_entry> remaining;
        remaining.reserve(entries_.size());

        for (const auto& e : entries_) {
            if (_delivered.count(e.path) == 0) {
                remaining.push_back(e);
            }
        }

        return manifest{std::move(remaining)};
    } // without
} // namespace copyem
