#ifndef COPYEM_UNIT_TEST_UTILS_HPP
#define COPYEM_UNIT_TEST_UTILS_HPP

#include "copyem/manifest.hpp"

#include <boost/filesystem.hpp>
#include <fmt/format.h>

#include <unistd.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace unit_test_utils
{
    namespace fs = boost::filesystem;

    // A directory under the system temporary directory that is removed with its contents
    // when the object goes out of scope.
    class scratch_directory
    {
    public:
        explicit scratch_directory(std::string_view _name)
            : path_{fs::temp_directory_path() /
                    fs::unique_path(fmt::format("copyem_{}_{}_%%%%-%%%%", _name, ::getpid()))}
        {
            fs::create_directories(path_);
        }

        scratch_directory(const scratch_directory&) = delete;
        auto operator=(const scratch_directory&) -> scratch_directory& = delete;

        ~scratch_directory()
        {
            boost::system::error_code ec;
            fs::remove_all(path_, ec);
        }

        auto path() const -> const fs::path& { return path_; }

        auto string() const -> std::string { return path_.string(); }

    private:
        fs::path path_;
    }; // class scratch_directory

    // Creates the parent directories as needed.
    inline auto write_file(const fs::path& _path, std::string_view _contents) -> void
    {
        fs::create_directories(_path.parent_path());
        std::ofstream out{_path.string(), std::ios::binary};
        out.write(_contents.data(), static_cast<std::streamsize>(_contents.size()));
    }

    inline auto write_file(const fs::path& _path, std::size_t _size, char _fill = 'x') -> void
    {
        write_file(_path, std::string(_size, _fill));
    }

    inline auto read_file(const fs::path& _path) -> std::string
    {
        std::ifstream in{_path.string(), std::ios::binary};
        return {std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    }

    // Files named "file_000", "file_001", ... with the given sizes.
    inline auto make_entries(const std::vector<std::int64_t>& _sizes) -> std::vector<copyem::file_entry>
    {
        std::vector<copyem::file_entry> entries;
        entries.reserve(_sizes.size());

        for (std::size_t i = 0; i < _sizes.size(); ++i) {
            entries.push_back({fmt::format("file_{:03d}", i), _sizes[i], std::nullopt});
        }

        return entries;
    }

    inline auto paths_of(const std::vector<copyem::file_entry>& _entries) -> std::vector<std::string>
    {
        std::vector<std::string> paths;
        paths.reserve(_entries.size());

        for (const auto& e : _entries) {
            paths.push_back(e.path);
        }

        return paths;
    }
} // namespace unit_test_utils

#endif // COPYEM_UNIT_TEST_UTILS_HPP
