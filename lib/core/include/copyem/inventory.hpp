#ifndef COPYEM_INVENTORY_HPP
#define COPYEM_INVENTORY_HPP

#include "copyem/configuration.hpp"
#include "copyem/manifest.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace copyem
{
    /// Reports which files already exist under the destination root.
    class remote_lister
    {
    public:
        virtual ~remote_lister() = default;

        /// \param[in] _paths Paths relative to the destination root.
        ///
        /// \returns The size of every path that exists. Absent paths are left out.
        ///
        /// \throws copyem::exception REMOTE_QUERY_ERROR if the destination cannot be queried.
        virtual auto list(const std::vector<std::string>& _paths) -> std::unordered_map<std::string, std::int64_t> = 0;
    }; // class remote_lister

    /// Runs "stat" over the destination shell (ssh, or sh -c for a local destination).
    ///
    /// The path list is fed to xargs on stdin, NUL-separated. A destination root that
    /// does not exist yet yields an empty result.
    class shell_remote_lister : public remote_lister
    {
    public:
        explicit shell_remote_lister(transfer_config _config, std::size_t _batch_size = 100000);

        auto list(const std::vector<std::string>& _paths) -> std::unordered_map<std::string, std::int64_t> override;

    private:
        auto list_batch(const std::vector<std::string>& _paths, std::size_t _first, std::size_t _last)
            -> std::unordered_map<std::string, std::int64_t>;

        transfer_config config_;
        std::size_t batch_size_;
    }; // class shell_remote_lister

    /// Lists every regular file under \p _source_root whose relative path matches
    /// \p _include_pattern, sorted by path.
    ///
    /// The pattern uses shell glob rules where '*' also matches '/'. An empty pattern
    /// matches every file.
    ///
    /// \throws copyem::exception SOURCE_PATH_ERROR if the root is not a readable directory.
    auto scan_source(const std::string& _source_root, const std::string& _include_pattern)
        -> std::vector<file_entry>;

    /// Builds the manifest of files that need to be transferred.
    ///
    /// Files whose remote size equals their local size are left out.
    ///
    /// \throws copyem::exception SOURCE_PATH_ERROR
    /// \throws copyem::exception REMOTE_QUERY_ERROR
    auto build_inventory(const std::string& _source_root, const std::string& _include_pattern, remote_lister& _lister)
        -> manifest;
} // namespace copyem

#endif // COPYEM_INVENTORY_HPP
