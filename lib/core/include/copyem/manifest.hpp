#ifndef COPYEM_MANIFEST_HPP
#define COPYEM_MANIFEST_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace copyem
{
    struct file_entry
    {
        std::string path; // Relative to the source root.
        std::int64_t size = 0;
        std::optional<std::int64_t> remote_size;

        // A file is eligible for transfer if it is absent remotely or the sizes differ.
        auto eligible() const noexcept -> bool
        {
            return !remote_size || *remote_size != size;
        }
    }; // struct file_entry

    auto operator==(const file_entry& _lhs, const file_entry& _rhs) noexcept -> bool;

    /// An ordered, immutable list of files deduplicated by relative path.
    ///
    /// Residual manifests are derived with without(). A manifest is never
    /// modified after construction.
    class manifest
    {
    public:
        using const_iterator = std::vector<file_entry>::const_iterator;

        manifest() = default;

        // Keeps the first occurrence of every relative path.
        explicit manifest(std::vector<file_entry> _entries);

        auto entries() const noexcept -> const std::vector<file_entry>& { return entries_; }
        auto size() const noexcept -> std::size_t { return entries_.size(); }
        auto empty() const noexcept -> bool { return entries_.empty(); }
        auto total_bytes() const noexcept -> std::int64_t { return total_bytes_; }

        auto begin() const noexcept -> const_iterator { return entries_.cbegin(); }
        auto end() const noexcept -> const_iterator { return entries_.cend(); }

        auto contains(const std::string& _path) const -> bool;

        /// Derives a new manifest holding every entry whose path is not in \p _delivered.
        /// The relative order of the remaining entries is preserved.
        auto without(const std::unordered_set<std::string>& _delivered) const -> manifest;

    private:
        std::vector<file_entry> entries_;
        std::unordered_set<std::string> paths_;
        std::int64_t total_bytes_ = 0;
    }; // class manifest
} // namespace copyem

#endif // COPYEM_MANIFEST_HPP
