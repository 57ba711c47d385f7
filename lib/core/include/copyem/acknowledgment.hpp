#ifndef COPYEM_ACKNOWLEDGMENT_HPP
#define COPYEM_ACKNOWLEDGMENT_HPP

#include "copyem/manifest.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace copyem
{
    /// Derives the set of delivered files from the consumer's transcript.
    ///
    /// The consumer prints the name of each archive member when it starts writing it.
    /// A member is therefore confirmed only when the next member is named, or when the
    /// consumer exits successfully. The member named last before a fault is never
    /// confirmed.
    ///
    /// The consumer keeps going after failing to write a member and reports the failure
    /// on its error stream. Such a member is never confirmed, and a confirmation already
    /// given for it is withdrawn.
    class acknowledgment_tracker
    {
    public:
        explicit acknowledgment_tracker(const std::vector<file_entry>& _planned);

        /// Processes one line of consumer output.
        ///
        /// A leading "./" is ignored. Lines that do not name a planned file are ignored.
        ///
        /// \returns The path confirmed by this line, if any.
        auto on_line(std::string_view _line) -> std::optional<std::string>;

        /// Processes one line of the consumer's error stream.
        ///
        /// Lines of the form "<program>: <member>: <message>" mark the named member as not
        /// delivered. Other lines are ignored.
        ///
        /// \returns The member that was marked, if any.
        auto on_error_line(std::string_view _line) -> std::optional<std::string>;

        /// Confirms the pending member. Call only when the consumer exited with status 0.
        auto on_consumer_success() -> std::optional<std::string>;

        auto acknowledged() const noexcept -> const std::vector<std::string>& { return acknowledged_; }
        auto acknowledged_bytes() const noexcept -> std::int64_t { return acknowledged_bytes_; }
        auto pending() const noexcept -> const std::optional<std::string>& { return pending_; }

    private:
        auto confirm(std::string _path) -> std::optional<std::string>;
        auto withdraw(const std::string& _path) -> void;

        std::unordered_map<std::string, std::int64_t> planned_;
        std::unordered_set<std::string> confirmed_;
        std::unordered_set<std::string> failed_;
        std::vector<std::string> acknowledged_;
        std::optional<std::string> pending_;
        std::int64_t acknowledged_bytes_ = 0;
    }; // class acknowledgment_tracker
} // namespace copyem

#endif // COPYEM_ACKNOWLEDGMENT_HPP
