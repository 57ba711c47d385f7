#include "copyem/acknowledgment.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace
{
    auto strip_current_directory(std::string_view _path) -> std::string_view
    {
        while (_path.size() > 2 && _path.substr(0, 2) == "./") {
            _path.remove_prefix(2);
        }

        return _path;
    } // strip_current_directory
} // anonymous namespace

namespace copyem
{
    acknowledgment_tracker::acknowledgment_tracker(const std::vector<file_entry>& _planned)
    {
        planned_.reserve(_planned.size());

        for (const auto& f : _planned) {
            planned_.emplace(f.path, f.size);
        }
    } // acknowledgment_tracker

    auto acknowledgment_tracker::on_line(std::string_view _line) -> std::optional<std::string>
    {
        if (!_line.empty() && _line.back() == '\r') {
            _line.remove_suffix(1);
        }

        std::string path{strip_current_directory(_line)};

        if (planned_.count(path) == 0 || confirmed_.count(path) > 0 || pending_ == path) {
            return std::nullopt;
        }

        // A member already reported as failed is never pending.
        std::optional<std::string> next;

        if (failed_.count(path) == 0) {
            next = std::move(path);
        }

        auto previous = std::exchange(pending_, std::move(next));

        if (!previous) {
            return std::nullopt;
        }

        return confirm(std::move(*previous));
    } // on_line

    auto acknowledgment_tracker::on_error_line(std::string_view _line) -> std::optional<std::string>
    {
        if (!_line.empty() && _line.back() == '\r') {
            _line.remove_suffix(1);
        }

        // The program name comes first. Member names may contain ": " themselves, so
        // every separator after the name is tried.
        const auto program_end = _line.find(": ");

        if (program_end == std::string_view::npos) {
            return std::nullopt;
        }

        const auto rest = strip_current_directory(_line.substr(program_end + 2));

        for (auto end = rest.find(": "); end != std::string_view::npos; end = rest.find(": ", end + 1)) {
            std::string path{rest.substr(0, end)};

            if (planned_.count(path) == 0) {
                continue;
            }

            failed_.insert(path);
            withdraw(path);

            if (pending_ == path) {
                pending_.reset();
            }

            return path;
        }

        return std::nullopt;
    } // on_error_line

    auto acknowledgment_tracker::on_consumer_success() -> std::optional<std::string>
    {
        if (!pending_) {
            return std::nullopt;
        }

        auto path = std::move(*pending_);
        pending_.reset();

        return confirm(std::move(path));
    } // on_consumer_success

    auto acknowledgment_tracker::confirm(std::string _path) -> std::optional<std::string>
    {
        if (failed_.count(_path) > 0) {
            return std::nullopt;
        }

        acknowledged_bytes_ += planned_.at(_path);
        confirmed_.insert(_path);
        acknowledged_.push_back(_path);

        return _path;
    } // confirm

    auto acknowledgment_tracker::withdraw(const std::string& _path) -> void
    {
        if (confirmed_.erase(_path) == 0) {
            return;
        }

        acknowledged_bytes_ -= planned_.at(_path);
        acknowledged_.erase(std::remove(std::begin(acknowledged_), std::end(acknowledged_), _path), std::end(acknowledged_));
    } // withdraw
} // namespace copyem
