#ifndef COPYEM_COST_MODEL_HPP
#define COPYEM_COST_MODEL_HPP

#include "copyem/manifest.hpp"

#include <cstdint>
#include <string>

namespace copyem
{
    /// Estimates the time needed to move one file: latency + size / speed.
    struct cost_model
    {
        double assumed_speed = 20.0 * 1024 * 1024; // bytes per second
        double per_file_latency = 0.15;            // seconds

        auto cost_of(std::int64_t _size) const noexcept -> double
        {
            return per_file_latency + static_cast<double>(_size) / assumed_speed;
        }

        auto cost_of(const file_entry& _entry) const noexcept -> double
        {
            return cost_of(_entry.size);
        }
    }; // struct cost_model

    /// Controls the order of files inside one stream.
    enum class order_policy
    {
        largest_first,     ///< Descending cost, the order produced by list scheduling.
        buffer_interleaved ///< Small files are slotted behind large ones while the buffer can hide their latency.
    };

    auto to_string(order_policy _policy) -> std::string;

    /// \throws copyem::exception CONFIGURATION_ERROR for unknown names.
    auto to_order_policy(const std::string& _name) -> order_policy;
} // namespace copyem

#endif // COPYEM_COST_MODEL_HPP
