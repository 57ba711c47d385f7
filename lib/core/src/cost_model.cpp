#include "copyem/cost_model.hpp"

#include "copyem/error_codes.hpp"
#include "copyem/exception.hpp"

#include <fmt/format.h>

namespace copyem
{
    auto to_string(order_policy _policy) -> std::string
    {
        switch (_policy) {
            case order_policy::largest_first:
                return "largest-first";
            case order_policy::buffer_interleaved:
                return "buffer-interleaved";
        }

        return "unknown";
    } // to_string

    auto to_order_policy(const std::string& _name) -> order_policy
    {
        if (_name == "largest-first" || _name == "largest_first") {
            return order_policy::largest_first;
        }

        if (_name == "buffer-interleaved" || _name == "buffer_interleaved") {
            return order_policy::buffer_interleaved;
        }

        COPYEM_THROW(CONFIGURATION_ERROR, fmt::format("{}: Unknown ordering policy [{}].", __func__, _name));
    } // to_order_policy
} // namespace copyem
