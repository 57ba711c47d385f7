#include "copyem/error_codes.hpp"

namespace copyem
{
    auto error_name(int _code) noexcept -> std::string_view
    {
        // Strip the errno portion of the code.
        const auto base = _code - (_code % 1000);

#define COPYEM_ERROR_NAME_CASE(err_name, err_code) \
    case err_code:                                 \
        return #err_name;

        switch (base) {
            COPYEM_ERROR_TABLE(COPYEM_ERROR_NAME_CASE)
            default:
                return "UNKNOWN_ERROR";
        }

#undef COPYEM_ERROR_NAME_CASE
    } // error_name
} // namespace copyem
