#ifndef COPYEM_ERROR_CODE_MATCHER_HPP
#define COPYEM_ERROR_CODE_MATCHER_HPP

#include "copyem/error_codes.hpp"
#include "copyem/exception.hpp"

#include <catch2/catch.hpp>
#include <fmt/format.h>

#include <cstdint>
#include <string>

// Matches a copyem::exception carrying the expected error code.
class error_code_matcher : public Catch::MatcherBase<copyem::exception>
{
    std::int64_t code_;

public:
    explicit error_code_matcher(const std::int64_t _code)
        : code_{_code}
    {
    }

    bool match(const copyem::exception& _e) const override
    {
        return _e.code() == code_;
    }

    std::string describe() const override
    {
        return fmt::format("has error code {} ({})", code_, copyem::error_name(static_cast<int>(code_)));
    }
};

inline auto has_error_code(const std::int64_t _code) -> error_code_matcher
{
    return error_code_matcher{_code};
}

#endif // COPYEM_ERROR_CODE_MATCHER_HPP
