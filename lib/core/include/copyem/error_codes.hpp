#ifndef COPYEM_ERROR_CODES_HPP
#define COPYEM_ERROR_CODES_HPP

/// \file
///
/// Defines the error codes used by copyem.
///
/// Error code format:
///
///      -mmmnnn
///
/// Where -mmm000 is a copyem error code and nnn is an optional errno value
/// which can be added to the base code (e.g. PIPE_CREATE_ERROR - EMFILE).

#include <string_view>

// clang-format off
#define COPYEM_ERROR_TABLE(NEW_ERROR)                          \
    NEW_ERROR(SYS_INVALID_INPUT_PARAM,         -130000)        \
    NEW_ERROR(CONFIGURATION_ERROR,             -201000)        \
    NEW_ERROR(SIZE_FORMAT_ERROR,               -202000)        \
    NEW_ERROR(SOURCE_PATH_ERROR,               -310000)        \
    NEW_ERROR(REMOTE_QUERY_ERROR,              -320000)        \
    NEW_ERROR(PROCESS_SPAWN_ERROR,             -510000)        \
    NEW_ERROR(PIPE_CREATE_ERROR,               -520000)        \
    NEW_ERROR(TEMPORARY_FILE_ERROR,            -530000)
// clang-format on

namespace copyem
{
#define COPYEM_DEFINE_ERROR_ENUM(err_name, err_code) err_name = err_code,

    enum error_code : int
    {
        COPYEM_ERROR_TABLE(COPYEM_DEFINE_ERROR_ENUM)
    };

#undef COPYEM_DEFINE_ERROR_ENUM

    /// Returns the symbolic name of an error code.
    ///
    /// The errno component of the code (the last three digits) is ignored when
    /// looking up the name.
    ///
    /// \param[in] _code The error code.
    ///
    /// \returns The name of the error code or "UNKNOWN_ERROR".
    auto error_name(int _code) noexcept -> std::string_view;
} // namespace copyem

#endif // COPYEM_ERROR_CODES_HPP
