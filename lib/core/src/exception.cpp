#include "copyem/exception.hpp"

#include "copyem/error_codes.hpp"

#include <sstream>

namespace copyem
{
    exception::exception(std::int64_t _code,
                         const std::string& _message,
                         const std::string& _file_name,
                         std::uint32_t _line_number,
                         const std::string& _function_name)
        : std::exception()
        , code_{_code}
        , message_stack_{_message}
        , line_number_{_line_number}
        , function_name_{_function_name}
        , file_name_{_file_name}
        , what_{}
    {
    } // exception

    auto exception::what() const noexcept -> const char*
    {
        assemble_full_display_what();
        return what_.c_str();
    } // what

    auto exception::client_display_what() const noexcept -> const char*
    {
        assemble_client_display_what();
        return what_.c_str();
    } // client_display_what

    auto exception::assemble_full_display_what() const noexcept -> void
    {
        try {
            std::ostringstream what_ss;

            what_ss << "copyem exception:"
                    << "\n    file: " << file_name_
                    << "\n    function: " << function_name_
                    << "\n    line: " << line_number_
                    << "\n    code: " << code_ << " (" << error_name(static_cast<int>(code_)) << ")"
                    << "\n    message:\n";

            for (const auto& entry : message_stack_) {
                what_ss << "        " << entry << '\n';
            }

            what_ = what_ss.str();
        }
        catch (const std::exception&) {
            what_ = "copyem exception: <message unavailable>";
        }
    } // assemble_full_display_what

    auto exception::assemble_client_display_what() const noexcept -> void
    {
        try {
            std::ostringstream what_ss;

            what_ss << error_name(static_cast<int>(code_)) << ": ";

            for (auto iter = std::begin(message_stack_); iter != std::end(message_stack_); ++iter) {
                if (iter != std::begin(message_stack_)) {
                    what_ss << "\n    ";
                }

                what_ss << *iter;
            }

            what_ = what_ss.str();
        }
        catch (const std::exception&) {
            what_ = "<message unavailable>";
        }
    } // assemble_client_display_what
} // namespace copyem
