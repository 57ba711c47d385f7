#ifndef COPYEM_EXCEPTION_HPP
#define COPYEM_EXCEPTION_HPP

#include <cstdint>
#include <exception>
#include <string>
#include <vector>

namespace copyem
{
    class exception : public std::exception
    {
    public:
        exception(std::int64_t _code,
                  const std::string& _message,
                  const std::string& _file_name,
                  std::uint32_t _line_number,
                  const std::string& _function_name);

        exception(const exception&) = default;
        auto operator=(const exception&) -> exception& = default;

        ~exception() override = default;

        // Full diagnostic including the throw site. Used for logging.
        auto what() const noexcept -> const char* override;

        // Short form suitable for the terminal.
        auto client_display_what() const noexcept -> const char*;

        // accessors
        auto code() const noexcept -> std::int64_t { return code_; }
        auto message_stack() const -> const std::vector<std::string>& { return message_stack_; }
        auto file_name() const -> const std::string& { return file_name_; }
        auto line_number() const noexcept -> std::uint32_t { return line_number_; }
        auto function_name() const -> const std::string& { return function_name_; }

        // mutators
        auto add_message(const std::string& _m) -> void { message_stack_.push_back(_m); }

    private:
        auto assemble_full_display_what() const noexcept -> void;
        auto assemble_client_display_what() const noexcept -> void;

        std::int64_t code_;
        std::vector<std::string> message_stack_;
        std::uint32_t line_number_;
        std::string function_name_;
        std::string file_name_;
        mutable std::string what_;
    }; // class exception
} // namespace copyem

#define COPYEM_THROW(_code, _msg) \
    (throw copyem::exception((_code), (_msg), __FILE__, __LINE__, __PRETTY_FUNCTION__))

#endif // COPYEM_EXCEPTION_HPP
