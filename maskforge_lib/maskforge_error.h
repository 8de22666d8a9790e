//////////////////////////////////////////////////////////////////////

#pragma once

#include <cstdint>
#include <string>

#include "maskforge_log.h"

//////////////////////////////////////////////////////////////////////

namespace
{
    constexpr char const *get_file_name(char const *const path)
    {
        char const *start_position = path;
        for(char const *c = path; *c != '\0'; ++c) {
            if(*c == '\\' || *c == '/') {
                start_position = c;
            }
        }
        if(start_position != path) {
            ++start_position;
        }
        return start_position;
    }
}    // namespace

//////////////////////////////////////////////////////////////////////

#define CHECK(x)                                                                                                                                  \
    do {                                                                                                                                          \
        ::maskforge_lib::maskforge_error_code __error = (x);                                                                                      \
        if(__error != ::maskforge_lib::ok) {                                                                                                      \
            LOG_ERROR("{}(error {}): `{}` (line {} of {})", ::maskforge_lib::get_error_text(__error), static_cast<int>(__error), #x, __LINE__,    \
                      get_file_name(__FILE__));                                                                                                   \
            return __error;                                                                                                                       \
        }                                                                                                                                         \
    } while(false)

//////////////////////////////////////////////////////////////////////

#define FAIL_IF(condition, error_code)                                                                                                                       \
    do {                                                                                                                                                     \
        if(condition) {                                                                                                                                      \
            LOG_ERROR("{}(error {}) because `{}` (at line {} of {})", ::maskforge_lib::get_error_text(error_code), static_cast<int>(error_code), #condition, \
                      __LINE__, get_file_name(__FILE__));                                                                                                    \
            return error_code;                                                                                                                               \
        }                                                                                                                                                    \
    } while(false)

namespace maskforge_lib
{
    //////////////////////////////////////////////////////////////////////

#undef MASKFORGE_ERROR_CODE
#undef MASKFORGE_ERROR_CODES
#define MASKFORGE_ERROR_CODE(a) error_##a,
#include "maskforge_error_codes.h"

    enum maskforge_error_code : uint32_t
    {
        ok,
        MASKFORGE_ERROR_CODES
    };

    char const *get_error_text(maskforge_error_code error_code);

    //////////////////////////////////////////////////////////////////////
    // convert a char to a string

    inline std::string string_from_char(int c)
    {
        if(c >= ' ' && c < 127) {
            return std::string({ static_cast<char>(c) });
        }
        return fmt::format("0x{:02x}", static_cast<uint8_t>(c));
    }

    //////////////////////////////////////////////////////////////////////
    // 'AD' back to "AD"

    inline std::string string_from_uint32(uint32_t n)
    {
        std::string s;
        while(n != 0) {
            uint32_t c = n >> 24;
            if(c != 0) {
                if(c < ' ' || c >= 127) {
                    c = '?';
                }
                s.append({ static_cast<char>(c) });
            }
            n <<= 8;
        }
        if(s.empty()) {
            s = "?";
        }
        return s;
    }

    //////////////////////////////////////////////////////////////////////
    // what went wrong, for the top level

    struct maskforge_error
    {
        maskforge_error_code error_code{};
        std::string message{};
        std::string filename{};
        int line_number{};

        maskforge_error() = default;

        maskforge_error(maskforge_error_code code, std::string const &msg, std::string const &file = {}, int line = 0)
            : error_code(code), message(msg), filename(file), line_number(line)
        {
        }

        std::string to_string() const;
    };

}    // namespace maskforge_lib
