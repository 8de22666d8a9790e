//////////////////////////////////////////////////////////////////////

#include <cctype>
#include <cstdint>
#include <limits>

#include "maskforge_error.h"
#include "maskforge_util.h"
#include "maskforge_reader.h"

LOG_CONTEXT("reader", info);

namespace
{
    bool is_whitespace(char c)
    {
        switch(c) {
        case '\n':
        case ' ':
        case '\r':
        case '\f':
        case '\t':
        case '\v':
            return true;
        }
        return false;
    }
}    // namespace

namespace maskforge_lib
{
    //////////////////////////////////////////////////////////////////////

    maskforge_error_code maskforge_reader::open(char const *data, size_t size)
    {
        FAIL_IF(data == nullptr, error_cant_read_file);
        FAIL_IF(size == 0, error_empty_file);
        file_data = data;
        file_size = size;
        file_pos = 0;
        line_number = 1;
        filename = fmt::format("mem:{}", size);
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code maskforge_reader::open(std::filesystem::path const &file_path)
    {
        std::vector<uint8_t> bytes;
        CHECK(maskforge_util::load_file(file_path, bytes));

        file_buffer.assign(bytes.begin(), bytes.end());

        file_data = file_buffer.data();
        file_size = file_buffer.size();

        filename = file_path.string();
        LOG_VERBOSE("Opened file {}, {} bytes available", filename, file_size);
        file_pos = 0;
        line_number = 1;
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    void maskforge_reader::close()
    {
        file_data = nullptr;
        file_size = 0;
        file_buffer.clear();
    }

    //////////////////////////////////////////////////////////////////////

    bool maskforge_reader::eof() const
    {
        return file_pos >= file_size;
    }

    //////////////////////////////////////////////////////////////////////

    void maskforge_reader::skip(size_t num_chars)
    {
        for(; num_chars != 0 && !eof(); --num_chars) {
            skip_whitespace();
            file_pos += 1;
        }
    }

    //////////////////////////////////////////////////////////////////////
    // step back over num_chars non-whitespace chars

    void maskforge_reader::rewind(size_t num_chars)
    {
        for(; num_chars != 0 && file_pos != 0; --num_chars) {
            file_pos -= 1;
            while(file_pos != 0 && is_whitespace(file_data[file_pos])) {
                if(file_data[file_pos] == '\n') {
                    line_number -= 1;
                }
                file_pos -= 1;
            }
        }
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code maskforge_reader::peek(char *c)
    {
        skip_whitespace();
        if(eof()) {
            return error_unexpected_eof;
        }
        *c = file_data[file_pos];
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code maskforge_reader::read_char(char *c)
    {
        skip_whitespace();
        if(eof()) {
            return error_unexpected_eof;
        }
        *c = file_data[file_pos];
        file_pos += 1;
        return ok;
    }

    //////////////////////////////////////////////////////////////////////
    // up to 4 chars packed big endian, so 'AD' can be a case label

    maskforge_error_code maskforge_reader::read_short(uint32_t *c, int count)
    {
        FAIL_IF(count > 4, error_unexpected_input);
        uint32_t r = 0;
        for(int i = 0; i < count; ++i) {
            char a;
            CHECK(read_char(&a));
            r <<= 8;
            r |= static_cast<uint8_t>(a);
        }
        *c = r;
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    void maskforge_reader::skip_whitespace()
    {
        while(!eof() && is_whitespace(file_data[file_pos])) {
            if(file_data[file_pos] == '\n') {
                line_number += 1;
            }
            file_pos += 1;
        }
    }

    //////////////////////////////////////////////////////////////////////
    // read_until strips whitespace but does NOT consume the terminator

    maskforge_error_code maskforge_reader::read_until(std::string *s, char value)
    {
        std::string result;
        while(!eof()) {
            char c = file_data[file_pos];
            if(c == value) {
                if(s != nullptr) {
                    *s = result;
                }
                return ok;
            }
            if(c == '\n') {
                line_number += 1;
            }
            file_pos += 1;
            if(!is_whitespace(c)) {
                result.push_back(c);
            }
        }
        return error_unexpected_eof;
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code maskforge_reader::get_int(int *value, size_t *length)
    {
        size_t len = 0;
        int64_t number = 0;
        bool too_big{ false };

        char c;
        CHECK(peek(&c));
        bool negate = c == '-';

        if(negate || c == '+') {
            skip(1);
        }

        while(peek(&c) == ok) {
            if(!isdigit(static_cast<unsigned char>(c))) {
                break;
            }
            file_pos += 1;
            if(!too_big) {
                number = number * 10 + (c - '0');
                too_big = number > std::numeric_limits<int>::max();
            }
            len += 1;
        }
        if(len == 0) {
            LOG_ERROR("Missing int at line {}", line_number);
            return error_invalid_number;
        }
        if(too_big) {
            LOG_ERROR("Number out of range at line {}", line_number);
            return error_invalid_number;
        }
        if(negate) {
            number = -number;
        }
        *value = static_cast<int>(number);
        if(length != nullptr) {
            *length = len;
        }
        return ok;
    }

    //////////////////////////////////////////////////////////////////////
    // no exponents, Gerber doesn't have them

    maskforge_error_code maskforge_reader::get_double(double *value, size_t *length)
    {
        size_t len = 0;
        double number = 0.0;

        double divide = 1.0;
        bool found_decimal_point{ false };
        size_t num_digits = 0;

        char c;
        CHECK(peek(&c));
        bool negate = c == '-';

        if(negate || c == '+') {
            skip(1);
        }

        while(peek(&c) == ok) {
            if(c == '.') {
                if(found_decimal_point) {
                    break;
                }
                file_pos += 1;
                found_decimal_point = true;
                len += 1;
                continue;
            }
            if(!isdigit(static_cast<unsigned char>(c))) {
                break;
            }
            file_pos += 1;
            num_digits += 1;
            double digit = c - '0';
            if(found_decimal_point) {
                divide /= 10.0;
                number += digit * divide;
            } else {
                number *= 10.0;
                number += digit;
            }
            len += 1;
        }
        if(num_digits == 0) {
            LOG_ERROR("Missing real number at line {}", line_number);
            return error_invalid_number;
        }
        if(negate) {
            number = -number;
        }
        if(length != nullptr) {
            *length = len;
        }
        *value = number;
        return ok;
    }

}    // namespace maskforge_lib
