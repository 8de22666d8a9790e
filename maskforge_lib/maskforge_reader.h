#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <filesystem>

#include "maskforge_error.h"

namespace maskforge_lib
{
    //////////////////////////////////////////////////////////////////////
    // text reader for Gerber, whitespace between tokens is invisible

    struct maskforge_reader
    {
        maskforge_reader() = default;

        maskforge_error_code open(std::filesystem::path const &file_path);

        maskforge_error_code open(char const *data, size_t size);

        void close();

        bool eof() const;

        maskforge_error_code peek(char *c);
        maskforge_error_code read_char(char *c);
        maskforge_error_code read_short(uint32_t *c, int count);
        maskforge_error_code read_until(std::string *s, char value);
        maskforge_error_code get_int(int *value, size_t *length = nullptr);
        maskforge_error_code get_double(double *value, size_t *length = nullptr);

        void skip(size_t num_chars);
        void rewind(size_t num_chars);
        void skip_whitespace();

        //////////////////////////////////////////////////////////////////////

        int line_number{};

        char const *file_data{};
        size_t file_size{};
        size_t file_pos{};

        std::string filename;
        std::vector<char> file_buffer;
    };

    //////////////////////////////////////////////////////////////////////

    enum tokenize_option
    {
        tokenize_remove_empty,
        tokenize_keep_empty,
    };

    template <typename T> void tokenize(std::string_view const str, T &tokens, std::string_view const delimiter, tokenize_option option)
    {
        size_t start = option == tokenize_keep_empty ? 0 : str.find_first_not_of(delimiter);
        while(start != std::string::npos && start <= str.size()) {
            size_t end = str.find_first_of(delimiter, start);
            if(end != start || option == tokenize_keep_empty) {
                tokens.push_back(typename T::value_type(str.substr(start, end - start)));
            }
            if(end == std::string::npos) {
                break;
            }
            start = option == tokenize_keep_empty ? end + 1 : str.find_first_not_of(delimiter, end);
        }
    }

    //////////////////////////////////////////////////////////////////////

    template <typename T> std::string join(T const &values, std::string_view const join_with)
    {
        std::string result;
        std::string_view joiner;
        for(auto const &s : values) {
            result = fmt::format("{}{}{}", result, joiner, s);
            joiner = join_with;
        }
        return result;
    }
}    // namespace maskforge_lib
