#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "maskforge_error.h"

namespace maskforge_util
{
    //////////////////////////////////////////////////////////////////////

    struct maskforge_timer
    {
        maskforge_timer() = default;

        std::chrono::time_point<std::chrono::high_resolution_clock> time_point_begin;

        void reset()
        {
            time_point_begin = std::chrono::high_resolution_clock::now();
        }

        double elapsed_seconds() const
        {
            auto time_point_end = std::chrono::high_resolution_clock::now();
            auto diff = time_point_end - time_point_begin;
            auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(diff);
            return microseconds.count() / 1000000.0;
        }
    };

    //////////////////////////////////////////////////////////////////////

    std::string to_lowercase(std::string const &s);

    //////////////////////////////////////////////////////////////////////
    // slurp a whole file, binary

    maskforge_lib::maskforge_error_code load_file(std::filesystem::path const &path, std::vector<uint8_t> &data);

    //////////////////////////////////////////////////////////////////////
    // get something from a map

    template <typename T, typename S> bool map_get_if_found(std::map<T, S> const &m, T const &key, S *const value)
    {
        auto f = m.find(key);
        if(f != m.end()) {
            *value = f->second;
            return true;
        }
        return false;
    }

    //////////////////////////////////////////////////////////////////////
    // get number of elements in an array

    template <typename T, size_t N> constexpr size_t array_length(T const (&)[N])
    {
        return N;
    }

    namespace util
    {
        //////////////////////////////////////////////////////////////////////
        // DEFER admin

        template <typename FUNC> struct defer_finalizer
        {
            FUNC lambda;

            template <typename T> defer_finalizer(T &&f) : lambda(std::forward<T>(f))
            {
            }

            defer_finalizer() = delete;
            defer_finalizer(defer_finalizer const &) = delete;
            defer_finalizer(defer_finalizer &&) = delete;

            ~defer_finalizer()
            {
                lambda();
            }
        };

        [[maybe_unused]] static struct
        {
            template <typename F> [[nodiscard]] defer_finalizer<F> operator<<(F &&f)
            {
                return defer_finalizer<F>(std::forward<F>(f));
            }
        } deferrer;

    }    // namespace util

}    // namespace maskforge_util

//////////////////////////////////////////////////////////////////////
// DEFER: auto generates a variable in current scope (using capture by VALUE!)

#define _DEFER_TOKENPASTE(x, y) x##y
#define _DEFER_TOKENPASTE2(x, y) _DEFER_TOKENPASTE(x, y)

#define DEFER(X) auto _DEFER_TOKENPASTE2(__deferred_lambda_call, __COUNTER__) = maskforge_util::util::deferrer << [=] { X; }

//////////////////////////////////////////////////////////////////////
// if there's a `to_string()` member function, you can use this
// to make a type formattable. If there's no to_string() method, compile fails

#define MASKFORGE_MAKE_FORMATTER(MASKFORGE_TYPE)                                       \
    template <> struct fmt::formatter<MASKFORGE_TYPE> : fmt::formatter<std::string>    \
    {                                                                                  \
        auto format(MASKFORGE_TYPE const &e, fmt::format_context &ctx) const           \
        {                                                                              \
            return fmt::format_to(ctx.out(), "{}", e.to_string());                     \
        }                                                                              \
    }

MASKFORGE_MAKE_FORMATTER(maskforge_lib::maskforge_error);
