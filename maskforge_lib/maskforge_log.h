//////////////////////////////////////////////////////////////////////

#pragma once

#include <chrono>
#include <string>

#include <fmt/format.h>

namespace maskforge_lib
{
    //////////////////////////////////////////////////////////////////////

    enum maskforge_log_level
    {
        log_level_debug = 0,
        log_level_verbose = 1,
        log_level_info = 2,
        log_level_warning = 3,
        log_level_error = 4,
        log_level_fatal = 5,
        log_level_none = 6
    };

    //////////////////////////////////////////////////////////////////////

    struct maskforge_log_context
    {
        char const *context;
        maskforge_log_level max_level;
    };

    //////////////////////////////////////////////////////////////////////

    typedef int (*maskforge_log_emitter_function)(char const *);

    extern maskforge_log_level log_level;

    extern maskforge_log_emitter_function log_emitter_function;

    //////////////////////////////////////////////////////////////////////

    inline void log_set_level(maskforge_log_level level)
    {
        log_level = level;
    }

    //////////////////////////////////////////////////////////////////////

    inline void log_set_emitter_function(maskforge_log_emitter_function function)
    {
        log_emitter_function = function;
    }

    //////////////////////////////////////////////////////////////////////

    void maskforge_log(maskforge_log_level level, char const *context, fmt::string_view fmt, fmt::format_args fmt_args);

    //////////////////////////////////////////////////////////////////////

    template <typename... args> void log(maskforge_log_level level, maskforge_log_context const &context, fmt::string_view fmt, args &&...arguments)
    {
        if(level == log_level_fatal || (level >= log_level && level >= context.max_level)) {
            maskforge_log(level, context.context, fmt, fmt::make_format_args(arguments...));
        }
    }

}    // namespace maskforge_lib

//////////////////////////////////////////////////////////////////////

#define LOG_CONTEXT(context, max_level)                                            \
    static constexpr ::maskforge_lib::maskforge_log_context __log_context          \
    {                                                                              \
        context, ::maskforge_lib::maskforge_log_level::log_level_##max_level      \
    }

#define LOG_DEBUG(msg, ...) ::maskforge_lib::log(::maskforge_lib::log_level_debug, __log_context, msg, ##__VA_ARGS__)
#define LOG_VERBOSE(msg, ...) ::maskforge_lib::log(::maskforge_lib::log_level_verbose, __log_context, msg, ##__VA_ARGS__)
#define LOG_INFO(msg, ...) ::maskforge_lib::log(::maskforge_lib::log_level_info, __log_context, msg, ##__VA_ARGS__)
#define LOG_WARNING(msg, ...) ::maskforge_lib::log(::maskforge_lib::log_level_warning, __log_context, msg, ##__VA_ARGS__)
#define LOG_ERROR(msg, ...) ::maskforge_lib::log(::maskforge_lib::log_level_error, __log_context, msg, ##__VA_ARGS__)
#define LOG_FATAL(msg, ...) ::maskforge_lib::log(::maskforge_lib::log_level_fatal, __log_context, msg, ##__VA_ARGS__)

#define MASKFORGE_ASSERT(x)                                                          \
    do                                                                               \
        if(!(x))                                                                     \
            LOG_FATAL("ASSERT FAILED: {} at line {} of {}", #x, __LINE__, __FILE__); \
    while(false)
