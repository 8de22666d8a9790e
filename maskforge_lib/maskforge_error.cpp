//////////////////////////////////////////////////////////////////////

#include <map>

#include "maskforge_error.h"

namespace
{
#undef MASKFORGE_ERROR_CODES
#undef MASKFORGE_ERROR_CODE
#define MASKFORGE_ERROR_CODE(a) { maskforge_lib::error_##a, #a },
#include "maskforge_error_codes.h"

    std::map<uint32_t, char const *> error_names_map = { { maskforge_lib::ok, "ok" }, MASKFORGE_ERROR_CODES };
}    // namespace

namespace maskforge_lib
{
    //////////////////////////////////////////////////////////////////////

    char const *get_error_text(maskforge_error_code error_code)
    {
        auto f = error_names_map.find(static_cast<uint32_t>(error_code));
        if(f == error_names_map.end()) {
            return "?";
        }
        return f->second;
    }

    //////////////////////////////////////////////////////////////////////

    std::string maskforge_error::to_string() const
    {
        std::string text = message.empty() ? std::string(get_error_text(error_code)) : message;
        if(filename.empty()) {
            return text;
        }
        if(line_number > 0) {
            return fmt::format("{} ({}:{})", text, filename, line_number);
        }
        return fmt::format("{} ({})", text, filename);
    }
}    // namespace maskforge_lib
