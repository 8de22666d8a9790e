#include <cstdlib>
#include <charconv>
#include <filesystem>
#include <string>
#include <system_error>

#include "maskforge_log.h"
#include "util.h"

LOG_CONTEXT("util", info);

//////////////////////////////////////////////////////////////////////

char const *app_name = "maskforge";
char const *settings_filename = "settings.json";

//////////////////////////////////////////////////////////////////////

std::optional<std::string> get_env_var(std::string const &key)
{
    char const *val = std::getenv(key.c_str());
    if(val == nullptr || val[0] == '\0') {
        return std::nullopt;
    }
    return std::string(val);
}

//////////////////////////////////////////////////////////////////////
// XDG_CONFIG_HOME, then ~/.config, then the temp folder

std::filesystem::path config_path(std::string const &application_name, std::string const &filename)
{
    namespace fs = std::filesystem;

    fs::path base_path;

    auto xdg_config = get_env_var("XDG_CONFIG_HOME");
    if(xdg_config.has_value()) {
        base_path = fs::path(xdg_config.value()) / application_name;
    } else {
        auto home = get_env_var("HOME");
        base_path = home.has_value() ? fs::path(home.value()) / ".config" / application_name : fs::temp_directory_path() / application_name;
    }

    std::error_code ec;
    fs::create_directories(base_path, ec);
    if(ec) {
        LOG_WARNING("Can't create {}: {}", base_path.string(), ec.message());
    }
    return base_path / filename;
}

//////////////////////////////////////////////////////////////////////

std::filesystem::path suggest_output_filename(std::filesystem::path const &input)
{
    std::filesystem::path output = input;
    output.replace_extension(".png");
    if(output == input) {
        output = input.parent_path() / (input.stem().string() + "_mask.png");
    }
    return output;
}

//////////////////////////////////////////////////////////////////////

bool parse_dimensions(std::string const &text, double *width, double *height)
{
    size_t x = text.find_first_of("xX");
    if(x == std::string::npos) {
        return false;
    }
    char const *begin = text.data();
    char const *mid = begin + x;
    char const *end = begin + text.size();
    double w;
    double h;
    auto [wp, we] = std::from_chars(begin, mid, w);
    if(we != std::errc() || wp != mid) {
        return false;
    }
    auto [hp, he] = std::from_chars(mid + 1, end, h);
    if(he != std::errc() || hp != end) {
        return false;
    }
    *width = w;
    *height = h;
    return true;
}

//////////////////////////////////////////////////////////////////////

bool parse_int(std::string const &text, int *value)
{
    char const *begin = text.data();
    char const *end = begin + text.size();
    if(begin != end && *begin == '+') {
        begin += 1;
    }
    int v;
    auto [p, e] = std::from_chars(begin, end, v);
    if(e != std::errc() || p != end) {
        return false;
    }
    *value = v;
    return true;
}

//////////////////////////////////////////////////////////////////////

bool parse_pixel_dimensions(std::string const &text, int *width, int *height)
{
    size_t x = text.find_first_of("xX");
    if(x == std::string::npos) {
        return false;
    }
    int w;
    int h;
    if(!parse_int(text.substr(0, x), &w) || !parse_int(text.substr(x + 1), &h)) {
        return false;
    }
    *width = w;
    *height = h;
    return true;
}
