//////////////////////////////////////////////////////////////////////

#include <fstream>
#include <nlohmann/json.hpp>

#include "maskforge_log.h"
#include "settings.h"
#include "util.h"

LOG_CONTEXT("settings", debug);

//////////////////////////////////////////////////////////////////////

bool settings_t::save_to(std::filesystem::path const &path)
{
    nlohmann::json json;
    to_json(json);
    std::string json_str = json.dump(4);
    LOG_DEBUG("{}", json_str);
    std::ofstream save(path);
    if(!save) {
        LOG_WARNING("Can't write settings to {}", path.string());
        return false;
    }
    save << json_str;
    save.close();
    return !save.fail();
}

//////////////////////////////////////////////////////////////////////

bool settings_t::load_from(std::filesystem::path const &path)
{
    std::ifstream load(path);
    if(!load) {
        LOG_VERBOSE("No settings at {}, using defaults", path.string());
        return false;
    }
    try {
        nlohmann::json json = nlohmann::json::parse(load);
        from_json(json);
    } catch(nlohmann::json::exception const &e) {
        LOG_WARNING("Settings file {} is bad ({}), using defaults", path.string(), e.what());
        *this = settings_t{};
        return false;
    }
    return true;
}

//////////////////////////////////////////////////////////////////////

bool settings_t::save()
{
    return save_to(config_path(app_name, settings_filename));
}

//////////////////////////////////////////////////////////////////////

bool settings_t::load()
{
    return load_from(config_path(app_name, settings_filename));
}
