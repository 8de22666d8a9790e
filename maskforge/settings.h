#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "maskforge_log.h"

//////////////////////////////////////////////////////////////////////
// everything the command line can set, remembered between runs

#define SETTINGS_FIELDS                          \
    X(int, display_pixel_width, 13312)           \
    X(int, display_pixel_height, 5120)           \
    X(double, display_width_mm, 223.642)         \
    X(double, display_height_mm, 126.48)         \
    X(double, circle_diameter_mm, 100.0)         \
    X(double, circle_offset_mm, 60.0)            \
    X(double, pcb_width_mm, 160.0)               \
    X(double, pcb_height_mm, 100.0)              \
    X(std::string, overflow, "clip")             \
    X(int, threshold, 128)                       \
    X(bool, gerber_mirror, true)                 \
    X(bool, gerber_invert, false)                \
    X(std::string, gds_cell, "")                 \
    X(int, gds_layer, -1)

struct settings_t
{
#define X(type, name, ...) type name = __VA_ARGS__;
    SETTINGS_FIELDS
#undef X

    bool save();
    bool load();

    bool save_to(std::filesystem::path const &path);
    bool load_from(std::filesystem::path const &path);

    void to_json(nlohmann::json &j) const
    {
#define X(type, name, ...) j[#name] = name;
        SETTINGS_FIELDS
#undef X
    }

    // missing or mistyped fields get their defaults, the rest still load
    void from_json(nlohmann::json const &j)
    {
        LOG_CONTEXT("from_json", info);
#define X(type, name, ...)                                                            \
    name = __VA_ARGS__;                                                               \
    if(j.contains(#name)) {                                                           \
        try {                                                                         \
            name = j.at(#name).get<type>();                                           \
        } catch(nlohmann::json::exception const &e) {                                 \
            LOG_WARNING("Setting {} ignored: {}", #name, e.what());                   \
        }                                                                             \
    }
        SETTINGS_FIELDS
#undef X
    }
};
