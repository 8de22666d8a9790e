#pragma once

#include <filesystem>
#include <optional>
#include <string>

//////////////////////////////////////////////////////////////////////

extern char const *app_name;
extern char const *settings_filename;

//////////////////////////////////////////////////////////////////////

std::optional<std::string> get_env_var(std::string const &key);

// creates the directory if it isn't there
std::filesystem::path config_path(std::string const &application_name, std::string const &filename);

// foo/bar.gbr -> foo/bar.png
std::filesystem::path suggest_output_filename(std::filesystem::path const &input);

// "13312x5120" or "223.642x126.48"
bool parse_dimensions(std::string const &text, double *width, double *height);

// "13312x5120", whole pixels which fit an int
bool parse_pixel_dimensions(std::string const &text, int *width, int *height);

// all of text, a leading + is allowed, out of int range fails
bool parse_int(std::string const &text, int *value);
