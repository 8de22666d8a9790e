#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>

#include "settings.h"
#include "util.h"

namespace fs = std::filesystem;

//////////////////////////////////////////////////////////////////////

static fs::path temp_settings(char const *name)
{
    return fs::temp_directory_path() / fmt::format("maskforge_test_{}.json", name);
}

//////////////////////////////////////////////////////////////////////

static void write_text(fs::path const &path, std::string const &text)
{
    std::ofstream f(path);
    f << text;
    assert(f.good());
}

//////////////////////////////////////////////////////////////////////

static void test_round_trip()
{
    fs::path path = temp_settings("round_trip");

    settings_t a;
    a.display_pixel_width = 3840;
    a.display_width_mm = 120.5;
    a.overflow = "error";
    a.gerber_mirror = false;
    a.gds_cell = "TOP";
    a.gds_layer = 7;
    assert(a.save_to(path));

    settings_t b;
    assert(b.load_from(path));
    assert(b.display_pixel_width == 3840);
    assert(b.display_width_mm == 120.5);
    assert(b.overflow == "error");
    assert(!b.gerber_mirror);
    assert(b.gds_cell == "TOP");
    assert(b.gds_layer == 7);
    assert(b.display_pixel_height == 5120);

    fs::remove(path);
}

//////////////////////////////////////////////////////////////////////

static void test_missing_and_broken_files()
{
    settings_t s;
    s.threshold = 3;
    assert(!s.load_from(temp_settings("does_not_exist")));
    assert(s.threshold == 3);

    fs::path path = temp_settings("broken");
    write_text(path, "{ \"threshold\": 10, ");
    assert(!s.load_from(path));
    assert(s.threshold == 128);
    assert(s.circle_diameter_mm == 100.0);
    fs::remove(path);
}

//////////////////////////////////////////////////////////////////////
// one bad field doesn't spoil the rest

static void test_wrong_types()
{
    fs::path path = temp_settings("wrong_types");
    write_text(path, R"({ "threshold": "lots", "pcb_width_mm": 42, "gerber_invert": true, "unknown_thing": 1 })");

    settings_t s;
    s.pcb_height_mm = 1;
    assert(s.load_from(path));
    assert(s.threshold == 128);
    assert(s.pcb_width_mm == 42.0);
    assert(s.gerber_invert);

    // absent fields go back to their defaults
    assert(s.pcb_height_mm == 100.0);
    fs::remove(path);
}

//////////////////////////////////////////////////////////////////////

static void test_util()
{
    assert(suggest_output_filename("boards/top.gbr") == fs::path("boards/top.png"));
    assert(suggest_output_filename("art/logo.png") == fs::path("art/logo_mask.png"));

    double w = 0;
    double h = 0;
    assert(parse_dimensions("13312x5120", &w, &h));
    assert(w == 13312 && h == 5120);
    assert(parse_dimensions("223.642x126.48", &w, &h));
    assert(w == 223.642 && h == 126.48);
    assert(!parse_dimensions("13312", &w, &h));
    assert(!parse_dimensions("10xfoo", &w, &h));
    assert(!parse_dimensions("x10", &w, &h));
}

//////////////////////////////////////////////////////////////////////
// numbers from the command line never wrap or truncate

static void test_integer_options()
{
    int n = -1;
    assert(parse_int("128", &n) && n == 128);
    assert(parse_int("+7", &n) && n == 7);
    assert(parse_int("-3", &n) && n == -3);

    n = 42;
    assert(!parse_int("4294967424", &n));
    assert(!parse_int("12.5", &n));
    assert(!parse_int("", &n));
    assert(!parse_int("9 ", &n));
    assert(n == 42);

    int w = 0;
    int h = 0;
    assert(parse_pixel_dimensions("13312x5120", &w, &h));
    assert(w == 13312 && h == 5120);
    assert(!parse_pixel_dimensions("13312.7x5120", &w, &h));
    assert(!parse_pixel_dimensions("1e12x5", &w, &h));
    assert(!parse_pixel_dimensions("99999999999x5", &w, &h));
    assert(!parse_pixel_dimensions("640", &w, &h));
    assert(w == 13312 && h == 5120);
}

//////////////////////////////////////////////////////////////////////

int main()
{
    test_round_trip();
    test_missing_and_broken_files();
    test_wrong_types();
    test_util();
    test_integer_options();
    return 0;
}
