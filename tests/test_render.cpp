#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>

#include "maskforge_render.h"
#include "maskforge_image_io.h"

#include "gds_writer.h"

using namespace maskforge_lib;

namespace fs = std::filesystem;

//////////////////////////////////////////////////////////////////////

static fs::path temp_file(char const *name)
{
    return fs::temp_directory_path() / fmt::format("maskforge_test_render_{}", name);
}

//////////////////////////////////////////////////////////////////////

static void write_bytes(fs::path const &path, void const *data, size_t size)
{
    std::ofstream f(path, std::ios::binary);
    f.write(static_cast<char const *>(data), static_cast<std::streamsize>(size));
    assert(f.good());
}

//////////////////////////////////////////////////////////////////////
// small panel: 400x100 at 1 px/mm, 60mm circles 50mm in from each side

static render_request small_panel()
{
    render_request request;
    request.display = display_geometry{}.with_pixels(400, 100).with_physical(400, 100);
    request.circles = circle_projection_spec{ 60, 50 };
    return request;
}

//////////////////////////////////////////////////////////////////////

static void test_bitmap()
{
    fs::path path = temp_file("white.png");
    assert(save_png(path, gray_image(64, 64, 255)) == ok);

    render_request request = small_panel();
    request.source = bitmap_request{ path, 128 };
    assert(request.input() == path);
    assert(std::string(request.tool_name()) == "bitmap");

    render_result result = render(request);
    assert(result.ok());
    assert(result.canvas.width == 400);
    assert(result.canvas.height == 100);

    // mirrored: normal inset on the right, inverted on the left
    assert(result.canvas.at(349, 50) == 255);
    assert(result.canvas.at(49, 50) == 0);
    assert(result.canvas.at(200, 50) == 0);

    fs::remove(path);
}

//////////////////////////////////////////////////////////////////////

static void test_gerber()
{
    fs::path path = temp_file("square.gbr");
    std::string text =
        "%FSLAX26Y26*%\n"
        "%MOMM*%\n"
        "G36*X0Y0D02*X10000000Y0D01*X10000000Y-10000000D01*X0Y-10000000D01*X0Y0D01*G37*\n"
        "M02*\n";
    write_bytes(path, text.data(), text.size());

    render_request request;
    request.display = display_geometry{}.with_pixels(400, 300).with_physical(40, 30);
    request.source = gerber_request{ path, pcb_placement_spec{ 20, 20 }, false, false };
    assert(std::string(request.tool_name()) == "gerber");

    render_result result = render(request);
    assert(result.ok());
    assert(result.canvas.width == 400);
    assert(result.canvas.height == 300);
    assert(result.canvas.at(150, 100) == 0);
    assert(result.canvas.at(250, 100) == 255);

    // the board is checked, the circles are not
    request.circles.diameter_mm = 0;
    assert(render(request).ok());

    // broken file reports where it stopped
    std::string broken = "%FSLAX26Y26*%\n%MOMM*%\nQ99*\n";
    write_bytes(path, broken.data(), broken.size());
    result = render(request);
    assert(!result.ok());
    assert(result.error.error_code == error_syntax_error);
    assert(result.error.line_number == 3);
    assert(result.error.filename == path.string());

    // one stray coordinate 2m away is an error, not an allocation
    std::string stray =
        "%FSLAX36Y36*%\n"
        "%MOMM*%\n"
        "G36*X0Y0D02*X2000000000Y0D01*X2000000000Y2000000000D01*X0Y2000000000D01*X0Y0D01*G37*\n"
        "M02*\n";
    write_bytes(path, stray.data(), stray.size());
    result = render(request);
    assert(!result.ok());
    assert(result.error.error_code == error_raster_too_large);
    assert(result.canvas.empty());

    fs::remove(path);
}

//////////////////////////////////////////////////////////////////////

static void test_gds()
{
    fs::path path = temp_file("square.gds");

    gds_writer w;
    w.library();
    w.cell("CHILD");
    w.boundary(4, -10000000, -10000000, 10000000, 10000000);
    w.end_cell();
    w.cell("TOP");
    w.sref("CHILD", 0, 0);
    w.boundary(2, -1000000, -1000000, 1000000, 1000000);
    w.end_cell();
    w.end_library();
    write_bytes(path, w.bytes.data(), w.bytes.size());

    // defaults: top cell, lowest layer
    render_request request = small_panel();
    request.source = gds_request{ path, "", std::nullopt };
    render_result result = render(request);
    assert(result.ok());
    assert(result.canvas.at(349, 50) == 255);
    assert(result.canvas.at(349 - 5, 50) == 0);

    request.source = gds_request{ path, "TOP", 4 };
    result = render(request);
    assert(result.ok());
    assert(result.canvas.at(349 - 5, 50) == 255);

    request.source = gds_request{ path, "NOPE", 4 };
    result = render(request);
    assert(result.error.error_code == error_cell_not_found);
    assert(result.error.message.find("NOPE") != std::string::npos);

    request.source = gds_request{ path, "TOP", 9 };
    result = render(request);
    assert(result.error.error_code == error_no_geometry_on_layer);
    assert(result.error.message.find('9') != std::string::npos);

    fs::remove(path);
}

//////////////////////////////////////////////////////////////////////

static void test_failures()
{
    render_request request = small_panel();
    request.source = bitmap_request{ temp_file("missing.png"), 128 };

    render_result result = render(request);
    assert(!result.ok());
    assert(result.error.error_code == error_file_not_found);
    assert(result.canvas.empty());

    // configuration is checked before the file is touched
    request.display = request.display.with_pixels(0, 100);
    std::string message;
    assert(validate_request(request, message) == error_invalid_configuration);
    result = render(request);
    assert(result.error.error_code == error_invalid_configuration);
    assert(!result.error.message.empty());

    request = small_panel();
    request.source = bitmap_request{ temp_file("missing.png"), 300 };
    assert(render(request).error.error_code == error_invalid_configuration);

    request.source = gds_request{ temp_file("missing.gds"), "", std::nullopt };
    assert(render(request).error.error_code == error_file_not_found);
}

//////////////////////////////////////////////////////////////////////

int main()
{
    test_bitmap();
    test_gerber();
    test_gds();
    test_failures();
    return 0;
}
