#include <cassert>
#include <cmath>
#include <string>

#include "maskforge_gerber.h"
#include "maskforge_adapters.h"

using namespace maskforge_lib;

//////////////////////////////////////////////////////////////////////

static bool near(double a, double b, double tolerance = 0.01)
{
    return fabs(a - b) <= tolerance;
}

//////////////////////////////////////////////////////////////////////
// the raster pixel covering a board position

static uint8_t pixel_at(layer_raster const &layer, double x_mm, double y_mm, double dots_per_mm = 10)
{
    int x = static_cast<int>(floor((x_mm - layer.min_x_mm) * dots_per_mm));
    int y = static_cast<int>(floor((layer.max_y_mm - y_mm) * dots_per_mm));
    return layer.image.at(x, y);
}

//////////////////////////////////////////////////////////////////////

static maskforge_error_code parse(gerber_file &g, std::string const &text)
{
    return g.parse_memory(text.data(), text.size());
}

//////////////////////////////////////////////////////////////////////

static char const *header = "%FSLAX26Y26*%\n%MOMM*%\n";

//////////////////////////////////////////////////////////////////////

static void test_region()
{
    gerber_file g;
    std::string text = std::string(header) +
                       "G36*\n"
                       "X0Y0D02*\n"
                       "G01X10000000Y0D01*\n"
                       "X10000000Y5000000D01*\n"
                       "X0Y5000000D01*\n"
                       "X0Y0D01*\n"
                       "G37*\n"
                       "M02*\n";
    assert(parse(g, text) == ok);
    assert(g.nets.size() == 1);
    assert(g.nets[0].net_type == net_type_region);
    assert(g.unit == unit_millimeter);

    layer_raster layer;
    assert(rasterize_gerber(g, 10, layer) == ok);
    assert(layer.image.width == 100);
    assert(layer.image.height == 50);
    assert(near(layer.min_x_mm, 0));
    assert(near(layer.max_y_mm, 5));
    assert(near(layer.width_mm, 10));
    assert(near(layer.height_mm, 5));
    assert(layer.image.at(50, 25) == 0);
    assert(layer.image.at(0, 0) == 0);
    assert(layer.image.at(99, 49) == 0);
}

//////////////////////////////////////////////////////////////////////

static void test_flash_and_clear_polarity()
{
    gerber_file g;
    std::string text = std::string(header) +
                       "%ADD10C,2*%\n"
                       "G36*X0Y0D02*X10000000Y0D01*X10000000Y10000000D01*X0Y10000000D01*X0Y0D01*G37*\n"
                       "%LPC*%\n"
                       "D10*\n"
                       "X5000000Y5000000D03*\n"
                       "M02*\n";
    assert(parse(g, text) == ok);
    assert(g.nets.size() == 2);
    assert(g.nets[1].net_type == net_type_flash);
    assert(g.nets[1].polarity == polarity_clear);

    layer_raster layer;
    assert(rasterize_gerber(g, 10, layer) == ok);
    assert(layer.image.width == 100);
    assert(pixel_at(layer, 5.05, 5.05) == 255);
    assert(pixel_at(layer, 1, 1) == 0);
    assert(pixel_at(layer, 5.05, 6.5) == 0);
}

//////////////////////////////////////////////////////////////////////

static void test_circle_stroke()
{
    gerber_file g;
    std::string text = std::string(header) +
                       "%ADD10C,1*%\n"
                       "D10*\n"
                       "X0Y0D02*\n"
                       "G01X10000000D01*\n"
                       "M02*\n";
    assert(parse(g, text) == ok);
    assert(g.nets.size() == 1);
    assert(g.nets[0].net_type == net_type_stroke);

    layer_raster layer;
    assert(rasterize_gerber(g, 10, layer) == ok);
    assert(near(layer.min_x_mm, -0.5));
    assert(near(layer.max_y_mm, 0.5));
    assert(near(layer.width_mm, 11));
    assert(near(layer.height_mm, 1));
    assert(pixel_at(layer, 5, 0) == 0);
    assert(pixel_at(layer, -0.45, 0.45) == 255);
}

//////////////////////////////////////////////////////////////////////

static void test_rectangle_stroke()
{
    gerber_file g;
    std::string text = std::string(header) +
                       "%ADD11R,2X1*%\n"
                       "D11*\n"
                       "X0Y0D02*\n"
                       "X0Y10000000D01*\n"
                       "M02*\n";
    assert(parse(g, text) == ok);

    layer_raster layer;
    assert(rasterize_gerber(g, 10, layer) == ok);
    assert(near(layer.min_x_mm, -1));
    assert(near(layer.max_y_mm, 10.5));
    assert(near(layer.width_mm, 2));
    assert(near(layer.height_mm, 11));
}

//////////////////////////////////////////////////////////////////////

static void test_arc()
{
    gerber_file g;
    std::string text = std::string(header) +
                       "%ADD10C,1*%\n"
                       "D10*\n"
                       "G75*\n"
                       "X10000000Y0D02*\n"
                       "G03X0Y10000000I-10000000J0D01*\n"
                       "M02*\n";
    assert(parse(g, text) == ok);
    assert(g.nets.size() == 1);
    gerber_net const &net = g.nets[0];
    assert(net.interpolation == interpolation_counterclockwise_circular);
    assert(near(net.arc.radius, 10));
    assert(near(net.arc.sweep_angle(), 90));

    layer_raster layer;
    assert(rasterize_gerber(g, 10, layer) == ok);
    assert(near(layer.min_x_mm, -0.5));
    assert(near(layer.max_y_mm, 10.5));
    assert(near(layer.width_mm, 11));
    assert(near(layer.height_mm, 11));

    // on the arc at 45 degrees, and the hollow middle
    assert(pixel_at(layer, 7.07, 7.07) == 0);
    assert(pixel_at(layer, 2.5, 2.5) == 255);
}

//////////////////////////////////////////////////////////////////////

static void test_macros()
{
    gerber_file g;
    std::string text = std::string(header) +
                       "%AMBOX*\n"
                       "0 a centred box*\n"
                       "21,1,4,2,0,0,0*%\n"
                       "%AMVAR*\n"
                       "$2=$1x2*\n"
                       "1,1,$2,0,0*%\n"
                       "%ADD12BOX*%\n"
                       "%ADD13VAR,1.5*%\n"
                       "D12*\n"
                       "X0Y0D03*\n"
                       "D13*\n"
                       "X20000000Y0D03*\n"
                       "M02*\n";
    assert(parse(g, text) == ok);
    assert(g.aperture_macros.size() == 2);
    assert(g.nets.size() == 2);

    layer_raster layer;
    assert(rasterize_gerber(g, 10, layer) == ok);

    // box -2..2 by -1..1, circle of diameter 3 at 20
    assert(near(layer.min_x_mm, -2));
    assert(near(layer.max_y_mm, 1.5));
    assert(near(layer.width_mm, 23.5));
    assert(near(layer.height_mm, 3));
}

//////////////////////////////////////////////////////////////////////

static void test_thermal_has_a_hole()
{
    gerber_file g;
    std::string text = std::string(header) +
                       "%AMTHERM*\n"
                       "7,0,0,4,2,0.5,0*%\n"
                       "%ADD14THERM*%\n"
                       "D14*\n"
                       "X0Y0D03*\n"
                       "M02*\n";
    assert(parse(g, text) == ok);

    layer_raster layer;
    assert(rasterize_gerber(g, 10, layer) == ok);
    assert(near(layer.width_mm, 4));
    assert(pixel_at(layer, 0.05, 0.05) == 255);
    // the ring between the gaps
    assert(pixel_at(layer, 1.06, 1.06) == 0);
    assert(pixel_at(layer, -1.06, -1.06) == 0);
    // in a gap
    assert(pixel_at(layer, 0.05, 1.5) == 255);
    assert(pixel_at(layer, -1.5, 0.05) == 255);
}

//////////////////////////////////////////////////////////////////////

static void test_step_and_repeat()
{
    gerber_file g;
    std::string text = std::string(header) +
                       "%ADD10C,1*%\n"
                       "%SRX3Y2I5J4*%\n"
                       "D10*\n"
                       "X0Y0D03*\n"
                       "%SR*%\n"
                       "M02*\n";
    assert(parse(g, text) == ok);
    assert(g.nets.size() == 6);

    layer_raster layer;
    assert(rasterize_gerber(g, 10, layer) == ok);
    assert(near(layer.min_x_mm, -0.5));
    assert(near(layer.max_y_mm, 4.5));
    assert(near(layer.width_mm, 11));
    assert(near(layer.height_mm, 5));
}

//////////////////////////////////////////////////////////////////////

static void test_inch_units_and_trailing_defaults()
{
    gerber_file g;
    std::string text =
        "%FSLAX24Y24*%\n"
        "%MOIN*%\n"
        "%ADD10C,0.1*%\n"
        "D10*\n"
        "X10000Y0D03*\n"
        "M02*\n";
    assert(parse(g, text) == ok);
    assert(g.unit == unit_inch);
    assert(near(g.nets[0].end.x, 25.4, 1e-9));

    layer_raster layer;
    assert(rasterize_gerber(g, 10, layer) == ok);
    assert(near(layer.min_x_mm, 25.4 - 1.27));
    assert(near(layer.width_mm, 2.54));
}

//////////////////////////////////////////////////////////////////////

static void test_errors()
{
    // undefined aperture, nothing drawn
    {
        gerber_file g;
        std::string text = std::string(header) + "D99*\nX0Y0D03*\nM02*\n";
        assert(parse(g, text) == ok);
        assert(g.nets.empty());
        layer_raster layer;
        assert(rasterize_gerber(g, 10, layer) == error_empty_layer);
    }

    // macro that was never defined
    {
        gerber_file g;
        std::string text = std::string(header) + "%ADD10NOPE*%\nM02*\n";
        assert(parse(g, text) == error_unknown_aperture_macro);
    }

    // garbage
    {
        gerber_file g;
        std::string text = std::string(header) + "Q123*\n";
        assert(parse(g, text) == error_syntax_error);
    }

    // aperture numbers start at 10
    {
        gerber_file g;
        std::string text = std::string(header) + "%ADD5C,1*%\n";
        assert(parse(g, text) == error_invalid_aperture_definition);
    }

    // unknown extended commands are skipped
    {
        gerber_file g;
        std::string text = std::string(header) + "%XYZZY*%\n%ADD10C,1*%\nD10*\nX0Y0D03*\nM02*\n";
        assert(parse(g, text) == ok);
        assert(g.nets.size() == 1);
    }

    // attributes are accepted and ignored
    {
        gerber_file g;
        std::string text = std::string(header) + "%TF.FileFunction,Copper,L1,Top*%\n%TA.AperFunction,SMDPad*%\n%ADD10C,1*%\n%TD*%\nD10*\nX0Y0D03*\nM02*\n";
        assert(parse(g, text) == ok);
        assert(g.nets.size() == 1);
    }
}

//////////////////////////////////////////////////////////////////////

static void test_coordinate_range()
{
    // ten digits still fit an int
    {
        gerber_file g;
        std::string text = "%FSLAX46Y46*%\n%MOMM*%\n%ADD10C,1*%\nD10*\nX2000000000Y0D03*\nM02*\n";
        assert(parse(g, text) == ok);
        assert(g.nets.size() == 1);
    }

    // 4.6 above 2147mm does not
    {
        gerber_file g;
        std::string text = "%FSLAX46Y46*%\n%MOMM*%\n%ADD10C,1*%\nD10*\nX3000000000Y0D03*\nM02*\n";
        assert(parse(g, text) == error_invalid_number);
    }

    // trailing zeros pushing it out of range
    {
        gerber_file g;
        std::string text = "%FSTAX46Y46*%\n%MOMM*%\n%ADD10C,1*%\nD10*\nX9Y0D03*\nM02*\n";
        assert(parse(g, text) == error_invalid_number);
    }
}

//////////////////////////////////////////////////////////////////////
// a stray far away coordinate is refused before anything is allocated

static void test_oversized_extent()
{
    gerber_file g;
    std::string text = "%FSLAX36Y36*%\n%MOMM*%\n"
                       "G36*X0Y0D02*X2000000000Y0D01*X2000000000Y2000000000D01*X0Y2000000000D01*X0Y0D01*G37*\n"
                       "M02*\n";
    assert(parse(g, text) == ok);

    layer_raster layer;
    assert(rasterize_gerber(g, 119, layer) == error_raster_too_large);
    assert(layer.image.empty());

    // the same board at a low density is fine
    assert(rasterize_gerber(g, 0.5, layer) == ok);
    assert(layer.image.width == 1000);
}

//////////////////////////////////////////////////////////////////////

static void test_canvas()
{
    // 10mm square below the X axis, so its top edge is the board's top edge
    gerber_file g;
    std::string text = std::string(header) + "G36*X0Y0D02*X10000000Y0D01*X10000000Y-10000000D01*X0Y-10000000D01*X0Y0D01*G37*M02*\n";
    assert(parse(g, text) == ok);

    display_geometry display = display_geometry{}.with_pixels(400, 300).with_physical(40, 30);
    pcb_placement_spec pcb{ 20, 20 };
    assert(gerber_dots_per_mm(display) == 20);

    gray_image canvas;
    assert(gerber_to_canvas(g, display, pcb, false, false, canvas) == ok);
    assert(canvas.width == 400);
    assert(canvas.height == 300);

    // board at (100, 50) size 200x200, square in its top left 100x100
    assert(canvas.at(50, 100) == 0);
    assert(canvas.at(150, 100) == 0);
    assert(canvas.at(250, 100) == 255);
    assert(canvas.at(150, 200) == 255);

    gray_image mirrored;
    assert(gerber_to_canvas(g, display, pcb, true, false, mirrored) == ok);
    assert(mirrored.at(150, 100) == 255);
    assert(mirrored.at(250, 100) == 0);
}

//////////////////////////////////////////////////////////////////////

int main()
{
    test_region();
    test_flash_and_clear_polarity();
    test_circle_stroke();
    test_rectangle_stroke();
    test_arc();
    test_macros();
    test_thermal_has_a_hole();
    test_step_and_repeat();
    test_inch_units_and_trailing_defaults();
    test_errors();
    test_coordinate_range();
    test_oversized_extent();
    test_canvas();
    return 0;
}
