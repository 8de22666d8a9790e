#include <cassert>
#include <cmath>
#include <string>

#include "maskforge_geometry.h"
#include "maskforge_2d.h"

using namespace maskforge_lib;
using namespace maskforge_lib::maskforge_2d;

//////////////////////////////////////////////////////////////////////

static void test_pixel_transform()
{
    display_geometry d = display_geometry{}.with_pixels(1000, 500).with_physical(100, 50);
    assert(d.px_per_mm_x() == 10.0);
    assert(d.px_per_mm_y() == 10.0);

    assert(d.to_pixels_x(12.34) == 123);
    assert(d.to_pixels_y(-5.0) == -50);
    assert(d.truncate_pixels_x(12.39) == 123);
    assert(d.truncate_pixels_y(-1.25) == -12);
    assert(d.ceil_pixels_x(12.31) == 124);
    assert(d.ceil_pixels_y(4.0) == 40);

    // nearest, ties to even
    assert(d.to_pixels_x(0.25) == 2);
    assert(d.to_pixels_x(0.75) == 8);

    // linear
    for(int mm = 0; mm < 100; mm += 7) {
        assert(d.to_pixels_x(mm * 2.0) == d.to_pixels_x(mm) * 2);
    }
}

//////////////////////////////////////////////////////////////////////

static void test_immutable_updates()
{
    display_geometry d;
    display_geometry e = d.with_pixels(100, 200);
    assert(d.pixel_width == 13312);
    assert(d.pixel_height == 5120);
    assert(e.pixel_width == 100);
    assert(e.pixel_height == 200);
    assert(e.physical_width_mm == d.physical_width_mm);

    display_geometry f = e.with_physical(10, 20);
    assert(e.physical_width_mm == d.physical_width_mm);
    assert(f.physical_width_mm == 10);
    assert(f.physical_height_mm == 20);
}

//////////////////////////////////////////////////////////////////////

static void test_default_layout()
{
    circle_layout l = layout_circles(display_geometry{}, circle_projection_spec{});
    assert(l.radius_x == 2976);
    assert(l.radius_y == 2024);
    assert(l.left_center_x == 3571);
    assert(l.right_center_x == 9740);
    assert(l.center_y == 2560);
    assert(l.width() == 5952);
    assert(l.height() == 4048);
}

//////////////////////////////////////////////////////////////////////

static void test_validation()
{
    std::string message;

    assert(validate_display(display_geometry{}, message) == ok);
    assert(validate_display(display_geometry{}.with_pixels(0, 100), message) == error_invalid_configuration);
    assert(!message.empty());
    assert(validate_display(display_geometry{}.with_physical(100, -1), message) == error_invalid_configuration);
    assert(validate_display(display_geometry{}.with_pixels(100000, 100), message) == error_invalid_configuration);

    circle_projection_spec circles;
    assert(validate_circles(circles, display_geometry{}, message) == ok);

    circles.diameter_mm = 0;
    assert(validate_circles(circles, display_geometry{}, message) == error_invalid_configuration);

    // less than a pixel
    circles.diameter_mm = 0.01;
    assert(validate_circles(circles, display_geometry{}, message) == error_invalid_configuration);

    // too big is only a warning
    circles.diameter_mm = 300;
    assert(validate_circles(circles, display_geometry{}, message) == ok);

    pcb_placement_spec pcb;
    assert(validate_pcb(pcb, message) == ok);
    pcb.pcb_height_mm = 0;
    assert(validate_pcb(pcb, message) == error_invalid_configuration);

    assert(validate_threshold(0, message) == ok);
    assert(validate_threshold(254, message) == ok);
    assert(validate_threshold(255, message) == error_invalid_configuration);
    assert(validate_threshold(-1, message) == error_invalid_configuration);
}

//////////////////////////////////////////////////////////////////////

static void test_overflow_names()
{
    overflow_policy p = overflow_clip;
    assert(overflow_policy_from_name("ERROR", &p));
    assert(p == overflow_error);
    assert(overflow_policy_from_name("clip", &p));
    assert(p == overflow_clip);
    assert(!overflow_policy_from_name("wrap", &p));
    assert(std::string(overflow_policy_name(overflow_error)) == "error");
}

//////////////////////////////////////////////////////////////////////

static void test_matrix()
{
    matrix m = matrix::multiply(matrix::rotate(90), matrix::translate({ 10, 0 }));
    vec2d p = transform_point(m, { 1, 0 });
    assert(fabs(p.x - 10) < 1e-9);
    assert(fabs(p.y - 1) < 1e-9);

    assert(matrix::scale({ 1, -1 }).is_reflection());
    assert(!matrix::rotate(45).is_reflection());

    std::vector<vec2d> square{ { 0, 0 }, { 1, 0 }, { 1, 1 }, { 0, 1 } };
    assert(signed_area(square) == 1.0);
}

//////////////////////////////////////////////////////////////////////

int main()
{
    test_pixel_transform();
    test_immutable_updates();
    test_default_layout();
    test_validation();
    test_overflow_names();
    test_matrix();
    return 0;
}
