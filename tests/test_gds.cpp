#include <cassert>
#include <cmath>
#include <string>
#include <vector>

#include "maskforge_gds.h"
#include "maskforge_adapters.h"

#include "gds_writer.h"

using namespace maskforge_lib;

//////////////////////////////////////////////////////////////////////

static bool near(double a, double b, double tolerance = 1e-3)
{
    return fabs(a - b) <= tolerance;
}

//////////////////////////////////////////////////////////////////////

static rect flattened_bounds(gds_library const &library, std::string const &cell, size_t *polygon_count = nullptr)
{
    gds_geometry geometry;
    assert(library.flatten(cell, geometry) == ok);
    if(polygon_count != nullptr) {
        *polygon_count = geometry.polygons.size();
    }
    return geometry.bounding_box();
}

//////////////////////////////////////////////////////////////////////

static void test_real8()
{
    uint8_t one[8] = { 0x41, 0x10, 0, 0, 0, 0, 0, 0 };
    assert(gds_decode_real8(one) == 1.0);

    uint8_t minus_one[8] = { 0xC1, 0x10, 0, 0, 0, 0, 0, 0 };
    assert(gds_decode_real8(minus_one) == -1.0);

    uint8_t zero[8] = {};
    assert(gds_decode_real8(zero) == 0.0);

    gds_writer w;
    w.put_real8(1e-9);
    w.put_real8(90);
    assert(fabs(gds_decode_real8(w.bytes.data()) - 1e-9) < 1e-20);
    assert(gds_decode_real8(w.bytes.data() + 8) == 90.0);
}

//////////////////////////////////////////////////////////////////////

static void test_boundary_and_units()
{
    gds_writer w;
    w.library("DEMO");
    w.cell("TOP");
    w.boundary(3, 0, 0, 2000, 1000);
    w.end_cell();
    w.end_library();

    gds_library library;
    assert(w.load(library) == ok);
    assert(library.name == "DEMO");
    assert(near(library.um_per_db(), 1e-3, 1e-12));
    assert(library.cells.size() == 1);

    gds_cell const *cell = library.find_cell("TOP");
    assert(cell != nullptr);
    assert(cell->elements.size() == 1);

    gds_element const &e = cell->elements[0];
    assert(e.element_type == gds_element_boundary);
    assert(e.layer == 3);
    assert(e.points.size() == 5);
    assert(near(e.points[1].x, 2));
    assert(near(e.points[2].y, 1));

    // closing point dropped
    assert(e.polygons.size() == 1);
    assert(e.polygons[0].contours.size() == 1);
    assert(e.polygons[0].contours[0].size() == 4);

    assert(library.find_cell("NOPE") == nullptr);
}

//////////////////////////////////////////////////////////////////////

static void test_box_and_paths()
{
    gds_writer w;
    w.library();
    w.cell("BOX");
    w.box(1, -1000, -1000, 1000, 1000);
    w.end_cell();
    w.cell("FLUSH");
    w.path(2, 0, 1000, { 0, 0, 10000, 0 });
    w.end_cell();
    w.cell("SQUARE");
    w.path(2, 2, 1000, { 0, 0, 10000, 0 });
    w.end_cell();
    w.cell("ROUND");
    w.path(2, 1, 1000, { 0, 0, 10000, 0 });
    w.end_cell();
    w.cell("DEGENERATE");
    w.path(2, 0, 1000, { 0, 0 });
    w.end_cell();
    w.end_library();

    gds_library library;
    assert(w.load(library) == ok);

    rect box = flattened_bounds(library, "BOX");
    assert(near(box.min_pos.x, -1));
    assert(near(box.max_pos.y, 1));

    rect flush = flattened_bounds(library, "FLUSH");
    assert(near(flush.min_pos.x, 0));
    assert(near(flush.max_pos.x, 10));
    assert(near(flush.min_pos.y, -0.5));
    assert(near(flush.max_pos.y, 0.5));

    // square ends run half the width past each end
    rect square = flattened_bounds(library, "SQUARE");
    assert(near(square.min_pos.x, -0.5));
    assert(near(square.max_pos.x, 10.5));

    rect round = flattened_bounds(library, "ROUND");
    assert(near(round.min_pos.x, -0.5, 0.01));
    assert(near(round.max_pos.x, 10.5, 0.01));

    size_t count = 99;
    flattened_bounds(library, "DEGENERATE", &count);
    assert(count == 0);
}

//////////////////////////////////////////////////////////////////////
// child is 1 x 2 um at the origin

static void test_references()
{
    gds_writer w;
    w.library();
    w.cell("CHILD");
    w.boundary(1, 0, 0, 1000, 2000);
    w.end_cell();
    w.cell("PLAIN");
    w.sref("CHILD", 10000, 0);
    w.end_cell();
    w.cell("ROTATED");
    w.sref("CHILD", 10000, 0, false, 1, 90);
    w.end_cell();
    w.cell("REFLECTED");
    w.sref("CHILD", 10000, 0, true, 1, 90);
    w.end_cell();
    w.cell("MAGNIFIED");
    w.sref("CHILD", 0, 0, false, 2, 0);
    w.end_cell();
    w.cell("NESTED");
    w.sref("PLAIN", 0, 5000);
    w.end_cell();
    w.end_library();

    gds_library library;
    assert(w.load(library) == ok);

    rect plain = flattened_bounds(library, "PLAIN");
    assert(near(plain.min_pos.x, 10));
    assert(near(plain.max_pos.x, 11));
    assert(near(plain.max_pos.y, 2));

    // (x, y) -> (-y, x) then moved
    rect rotated = flattened_bounds(library, "ROTATED");
    assert(near(rotated.min_pos.x, 8));
    assert(near(rotated.max_pos.x, 10));
    assert(near(rotated.min_pos.y, 0));
    assert(near(rotated.max_pos.y, 1));

    // reflected about X first
    rect reflected = flattened_bounds(library, "REFLECTED");
    assert(near(reflected.min_pos.x, 10));
    assert(near(reflected.max_pos.x, 12));
    assert(near(reflected.min_pos.y, 0));
    assert(near(reflected.max_pos.y, 1));

    rect magnified = flattened_bounds(library, "MAGNIFIED");
    assert(near(magnified.max_pos.x, 2));
    assert(near(magnified.max_pos.y, 4));

    rect nested = flattened_bounds(library, "NESTED");
    assert(near(nested.min_pos.x, 10));
    assert(near(nested.min_pos.y, 5));
    assert(near(nested.max_pos.y, 7));

    std::vector<std::string> top = library.top_cells();
    assert(top.size() == 4);
    assert(top[0] == "ROTATED");
    assert(top[3] == "NESTED");
}

//////////////////////////////////////////////////////////////////////

static void test_array_reference()
{
    gds_writer w;
    w.library();
    w.cell("CHILD");
    w.boundary(1, 0, 0, 1000, 2000);
    w.end_cell();
    w.cell("ARRAY");
    w.aref("CHILD", 3, 2, { 0, 0, 30000, 0, 0, 20000 });
    w.end_cell();
    w.end_library();

    gds_library library;
    assert(w.load(library) == ok);

    size_t count = 0;
    rect bounds = flattened_bounds(library, "ARRAY", &count);
    assert(count == 6);
    assert(near(bounds.min_pos.x, 0));
    assert(near(bounds.max_pos.x, 21));
    assert(near(bounds.max_pos.y, 12));
}

//////////////////////////////////////////////////////////////////////

static void test_reference_errors()
{
    gds_writer w;
    w.library();
    w.cell("A");
    w.sref("B", 0, 0);
    w.end_cell();
    w.cell("B");
    w.boundary(1, 0, 0, 10, 10);
    w.sref("A", 100, 0);
    w.end_cell();
    w.cell("DANGLING");
    w.sref("NOPE", 0, 0);
    w.end_cell();
    w.end_library();

    gds_library library;
    assert(w.load(library) == ok);

    gds_geometry geometry;
    assert(library.flatten("A", geometry) == error_gds_recursive_reference);
    assert(library.flatten("DANGLING", geometry) == error_gds_missing_reference);
    assert(library.flatten("MISSING", geometry) == error_cell_not_found);

    std::vector<std::string> top = library.top_cells();
    assert(top.size() == 1);
    assert(top[0] == "DANGLING");

    std::string cell;
    assert(gds_default_cell(library, cell) == ok);
    assert(cell == "DANGLING");
}

//////////////////////////////////////////////////////////////////////

static void test_discovery()
{
    gds_writer w;
    w.library();
    w.cell("ONE");
    w.boundary(5, 0, 0, 10, 10);
    w.boundary(1, 0, 0, 10, 10);
    w.end_cell();
    w.cell("TWO");
    w.path(3, 0, 10, { 0, 0, 100, 0 });
    w.end_cell();
    w.end_library();

    gds_library library;
    assert(w.load(library) == ok);

    std::vector<std::string> cells = library.list_cells();
    assert(cells.size() == 2);
    assert(cells[0] == "ONE");
    assert(cells[1] == "TWO");

    std::vector<int> layers = library.list_layers();
    assert(layers == (std::vector<int>{ 1, 3, 5 }));

    int layer = -1;
    assert(gds_default_layer(library, layer) == ok);
    assert(layer == 1);
}

//////////////////////////////////////////////////////////////////////

static void test_malformed_streams()
{
    gds_library library;

    assert(library.load(nullptr, 0) == error_empty_file);

    // no HEADER
    {
        gds_writer w;
        w.string(gds_libname, "LIB");
        w.end_library();
        assert(w.load(library) == error_bad_gds_structure);
    }

    // odd length
    {
        gds_writer w;
        w.library();
        w.bytes.insert(w.bytes.end(), { 0x00, 0x05, gds_endlib, 0x00, 0x00 });
        assert(w.load(library) == error_bad_gds_record);
    }

    // length runs past the end
    {
        gds_writer w;
        w.library();
        w.bytes.insert(w.bytes.end(), { 0x00, 0x20, gds_endlib, 0x00 });
        assert(w.load(library) == error_bad_gds_record);
    }

    // no ENDLIB
    {
        gds_writer w;
        w.library();
        w.cell("TOP");
        w.end_cell();
        assert(w.load(library) == error_unexpected_eof);
    }

    // element outside a structure
    {
        gds_writer w;
        w.library();
        w.boundary(1, 0, 0, 10, 10);
        w.end_library();
        assert(w.load(library) == error_bad_gds_structure);
    }

    // zero columns
    {
        gds_writer w;
        w.library();
        w.cell("TOP");
        w.aref("TOP", 0, 1, { 0, 0, 10, 0, 0, 10 });
        w.end_cell();
        w.end_library();
        assert(w.load(library) == error_bad_gds_record);
    }
}

//////////////////////////////////////////////////////////////////////
// 1 px per mm, a 20mm square on layer 1 and a marker on layer 2

static void test_rasterize()
{
    gds_writer w;
    w.library();
    w.cell("TOP");
    w.boundary(1, -10000000, -10000000, 10000000, 10000000);
    w.boundary(2, -1000000, -1000000, 1000000, 1000000);
    w.boundary(7, -1000000, -1000000, 1000000, 1000000, 3);
    w.end_cell();
    w.end_library();

    gds_library library;
    assert(w.load(library) == ok);

    display_geometry display = display_geometry{}.with_pixels(400, 100).with_physical(400, 100);
    circle_projection_spec circles{ 60, 50 };
    circle_layout layout = layout_circles(display, circles);

    gray_image raster;
    assert(rasterize_gds(library, "TOP", 1, display, layout, raster) == ok);
    assert(raster.width == layout.width());
    assert(raster.height == layout.height());
    assert(raster.at(layout.radius_x, layout.radius_y) == 255);
    assert(raster.at(layout.radius_x + 8, layout.radius_y - 8) == 255);
    assert(raster.at(layout.radius_x + 12, layout.radius_y) == 0);
    assert(raster.at(0, 0) == 0);

    gray_image marker;
    assert(rasterize_gds(library, "TOP", 2, display, layout, marker) == ok);
    assert(marker.at(layout.radius_x, layout.radius_y) == 255);
    assert(marker.at(layout.radius_x + 5, layout.radius_y) == 0);

    // layer 7 only has datatype 3
    assert(rasterize_gds(library, "TOP", 7, display, layout, raster) == error_no_geometry_on_layer);
    assert(rasterize_gds(library, "TOP", 9, display, layout, raster) == error_no_geometry_on_layer);

    gray_image canvas;
    assert(gds_to_canvas(library, "TOP", 1, display, circles, canvas) == ok);
    assert(canvas.width == 400);
    assert(canvas.height == 100);

    // mirrored, so the left circle lands where the right one was
    assert(canvas.at(399 - layout.left_center_x, layout.center_y) == 255);
    assert(canvas.at(399 - layout.right_center_x, layout.center_y) == 0);
    assert(canvas.at(0, 0) == 0);
}

//////////////////////////////////////////////////////////////////////

int main()
{
    test_real8();
    test_boundary_and_units();
    test_box_and_paths();
    test_references();
    test_array_reference();
    test_reference_errors();
    test_discovery();
    test_malformed_streams();
    test_rasterize();
    return 0;
}
