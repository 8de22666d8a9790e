#include <cassert>
#include <filesystem>
#include <vector>

#include "maskforge_image.h"
#include "maskforge_image_io.h"

using namespace maskforge_lib;
using namespace maskforge_lib::maskforge_2d;

//////////////////////////////////////////////////////////////////////

static gray_image gradient(int w, int h)
{
    gray_image image(w, h);
    for(int y = 0; y < h; ++y) {
        for(int x = 0; x < w; ++x) {
            image.at(x, y) = static_cast<uint8_t>((x * 7 + y * 13) & 0xff);
        }
    }
    return image;
}

//////////////////////////////////////////////////////////////////////

static void test_mirror_and_invert()
{
    gray_image a = gradient(17, 9);
    gray_image b = a;

    mirror_horizontal(b);
    assert(b.at(0, 3) == a.at(16, 3));
    assert(b.at(8, 3) == a.at(8, 3));
    mirror_horizontal(b);
    assert(b == a);

    invert(b);
    assert(b.at(5, 5) == 255 - a.at(5, 5));
    invert(b);
    assert(b == a);
}

//////////////////////////////////////////////////////////////////////

static void test_threshold()
{
    gray_image a = gradient(32, 32);
    threshold(a, 128);
    for(uint8_t p : a.pixels) {
        assert(p == 0 || p == 255);
    }
    gray_image b = a;
    threshold(b, 128);
    assert(a == b);

    gray_image c(2, 1);
    c.at(0, 0) = 127;
    c.at(1, 0) = 128;
    threshold(c, 128);
    assert(c.at(0, 0) == 0);
    assert(c.at(1, 0) == 255);

    // zero lets everything through
    gray_image d(3, 1, 0);
    threshold(d, 0);
    assert(d.at(0, 0) == 255);
    assert(d.at(2, 0) == 255);
}

//////////////////////////////////////////////////////////////////////

static void test_size_limits()
{
    assert(image_size_ok(13312, 5120));
    assert(image_size_ok(max_image_side, 1));
    assert(!image_size_ok(max_image_side + 1, 1));
    assert(!image_size_ok(max_image_side, max_image_side));
    assert(!image_size_ok(0, 10));
    assert(!image_size_ok(238000, 238000));
    assert(!image_size_ok(1e12, 5));
}

//////////////////////////////////////////////////////////////////////

static void test_crop()
{
    gray_image wide = gradient(10, 4);
    gray_image square = center_square_crop(wide);
    assert(square.width == 4);
    assert(square.height == 4);
    assert(square.at(0, 0) == wide.at(3, 0));

    // odd difference, the extra row comes off the bottom
    gray_image tall = gradient(4, 7);
    square = center_square_crop(tall);
    assert(square.height == 4);
    assert(square.at(0, 0) == tall.at(0, 1));
}

//////////////////////////////////////////////////////////////////////

static void test_resize()
{
    gray_image flat(40, 30, 200);
    gray_image r = resize_lanczos(flat, 13, 71);
    assert(r.width == 13);
    assert(r.height == 71);
    for(uint8_t p : r.pixels) {
        assert(p == 200);
    }

    gray_image g = gradient(8, 8);
    assert(resize_lanczos(g, 8, 8) == g);
    assert(resize_lanczos(g, 0, 8).empty());
}

//////////////////////////////////////////////////////////////////////

static void test_ellipse_and_paste()
{
    gray_image mask = ellipse_mask(20, 10);
    assert(mask.at(10, 5) == 255);
    assert(mask.at(0, 0) == 0);
    assert(mask.at(19, 9) == 0);
    assert(mask.at(0, 5) == 255);
    assert(mask.at(10, 0) == 255);

    gray_image dst(30, 30, 7);
    gray_image src(20, 10, 99);
    bool clipped = paste(dst, src, 5, 5, &mask);
    assert(!clipped);
    assert(dst.at(15, 10) == 99);
    assert(dst.at(5, 5) == 7);

    clipped = paste(dst, src, 25, -5);
    assert(clipped);
    assert(dst.at(29, 0) == 99);
    assert(dst.at(24, 0) == 7);
}

//////////////////////////////////////////////////////////////////////

static void test_fill_polygons()
{
    gray_image image(20, 20, 0);

    // square with a square hole running the other way
    std::vector<std::vector<vec2d>> contours{ { { 2, 2 }, { 18, 2 }, { 18, 18 }, { 2, 18 } }, { { 6, 6 }, { 6, 14 }, { 14, 14 }, { 14, 6 } } };
    fill_polygons(image, contours, 255);
    assert(image.at(3, 3) == 255);
    assert(image.at(17, 17) == 255);
    assert(image.at(10, 10) == 0);
    assert(image.at(0, 0) == 0);
    assert(image.at(19, 10) == 0);

    // overlaps OR together when both run the same way
    gray_image both(20, 20, 0);
    fill_polygon(both, { { 0, 0 }, { 10, 0 }, { 10, 10 }, { 0, 10 } }, 255);
    fill_polygon(both, { { 5, 5 }, { 15, 5 }, { 15, 15 }, { 5, 15 } }, 255);
    assert(both.at(7, 7) == 255);
    assert(both.at(12, 12) == 255);
    assert(both.at(12, 2) == 0);

    // off the edge is clipped
    gray_image edge(4, 4, 0);
    fill_polygon(edge, { { -10, -10 }, { 10, -10 }, { 10, 10 }, { -10, 10 } }, 9);
    for(uint8_t p : edge.pixels) {
        assert(p == 9);
    }
}

//////////////////////////////////////////////////////////////////////

static void test_png_round_trip()
{
    std::filesystem::path path = std::filesystem::temp_directory_path() / "maskforge_test_image.png";
    gray_image a = gradient(23, 11);
    assert(save_png(path, a) == ok);

    gray_image b;
    assert(load_image(path, b) == ok);
    assert(a == b);
    std::filesystem::remove(path);

    assert(load_image(path, b) == error_file_not_found);

    uint8_t garbage[] = { 1, 2, 3, 4, 5, 6, 7, 8 };
    assert(decode_image(garbage, sizeof(garbage), b) == error_image_decode_failed);

    assert(save_png(path, gray_image{}) == error_png_write_failed);
}

//////////////////////////////////////////////////////////////////////

int main()
{
    test_mirror_and_invert();
    test_threshold();
    test_size_limits();
    test_crop();
    test_resize();
    test_ellipse_and_paste();
    test_fill_polygons();
    test_png_round_trip();
    return 0;
}
