//////////////////////////////////////////////////////////////////////
// 8 bit single channel images and the handful of operations the compositors need

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "maskforge_2d.h"

namespace maskforge_lib
{
    //////////////////////////////////////////////////////////////////////

    struct gray_image
    {
        int width{};
        int height{};
        std::vector<uint8_t> pixels;

        gray_image() = default;

        gray_image(int w, int h, uint8_t fill_value = 0) : width(w), height(h), pixels(static_cast<size_t>(w) * static_cast<size_t>(h), fill_value)
        {
        }

        bool empty() const
        {
            return width <= 0 || height <= 0;
        }

        uint8_t at(int x, int y) const
        {
            return pixels[static_cast<size_t>(y) * width + x];
        }

        uint8_t &at(int x, int y)
        {
            return pixels[static_cast<size_t>(y) * width + x];
        }

        uint8_t *row(int y)
        {
            return pixels.data() + static_cast<size_t>(y) * width;
        }

        uint8_t const *row(int y) const
        {
            return pixels.data() + static_cast<size_t>(y) * width;
        }

        bool operator==(gray_image const &o) const = default;

        std::string to_string() const
        {
            return fmt::format("{}x{}", width, height);
        }
    };

    //////////////////////////////////////////////////////////////////////
    // the largest raster anything here will allocate, per side and in total

    int constexpr max_image_side = 1 << 16;
    size_t constexpr max_image_pixels = size_t{ 1 } << 30;

    // doubles, so a size which has already overflowed an int is still caught
    bool image_size_ok(double width, double height);

    //////////////////////////////////////////////////////////////////////

    void fill(gray_image &image, uint8_t value);

    // left-right flip
    void mirror_horizontal(gray_image &image);

    // 255 - v
    void invert(gray_image &image);

    // v >= threshold ? 255 : 0
    void threshold(gray_image &image, int threshold_value);

    gray_image crop(gray_image const &image, int x, int y, int w, int h);

    // largest centred square, trimmed symmetrically from the longer axis
    gray_image center_square_crop(gray_image const &image);

    // Lanczos over an 8x8 neighbourhood
    gray_image resize_lanczos(gray_image const &image, int new_width, int new_height);

    // 255 inside the ellipse inscribed in [0, 0, w, h], 0 outside, no antialiasing
    gray_image ellipse_mask(int w, int h);

    //////////////////////////////////////////////////////////////////////
    // copy src into dst with its top left at (x, y), where mask (if any) is non-zero
    // anything falling outside dst is dropped, returns true if that happened

    bool paste(gray_image &dst, gray_image const &src, int x, int y, gray_image const *mask = nullptr);

    //////////////////////////////////////////////////////////////////////
    // solid fill of one or more contours (even-odd, so a contour inside another is a hole)
    // vertices are in pixel units, x right, y down, the centre of pixel (0, 0) is at (0.5, 0.5)

    void fill_polygons(gray_image &image, std::vector<std::vector<maskforge_2d::vec2d>> const &contours, uint8_t value);

    void fill_polygon(gray_image &image, std::vector<maskforge_2d::vec2d> const &contour, uint8_t value);

}    // namespace maskforge_lib

MASKFORGE_MAKE_FORMATTER(maskforge_lib::gray_image);
