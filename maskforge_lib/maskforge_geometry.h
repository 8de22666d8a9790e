//////////////////////////////////////////////////////////////////////
// physical (mm) to display pixel mapping, and the per tool placement specs

#pragma once

#include <string>

#include "maskforge_error.h"
#include "maskforge_util.h"

namespace maskforge_lib
{
    //////////////////////////////////////////////////////////////////////
    // the exposure panel, immutable: the with_ functions return a new one

    struct display_geometry
    {
        int pixel_width{ 13312 };
        int pixel_height{ 5120 };
        double physical_width_mm{ 223.642 };
        double physical_height_mm{ 126.48 };

        double px_per_mm_x() const
        {
            return pixel_width / physical_width_mm;
        }

        double px_per_mm_y() const
        {
            return pixel_height / physical_height_mm;
        }

        // offsets: nearest
        int to_pixels_x(double mm) const;
        int to_pixels_y(double mm) const;

        // radii and centres: toward zero
        int truncate_pixels_x(double mm) const;
        int truncate_pixels_y(double mm) const;

        // canvas sizes: up
        int ceil_pixels_x(double mm) const;
        int ceil_pixels_y(double mm) const;

        display_geometry with_pixels(int width, int height) const;
        display_geometry with_physical(double width_mm, double height_mm) const;

        std::string to_string() const;
    };

    //////////////////////////////////////////////////////////////////////

    struct circle_projection_spec
    {
        double diameter_mm{ 100.0 };
        double offset_from_edge_mm{ 60.0 };

        std::string to_string() const;
    };

    //////////////////////////////////////////////////////////////////////

    enum overflow_policy
    {
        overflow_clip = 0,
        overflow_error = 1
    };

    char const *overflow_policy_name(overflow_policy policy);

    bool overflow_policy_from_name(std::string const &name, overflow_policy *policy);

    //////////////////////////////////////////////////////////////////////

    struct pcb_placement_spec
    {
        double pcb_width_mm{ 160.0 };
        double pcb_height_mm{ 100.0 };
        overflow_policy overflow{ overflow_clip };

        std::string to_string() const;
    };

    //////////////////////////////////////////////////////////////////////
    // where the two insets land, in canvas pixels, before the final mirror

    struct circle_layout
    {
        int radius_x{};
        int radius_y{};
        int left_center_x{};
        int right_center_x{};
        int center_y{};

        int width() const
        {
            return radius_x * 2;
        }

        int height() const
        {
            return radius_y * 2;
        }

        std::string to_string() const;
    };

    circle_layout layout_circles(display_geometry const &display, circle_projection_spec const &circles);

    //////////////////////////////////////////////////////////////////////
    // validation happens before any rendering so nothing below has to guard against zeros

    int constexpr max_threshold = 254;

    maskforge_error_code validate_display(display_geometry const &display, std::string &message);

    maskforge_error_code validate_circles(circle_projection_spec const &circles, display_geometry const &display, std::string &message);

    maskforge_error_code validate_pcb(pcb_placement_spec const &pcb, std::string &message);

    maskforge_error_code validate_threshold(int threshold, std::string &message);

}    // namespace maskforge_lib

MASKFORGE_MAKE_FORMATTER(maskforge_lib::display_geometry);
MASKFORGE_MAKE_FORMATTER(maskforge_lib::circle_projection_spec);
MASKFORGE_MAKE_FORMATTER(maskforge_lib::pcb_placement_spec);
MASKFORGE_MAKE_FORMATTER(maskforge_lib::circle_layout);
