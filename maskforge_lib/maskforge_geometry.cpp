//////////////////////////////////////////////////////////////////////

#include <cmath>

#include "maskforge_math.h"
#include "maskforge_image.h"
#include "maskforge_geometry.h"

LOG_CONTEXT("geometry", verbose);

namespace maskforge_lib
{
    //////////////////////////////////////////////////////////////////////

    int display_geometry::to_pixels_x(double mm) const
    {
        return round_to_int(mm * px_per_mm_x());
    }

    //////////////////////////////////////////////////////////////////////

    int display_geometry::to_pixels_y(double mm) const
    {
        return round_to_int(mm * px_per_mm_y());
    }

    //////////////////////////////////////////////////////////////////////

    int display_geometry::truncate_pixels_x(double mm) const
    {
        return truncate_to_int(mm * px_per_mm_x());
    }

    //////////////////////////////////////////////////////////////////////

    int display_geometry::truncate_pixels_y(double mm) const
    {
        return truncate_to_int(mm * px_per_mm_y());
    }

    //////////////////////////////////////////////////////////////////////

    int display_geometry::ceil_pixels_x(double mm) const
    {
        return static_cast<int>(std::ceil(mm * px_per_mm_x()));
    }

    //////////////////////////////////////////////////////////////////////

    int display_geometry::ceil_pixels_y(double mm) const
    {
        return static_cast<int>(std::ceil(mm * px_per_mm_y()));
    }

    //////////////////////////////////////////////////////////////////////

    display_geometry display_geometry::with_pixels(int width, int height) const
    {
        display_geometry d = *this;
        d.pixel_width = width;
        d.pixel_height = height;
        return d;
    }

    //////////////////////////////////////////////////////////////////////

    display_geometry display_geometry::with_physical(double width_mm, double height_mm) const
    {
        display_geometry d = *this;
        d.physical_width_mm = width_mm;
        d.physical_height_mm = height_mm;
        return d;
    }

    //////////////////////////////////////////////////////////////////////

    std::string display_geometry::to_string() const
    {
        return fmt::format("DISPLAY: {}x{}px, {:g}x{:g}mm", pixel_width, pixel_height, physical_width_mm, physical_height_mm);
    }

    //////////////////////////////////////////////////////////////////////

    std::string circle_projection_spec::to_string() const
    {
        return fmt::format("CIRCLES: diameter {:g}mm, offset {:g}mm", diameter_mm, offset_from_edge_mm);
    }

    //////////////////////////////////////////////////////////////////////

    char const *overflow_policy_name(overflow_policy policy)
    {
        switch(policy) {
        case overflow_clip:
            return "clip";
        case overflow_error:
            return "error";
        }
        return "?";
    }

    //////////////////////////////////////////////////////////////////////

    bool overflow_policy_from_name(std::string const &name, overflow_policy *policy)
    {
        std::string n = maskforge_util::to_lowercase(name);
        if(n == "clip") {
            *policy = overflow_clip;
            return true;
        }
        if(n == "error") {
            *policy = overflow_error;
            return true;
        }
        return false;
    }

    //////////////////////////////////////////////////////////////////////

    std::string pcb_placement_spec::to_string() const
    {
        return fmt::format("PCB: {:g}x{:g}mm, overflow {}", pcb_width_mm, pcb_height_mm, overflow_policy_name(overflow));
    }

    //////////////////////////////////////////////////////////////////////

    std::string circle_layout::to_string() const
    {
        return fmt::format("RADIUS: {}x{}, LEFT: {}, RIGHT: {}, Y: {}", radius_x, radius_y, left_center_x, right_center_x, center_y);
    }

    //////////////////////////////////////////////////////////////////////

    circle_layout layout_circles(display_geometry const &display, circle_projection_spec const &circles)
    {
        circle_layout l;
        double radius_mm = circles.diameter_mm / 2.0;
        l.radius_x = display.truncate_pixels_x(radius_mm);
        l.radius_y = display.truncate_pixels_y(radius_mm);
        l.left_center_x = display.truncate_pixels_x(circles.offset_from_edge_mm);
        l.right_center_x = display.truncate_pixels_x(display.physical_width_mm - circles.offset_from_edge_mm);
        l.center_y = display.pixel_height / 2;
        return l;
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code validate_display(display_geometry const &display, std::string &message)
    {
        if(display.pixel_width <= 0 || display.pixel_height <= 0) {
            message = fmt::format("Display pixel size must be positive, got {}x{}", display.pixel_width, display.pixel_height);
        } else if(!image_size_ok(display.pixel_width, display.pixel_height)) {
            message = fmt::format("Display pixel size {}x{} is too large", display.pixel_width, display.pixel_height);
        } else if(!(display.physical_width_mm > 0) || !(display.physical_height_mm > 0)) {
            message = fmt::format("Display physical size must be positive, got {:g}x{:g}mm", display.physical_width_mm, display.physical_height_mm);
        } else {
            return ok;
        }
        LOG_ERROR("{}", message);
        return error_invalid_configuration;
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code validate_circles(circle_projection_spec const &circles, display_geometry const &display, std::string &message)
    {
        CHECK(validate_display(display, message));

        if(!(circles.diameter_mm > 0)) {
            message = fmt::format("Circle diameter must be positive, got {:g}mm", circles.diameter_mm);
            LOG_ERROR("{}", message);
            return error_invalid_configuration;
        }

        if(circles.offset_from_edge_mm < 0) {
            message = fmt::format("Circle offset must not be negative, got {:g}mm", circles.offset_from_edge_mm);
            LOG_ERROR("{}", message);
            return error_invalid_configuration;
        }

        circle_layout layout = layout_circles(display, circles);

        if(layout.radius_x <= 0 || layout.radius_y <= 0) {
            message = fmt::format("Circle diameter {:g}mm is less than one pixel on this display", circles.diameter_mm);
            LOG_ERROR("{}", message);
            return error_invalid_configuration;
        }

        // lenient: an inset hanging off the canvas is clipped, not refused
        if(circles.offset_from_edge_mm + circles.diameter_mm / 2 > display.physical_width_mm / 2 || circles.offset_from_edge_mm < circles.diameter_mm / 2 ||
           circles.diameter_mm > display.physical_height_mm) {
            LOG_WARNING("Circles ({}) do not fit on the display ({}), they will be clipped", circles, display);
        }

        if(layout.radius_x != layout.radius_y) {
            LOG_VERBOSE("Pixels are not square, insets are {}x{} ellipses", layout.width(), layout.height());
        }
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code validate_pcb(pcb_placement_spec const &pcb, std::string &message)
    {
        if(!(pcb.pcb_width_mm > 0) || !(pcb.pcb_height_mm > 0)) {
            message = fmt::format("PCB size must be positive, got {:g}x{:g}mm", pcb.pcb_width_mm, pcb.pcb_height_mm);
            LOG_ERROR("{}", message);
            return error_invalid_configuration;
        }
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code validate_threshold(int threshold, std::string &message)
    {
        if(threshold < 0 || threshold > max_threshold) {
            message = fmt::format("Threshold must be 0..{}, got {}", max_threshold, threshold);
            LOG_ERROR("{}", message);
            return error_invalid_configuration;
        }
        return ok;
    }

}    // namespace maskforge_lib
