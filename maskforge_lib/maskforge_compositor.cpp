//////////////////////////////////////////////////////////////////////

#include <algorithm>
#include <cmath>

#include "maskforge_math.h"
#include "maskforge_compositor.h"

LOG_CONTEXT("compositor", debug);

namespace maskforge_lib
{
    //////////////////////////////////////////////////////////////////////

    gray_image prepare_inset(gray_image const &source, circle_layout const &layout, std::optional<int> threshold_value, bool inverted)
    {
        gray_image image = source;

        if(threshold_value.has_value()) {
            threshold(image, threshold_value.value());
        }

        if(inverted) {
            invert(image);
        }
        return resize_lanczos(center_square_crop(image), layout.width(), layout.height());
    }

    //////////////////////////////////////////////////////////////////////

    namespace
    {
        // normal inset on the left, inverted on the right, both through the ellipse
        gray_image paste_insets(gray_image const &left, gray_image const &right, display_geometry const &display, circle_layout const &layout)
        {
            gray_image canvas(display.pixel_width, display.pixel_height, 0);
            gray_image mask = ellipse_mask(layout.width(), layout.height());

            struct placement
            {
                int center_x;
                gray_image const &inset;
            };

            placement const placements[] = { { layout.left_center_x, left }, { layout.right_center_x, right } };

            for(auto const &p : placements) {
                if(paste(canvas, p.inset, p.center_x - layout.radius_x, layout.center_y - layout.radius_y, &mask)) {
                    LOG_WARNING("Inset at x={} was clipped by the canvas edge", p.center_x);
                }
            }
            return canvas;
        }

    }    // namespace

    //////////////////////////////////////////////////////////////////////

    gray_image compose_dual_circle_unmirrored(gray_image const &source, display_geometry const &display, circle_projection_spec const &circles,
                                              std::optional<int> threshold_value)
    {
        circle_layout layout = layout_circles(display, circles);

        LOG_VERBOSE("{}", layout);

        gray_image left = prepare_inset(source, layout, threshold_value, false);
        gray_image right = prepare_inset(source, layout, threshold_value, true);
        return paste_insets(left, right, display, layout);
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code compose_dual_circle_sized(gray_image const &inset, display_geometry const &display, circle_projection_spec const &circles,
                                                   gray_image &canvas)
    {
        circle_layout layout = layout_circles(display, circles);

        if(inset.width != layout.width() || inset.height != layout.height()) {
            LOG_ERROR("Inset is {}, the layout needs {}x{}", inset, layout.width(), layout.height());
            return error_invalid_configuration;
        }

        gray_image right = inset;
        invert(right);
        canvas = paste_insets(inset, right, display, layout);
        mirror_horizontal(canvas);
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    gray_image compose_dual_circle(gray_image const &source, display_geometry const &display, circle_projection_spec const &circles,
                                   std::optional<int> threshold_value)
    {
        gray_image canvas = compose_dual_circle_unmirrored(source, display, circles, threshold_value);
        mirror_horizontal(canvas);
        return canvas;
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code compose_pcb_sub_canvas(layer_raster const &layer, display_geometry const &display, pcb_placement_spec const &pcb, bool mirror,
                                                bool inverted, gray_image &sub_canvas)
    {
        double board_w = ceil(pcb.pcb_width_mm * display.px_per_mm_x());
        double board_h = ceil(pcb.pcb_height_mm * display.px_per_mm_y());
        double layer_px_w = trunc(layer.width_mm * display.px_per_mm_x());
        double layer_px_h = trunc(layer.height_mm * display.px_per_mm_y());

        if(!image_size_ok(board_w, board_h) || !image_size_ok(std::max(layer_px_w, 1.0), std::max(layer_px_h, 1.0))) {
            LOG_ERROR("Board ({}) or layer ({}) is too large for the display density", pcb, layer);
            return error_raster_too_large;
        }

        int layer_w = std::max(display.truncate_pixels_x(layer.width_mm), 1);
        int layer_h = std::max(display.truncate_pixels_y(layer.height_mm), 1);

        gray_image resized = resize_lanczos(layer.image, layer_w, layer_h);

        sub_canvas = gray_image(display.ceil_pixels_x(pcb.pcb_width_mm), display.ceil_pixels_y(pcb.pcb_height_mm), 255);

        int offset_x = display.to_pixels_x(layer.min_x_mm);
        int offset_y = display.to_pixels_y(-layer.max_y_mm);

        LOG_VERBOSE("layer {}x{} at ({},{}) on board {}", layer_w, layer_h, offset_x, offset_y, sub_canvas);

        if(paste(sub_canvas, resized, offset_x, offset_y)) {
            if(pcb.overflow == overflow_error) {
                LOG_ERROR("Layer ({}) does not fit on the board ({})", layer, pcb);
                return error_layer_exceeds_pcb;
            }
            LOG_WARNING("Layer ({}) clipped by the board ({})", layer, pcb);
        }

        if(mirror) {
            mirror_horizontal(sub_canvas);
        }
        if(inverted) {
            invert(sub_canvas);
        }
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code compose_pcb_canvas(layer_raster const &layer, display_geometry const &display, pcb_placement_spec const &pcb, bool mirror,
                                            bool inverted, gray_image &canvas)
    {
        gray_image sub_canvas;
        CHECK(compose_pcb_sub_canvas(layer, display, pcb, mirror, inverted, sub_canvas));

        canvas = gray_image(display.pixel_width, display.pixel_height, 0);

        int x = floor_div(display.pixel_width - sub_canvas.width, 2);
        int y = floor_div(display.pixel_height - sub_canvas.height, 2);

        if(paste(canvas, sub_canvas, x, y)) {
            LOG_WARNING("Board ({}) is larger than the display ({}), clipped", pcb, display);
        }
        return ok;
    }

}    // namespace maskforge_lib
