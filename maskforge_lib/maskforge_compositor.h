//////////////////////////////////////////////////////////////////////
// the two ways a source raster ends up on the display canvas

#pragma once

#include <optional>

#include "maskforge_error.h"
#include "maskforge_geometry.h"
#include "maskforge_image.h"

namespace maskforge_lib
{
    //////////////////////////////////////////////////////////////////////
    // a rendered Gerber layer and where it sits on the board (Y up)

    struct layer_raster
    {
        gray_image image;
        double min_x_mm{};
        double max_y_mm{};
        double width_mm{};
        double height_mm{};

        std::string to_string() const
        {
            return fmt::format("{} at ({:g},{:g}) size {:g}x{:g}mm", image, min_x_mm, max_y_mm, width_mm, height_mm);
        }
    };

    //////////////////////////////////////////////////////////////////////
    // one inset: threshold, invert, square crop, Lanczos to the layout size

    gray_image prepare_inset(gray_image const &source, circle_layout const &layout, std::optional<int> threshold_value, bool inverted);

    //////////////////////////////////////////////////////////////////////
    // both insets pasted through the elliptical mask, left normal and right inverted, no mirror

    gray_image compose_dual_circle_unmirrored(gray_image const &source, display_geometry const &display, circle_projection_spec const &circles,
                                              std::optional<int> threshold_value);

    //////////////////////////////////////////////////////////////////////
    // the above, then the whole canvas flipped left to right (always, it's the optics)

    gray_image compose_dual_circle(gray_image const &source, display_geometry const &display, circle_projection_spec const &circles,
                                   std::optional<int> threshold_value);

    //////////////////////////////////////////////////////////////////////
    // an inset rendered at exactly the layout size (the GDS raster): no threshold, crop or resample,
    // right copy inverted, pasted and mirrored as compose_dual_circle does

    maskforge_error_code compose_dual_circle_sized(gray_image const &inset, display_geometry const &display, circle_projection_spec const &circles,
                                                   gray_image &canvas);

    //////////////////////////////////////////////////////////////////////
    // layer resampled to display density and placed on a white board sized canvas, then mirror/invert

    maskforge_error_code compose_pcb_sub_canvas(layer_raster const &layer, display_geometry const &display, pcb_placement_spec const &pcb, bool mirror,
                                                bool inverted, gray_image &sub_canvas);

    //////////////////////////////////////////////////////////////////////
    // the board canvas centred on a black display canvas

    maskforge_error_code compose_pcb_canvas(layer_raster const &layer, display_geometry const &display, pcb_placement_spec const &pcb, bool mirror,
                                            bool inverted, gray_image &canvas);

}    // namespace maskforge_lib

MASKFORGE_MAKE_FORMATTER(maskforge_lib::layer_raster);
