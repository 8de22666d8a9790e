//////////////////////////////////////////////////////////////////////
// draw interface which collects entities and scan converts them into a layer_raster

#pragma once

#include <vector>

#include "maskforge_draw.h"
#include "maskforge_compositor.h"

namespace maskforge_lib
{
    //////////////////////////////////////////////////////////////////////
    // one flash / stroke / region: its contours are unioned (holes subtract) before it's painted

    struct raster_entity
    {
        struct contour_span
        {
            size_t offset;
            size_t count;
        };

        int entity_id{};
        maskforge_polarity polarity{ polarity_dark };
        bool has_exposure{ false };
        std::vector<float> points;    // x,y pairs
        std::vector<contour_span> contours;
    };

    //////////////////////////////////////////////////////////////////////

    struct maskforge_raster_drawer : maskforge_draw_interface
    {
        static constexpr double arc_degrees = 3.6;

        std::vector<raster_entity> entities;
        rect extent{ rect::empty() };

        maskforge_raster_drawer() = default;

        maskforge_error_code fill_elements(maskforge_draw_element const *elements, size_t num_elements, maskforge_polarity polarity, int entity_id,
                                           bool exposure) override;

        void clear();

        // white image, dark entities black, clear entities white, in the order they were drawn
        maskforge_error_code render(double dots_per_mm, layer_raster &layer) const;
    };

}    // namespace maskforge_lib
