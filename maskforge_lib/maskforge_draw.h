#pragma once

#include <vector>

#include "maskforge_2d.h"
#include "maskforge_error.h"

//////////////////////////////////////////////////////////////////////
// units are mm
// origin is lower left

namespace maskforge_lib
{
    using namespace maskforge_2d;

    //////////////////////////////////////////////////////////////////////

    enum maskforge_polarity
    {
        polarity_dark,     // add to the current rendering
        polarity_clear     // subtract from the current rendering
    };

    //////////////////////////////////////////////////////////////////////

    enum maskforge_draw_element_type
    {
        draw_element_line = 0,
        draw_element_arc = 1
    };

    //////////////////////////////////////////////////////////////////////

    struct maskforge_draw_element
    {
        maskforge_draw_element_type draw_element_type{ draw_element_line };

        vec2d line_start;
        vec2d line_end;
        vec2d arc_center;
        double start_degrees{};
        double end_degrees{};
        double radius{};

        maskforge_draw_element() = default;

        maskforge_draw_element(vec2d const &start, vec2d const &end) : draw_element_type(draw_element_line), line_start(start), line_end(end)
        {
        }

        maskforge_draw_element(vec2d const &center, double start_degrees, double end_degrees, double radius)
            : draw_element_type(draw_element_arc), arc_center(center), start_degrees(start_degrees), end_degrees(end_degrees), radius(radius)
        {
        }

        // for similarity transforms only (rotate, mirror, uniform scale, translate)
        maskforge_draw_element transformed(matrix const &m) const;

        std::string to_string() const
        {
            switch(draw_element_type) {
            case draw_element_line:
                return fmt::format("line: {},{}", line_start, line_end);
            case draw_element_arc:
                return fmt::format("arc: at {}, from {} to {}, radius {}", arc_center, start_degrees, end_degrees, radius);
            }
            return std::string{ "?" };
        }
    };

    //////////////////////////////////////////////////////////////////////
    // arcs become chords of at most arc_degrees, consecutive duplicates are dropped

    void flatten_elements(maskforge_draw_element const *elements, size_t num_elements, double arc_degrees, std::vector<vec2d> &points);

    //////////////////////////////////////////////////////////////////////

    struct maskforge_draw_interface
    {
        virtual ~maskforge_draw_interface() = default;

        // a closed filled shape of lines/arcs, all the calls with the same entity_id make one entity
        // exposure false means the shape cuts a hole in its entity rather than adding to it
        virtual maskforge_error_code fill_elements(maskforge_draw_element const *elements, size_t num_elements, maskforge_polarity polarity, int entity_id,
                                                   bool exposure) = 0;
    };

}    // namespace maskforge_lib

MASKFORGE_MAKE_FORMATTER(maskforge_lib::maskforge_draw_element);
