//////////////////////////////////////////////////////////////////////

#include <algorithm>
#include <cmath>

#include "maskforge_draw.h"

namespace maskforge_lib
{
    //////////////////////////////////////////////////////////////////////

    maskforge_draw_element maskforge_draw_element::transformed(matrix const &m) const
    {
        if(draw_element_type == draw_element_line) {
            return maskforge_draw_element(transform_point(m, line_start), transform_point(m, line_end));
        }

        // where does the start direction end up, and does the sweep flip
        double det = m.A * m.D - m.B * m.C;
        double scale = sqrt(fabs(det));
        double radians = deg_2_rad(start_degrees);
        vec2d direction{ cos(radians), sin(radians) };
        vec2d moved{ direction.x * m.A + direction.y * m.C, direction.x * m.B + direction.y * m.D };
        double new_start = rad_2_deg(atan2(moved.y, moved.x));
        double sweep = end_degrees - start_degrees;
        if(det < 0) {
            sweep = -sweep;
        }
        return maskforge_draw_element(transform_point(m, arc_center), new_start, new_start + sweep, radius * scale);
    }

    //////////////////////////////////////////////////////////////////////

    void flatten_elements(maskforge_draw_element const *elements, size_t num_elements, double arc_degrees, std::vector<vec2d> &points)
    {
        double constexpr THRESHOLD = 1e-9;

        size_t const offset = points.size();

        auto add_point = [&](double x, double y) {
            if(points.size() == offset || fabs(points.back().x - x) > THRESHOLD || fabs(points.back().y - y) > THRESHOLD) {
                points.emplace_back(x, y);
            }
        };

        auto add_arc_point = [&](maskforge_draw_element const &element, double t) {
            double radians = deg_2_rad(t);
            double x = cos(radians) * element.radius + element.arc_center.x;
            double y = sin(radians) * element.radius + element.arc_center.y;
            add_point(x, y);
        };

        for(size_t n = 0; n < num_elements; ++n) {

            maskforge_draw_element const &element = elements[n];

            switch(element.draw_element_type) {

            case draw_element_line:
                add_point(element.line_start.x, element.line_start.y);
                add_point(element.line_end.x, element.line_end.y);
                break;

            case draw_element_arc: {

                double start = element.start_degrees;
                double end = element.end_degrees;

                // even steps so the chords are all the same length
                int steps = std::max(1, static_cast<int>(ceil(fabs(end - start) / arc_degrees)));
                for(int i = 0; i <= steps; ++i) {
                    add_arc_point(element, start + (end - start) * i / steps);
                }
            } break;
            }
        }

        // closing point is implicit
        if(points.size() > offset + 1) {
            vec2d const &first = points[offset];
            if(fabs(points.back().x - first.x) <= THRESHOLD && fabs(points.back().y - first.y) <= THRESHOLD) {
                points.pop_back();
            }
        }
    }

}    // namespace maskforge_lib
