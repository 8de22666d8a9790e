#include <math.h>

#include "maskforge_2d.h"

namespace maskforge_lib
{
    namespace maskforge_2d
    {
        //////////////////////////////////////////////////////////////////////

        vec2d::vec2d(double x, double y) : x(x), y(y)
        {
        }

        //////////////////////////////////////////////////////////////////////

        vec2d::vec2d(double x, double y, matrix const &m) : x(x * m.A + y * m.C + m.X), y(x * m.B + y * m.D + m.Y)
        {
        }

        //////////////////////////////////////////////////////////////////////

        vec2d::vec2d(vec2d const &o, matrix const &m) : vec2d(o.x, o.y, m)
        {
        }

        //////////////////////////////////////////////////////////////////////
        // l then r

        matrix matrix::multiply(matrix const &l, matrix const &r)
        {
            return matrix(l.A * r.A + l.B * r.C,          //
                          l.A * r.B + l.B * r.D,          //
                          l.C * r.A + l.D * r.C,          //
                          l.C * r.B + l.D * r.D,          //
                          l.X * r.A + l.Y * r.C + r.X,    //
                          l.X * r.B + l.Y * r.D + r.Y);
        }

        //////////////////////////////////////////////////////////////////////

        matrix matrix::identity()
        {
            return matrix(1.0, 0.0, 0.0, 1.0, 0.0, 0.0);
        }

        //////////////////////////////////////////////////////////////////////

        matrix matrix::translate(vec2d const &offset)
        {
            return matrix(1.0, 0.0, 0.0, 1.0, offset.x, offset.y);
        }

        //////////////////////////////////////////////////////////////////////
        // counter clockwise

        matrix matrix::rotate(double angle_degrees)
        {
            double radians = deg_2_rad(angle_degrees);
            double s = sin(radians);
            double c = cos(radians);
            return matrix(c, s, -s, c, 0.0, 0.0);
        }

        //////////////////////////////////////////////////////////////////////

        matrix matrix::scale(vec2d const &scale)
        {
            return matrix(scale.x, 0.0, 0.0, scale.y, 0.0, 0.0);
        }

        //////////////////////////////////////////////////////////////////////

        vec2d transform_point(matrix const &m, vec2d const &p)
        {
            return vec2d(p.x, p.y, m);
        }

        //////////////////////////////////////////////////////////////////////

        rect rect::union_with(rect const &o) const
        {
            double x1 = std::min(min_pos.x, o.min_pos.x);
            double y1 = std::min(min_pos.y, o.min_pos.y);
            double x2 = std::max(max_pos.x, o.max_pos.x);
            double y2 = std::max(max_pos.y, o.max_pos.y);
            return { { x1, y1 }, { x2, y2 } };
        }

    }    // namespace maskforge_2d

}    // namespace maskforge_lib
