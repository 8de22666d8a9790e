#pragma once

#include <vector>
#include <string>
#include <limits>
#include <algorithm>

#include "maskforge_math.h"
#include "maskforge_util.h"

namespace maskforge_lib
{
    namespace maskforge_2d
    {
        struct matrix;

        //////////////////////////////////////////////////////////////////////

        struct vec2d
        {
            double x{};
            double y{};

            vec2d() = default;
            vec2d(double x, double y);
            vec2d(double x, double y, matrix const &transform_matrix);
            vec2d(vec2d const &o, matrix const &transform_matrix);

            //////////////////////////////////////////////////////////////////////

            vec2d scale(double scale) const
            {
                return { x * scale, y * scale };
            }

            //////////////////////////////////////////////////////////////////////

            vec2d add(vec2d const &v) const
            {
                return { x + v.x, y + v.y };
            }

            //////////////////////////////////////////////////////////////////////

            vec2d subtract(vec2d const &v) const
            {
                return { x - v.x, y - v.y };
            }

            //////////////////////////////////////////////////////////////////////

            double length_squared() const
            {
                return x * x + y * y;
            }

            //////////////////////////////////////////////////////////////////////

            double length() const
            {
                return sqrt(length_squared());
            }

            //////////////////////////////////////////////////////////////////////

            vec2d negate() const
            {
                return { -x, -y };
            }

            //////////////////////////////////////////////////////////////////////

            bool operator==(vec2d const &o) const = default;

            //////////////////////////////////////////////////////////////////////

            std::string to_string() const
            {
                return fmt::format("(X:{:g},Y:{:g})", x, y);
            }
        };
    }    // namespace maskforge_2d
}    // namespace maskforge_lib

MASKFORGE_MAKE_FORMATTER(maskforge_lib::maskforge_2d::vec2d);

namespace maskforge_lib
{
    namespace maskforge_2d
    {
        //////////////////////////////////////////////////////////////////////

        struct rect
        {
            vec2d min_pos{};
            vec2d max_pos{};

            //////////////////////////////////////////////////////////////////////

            std::string to_string() const
            {
                return fmt::format("(MIN:{} MAX:{})", min_pos, max_pos);
            }

            //////////////////////////////////////////////////////////////////////

            rect() = default;

            //////////////////////////////////////////////////////////////////////

            rect(double x1, double y1, double x2, double y2) : min_pos(x1, y1), max_pos(x2, y2)
            {
            }

            //////////////////////////////////////////////////////////////////////

            rect(vec2d const &min, vec2d const &max) : min_pos(min), max_pos(max)
            {
            }

            //////////////////////////////////////////////////////////////////////
            // inside out, anything expands it

            static rect empty()
            {
                double constexpr big = std::numeric_limits<double>::max();
                return { { big, big }, { -big, -big } };
            }

            //////////////////////////////////////////////////////////////////////

            bool is_valid() const
            {
                return min_pos.x <= max_pos.x && min_pos.y <= max_pos.y;
            }

            //////////////////////////////////////////////////////////////////////

            bool contains_rect(rect const &r) const
            {
                return r.min_pos.x >= min_pos.x && r.max_pos.x <= max_pos.x && r.min_pos.y >= min_pos.y && r.max_pos.y <= max_pos.y;
            }

            //////////////////////////////////////////////////////////////////////

            double width() const
            {
                return max_pos.x - min_pos.x;
            }

            //////////////////////////////////////////////////////////////////////

            double height() const
            {
                return max_pos.y - min_pos.y;
            }

            //////////////////////////////////////////////////////////////////////

            vec2d mid_point() const
            {
                return vec2d{ (min_pos.x + max_pos.x) / 2, (min_pos.y + max_pos.y) / 2 };
            }

            //////////////////////////////////////////////////////////////////////

            void expand_to_contain(vec2d const &p)
            {
                if(p.x < min_pos.x) {
                    min_pos.x = p.x;
                }
                if(p.y < min_pos.y) {
                    min_pos.y = p.y;
                }
                if(p.x > max_pos.x) {
                    max_pos.x = p.x;
                }
                if(p.y > max_pos.y) {
                    max_pos.y = p.y;
                }
            }

            //////////////////////////////////////////////////////////////////////

            rect union_with(rect const &o) const;
        };

        //////////////////////////////////////////////////////////////////////

        struct matrix
        {
            double A, B;
            double C, D;
            double X, Y;

            //////////////////////////////////////////////////////////////////////

            matrix() = default;

            //////////////////////////////////////////////////////////////////////

            matrix(double a, double b, double c, double d, double x, double y) : A(a), B(b), C(c), D(d), X(x), Y(y)
            {
            }

            //////////////////////////////////////////////////////////////////////

            std::string to_string() const
            {
                return fmt::format("MATRIX: A:{}, B:{}, C:{}, D:{}, X:{}, Y:{}", A, B, C, D, X, Y);
            }

            //////////////////////////////////////////////////////////////////////
            // true if the transform flips handedness (so contours change winding)

            bool is_reflection() const
            {
                return (A * D - B * C) < 0;
            }

            static matrix multiply(matrix const &l, matrix const &r);
            static matrix identity();
            static matrix translate(vec2d const &offset);
            static matrix rotate(double angle_degrees);
            static matrix scale(vec2d const &scale);
        };

        vec2d transform_point(matrix const &m, vec2d const &p);

        //////////////////////////////////////////////////////////////////////

        template <typename T> void transform_points(matrix const &m, T &points)
        {
            for(auto &p : points) {
                p = vec2d(p.x, p.y, m);
            }
        }

        //////////////////////////////////////////////////////////////////////
        // shoelace, positive for counter clockwise when Y is up

        template <typename T> double signed_area(std::vector<T> const &points)
        {
            double area = 0;
            size_t n = points.size();
            for(size_t i = 0, j = n - 1; i < n; j = i++) {
                area += (points[j].x * points[i].y) - (points[i].x * points[j].y);
            }
            return area / 2;
        }

    }    // namespace maskforge_2d

}    // namespace maskforge_lib

MASKFORGE_MAKE_FORMATTER(maskforge_lib::maskforge_2d::rect);
MASKFORGE_MAKE_FORMATTER(maskforge_lib::maskforge_2d::matrix);
