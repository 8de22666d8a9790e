#pragma once

#define _USE_MATH_DEFINES
#include <math.h>

namespace maskforge_lib
{
    //////////////////////////////////////////////////////////////////////

    inline double deg_2_rad(double x)
    {
        return x * (M_PI / 180.0);
    }

    //////////////////////////////////////////////////////////////////////

    inline double rad_2_deg(double x)
    {
        return x * (180 / M_PI);
    }

    //////////////////////////////////////////////////////////////////////
    // nearest, ties to even

    inline int round_to_int(double x)
    {
        return static_cast<int>(lrint(x));
    }

    //////////////////////////////////////////////////////////////////////
    // truncate toward zero

    inline int truncate_to_int(double x)
    {
        return static_cast<int>(x);
    }

    //////////////////////////////////////////////////////////////////////
    // rounds toward negative infinity, b > 0

    inline int floor_div(int a, int b)
    {
        int q = a / b;
        if((a % b) != 0 && a < 0) {
            q -= 1;
        }
        return q;
    }

}    // namespace maskforge_lib
