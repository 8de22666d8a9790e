//////////////////////////////////////////////////////////////////////
// Gerber apertures: the standard ones and aperture macros (AM)

#pragma once

#include <map>
#include <string>
#include <vector>

#include "maskforge_error.h"
#include "maskforge_util.h"
#include "maskforge_draw.h"

namespace maskforge_lib
{
    struct maskforge_reader;

    static constexpr int max_num_aperture_parameters = 102;

    //////////////////////////////////////////////////////////////////////

    enum gerber_opcode
    {
        opcode_nop = 0,           // No operation.
        opcode_push_value,        // Push the value onto the stack.
        opcode_push_parameter,    // Push parameter onto stack.
        opcode_pop_parameter,     // Pop parameter from stack.
        opcode_add,               // Mathmatical add operation.
        opcode_subtract,          // Mathmatical subtract operation.
        opcode_multiply,          // Mathmatical multiply operation.
        opcode_divide,            // Mathmatical divide operation.
        opcode_open_bracket,      // Open bracket
        opcode_close_bracket,     // Close bracket
        opcode_unary_minus,       // -x
        opcode_unary_plus,        // +x
        opcode_primitive,         // Draw macro primitive.
        opcode_num_opcodes,
    };

    //////////////////////////////////////////////////////////////////////

    enum gerber_primitive_code
    {
        primitive_comment = 0,
        primitive_circle = 1,
        primitive_vector_line_legacy = 2,
        primitive_outline = 4,
        primitive_polygon = 5,
        primitive_moire = 6,
        primitive_thermal = 7,
        primitive_vector_line = 20,
        primitive_center_line = 21,
        primitive_lower_left_line = 22
    };

    //////////////////////////////////////////////////////////////////////

    enum gerber_aperture_type
    {
        aperture_type_none,
        aperture_type_circle,
        aperture_type_rectangle,
        aperture_type_oval,
        aperture_type_polygon,
        aperture_type_macro
    };

    char const *aperture_type_name(gerber_aperture_type type);

    //////////////////////////////////////////////////////////////////////

    struct gerber_instruction
    {
        gerber_opcode opcode{ opcode_nop };
        double double_value{};
        int int_value{};

        gerber_instruction() = default;

        gerber_instruction(gerber_opcode code) : opcode(code)
        {
        }

        gerber_instruction(gerber_opcode code, double value) : opcode(code), double_value(value)
        {
        }

        gerber_instruction(gerber_opcode code, int value) : opcode(code), int_value(value)
        {
        }
    };

    //////////////////////////////////////////////////////////////////////
    // one evaluated primitive, values are as written in the file (not scaled)

    struct gerber_macro_primitive
    {
        int code{};
        std::vector<double> values;
    };

    //////////////////////////////////////////////////////////////////////

    struct gerber_aperture_macro
    {
        std::vector<gerber_instruction> instructions;
        std::string name;

        std::string to_string() const
        {
            return fmt::format("APERTURE_MACRO: NAME: {}, INSTRUCTIONS: {}", name, instructions.size());
        }

        gerber_aperture_macro() = default;

        // eats the trailing %
        maskforge_error_code parse_aperture_macro(maskforge_reader &reader);

        maskforge_error_code execute(std::vector<double> parameters, std::vector<gerber_macro_primitive> &primitives) const;
    };

    //////////////////////////////////////////////////////////////////////
    // one closed outline of an aperture, centred on the flash point, in mm

    struct gerber_shape_contour
    {
        std::vector<maskforge_draw_element> elements;
        bool exposure{ true };
    };

    //////////////////////////////////////////////////////////////////////

    struct gerber_aperture
    {
        int aperture_number{};
        gerber_aperture_type aperture_type{ aperture_type_none };
        std::string macro_name;
        std::vector<double> parameters;    // mm for standard apertures, raw for macros
        std::vector<gerber_shape_contour> shape;

        std::string to_string() const
        {
            return fmt::format("APERTURE D{}: TYPE: {} {}, PARAMETERS: {}, CONTOURS: {}", aperture_number, aperture_type_name(aperture_type), macro_name,
                               parameters.size(), shape.size());
        }

        // diameter if it's a circle, otherwise the narrowest dimension
        double stroke_width() const;

        // the outline polygon(s), arcs flattened, for sweeping along a draw
        std::vector<vec2d> outline_points() const;

        // fill in shape from type and parameters
        maskforge_error_code build_shape(double unit_scale, gerber_aperture_macro const *macro);
    };

    //////////////////////////////////////////////////////////////////////
    // shape helpers, also used for strokes

    gerber_shape_contour circle_contour(vec2d const &center, double radius, bool exposure = true);

    gerber_shape_contour polygon_contour(std::vector<vec2d> const &points, bool exposure = true);

    gerber_shape_contour capsule_contour(vec2d const &center, double width, double height, bool exposure = true);

    // points of the convex hull, counter clockwise
    std::vector<vec2d> convex_hull(std::vector<vec2d> points);

}    // namespace maskforge_lib

MASKFORGE_MAKE_FORMATTER(maskforge_lib::gerber_aperture_macro);
MASKFORGE_MAKE_FORMATTER(maskforge_lib::gerber_aperture);
