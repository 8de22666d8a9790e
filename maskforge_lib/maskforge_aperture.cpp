//////////////////////////////////////////////////////////////////////

#include <algorithm>
#include <cmath>
#include <map>
#include <stack>

#include "maskforge_error.h"
#include "maskforge_util.h"
#include "maskforge_reader.h"
#include "maskforge_aperture.h"

LOG_CONTEXT("aperture", info);

namespace
{
    using namespace maskforge_lib;
    using namespace maskforge_util;

    //////////////////////////////////////////////////////////////////////

    enum gerber_associativity
    {
        associate_left = 0,
        associate_right = 1,
    };

    //////////////////////////////////////////////////////////////////////

    struct opcode_descriptor
    {
        gerber_associativity associativity;
        int operator_precedence;
        bool precedes_unary_operator;
    };

    // if previous token is:
    // open bracket
    // first token (i.e. nop)
    // an operator (X,/,+,-)
    // then +,- are unary

    opcode_descriptor opcode_details[] = {
        { associate_left, 0, true },     // opcode_nop
        { associate_left, 0, false },    // opcode_push_value
        { associate_left, 0, false },    // opcode_push_parameter
        { associate_left, 0, false },    // opcode_pop_parameter
        { associate_left, 1, true },     // opcode_add
        { associate_left, 1, true },     // opcode_subtract
        { associate_left, 2, true },     // opcode_multiply
        { associate_left, 2, true },     // opcode_divide
        { associate_right, 0, true },    // opcode_open_bracket
        { associate_left, 0, true },     // opcode_close_bracket
        { associate_right, 3, true },    // opcode_unary_minus
        { associate_right, 3, true },    // opcode_unary_plus
        { associate_left, 0, false },    // opcode_primitive
    };

    static_assert(array_length(opcode_details) == opcode_num_opcodes);

    double constexpr arc_flatten_degrees = 10.0;

    //////////////////////////////////////////////////////////////////////
    // rotate about the macro origin

    vec2d rotated(vec2d const &p, double degrees)
    {
        return transform_point(matrix::rotate(degrees), p);
    }

    //////////////////////////////////////////////////////////////////////

    gerber_shape_contour rotated_polygon(std::vector<vec2d> points, double degrees, bool exposure)
    {
        for(auto &p : points) {
            p = rotated(p, degrees);
        }
        return polygon_contour(points, exposure);
    }

    //////////////////////////////////////////////////////////////////////
    // axis aligned box centred at c, then rotated about the origin

    gerber_shape_contour rotated_box(vec2d const &c, double w, double h, double degrees, bool exposure)
    {
        double w2 = w / 2;
        double h2 = h / 2;
        return rotated_polygon({ { c.x - w2, c.y - h2 }, { c.x + w2, c.y - h2 }, { c.x + w2, c.y + h2 }, { c.x - w2, c.y + h2 } }, degrees, exposure);
    }

    //////////////////////////////////////////////////////////////////////

    std::vector<vec2d> regular_polygon_points(vec2d const &center, double diameter, int vertices, double degrees)
    {
        std::vector<vec2d> points;
        double r = diameter / 2;
        for(int i = 0; i < vertices; ++i) {
            double radians = deg_2_rad(degrees + 360.0 * i / vertices);
            points.emplace_back(center.x + cos(radians) * r, center.y + sin(radians) * r);
        }
        return points;
    }

    //////////////////////////////////////////////////////////////////////

    bool exposure_on(double v)
    {
        return v != 0.0;
    }

}    // namespace

namespace maskforge_lib
{
    //////////////////////////////////////////////////////////////////////

    char const *aperture_type_name(gerber_aperture_type type)
    {
        switch(type) {
        case aperture_type_none:
            return "none";
        case aperture_type_circle:
            return "circle";
        case aperture_type_rectangle:
            return "rectangle";
        case aperture_type_oval:
            return "oval";
        case aperture_type_polygon:
            return "polygon";
        case aperture_type_macro:
            return "macro";
        }
        return "?";
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code gerber_aperture_macro::parse_aperture_macro(maskforge_reader &reader)
    {
        LOG_CONTEXT("macro_parser", info);

        CHECK(reader.read_until(&name, '*'));

        LOG_VERBOSE("Aperture macro: {}", name);

        // skip '*'
        char c;
        CHECK(reader.read_char(&c));

        if(c != '*' || name.empty()) {
            return error_invalid_aperture_macro;
        }

        constexpr size_t max_operation_stack_size = 64;

        bool done{ false };

        // have we parsed the first bit yet (either "number," or "$number=")
        bool got_line_header{ false };

        // if it started with "number," then this is the number
        int primitive{ 0 };

        // have we seen any digit of the primitive number
        bool got_primitive{ false };

        // if it started with "$number=" then this is the number
        int assign_parameter{ 0 };

        // does previous opcode mean a + or - is interpreted as unary
        bool unary_available{ true };

        // rpn stack of operators
        std::stack<gerber_opcode> ops;

        // flush opcode stack back to some opcode taking into account precedence, braces and left/right associativity

        auto flush_stack = [&](gerber_opcode opcode = opcode_nop) {
            while(!ops.empty()) {

                gerber_opcode next_opcode = ops.top();

                if(next_opcode == opcode_open_bracket) {
                    if(opcode == opcode_close_bracket) {
                        ops.pop();
                    }
                    break;
                }

                bool less{ false };

                opcode_descriptor const &details = opcode_details[opcode];
                opcode_descriptor const &next_details = opcode_details[next_opcode];

                switch(details.associativity) {

                case associate_left:
                    less = next_details.operator_precedence < details.operator_precedence;
                    break;

                default:
                    less = next_details.operator_precedence <= details.operator_precedence;
                    break;
                }

                if(less) {
                    break;
                }

                instructions.emplace_back(next_opcode);
                ops.pop();
            }
        };

        auto push_opcode = [&](gerber_opcode opcode) {
            if(ops.size() >= max_operation_stack_size) {
                return error_formula_too_complex;
            }
            ops.push(opcode);
            unary_available = opcode_details[opcode].precedes_unary_operator;
            return ok;
        };

        while(!done) {

            char character;
            CHECK(reader.read_char(&character));

            switch(character) {

                // $ might be assigning a new variable (e.g. "$n=<expression>")
                // or it might be being used as part of an expression (e.g. "$n+5")

            case '$':

                if(got_line_header) {
                    int param;
                    CHECK(reader.get_int(&param));
                    instructions.emplace_back(opcode_push_parameter, param);
                    unary_available = false;
                } else {
                    CHECK(reader.get_int(&assign_parameter));
                }
                break;

            case '=':

                if(assign_parameter == 0) {
                    return error_invalid_aperture_macro;
                }
                unary_available = true;
                got_line_header = true;
                break;

            case ',':

                // no commas in assignment expressions
                if(assign_parameter != 0) {
                    return error_invalid_aperture_macro;
                }

                if(!got_primitive) {
                    return error_invalid_aperture_macro;
                }
                unary_available = true;

                // first comma means preceding number was the primitive code
                if(!got_line_header) {
                    got_line_header = true;
                    break;
                }
                flush_stack();
                break;

                // * is terminator, not multiply (which is x or X)!

            case '*':

                if(!got_line_header) {
                    return error_invalid_aperture_macro;
                }

                while(!ops.empty()) {
                    gerber_opcode opcode = ops.top();
                    ops.pop();
                    if(opcode != opcode_open_bracket) {
                        instructions.emplace_back(opcode);
                    }
                }

                if(assign_parameter != 0) {
                    LOG_DEBUG("assign: {}", assign_parameter);
                    instructions.emplace_back(opcode_pop_parameter, assign_parameter);
                } else {
                    LOG_DEBUG("primitive: {}", primitive);
                    instructions.emplace_back(opcode_primitive, primitive);
                }
                assign_parameter = 0;
                primitive = 0;
                got_primitive = false;
                got_line_header = false;
                unary_available = true;
                break;

            case '(':

                CHECK(push_opcode(opcode_open_bracket));
                break;

            case ')':

                flush_stack(opcode_close_bracket);
                unary_available = false;
                break;

            case '+':

                if(unary_available) {
                    CHECK(push_opcode(opcode_unary_plus));
                } else {
                    flush_stack(opcode_add);
                    CHECK(push_opcode(opcode_add));
                }
                break;

            case '-':

                if(unary_available) {
                    CHECK(push_opcode(opcode_unary_minus));
                } else {
                    flush_stack(opcode_subtract);
                    CHECK(push_opcode(opcode_subtract));
                }
                break;

            case '/':

                flush_stack(opcode_divide);
                CHECK(push_opcode(opcode_divide));
                break;

            case 'x':
            case 'X':

                flush_stack(opcode_multiply);
                CHECK(push_opcode(opcode_multiply));
                break;

            case '0':
            case '1':
            case '2':
            case '3':
            case '4':
            case '5':
            case '6':
            case '7':
            case '8':
            case '9':
            case '.':

                // Comments in aperture macros are a definition starting with zero and ending with a '*'
                if(character == '0' && !got_line_header && !got_primitive) {
                    char next;
                    CHECK(reader.peek(&next));
                    if(next != ',') {
                        std::string comment;
                        CHECK(reader.read_until(&comment, '*'));
                        LOG_VERBOSE("macro comment: {}", comment);
                        reader.skip(1);
                        break;
                    }
                }

                // First number in an aperture macro describes the primitive as a numerical value
                if(!got_line_header) {
                    if(character == '.') {
                        return error_invalid_aperture_macro;
                    }
                    primitive = primitive * 10 + (character - '0');
                    got_primitive = true;
                    break;
                }

                // already had the primitive, this is just some number in some expression
                reader.rewind(1);
                double d;
                CHECK(reader.get_double(&d));
                instructions.emplace_back(opcode_push_value, d);
                unary_available = false;
                break;

            case '%':
                done = true;
                LOG_DEBUG("Finished parsing {}, {} instructions", name, instructions.size());
                break;

            default:
                LOG_ERROR("Unexpected {} in macro {}", string_from_char(character), name);
                return error_invalid_aperture_macro;
            }
        }
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code gerber_aperture_macro::execute(std::vector<double> parameters, std::vector<gerber_macro_primitive> &primitives) const
    {
        LOG_CONTEXT("execute_macro", info);

        LOG_DEBUG("Execute aperture macro \"{}\"", name);

        std::vector<double> macro_stack;

        auto pop = [&](double *d) {
            if(macro_stack.empty()) {
                LOG_ERROR("stack underflow in macro {}", name);
                return error_invalid_aperture_macro;
            }
            *d = macro_stack.back();
            macro_stack.pop_back();
            return ok;
        };

        auto binary = [&](auto op) {
            double b;
            double a;
            CHECK(pop(&b));
            CHECK(pop(&a));
            macro_stack.push_back(op(a, b));
            return ok;
        };

        for(auto const &instruction : instructions) {

            switch(instruction.opcode) {

            case opcode_nop:
            case opcode_open_bracket:
            case opcode_close_bracket:
                break;

            case opcode_push_value:
                macro_stack.push_back(instruction.double_value);
                break;

            case opcode_push_parameter: {
                int id = instruction.int_value - 1;
                FAIL_IF(id < 0, error_invalid_aperture_macro);
                double v = 0;
                if(static_cast<size_t>(id) < parameters.size()) {
                    v = parameters[id];
                } else {
                    LOG_WARNING("Macro {} uses undefined ${}, using 0", name, instruction.int_value);
                }
                macro_stack.push_back(v);
            } break;

            case opcode_pop_parameter: {
                double d;
                CHECK(pop(&d));
                int id = instruction.int_value - 1;
                FAIL_IF(id < 0 || id >= max_num_aperture_parameters, error_invalid_aperture_macro);
                if(parameters.size() <= static_cast<size_t>(id)) {
                    parameters.resize(static_cast<size_t>(id) + 1);
                }
                parameters[id] = d;
                macro_stack.clear();
                LOG_DEBUG("${} = {}", id + 1, d);
            } break;

            case opcode_add:
                CHECK(binary([](double a, double b) { return a + b; }));
                break;

            case opcode_subtract:
                CHECK(binary([](double a, double b) { return a - b; }));
                break;

            case opcode_multiply:
                CHECK(binary([](double a, double b) { return a * b; }));
                break;

            case opcode_divide:
                CHECK(binary([](double a, double b) { return b == 0 ? 0.0 : a / b; }));
                break;

            case opcode_unary_minus: {
                double d;
                CHECK(pop(&d));
                macro_stack.push_back(-d);
            } break;

            case opcode_unary_plus:
                break;

            case opcode_primitive: {
                gerber_macro_primitive p;
                p.code = instruction.int_value;
                p.values = std::move(macro_stack);
                macro_stack.clear();
                LOG_DEBUG("primitive {} with {} values", p.code, p.values.size());
                primitives.push_back(std::move(p));
            } break;

            default:
                return error_invalid_aperture_macro;
            }
        }
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    gerber_shape_contour circle_contour(vec2d const &center, double radius, bool exposure)
    {
        gerber_shape_contour c;
        c.exposure = exposure;
        c.elements.emplace_back(center, 0.0, 360.0, radius);
        return c;
    }

    //////////////////////////////////////////////////////////////////////

    gerber_shape_contour polygon_contour(std::vector<vec2d> const &points, bool exposure)
    {
        gerber_shape_contour c;
        c.exposure = exposure;
        size_t n = points.size();
        for(size_t i = 0; i < n; ++i) {
            c.elements.emplace_back(points[i], points[(i + 1) % n]);
        }
        return c;
    }

    //////////////////////////////////////////////////////////////////////
    // obround: a box with semicircular ends on the short sides

    gerber_shape_contour capsule_contour(vec2d const &center, double width, double height, bool exposure)
    {
        double w2 = width / 2;
        double h2 = height / 2;

        if(fabs(width - height) < 1e-9) {
            return circle_contour(center, w2, exposure);
        }

        gerber_shape_contour c;
        c.exposure = exposure;

        if(width > height) {
            double l = center.x - w2 + h2;
            double r = center.x + w2 - h2;
            c.elements.emplace_back(vec2d{ l, center.y - h2 }, vec2d{ r, center.y - h2 });
            c.elements.emplace_back(vec2d{ r, center.y }, 270.0, 450.0, h2);
            c.elements.emplace_back(vec2d{ r, center.y + h2 }, vec2d{ l, center.y + h2 });
            c.elements.emplace_back(vec2d{ l, center.y }, 90.0, 270.0, h2);
        } else {
            double b = center.y - h2 + w2;
            double t = center.y + h2 - w2;
            c.elements.emplace_back(vec2d{ center.x, b }, 180.0, 360.0, w2);
            c.elements.emplace_back(vec2d{ center.x + w2, b }, vec2d{ center.x + w2, t });
            c.elements.emplace_back(vec2d{ center.x, t }, 0.0, 180.0, w2);
            c.elements.emplace_back(vec2d{ center.x - w2, t }, vec2d{ center.x - w2, b });
        }
        return c;
    }

    //////////////////////////////////////////////////////////////////////
    // Andrew's monotone chain

    std::vector<vec2d> convex_hull(std::vector<vec2d> points)
    {
        std::sort(points.begin(), points.end(), [](vec2d const &a, vec2d const &b) { return a.x < b.x || (a.x == b.x && a.y < b.y); });
        points.erase(std::unique(points.begin(), points.end()), points.end());

        if(points.size() < 3) {
            return points;
        }

        auto cross = [](vec2d const &o, vec2d const &a, vec2d const &b) { return (a.x - o.x) * (b.y - o.y) - (a.y - o.y) * (b.x - o.x); };

        std::vector<vec2d> hull(points.size() * 2);
        size_t k = 0;
        for(size_t i = 0; i < points.size(); ++i) {
            while(k >= 2 && cross(hull[k - 2], hull[k - 1], points[i]) <= 0) {
                k -= 1;
            }
            hull[k++] = points[i];
        }
        for(size_t i = points.size() - 1, t = k + 1; i > 0; --i) {
            while(k >= t && cross(hull[k - 2], hull[k - 1], points[i - 1]) <= 0) {
                k -= 1;
            }
            hull[k++] = points[i - 1];
        }
        hull.resize(k - 1);
        return hull;
    }

    //////////////////////////////////////////////////////////////////////

    double gerber_aperture::stroke_width() const
    {
        switch(aperture_type) {
        case aperture_type_circle:
        case aperture_type_polygon:
            return parameters.empty() ? 0.0 : parameters[0];
        case aperture_type_rectangle:
        case aperture_type_oval:
            return parameters.size() < 2 ? 0.0 : std::min(parameters[0], parameters[1]);
        default:
            break;
        }
        // a macro: the smaller side of its extent
        std::vector<vec2d> points = outline_points();
        rect extent = rect::empty();
        for(auto const &p : points) {
            extent.expand_to_contain(p);
        }
        if(!extent.is_valid()) {
            return 0.0;
        }
        return std::min(extent.width(), extent.height());
    }

    //////////////////////////////////////////////////////////////////////

    std::vector<vec2d> gerber_aperture::outline_points() const
    {
        std::vector<vec2d> points;
        for(auto const &contour : shape) {
            if(contour.exposure) {
                flatten_elements(contour.elements.data(), contour.elements.size(), arc_flatten_degrees, points);
            }
        }
        return points;
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code gerber_aperture::build_shape(double unit_scale, gerber_aperture_macro const *macro)
    {
        shape.clear();

        vec2d const origin{ 0, 0 };

        auto parameter = [&](size_t i, double default_value = 0.0) { return i < parameters.size() ? parameters[i] : default_value; };

        auto add_hole = [&](size_t index) {
            double hole = parameter(index);
            if(hole > 0) {
                shape.push_back(circle_contour(origin, hole / 2, false));
            }
        };

        switch(aperture_type) {

        case aperture_type_circle:
            FAIL_IF(parameters.empty(), error_invalid_aperture_definition);
            shape.push_back(circle_contour(origin, parameters[0] / 2));
            add_hole(1);
            break;

        case aperture_type_rectangle:
            FAIL_IF(parameters.size() < 2, error_invalid_aperture_definition);
            shape.push_back(rotated_box(origin, parameters[0], parameters[1], 0, true));
            add_hole(2);
            break;

        case aperture_type_oval:
            FAIL_IF(parameters.size() < 2, error_invalid_aperture_definition);
            shape.push_back(capsule_contour(origin, parameters[0], parameters[1]));
            add_hole(2);
            break;

        case aperture_type_polygon: {
            FAIL_IF(parameters.size() < 2, error_invalid_aperture_definition);
            int vertices = static_cast<int>(parameters[1]);
            FAIL_IF(vertices < 3 || vertices > 12, error_invalid_aperture_definition);
            shape.push_back(polygon_contour(regular_polygon_points(origin, parameters[0], vertices, parameter(2))));
            add_hole(3);
        } break;

        case aperture_type_macro: {
            FAIL_IF(macro == nullptr, error_unknown_aperture_macro);

            std::vector<gerber_macro_primitive> primitives;
            CHECK(macro->execute(parameters, primitives));

            for(auto const &p : primitives) {

                auto value = [&](size_t i) { return i < p.values.size() ? p.values[i] : 0.0; };
                auto length = [&](size_t i) { return value(i) * unit_scale; };
                auto point = [&](size_t i) { return vec2d{ length(i), length(i + 1) }; };

                switch(p.code) {

                case primitive_comment:
                    break;

                case primitive_circle: {
                    vec2d center = rotated(point(2), value(4));
                    shape.push_back(circle_contour(center, length(1) / 2, exposure_on(value(0))));
                } break;

                case primitive_outline: {
                    int n = static_cast<int>(value(1));
                    FAIL_IF(n < 1 || p.values.size() < static_cast<size_t>(n + 1) * 2 + 2, error_invalid_aperture_macro);
                    std::vector<vec2d> points;
                    for(int i = 0; i <= n; ++i) {
                        points.push_back(point(2 + i * 2));
                    }
                    double rotation = value(2 + (n + 1) * 2);
                    shape.push_back(rotated_polygon(points, rotation, exposure_on(value(0))));
                } break;

                case primitive_polygon: {
                    int n = static_cast<int>(value(1));
                    FAIL_IF(n < 3, error_invalid_aperture_macro);
                    std::vector<vec2d> points = regular_polygon_points(point(2), length(4), n, 0);
                    shape.push_back(rotated_polygon(points, value(5), exposure_on(value(0))));
                } break;

                case primitive_vector_line:
                case primitive_vector_line_legacy: {
                    vec2d start = point(2);
                    vec2d end = point(4);
                    double half = length(1) / 2;
                    vec2d d = end.subtract(start);
                    double len = d.length();
                    if(len == 0) {
                        break;
                    }
                    vec2d n{ -d.y / len * half, d.x / len * half };
                    shape.push_back(rotated_polygon({ start.subtract(n), end.subtract(n), end.add(n), start.add(n) }, value(6), exposure_on(value(0))));
                } break;

                case primitive_center_line:
                    shape.push_back(rotated_box(point(3), length(1), length(2), value(5), exposure_on(value(0))));
                    break;

                case primitive_lower_left_line: {
                    vec2d ll = point(3);
                    vec2d center{ ll.x + length(1) / 2, ll.y + length(2) / 2 };
                    shape.push_back(rotated_box(center, length(1), length(2), value(5), exposure_on(value(0))));
                } break;

                case primitive_thermal: {
                    // outer ring minus the inner disc minus the two gaps
                    vec2d center = point(0);
                    double outer = length(2);
                    double inner = length(3);
                    double gap = length(4);
                    double rotation = value(5);
                    shape.push_back(circle_contour(rotated(center, rotation), outer / 2));
                    if(inner > 0) {
                        shape.push_back(circle_contour(rotated(center, rotation), inner / 2, false));
                    }
                    if(gap > 0) {
                        shape.push_back(rotated_box(center, outer, gap, rotation, false));
                        shape.push_back(rotated_box(center, gap, outer, rotation, false));
                    }
                } break;

                case primitive_moire:
                    LOG_WARNING("Moire primitive in macro {} is not supported, skipped", macro->name);
                    break;

                default:
                    LOG_ERROR("Unknown primitive {} in macro {}", p.code, macro->name);
                    return error_invalid_aperture_macro;
                }
            }
        } break;

        default:
            return error_invalid_aperture_definition;
        }
        return ok;
    }

}    // namespace maskforge_lib
