//////////////////////////////////////////////////////////////////////

#define _USE_MATH_DEFINES
#include <math.h>

#include <algorithm>
#include <cfloat>
#include <charconv>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

#include "maskforge_error.h"
#include "maskforge_util.h"
#include "maskforge_gerber.h"

LOG_CONTEXT("gerber", debug);

//////////////////////////////////////////////////////////////////////

namespace
{
    using namespace maskforge_lib;
    using namespace maskforge_util;

    double constexpr arc_tolerance = 1.0e-6;

    //////////////////////////////////////////////////////////////////////

    std::optional<double> double_from_string_view(std::string_view sv)
    {
        if(!sv.empty() && sv.front() == '+') {
            sv.remove_prefix(1);
        }
        double d;
        auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), d);
        if(ec != std::errc{} || ptr != sv.data() + sv.size()) {
            return std::nullopt;
        }
        return d;
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code add_trailing_zeros(int integer_part, int decimal_part, int length, int *coordinate)
    {
        int omitted_value = integer_part + decimal_part - length;
        int64_t value = *coordinate;
        for(int x = 0; x < omitted_value; x++) {
            value *= 10;
            if(value > std::numeric_limits<int>::max() || value < std::numeric_limits<int>::min()) {
                return error_invalid_number;
            }
        }
        *coordinate = static_cast<int>(value);
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    double angle_of(vec2d const &center, vec2d const &p)
    {
        return rad_2_deg(atan2(p.y - center.y, p.x - center.x));
    }

    //////////////////////////////////////////////////////////////////////
    // end angle moved so the sweep goes the right way, same point means a full circle

    double normalize_end_angle(double start_angle, double end_angle, bool is_clockwise)
    {
        if(is_clockwise) {
            if(start_angle - end_angle < arc_tolerance) {
                end_angle -= 360.0;
            }
        } else {
            if(end_angle - start_angle < arc_tolerance) {
                end_angle += 360.0;
            }
        }
        return end_angle;
    }

    //////////////////////////////////////////////////////////////////////

    void calculate_arc_mq(vec2d const &start, vec2d const &end, vec2d const &offset, bool is_clockwise, gerber_arc *arc)
    {
        arc->center = start.add(offset);
        arc->radius = offset.length();
        arc->start_angle = angle_of(arc->center, start);
        arc->end_angle = normalize_end_angle(arc->start_angle, angle_of(arc->center, end), is_clockwise);
    }

    //////////////////////////////////////////////////////////////////////
    // the offset is unsigned, pick the centre which gives a sweep of 90 or less and the closest radii

    bool calculate_arc_sq(vec2d const &start, vec2d const &end, vec2d const &offset, bool is_clockwise, gerber_arc *arc)
    {
        double i = fabs(offset.x);
        double j = fabs(offset.y);

        vec2d centers[4] = { { start.x + i, start.y + j }, { start.x + i, start.y - j }, { start.x - i, start.y + j }, { start.x - i, start.y - j } };

        double best_deviation{ DBL_MAX };
        bool found{ false };

        for(auto const &c : centers) {

            double start_radius = start.subtract(c).length();
            double end_radius = end.subtract(c).length();

            double deviation = fabs(start_radius - end_radius);

            if(deviation >= best_deviation) {
                continue;
            }

            double alpha = angle_of(c, start);
            double beta = angle_of(c, end);

            // a zero length arc is fine here, normalizing would make it a full circle
            if(fabs(alpha - beta) >= arc_tolerance) {
                beta = normalize_end_angle(alpha, beta, is_clockwise);
            }

            if(fabs(beta - alpha) > 90.0 + arc_tolerance) {
                continue;
            }

            best_deviation = deviation;
            arc->center = c;
            arc->radius = start_radius;
            arc->start_angle = alpha;
            arc->end_angle = beta;
            found = true;
        }
        return found;
    }

    //////////////////////////////////////////////////////////////////////

    vec2d point_on_circle(vec2d const &center, double radius, double degrees)
    {
        double radians = deg_2_rad(degrees);
        return { center.x + cos(radians) * radius, center.y + sin(radians) * radius };
    }

}    // namespace

namespace maskforge_lib
{
    //////////////////////////////////////////////////////////////////////

    char const *net_type_name(gerber_net_type type)
    {
        switch(type) {
        case net_type_flash:
            return "flash";
        case net_type_stroke:
            return "stroke";
        case net_type_region:
            return "region";
        }
        return "?";
    }

    //////////////////////////////////////////////////////////////////////

    matrix gerber_aperture_transform::to_matrix() const
    {
        matrix m = matrix::scale({ mirror_x ? -1.0 : 1.0, mirror_y ? -1.0 : 1.0 });
        m = matrix::multiply(m, matrix::rotate(rotation));
        return matrix::multiply(m, matrix::scale({ scale, scale }));
    }

    //////////////////////////////////////////////////////////////////////

    gerber_net gerber_net::translated(vec2d const &offset) const
    {
        gerber_net net = *this;
        net.start = start.add(offset);
        net.end = end.add(offset);
        net.arc.center = arc.center.add(offset);
        matrix m = matrix::translate(offset);
        for(auto &contour : net.contours) {
            for(auto &element : contour) {
                element = element.transformed(m);
            }
        }
        return net;
    }

    //////////////////////////////////////////////////////////////////////

    void gerber_file::reset()
    {
        filename = std::string{};
        unit = unit_unspecified;
        format = gerber_format{};
        state = gerber_state{};
        aperture_macros.clear();
        apertures.clear();
        nets.clear();
        warned_units = false;
        warned_format = false;
        warned_macro_stroke = false;
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code gerber_file::parse_file(std::filesystem::path const &file_path)
    {
        reset();
        CHECK(reader.open(file_path));
        return do_parse();
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code gerber_file::parse_memory(char const *data, size_t size)
    {
        reset();
        CHECK(reader.open(data, size));
        return do_parse();
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code gerber_file::do_parse()
    {
        filename = reader.filename;
        maskforge_error_code error = parse_gerber_segment();
        if(error != ok) {
            LOG_ERROR("Parsing {} failed at line {}: {}", filename, reader.line_number, get_error_text(error));
            return error;
        }
        LOG_VERBOSE("Parsing complete after {} lines, found {} nets", reader.line_number, nets.size());
        return ok;
    }

    //////////////////////////////////////////////////////////////////////
    // mm per file unit, inch if the file never said

    double gerber_file::unit_scale()
    {
        if(unit == unit_unspecified) {
            if(!warned_units) {
                LOG_WARNING("{}: no units specified before use (line {}), assuming inch", filename, reader.line_number);
                warned_units = true;
            }
            unit = unit_inch;
        }
        return unit == unit_inch ? 25.4 : 1.0;
    }

    //////////////////////////////////////////////////////////////////////

    vec2d gerber_file::coordinate_to_mm(int x, int y)
    {
        double s = unit_scale();
        return { x / pow(10.0, format.decimal_part_x) * s, y / pow(10.0, format.decimal_part_y) * s };
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code gerber_file::parse_coordinate(char axis, int *coordinate)
    {
        if(!format.specified && !warned_format) {
            LOG_WARNING("{}: no format specification before the first coordinate (line {}), assuming {}", filename, reader.line_number, format);
            warned_format = true;
        }
        size_t length = 0;
        CHECK(reader.get_int(coordinate, &length));
        if(format.omit_zeros == omit_zeros_trailing) {
            if(axis == 'X' || axis == 'I') {
                CHECK(add_trailing_zeros(format.integral_part_x, format.decimal_part_x, static_cast<int>(length), coordinate));
            } else {
                CHECK(add_trailing_zeros(format.integral_part_y, format.decimal_part_y, static_cast<int>(length), coordinate));
            }
        }
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code gerber_file::read_command(std::string *command, size_t length)
    {
        command->clear();
        for(size_t i = 0; i < length; ++i) {
            char c;
            CHECK(reader.read_char(&c));
            command->push_back(c);
        }
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code gerber_file::parse_gerber_segment()
    {
        LOG_CONTEXT("parse_segment", info);

        bool done{ false };

        while(!done) {

            reader.skip_whitespace();
            if(reader.eof()) {
                LOG_WARNING("{}: no M02 at end of file", filename);
                break;
            }

            char c;
            CHECK(reader.read_char(&c));

            switch(c) {

            case 'G': {
                CHECK(parse_g_code());
            } break;

            case 'D': {
                CHECK(parse_d_code());
            } break;

            case 'M': {
                CHECK(parse_m_code(&done));
            } break;

            case 'N': {
                // sequence number, ignored
                int sequence;
                CHECK(reader.get_int(&sequence));
            } break;

            case 'X':
            case 'Y': {
                int coordinate;
                CHECK(parse_coordinate(c, &coordinate));
                int &current = c == 'X' ? state.current_x : state.current_y;
                if(format.coordinate == coordinate_incremental) {
                    current += coordinate;
                } else {
                    current = coordinate;
                }
                state.changed();
            } break;

            case 'I': {
                CHECK(parse_coordinate(c, &state.center_x));
                state.changed();
            } break;

            case 'J': {
                CHECK(parse_coordinate(c, &state.center_y));
                state.changed();
            } break;

            case '%': {
                CHECK(parse_rs274x());
            } break;

            case '*': {
                if(!state.changed_state) {
                    break;
                }
                state.changed(false);
                CHECK(execute_operation());
            } break;

            default:
                LOG_ERROR("{}: unexpected {} at line {}", filename, string_from_char(c), reader.line_number);
                return error_syntax_error;
            }
        }

        if(state.is_region_fill) {
            LOG_WARNING("{}: region not closed with G37, closing it", filename);
            end_region();
        }
        close_step_and_repeat();
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code gerber_file::parse_g_code()
    {
        int code;
        CHECK(reader.get_int(&code));

        switch(code) {

        // Move - Deprecated.
        case 0:
            break;

        // Linear Interpolation
        case 1:
            state.interpolation = interpolation_linear;
            break;

        // Clockwise Circular Interpolation
        case 2:
            state.interpolation = interpolation_clockwise_circular;
            break;

        // Counter Clockwise Circular Interpolation.
        case 3:
            state.interpolation = interpolation_counterclockwise_circular;
            break;

        // Comment
        case 4: {
            std::string comment;
            CHECK(reader.read_until(&comment, '*'));
            LOG_VERBOSE("Comment({}): {}", reader.line_number, comment);
        } break;

        // Turn on Region Fill
        case 36:
            begin_region();
            break;

        // Turn off Region Fill
        case 37:
            if(!state.is_region_fill) {
                LOG_WARNING("G37 without G36 at line {}", reader.line_number);
            } else {
                end_region();
            }
            break;

        // Select aperture - Deprecated.
        case 54: {
            char c;
            CHECK(reader.read_char(&c));
            if(c != 'D') {
                LOG_ERROR("after G54, expected 'D', got {} at line {}", string_from_char(c), reader.line_number);
                return error_unexpected_input;
            }
            int aperture_number;
            CHECK(reader.get_int(&aperture_number));
            state.current_aperture = aperture_number;
        } break;

        // Prepare for flash - Deprecated.
        case 55:
            break;

        // Specify inches - Deprecated.
        case 70:
            unit = unit_inch;
            break;

        // Specify millimeters - Deprecated.
        case 71:
            unit = unit_millimeter;
            break;

        // Single quadrant arcs
        case 74:
            state.is_multi_quadrant = false;
            break;

        // Multi quadrant arcs
        case 75:
            state.is_multi_quadrant = true;
            break;

        // Specify absolute format - Deprecated.
        case 90:
            format.coordinate = coordinate_absolute;
            break;

        // Specify incremental format - Deprecated.
        case 91:
            format.coordinate = coordinate_incremental;
            break;

        default:
            LOG_WARNING("Unknown code G{} at line {}, ignored", code, reader.line_number);
            break;
        }
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code gerber_file::parse_d_code()
    {
        int code;
        CHECK(reader.get_int(&code));

        switch(code) {

        // Exposure on.
        case 1:
            state.aperture_state = aperture_state_on;
            state.changed();
            break;

        // Exposure off.
        case 2:
            state.aperture_state = aperture_state_off;
            state.changed();
            break;

        // Flash aperture.
        case 3:
            state.aperture_state = aperture_state_flash;
            state.changed();
            break;

        // Aperture id in use.
        default:
            if(code >= min_aperture && code <= max_num_apertures) {
                LOG_DEBUG("Using aperture {} at line {}", code, reader.line_number);
                state.current_aperture = code;
            } else {
                LOG_WARNING("D{} out of bounds at line {}", code, reader.line_number);
            }
            state.changed(false);
            break;
        }
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code gerber_file::parse_m_code(bool *done)
    {
        int code;
        CHECK(reader.get_int(&code));

        switch(code) {

        // 'optional stop', same as M02
        case 0:
        case 2:
            *done = true;
            break;

        case 1:
            break;

        default:
            LOG_WARNING("Unknown code M{} at line {}, ignored", code, reader.line_number);
            break;
        }
        return ok;
    }

    //////////////////////////////////////////////////////////////////////
    // D01/D02/D03 at the end of a block

    maskforge_error_code gerber_file::execute_operation()
    {
        vec2d start = coordinate_to_mm(state.previous_x, state.previous_y);
        vec2d end = coordinate_to_mm(state.current_x, state.current_y);
        vec2d offset = coordinate_to_mm(state.center_x, state.center_y);

        // I and J are not modal
        state.center_x = 0;
        state.center_y = 0;
        state.previous_x = state.current_x;
        state.previous_y = state.current_y;

        bool is_arc = state.interpolation != interpolation_linear;
        bool is_clockwise = state.interpolation == interpolation_clockwise_circular;

        switch(state.aperture_state) {

        case aperture_state_off:
            if(state.is_region_fill) {
                close_region_contour();
            }
            break;

        case aperture_state_on: {

            gerber_arc arc;
            if(is_arc) {
                CHECK(calculate_arc(start, end, offset, is_clockwise, &arc));
            }

            if(state.is_region_fill) {
                if(is_arc) {
                    state.region_contour.emplace_back(arc.center, arc.start_angle, arc.end_angle, arc.radius);
                } else {
                    state.region_contour.emplace_back(start, end);
                }
                break;
            }

            auto found = apertures.find(state.current_aperture);
            if(found == apertures.end()) {
                LOG_WARNING("{}: draw with undefined aperture D{} at line {}, skipped", filename, state.current_aperture, reader.line_number);
                break;
            }
            if(found->second.aperture_type == aperture_type_macro && !is_arc && !warned_macro_stroke) {
                LOG_WARNING("{}: drawing with macro aperture D{} uses its convex outline", filename, state.current_aperture);
                warned_macro_stroke = true;
            }

            gerber_net net;
            net.net_type = net_type_stroke;
            net.start = start;
            net.end = end;
            net.aperture = state.current_aperture;
            net.interpolation = state.interpolation;
            net.arc = arc;
            net.polarity = state.polarity;
            net.aperture_matrix = state.aperture_transform.to_matrix();
            net.line_number = reader.line_number;
            nets.push_back(std::move(net));
        } break;

        case aperture_state_flash: {

            if(state.is_region_fill) {
                LOG_WARNING("{}: D03 inside a region at line {}, ignored", filename, reader.line_number);
                break;
            }
            if(!apertures.contains(state.current_aperture)) {
                LOG_WARNING("{}: flash with undefined aperture D{} at line {}, skipped", filename, state.current_aperture, reader.line_number);
                break;
            }

            gerber_net net;
            net.net_type = net_type_flash;
            net.start = end;
            net.end = end;
            net.aperture = state.current_aperture;
            net.polarity = state.polarity;
            net.aperture_matrix = state.aperture_transform.to_matrix();
            net.line_number = reader.line_number;
            nets.push_back(std::move(net));
        } break;
        }
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code gerber_file::calculate_arc(vec2d const &start, vec2d const &end, vec2d const &offset, bool is_clockwise, gerber_arc *arc)
    {
        if(state.is_multi_quadrant) {
            calculate_arc_mq(start, end, offset, is_clockwise, arc);
        } else if(!calculate_arc_sq(start, end, offset, is_clockwise, arc)) {
            LOG_WARNING("{}: no single quadrant arc fits at line {}, treating it as multi quadrant", filename, reader.line_number);
            calculate_arc_mq(start, end, offset, is_clockwise, arc);
        }
        LOG_DEBUG("{}", *arc);
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    void gerber_file::begin_region()
    {
        if(state.is_region_fill) {
            LOG_WARNING("G36 inside a region at line {}", reader.line_number);
            return;
        }
        state.is_region_fill = true;
        state.region_contours.clear();
        state.region_contour.clear();
    }

    //////////////////////////////////////////////////////////////////////
    // a D02 (or the G37) ends a contour, add the closing edge if it's missing

    void gerber_file::close_region_contour()
    {
        if(state.region_contour.empty()) {
            return;
        }
        maskforge_draw_element const &first = state.region_contour.front();
        maskforge_draw_element const &last = state.region_contour.back();
        vec2d first_point = first.draw_element_type == draw_element_line ? first.line_start
                                                                           : point_on_circle(first.arc_center, first.radius, first.start_degrees);
        vec2d last_point = last.draw_element_type == draw_element_line ? last.line_end : point_on_circle(last.arc_center, last.radius, last.end_degrees);
        if(last_point.subtract(first_point).length() > 1e-6) {
            LOG_VERBOSE("Region contour not closed at line {}, closing it", reader.line_number);
            state.region_contour.emplace_back(last_point, first_point);
        }
        state.region_contours.push_back(std::move(state.region_contour));
        state.region_contour.clear();
    }

    //////////////////////////////////////////////////////////////////////

    void gerber_file::end_region()
    {
        close_region_contour();
        state.is_region_fill = false;
        if(state.region_contours.empty()) {
            LOG_VERBOSE("Empty region at line {}", reader.line_number);
            return;
        }
        gerber_net net;
        net.net_type = net_type_region;
        net.polarity = state.polarity;
        net.contours = std::move(state.region_contours);
        net.line_number = reader.line_number;
        state.region_contours.clear();
        nets.push_back(std::move(net));
    }

    //////////////////////////////////////////////////////////////////////
    // copy the block's nets to the other grid positions

    void gerber_file::close_step_and_repeat()
    {
        if(!state.in_step_and_repeat) {
            return;
        }
        state.in_step_and_repeat = false;

        gerber_step_and_repeat const &sr = state.step_and_repeat;

        size_t end = nets.size();

        LOG_VERBOSE("Step and repeat {}x{} of {} nets", sr.repeat_x, sr.repeat_y, end - sr.first_net);

        for(int y = 0; y < sr.repeat_y; ++y) {
            for(int x = 0; x < sr.repeat_x; ++x) {
                if(x == 0 && y == 0) {
                    continue;
                }
                vec2d offset{ x * sr.step_x, y * sr.step_y };
                for(size_t i = sr.first_net; i < end; ++i) {
                    nets.push_back(nets[i].translated(offset));
                }
            }
        }
    }

    //////////////////////////////////////////////////////////////////////
    // always returns after it eats the final %

    maskforge_error_code gerber_file::parse_rs274x()
    {
        LOG_CONTEXT("RS274X", info);

        while(true) {

            uint32_t command;
            CHECK(reader.read_short(&command, 2));

            LOG_DEBUG("command {}", string_from_uint32(command));

            switch(command) {

                //////////////////////////////////////////////////////////////////////
                // AM: aperture macro

            case 'AM': {
                gerber_aperture_macro macro;
                CHECK(macro.parse_aperture_macro(reader));
                LOG_DEBUG("AM {}", macro);
                std::string name = macro.name;
                aperture_macros[name] = std::move(macro);
                return ok;
            }

                //////////////////////////////////////////////////////////////////////
                // AD: aperture definition

            case 'AD': {
                gerber_aperture aperture;
                CHECK(parse_aperture_definition(&aperture));
                LOG_DEBUG("AD {}", aperture);
                int aperture_number = aperture.aperture_number;
                if(apertures.contains(aperture_number)) {
                    LOG_WARNING("{}: aperture D{} already defined, overwriting", filename, aperture_number);
                }
                apertures[aperture_number] = std::move(aperture);
            } break;

                //////////////////////////////////////////////////////////////////////
                // FS: format specification

            case 'FS': {
                CHECK(parse_format_specification());
            } break;

                //////////////////////////////////////////////////////////////////////
                // MO: mode (MM or INCH units, basically)

            case 'MO': {
                uint32_t rs_command;
                CHECK(reader.read_short(&rs_command, 2));

                switch(rs_command) {

                case 'IN':
                    unit = unit_inch;
                    break;

                case 'MM':
                    unit = unit_millimeter;
                    break;

                default:
                    LOG_ERROR("MO: expected [IN|MM], got {} at line {}", string_from_uint32(rs_command), reader.line_number);
                    return error_invalid_unit;
                }
                LOG_DEBUG("Units: {}", unit == unit_inch ? "inch" : "mm");
            } break;

                //////////////////////////////////////////////////////////////////////
                // LP: level polarity

            case 'LP': {
                char c;
                CHECK(reader.read_char(&c));

                switch(c) {

                case 'D':
                    state.polarity = polarity_dark;
                    break;

                case 'C':
                    state.polarity = polarity_clear;
                    break;

                default:
                    LOG_ERROR("LP: expected [D|C], got {} at line {}", string_from_char(c), reader.line_number);
                    return error_syntax_error;
                }
            } break;

                //////////////////////////////////////////////////////////////////////
                // LM: load mirroring

            case 'LM': {
                std::string mirror;
                CHECK(reader.read_until(&mirror, '*'));
                state.aperture_transform.mirror_x = mirror == "X" || mirror == "XY";
                state.aperture_transform.mirror_y = mirror == "Y" || mirror == "XY";
                if(mirror != "N" && mirror != "X" && mirror != "Y" && mirror != "XY") {
                    LOG_ERROR("LM: expected [N|X|Y|XY], got {} at line {}", mirror, reader.line_number);
                    return error_syntax_error;
                }
            } break;

                //////////////////////////////////////////////////////////////////////
                // LR: load rotation

            case 'LR': {
                CHECK(reader.get_double(&state.aperture_transform.rotation));
            } break;

                //////////////////////////////////////////////////////////////////////
                // LS: load scaling

            case 'LS': {
                double scale;
                CHECK(reader.get_double(&scale));
                FAIL_IF(scale <= 0, error_syntax_error);
                state.aperture_transform.scale = scale;
            } break;

                //////////////////////////////////////////////////////////////////////
                // SR: step & repeat

            case 'SR': {
                CHECK(parse_step_and_repeat());
            } break;

                //////////////////////////////////////////////////////////////////////
                // IP: image polarity

            case 'IP': {
                uint32_t polarity;
                CHECK(reader.read_short(&polarity, 3));
                if(polarity == 'NEG') {
                    LOG_WARNING("{}: negative image polarity is not supported, drawing as positive", filename);
                } else if(polarity != 'POS') {
                    LOG_ERROR("IP: expected [POS|NEG], got {} at line {}", string_from_uint32(polarity), reader.line_number);
                    return error_syntax_error;
                }
            } break;

                //////////////////////////////////////////////////////////////////////
                // attributes and legacy image parameters, accepted and ignored

            case 'TF':
            case 'TA':
            case 'TO':
            case 'TD':
            case 'IN':
            case 'LN':
            case 'AS':
            case 'IR':
            case 'MI':
            case 'OF':
            case 'SF':
            case 'IJ':
            case 'IO':
            case 'PF': {
                std::string field;
                CHECK(reader.read_until(&field, '*'));
                LOG_VERBOSE("{}{} ignored", string_from_uint32(command), field);
            } break;

            default:
                LOG_WARNING("{}: unsupported command {} at line {}, skipped", filename, string_from_uint32(command), reader.line_number);
                break;
            }

            // ignore everything up to (but not including) the *
            CHECK(reader.read_until(nullptr, '*'));

            // skip the trailing *
            reader.skip(1);

            // % means end of RS274X commands
            char c;
            CHECK(reader.peek(&c));
            if(c == '%') {
                reader.skip(1);
                return ok;
            }
        }
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code gerber_file::parse_format_specification()
    {
        char c;
        CHECK(reader.read_char(&c));

        switch(c) {

        case 'L':
            format.omit_zeros = omit_zeros_leading;
            break;

        case 'T':
            format.omit_zeros = omit_zeros_trailing;
            break;

        case 'D':
            format.omit_zeros = omit_zeros_explicit;
            break;

        default:
            LOG_ERROR("FS: expected [L|T|D], got {}", string_from_char(c));
            return error_invalid_format_specification;
        }

        CHECK(reader.read_char(&c));

        switch(c) {

        case 'A':
            format.coordinate = coordinate_absolute;
            break;

        case 'I':
            format.coordinate = coordinate_incremental;
            break;

        default:
            LOG_ERROR("FS: expected [A|I], got {}", string_from_char(c));
            return error_invalid_format_specification;
        }

        auto read_digit = [&](int *digit) {
            char d;
            CHECK(reader.read_char(&d));
            if(d < '0' || d > '9') {
                LOG_ERROR("FS: expected digit, got {}", string_from_char(d));
                return error_invalid_format_specification;
            }
            *digit = d - '0';
            return ok;
        };

        CHECK(reader.read_char(&c));

        while(c != '*') {

            int unused;

            switch(c) {

            case 'N':
            case 'G':
            case 'D':
            case 'M':
                CHECK(read_digit(&unused));
                break;

            case 'X':
                CHECK(read_digit(&format.integral_part_x));
                CHECK(read_digit(&format.decimal_part_x));
                break;

            case 'Y':
                CHECK(read_digit(&format.integral_part_y));
                CHECK(read_digit(&format.decimal_part_y));
                break;

            default:
                LOG_ERROR("FS: expected [N|G|D|M|X|Y], got {}", string_from_char(c));
                return error_invalid_format_specification;
            }
            CHECK(reader.read_char(&c));
        }
        format.specified = true;
        LOG_DEBUG("{}", format);
        reader.rewind(1);
        return ok;
    }

    //////////////////////////////////////////////////////////////////////
    // a new SR (or an empty one) closes the open block

    maskforge_error_code gerber_file::parse_step_and_repeat()
    {
        close_step_and_repeat();

        gerber_step_and_repeat sr;

        char c;
        CHECK(reader.read_char(&c));

        while(c != '*') {

            double d;

            switch(c) {

            case 'X':
                CHECK(reader.get_int(&sr.repeat_x));
                break;

            case 'Y':
                CHECK(reader.get_int(&sr.repeat_y));
                break;

            case 'I':
                CHECK(reader.get_double(&d));
                sr.step_x = d * unit_scale();
                break;

            case 'J':
                CHECK(reader.get_double(&d));
                sr.step_y = d * unit_scale();
                break;

            default:
                LOG_ERROR("SR: expected [X|Y|I|J], got {} at line {}", string_from_char(c), reader.line_number);
                return error_invalid_step_repeat;
            }
            CHECK(reader.read_char(&c));
        }
        reader.rewind(1);

        if(sr.repeat_x < 1 || sr.repeat_y < 1) {
            LOG_ERROR("SR: repeat counts must be at least 1, got {}x{} at line {}", sr.repeat_x, sr.repeat_y, reader.line_number);
            return error_invalid_step_repeat;
        }

        if(sr.repeat_x * sr.repeat_y > 1) {
            sr.first_net = nets.size();
            state.step_and_repeat = sr;
            state.in_step_and_repeat = true;
            LOG_DEBUG("Step and repeat: {}x{} step {},{}", sr.repeat_x, sr.repeat_y, sr.step_x, sr.step_y);
        }
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code gerber_file::parse_aperture_definition(gerber_aperture *aperture)
    {
        LOG_CONTEXT("parse_aperture", info);

        char c;
        CHECK(reader.read_char(&c));
        if(c != 'D') {
            LOG_ERROR("Invalid char after AD, found: {}", string_from_char(c));
            return error_unexpected_input;
        }
        int aperture_id;
        CHECK(reader.get_int(&aperture_id));

        if(aperture_id < min_aperture || aperture_id > max_num_apertures) {
            LOG_ERROR("Aperture number D{} must be >= {}, <= {}", aperture_id, min_aperture, max_num_apertures);
            return error_invalid_aperture_definition;
        }

        std::string definition;
        CHECK(reader.read_until(&definition, '*'));

        std::vector<std::string> tokens;
        tokenize(definition, tokens, ",", tokenize_remove_empty);

        if(tokens.empty()) {
            LOG_ERROR("Bad aperture definition: {}", definition);
            return error_invalid_aperture_definition;
        }

        gerber_aperture_macro const *macro{ nullptr };

        if(tokens[0].size() == 1 && std::string_view("CROP").find(tokens[0][0]) != std::string_view::npos) {
            switch(tokens[0][0]) {
            case 'C':
                aperture->aperture_type = aperture_type_circle;
                break;
            case 'R':
                aperture->aperture_type = aperture_type_rectangle;
                break;
            case 'O':
                aperture->aperture_type = aperture_type_oval;
                break;
            case 'P':
                aperture->aperture_type = aperture_type_polygon;
                break;
            }
            LOG_DEBUG("Aperture definition {} is a {}", aperture_id, aperture_type_name(aperture->aperture_type));

        } else {
            aperture->aperture_type = aperture_type_macro;
            aperture->macro_name = tokens[0];
            auto found = aperture_macros.find(tokens[0]);
            if(found == aperture_macros.end()) {
                LOG_ERROR("Unknown aperture macro: {}", tokens[0]);
                return error_unknown_aperture_macro;
            }
            macro = &found->second;
            LOG_DEBUG("Aperture definition {} is macro {}", aperture_id, macro->name);
        }

        for(size_t token_index = 1; token_index < tokens.size(); ++token_index) {
            std::vector<std::string> parameters;
            tokenize(tokens[token_index], parameters, "Xx", tokenize_remove_empty);
            for(std::string const &s : parameters) {
                if(aperture->parameters.size() == max_num_aperture_parameters) {
                    LOG_ERROR("Parameter count exceeds max allowed ({})", max_num_aperture_parameters);
                    return error_invalid_aperture_definition;
                }
                auto value = double_from_string_view(s);
                if(!value.has_value()) {
                    LOG_ERROR("Invalid number in aperture parameters: \"{}\"", s);
                    return error_invalid_number;
                }
                aperture->parameters.push_back(value.value());
            }
        }

        double scale = unit_scale();

        // standard apertures: everything but the vertex count and rotation of a polygon is a length
        switch(aperture->aperture_type) {
        case aperture_type_circle:
        case aperture_type_rectangle:
        case aperture_type_oval:
            for(auto &p : aperture->parameters) {
                p *= scale;
            }
            break;
        case aperture_type_polygon:
            for(size_t i = 0; i < aperture->parameters.size(); ++i) {
                if(i != 1 && i != 2) {
                    aperture->parameters[i] *= scale;
                }
            }
            break;
        default:
            break;
        }
        aperture->aperture_number = aperture_id;
        CHECK(aperture->build_shape(scale, macro));
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code gerber_file::draw_flash(maskforge_draw_interface &drawer, gerber_net const &net, gerber_aperture const &aperture,
                                                 int entity_id) const
    {
        matrix m = matrix::multiply(net.aperture_matrix, matrix::translate(net.end));
        std::vector<maskforge_draw_element> elements;
        for(auto const &contour : aperture.shape) {
            elements.clear();
            for(auto const &element : contour.elements) {
                elements.push_back(element.transformed(m));
            }
            CHECK(drawer.fill_elements(elements.data(), elements.size(), net.polarity, entity_id, contour.exposure));
        }
        return ok;
    }

    //////////////////////////////////////////////////////////////////////
    // a capsule: two sides and two semicircle ends

    maskforge_error_code gerber_file::draw_linear_circle(maskforge_draw_interface &drawer, gerber_net const &net, double width, int entity_id) const
    {
        vec2d start = net.start;
        vec2d end = net.end;

        double thickness = width / 2;

        if(start.x == end.x && start.y == end.y) {
            maskforge_draw_element e(start, 0.0, 360.0, thickness);
            return drawer.fill_elements(&e, 1, net.polarity, entity_id, true);
        }

        double dx = end.x - start.x;
        double dy = end.y - start.y;

        double rad = atan2(dy, dx);

        double ox = cos(rad) * thickness;
        double oy = sin(rad) * thickness;

        double deg = rad_2_deg(rad);

        vec2d p1(start.x + oy, start.y - ox);
        vec2d p2(end.x + oy, end.y - ox);
        vec2d p3(end.x - oy, end.y + ox);
        vec2d p4(start.x - oy, start.y + ox);

        maskforge_draw_element e[4] = { maskforge_draw_element(p1, p2),                                      //
                                        maskforge_draw_element(end, deg - 90, deg + 90, thickness),          //
                                        maskforge_draw_element(p3, p4),                                      //
                                        maskforge_draw_element(start, deg + 90, deg + 270, thickness) };    //

        return drawer.fill_elements(e, 4, net.polarity, entity_id, true);
    }

    //////////////////////////////////////////////////////////////////////
    // any other aperture: hull of the outline at both ends

    maskforge_error_code gerber_file::draw_linear_sweep(maskforge_draw_interface &drawer, gerber_net const &net, gerber_aperture const &aperture,
                                                        int entity_id) const
    {
        std::vector<vec2d> outline = aperture.outline_points();
        if(outline.empty()) {
            return ok;
        }
        transform_points(net.aperture_matrix, outline);

        std::vector<vec2d> points;
        points.reserve(outline.size() * 2);
        for(auto const &p : outline) {
            points.push_back(p.add(net.start));
            points.push_back(p.add(net.end));
        }
        std::vector<vec2d> hull = convex_hull(std::move(points));
        if(hull.size() < 3) {
            return ok;
        }
        gerber_shape_contour contour = polygon_contour(hull);
        return drawer.fill_elements(contour.elements.data(), contour.elements.size(), net.polarity, entity_id, true);
    }

    //////////////////////////////////////////////////////////////////////
    // annular sector with round ends

    maskforge_error_code gerber_file::draw_arc(maskforge_draw_interface &drawer, gerber_net const &net, double thickness, int entity_id) const
    {
        gerber_arc const &arc = net.arc;

        double half = thickness / 2;
        double lo = std::min(arc.start_angle, arc.end_angle);
        double hi = std::max(arc.start_angle, arc.end_angle);

        double outer = arc.radius + half;
        double inner = arc.radius - half;

        vec2d p_lo = point_on_circle(arc.center, arc.radius, lo);
        vec2d p_hi = point_on_circle(arc.center, arc.radius, hi);

        if(inner > 0) {
            maskforge_draw_element e[4] = { maskforge_draw_element(arc.center, lo, hi, outer),              //
                                            maskforge_draw_element(p_hi, hi, hi + 180, half),               //
                                            maskforge_draw_element(arc.center, hi, lo, inner),              //
                                            maskforge_draw_element(p_lo, lo + 180, lo + 360, half) };       //
            return drawer.fill_elements(e, 4, net.polarity, entity_id, true);
        }

        // thicker than the radius, the inside edge collapses to the centre
        maskforge_draw_element e[3] = { maskforge_draw_element(arc.center, lo, hi, outer),                               //
                                        maskforge_draw_element(point_on_circle(arc.center, outer, hi), arc.center),      //
                                        maskforge_draw_element(arc.center, point_on_circle(arc.center, outer, lo)) };    //
        CHECK(drawer.fill_elements(e, 3, net.polarity, entity_id, true));

        maskforge_draw_element end_caps[2] = { maskforge_draw_element(p_lo, 0.0, 360.0, half), maskforge_draw_element(p_hi, 0.0, 360.0, half) };
        CHECK(drawer.fill_elements(&end_caps[0], 1, net.polarity, entity_id, true));
        CHECK(drawer.fill_elements(&end_caps[1], 1, net.polarity, entity_id, true));
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code gerber_file::fill_region_path(maskforge_draw_interface &drawer, gerber_net const &net, int entity_id) const
    {
        for(auto const &contour : net.contours) {
            CHECK(drawer.fill_elements(contour.data(), contour.size(), net.polarity, entity_id, true));
        }
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code gerber_file::draw(maskforge_draw_interface &drawer) const
    {
        size_t num_nets = nets.size();

        maskforge_timer timer;
        timer.reset();

        LOG_VERBOSE("DRAW BEGINS, {} nets", num_nets);

        for(size_t net_index = 0; net_index < num_nets; ++net_index) {

            gerber_net const &net = nets[net_index];
            int entity_id = static_cast<int>(net_index);

            if(net.net_type == net_type_region) {
                CHECK(fill_region_path(drawer, net, entity_id));
                continue;
            }

            auto found = apertures.find(net.aperture);
            if(found == apertures.end()) {
                LOG_WARNING("{} has no aperture, skipped", net);
                continue;
            }
            gerber_aperture const &aperture = found->second;

            double matrix_scale = sqrt(fabs(net.aperture_matrix.A * net.aperture_matrix.D - net.aperture_matrix.B * net.aperture_matrix.C));

            switch(net.net_type) {

            case net_type_flash:
                CHECK(draw_flash(drawer, net, aperture, entity_id));
                break;

            case net_type_stroke: {

                double width = aperture.stroke_width() * matrix_scale;

                if(net.interpolation == interpolation_linear) {
                    if(aperture.aperture_type == aperture_type_circle) {
                        if(width > 0) {
                            CHECK(draw_linear_circle(drawer, net, width, entity_id));
                        }
                    } else {
                        CHECK(draw_linear_sweep(drawer, net, aperture, entity_id));
                    }
                } else {
                    if(aperture.aperture_type != aperture_type_circle) {
                        LOG_VERBOSE("Arc with {} aperture D{} drawn with round ends", aperture_type_name(aperture.aperture_type), net.aperture);
                    }
                    if(width > 0) {
                        CHECK(draw_arc(drawer, net, width, entity_id));
                    }
                }
            } break;

            default:
                break;
            }
        }
        LOG_VERBOSE("DRAW COMPLETE, {} nets took {} seconds", num_nets, timer.elapsed_seconds());
        return ok;
    }

}    // namespace maskforge_lib
