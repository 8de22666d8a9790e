//////////////////////////////////////////////////////////////////////
// RS-274X parser: text in, nets out, nets drawn through a maskforge_draw_interface

#pragma once

#include <map>
#include <string>
#include <vector>
#include <filesystem>

#include "maskforge_error.h"
#include "maskforge_reader.h"
#include "maskforge_aperture.h"
#include "maskforge_draw.h"

namespace maskforge_lib
{
    //////////////////////////////////////////////////////////////////////

    enum gerber_omit_zeros
    {
        omit_zeros_leading,
        omit_zeros_trailing,
        omit_zeros_explicit
    };

    enum gerber_coordinate
    {
        coordinate_absolute,
        coordinate_incremental
    };

    enum gerber_unit
    {
        unit_unspecified,
        unit_inch,
        unit_millimeter
    };

    enum gerber_aperture_state
    {
        aperture_state_off,      // D02
        aperture_state_on,       // D01
        aperture_state_flash     // D03
    };

    enum gerber_interpolation
    {
        interpolation_linear,
        interpolation_clockwise_circular,
        interpolation_counterclockwise_circular
    };

    enum gerber_net_type
    {
        net_type_flash,
        net_type_stroke,
        net_type_region
    };

    char const *net_type_name(gerber_net_type type);

    //////////////////////////////////////////////////////////////////////

    struct gerber_format
    {
        gerber_omit_zeros omit_zeros{ omit_zeros_leading };
        gerber_coordinate coordinate{ coordinate_absolute };
        int integral_part_x{ 3 };
        int decimal_part_x{ 6 };
        int integral_part_y{ 3 };
        int decimal_part_y{ 6 };
        bool specified{ false };

        std::string to_string() const
        {
            return fmt::format("FORMAT: X{}.{} Y{}.{} OMIT: {} {}", integral_part_x, decimal_part_x, integral_part_y, decimal_part_y,
                               static_cast<int>(omit_zeros), coordinate == coordinate_absolute ? "absolute" : "incremental");
        }
    };

    //////////////////////////////////////////////////////////////////////
    // end_angle - start_angle is the signed sweep, positive is counter clockwise

    struct gerber_arc
    {
        vec2d center{};
        double radius{};
        double start_angle{};
        double end_angle{};

        double sweep_angle() const
        {
            return end_angle - start_angle;
        }

        std::string to_string() const
        {
            return fmt::format("ARC: CENTER: {}, RADIUS: {:g}, START: {:g}, END: {:g}", center, radius, start_angle, end_angle);
        }
    };

    //////////////////////////////////////////////////////////////////////
    // LM, LR, LS

    struct gerber_aperture_transform
    {
        bool mirror_x{ false };
        bool mirror_y{ false };
        double rotation{ 0.0 };
        double scale{ 1.0 };

        // mirror, then rotate, then scale
        matrix to_matrix() const;
    };

    //////////////////////////////////////////////////////////////////////

    struct gerber_net
    {
        gerber_net_type net_type{ net_type_flash };
        vec2d start{};
        vec2d end{};
        int aperture{};
        gerber_interpolation interpolation{ interpolation_linear };
        gerber_arc arc{};
        maskforge_polarity polarity{ polarity_dark };
        matrix aperture_matrix{ matrix::identity() };
        std::vector<std::vector<maskforge_draw_element>> contours;    // regions only
        int line_number{};

        gerber_net translated(vec2d const &offset) const;

        std::string to_string() const
        {
            return fmt::format("NET: {} D{} FROM {} TO {} (line {})", net_type_name(net_type), aperture, start, end, line_number);
        }
    };

    //////////////////////////////////////////////////////////////////////

    struct gerber_step_and_repeat
    {
        int repeat_x{ 1 };
        int repeat_y{ 1 };
        double step_x{};    // mm
        double step_y{};
        size_t first_net{};
    };

    //////////////////////////////////////////////////////////////////////

    struct gerber_state
    {
        int current_x{};
        int current_y{};

        int previous_x{};
        int previous_y{};

        int center_x{};
        int center_y{};

        int current_aperture{};

        bool changed_state{ false };

        gerber_aperture_state aperture_state{ aperture_state_off };
        gerber_interpolation interpolation{ interpolation_linear };
        maskforge_polarity polarity{ polarity_dark };
        gerber_aperture_transform aperture_transform{};

        bool is_region_fill{ false };
        bool is_multi_quadrant{ false };

        std::vector<std::vector<maskforge_draw_element>> region_contours;
        std::vector<maskforge_draw_element> region_contour;

        bool in_step_and_repeat{ false };
        gerber_step_and_repeat step_and_repeat{};

        void changed(bool state_changed = true)
        {
            changed_state = state_changed;
        }
    };

    //////////////////////////////////////////////////////////////////////

    struct gerber_file
    {
        static constexpr int min_aperture = 10;
        static constexpr int max_num_apertures = 99999;

        std::string filename;

        gerber_unit unit{ unit_unspecified };
        gerber_format format{};
        gerber_state state{};
        maskforge_reader reader{};

        std::map<std::string, gerber_aperture_macro> aperture_macros;
        std::map<int, gerber_aperture> apertures;
        std::vector<gerber_net> nets;

        gerber_file() = default;

        maskforge_error_code parse_file(std::filesystem::path const &file_path);
        maskforge_error_code parse_memory(char const *data, size_t size);

        // entity_id of each net is its index
        maskforge_error_code draw(maskforge_draw_interface &drawer) const;

        bool warned_units{ false };
        bool warned_format{ false };
        bool warned_macro_stroke{ false };

        void reset();

        double unit_scale();
        vec2d coordinate_to_mm(int x, int y);

        maskforge_error_code do_parse();
        maskforge_error_code parse_gerber_segment();
        maskforge_error_code parse_g_code();
        maskforge_error_code parse_d_code();
        maskforge_error_code parse_m_code(bool *done);
        maskforge_error_code parse_rs274x();
        maskforge_error_code parse_format_specification();
        maskforge_error_code parse_aperture_definition(gerber_aperture *aperture);
        maskforge_error_code parse_step_and_repeat();
        maskforge_error_code parse_coordinate(char axis, int *coordinate);
        maskforge_error_code read_command(std::string *command, size_t length);

        maskforge_error_code execute_operation();
        void begin_region();
        void close_region_contour();
        void end_region();
        void close_step_and_repeat();

        maskforge_error_code calculate_arc(vec2d const &start, vec2d const &end, vec2d const &offset, bool is_clockwise, gerber_arc *arc);

        maskforge_error_code draw_flash(maskforge_draw_interface &drawer, gerber_net const &net, gerber_aperture const &aperture, int entity_id) const;
        maskforge_error_code draw_linear_circle(maskforge_draw_interface &drawer, gerber_net const &net, double width, int entity_id) const;
        maskforge_error_code draw_linear_sweep(maskforge_draw_interface &drawer, gerber_net const &net, gerber_aperture const &aperture,
                                               int entity_id) const;
        maskforge_error_code draw_arc(maskforge_draw_interface &drawer, gerber_net const &net, double thickness, int entity_id) const;
        maskforge_error_code fill_region_path(maskforge_draw_interface &drawer, gerber_net const &net, int entity_id) const;
    };

}    // namespace maskforge_lib

MASKFORGE_MAKE_FORMATTER(maskforge_lib::gerber_format);
MASKFORGE_MAKE_FORMATTER(maskforge_lib::gerber_arc);
MASKFORGE_MAKE_FORMATTER(maskforge_lib::gerber_net);
