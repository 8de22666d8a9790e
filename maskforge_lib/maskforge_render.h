//////////////////////////////////////////////////////////////////////
// one call from a file on disk to a finished display canvas

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <variant>

#include "maskforge_error.h"
#include "maskforge_geometry.h"
#include "maskforge_image.h"

namespace maskforge_lib
{
    //////////////////////////////////////////////////////////////////////

    struct bitmap_request
    {
        std::filesystem::path input;
        int threshold{ 128 };
    };

    //////////////////////////////////////////////////////////////////////

    struct gerber_request
    {
        std::filesystem::path input;
        pcb_placement_spec pcb{};
        bool mirror{ true };
        bool invert{ false };
    };

    //////////////////////////////////////////////////////////////////////
    // empty cell name means the first top level cell, no layer means the lowest one

    struct gds_request
    {
        std::filesystem::path input;
        std::string cell;
        std::optional<int> layer;
    };

    //////////////////////////////////////////////////////////////////////

    using render_source = std::variant<bitmap_request, gerber_request, gds_request>;

    struct render_request
    {
        display_geometry display{};
        circle_projection_spec circles{};
        render_source source;

        std::filesystem::path const &input() const;

        char const *tool_name() const;
    };

    //////////////////////////////////////////////////////////////////////
    // either a canvas exactly display sized, or what went wrong

    struct render_result
    {
        maskforge_error error{};
        gray_image canvas{};

        bool ok() const
        {
            return error.error_code == maskforge_lib::ok;
        }
    };

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code validate_request(render_request const &request, std::string &message);

    render_result render(render_request const &request);

}    // namespace maskforge_lib
