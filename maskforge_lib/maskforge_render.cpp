//////////////////////////////////////////////////////////////////////

#include <exception>
#include <new>

#include "maskforge_util.h"
#include "maskforge_image_io.h"
#include "maskforge_adapters.h"
#include "maskforge_render.h"

LOG_CONTEXT("render", debug);

namespace
{
    using namespace maskforge_lib;

    //////////////////////////////////////////////////////////////////////

    template <class... Ts> struct overloaded : Ts...
    {
        using Ts::operator()...;
    };

    //////////////////////////////////////////////////////////////////////

    render_result failure(maskforge_error_code code, std::string const &message, std::filesystem::path const &input, int line = 0)
    {
        render_result result;
        result.error = maskforge_error(code, message.empty() ? std::string(get_error_text(code)) : message, input.string(), line);
        return result;
    }

    //////////////////////////////////////////////////////////////////////

    render_result render_bitmap(render_request const &request, bitmap_request const &bitmap)
    {
        gray_image source;
        maskforge_error_code error = load_image(bitmap.input, source);
        if(error != ok) {
            return failure(error, {}, bitmap.input);
        }
        LOG_VERBOSE("Bitmap {} is {}", bitmap.input.string(), source);

        render_result result;
        error = bitmap_to_canvas(source, request.display, request.circles, bitmap.threshold, result.canvas);
        if(error != ok) {
            return failure(error, {}, bitmap.input);
        }
        return result;
    }

    //////////////////////////////////////////////////////////////////////

    render_result render_gerber(render_request const &request, gerber_request const &gerber_req)
    {
        gerber_file gerber;
        maskforge_error_code error = gerber.parse_file(gerber_req.input);
        if(error != ok) {
            return failure(error, fmt::format("Error parsing Gerber: {}", get_error_text(error)), gerber_req.input, gerber.reader.line_number);
        }
        LOG_VERBOSE("Gerber {}: {} nets, {} apertures", gerber_req.input.string(), gerber.nets.size(), gerber.apertures.size());

        render_result result;
        error = gerber_to_canvas(gerber, request.display, gerber_req.pcb, gerber_req.mirror, gerber_req.invert, result.canvas);
        if(error != ok) {
            return failure(error, {}, gerber_req.input);
        }
        return result;
    }

    //////////////////////////////////////////////////////////////////////

    render_result render_gds(render_request const &request, gds_request const &gds)
    {
        gds_library library;
        maskforge_error_code error = library.load(gds.input);
        if(error != ok) {
            return failure(error, fmt::format("Error reading GDSII: {}", get_error_text(error)), gds.input);
        }

        std::string cell = gds.cell;
        if(cell.empty()) {
            error = gds_default_cell(library, cell);
            if(error != ok) {
                return failure(error, {}, gds.input);
            }
        }

        int layer;
        if(gds.layer.has_value()) {
            layer = gds.layer.value();
        } else {
            error = gds_default_layer(library, layer);
            if(error != ok) {
                return failure(error, {}, gds.input);
            }
        }

        LOG_VERBOSE("GDS {}: cell {} layer {}", gds.input.string(), cell, layer);

        render_result result;
        error = gds_to_canvas(library, cell, layer, request.display, request.circles, result.canvas);
        if(error != ok) {
            switch(error) {
            case error_cell_not_found:
                return failure(error, fmt::format("Cell '{}' not found", cell), gds.input);
            case error_no_geometry_on_layer:
                return failure(error, fmt::format("No polygons on layer {} of cell '{}'", layer, cell), gds.input);
            default:
                return failure(error, {}, gds.input);
            }
        }
        return result;
    }

}    // namespace

namespace maskforge_lib
{
    //////////////////////////////////////////////////////////////////////

    std::filesystem::path const &render_request::input() const
    {
        return std::visit([](auto const &s) -> std::filesystem::path const & { return s.input; }, source);
    }

    //////////////////////////////////////////////////////////////////////

    char const *render_request::tool_name() const
    {
        return std::visit(overloaded{ [](bitmap_request const &) { return "bitmap"; }, [](gerber_request const &) { return "gerber"; },
                                      [](gds_request const &) { return "gds"; } },
                          source);
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code validate_request(render_request const &request, std::string &message)
    {
        CHECK(validate_display(request.display, message));

        if(std::holds_alternative<gerber_request>(request.source)) {
            CHECK(validate_pcb(std::get<gerber_request>(request.source).pcb, message));
            return ok;
        }

        CHECK(validate_circles(request.circles, request.display, message));

        if(std::holds_alternative<bitmap_request>(request.source)) {
            CHECK(validate_threshold(std::get<bitmap_request>(request.source).threshold, message));
        }
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    render_result render(render_request const &request)
    {
        maskforge_util::maskforge_timer timer;
        timer.reset();

        std::string message;
        maskforge_error_code error = validate_request(request, message);
        if(error != ok) {
            return failure(error, message, request.input());
        }

        LOG_VERBOSE("Render {} {} onto {}", request.tool_name(), request.input().string(), request.display);

        // the raster stages allocate (and OpenCV throws), nothing may leave here but a render_result
        render_result result;
        try {
            result = std::visit(overloaded{ [&](bitmap_request const &r) { return render_bitmap(request, r); },
                                            [&](gerber_request const &r) { return render_gerber(request, r); },
                                            [&](gds_request const &r) { return render_gds(request, r); } },
                                request.source);
        } catch(std::bad_alloc const &) {
            LOG_ERROR("Out of memory rendering {}", request.input().string());
            return failure(error_out_of_memory, "Out of memory", request.input());
        } catch(std::exception const &e) {
            LOG_ERROR("Rendering {} failed: {}", request.input().string(), e.what());
            return failure(error_render_failed, e.what(), request.input());
        }

        if(result.ok()) {
            LOG_VERBOSE("Rendered {} in {:.3f}s", request.input().string(), timer.elapsed_seconds());
        }
        return result;
    }

}    // namespace maskforge_lib
