//////////////////////////////////////////////////////////////////////

#include "maskforge_raster_drawer.h"
#include "maskforge_adapters.h"

LOG_CONTEXT("adapters", debug);

namespace maskforge_lib
{
    //////////////////////////////////////////////////////////////////////

    maskforge_error_code bitmap_to_canvas(gray_image const &source, display_geometry const &display, circle_projection_spec const &circles,
                                          int threshold_value, gray_image &canvas)
    {
        FAIL_IF(source.empty(), error_image_decode_failed);
        canvas = compose_dual_circle(source, display, circles, threshold_value);
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    int gerber_dots_per_mm(display_geometry const &display)
    {
        return static_cast<int>(display.px_per_mm_x() * 2);
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code rasterize_gerber(gerber_file const &gerber, double dots_per_mm, layer_raster &layer)
    {
        maskforge_raster_drawer drawer;
        CHECK(gerber.draw(drawer));
        CHECK(drawer.render(dots_per_mm, layer));
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code gerber_to_canvas(gerber_file const &gerber, display_geometry const &display, pcb_placement_spec const &pcb, bool mirror,
                                          bool inverted, gray_image &canvas)
    {
        int dpmm = gerber_dots_per_mm(display);
        if(dpmm < 1) {
            LOG_ERROR("Display density {:g} px/mm is too low to rasterize Gerber", display.px_per_mm_x());
            return error_invalid_configuration;
        }

        layer_raster layer;
        CHECK(rasterize_gerber(gerber, dpmm, layer));
        CHECK(compose_pcb_canvas(layer, display, pcb, mirror, inverted, canvas));
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code rasterize_gds(gds_library const &library, std::string const &cell_name, int layer, display_geometry const &display,
                                       circle_layout const &layout, gray_image &raster)
    {
        gds_geometry geometry;
        CHECK(library.flatten(cell_name, geometry));

        std::vector<gds_polygon> selected = geometry.select(layer, 0);
        if(selected.empty()) {
            LOG_ERROR("No polygons on layer {} in cell {}", layer, cell_name);
            return error_no_geometry_on_layer;
        }

        // the whole cell decides the centre, not just the chosen layer
        rect box = geometry.bounding_box();
        if(!box.is_valid()) {
            LOG_ERROR("Cell {} is empty", cell_name);
            return error_empty_cell;
        }
        vec2d center = box.mid_point();

        double const scale_x = display.px_per_mm_x() / 1000.0;
        double const scale_y = display.px_per_mm_y() / 1000.0;

        LOG_VERBOSE("Cell {} layer {}: {} polygons, bounds {} um", cell_name, layer, selected.size(), box);

        raster = gray_image(layout.width(), layout.height(), 0);

        std::vector<std::vector<vec2d>> contours;
        for(auto const &polygon : selected) {
            contours.clear();
            for(auto const &contour : polygon.contours) {
                std::vector<vec2d> &c = contours.emplace_back();
                c.reserve(contour.size());
                for(auto const &p : contour) {
                    c.emplace_back((p.x - center.x) * scale_x + layout.radius_x, (center.y - p.y) * scale_y + layout.radius_y);
                }
            }
            fill_polygons(raster, contours, 255);
        }
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code gds_to_canvas(gds_library const &library, std::string const &cell_name, int layer, display_geometry const &display,
                                       circle_projection_spec const &circles, gray_image &canvas)
    {
        circle_layout layout = layout_circles(display, circles);

        gray_image raster;
        CHECK(rasterize_gds(library, cell_name, layer, display, layout, raster));

        CHECK(compose_dual_circle_sized(raster, display, circles, canvas));
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code gds_default_cell(gds_library const &library, std::string &cell_name)
    {
        std::vector<std::string> top = library.top_cells();
        if(top.empty()) {
            LOG_ERROR("Library {} has no top level cell", library.name);
            return error_cell_not_found;
        }
        if(top.size() > 1) {
            LOG_INFO("{} top level cells, using {}", top.size(), top.front());
        }
        cell_name = top.front();
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code gds_default_layer(gds_library const &library, int &layer)
    {
        std::vector<int> layers = library.list_layers();
        if(layers.empty()) {
            LOG_ERROR("Library {} has no geometry", library.name);
            return error_no_geometry_on_layer;
        }
        layer = layers.front();
        return ok;
    }

}    // namespace maskforge_lib
