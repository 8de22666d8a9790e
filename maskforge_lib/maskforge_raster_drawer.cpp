//////////////////////////////////////////////////////////////////////

#include <algorithm>
#include <cmath>

#include <tesselator.h>

#include "maskforge_error.h"
#include "maskforge_util.h"
#include "maskforge_raster_drawer.h"

LOG_CONTEXT("raster_drawer", debug);

namespace maskforge_lib
{
    //////////////////////////////////////////////////////////////////////

    void maskforge_raster_drawer::clear()
    {
        entities.clear();
        extent = rect::empty();
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code maskforge_raster_drawer::fill_elements(maskforge_draw_element const *elements, size_t num_elements, maskforge_polarity polarity,
                                                                int entity_id, bool exposure)
    {
        std::vector<vec2d> points;
        flatten_elements(elements, num_elements, arc_degrees, points);

        if(points.size() < 3) {
            LOG_DEBUG("CULLED SECTION OF ENTITY {}", entity_id);
            return ok;
        }

        // exposed contours counter clockwise, holes clockwise, so positive winding does the rest
        bool counter_clockwise = signed_area(points) > 0;
        if(counter_clockwise != exposure) {
            std::reverse(points.begin(), points.end());
        }

        if(entities.empty() || entities.back().entity_id != entity_id || entities.back().polarity != polarity) {
            raster_entity &e = entities.emplace_back();
            e.entity_id = entity_id;
            e.polarity = polarity;
        }

        raster_entity &e = entities.back();
        e.has_exposure |= exposure;
        e.contours.push_back({ e.points.size() / 2, points.size() });
        for(auto const &p : points) {
            e.points.push_back(static_cast<float>(p.x));
            e.points.push_back(static_cast<float>(p.y));
            extent.expand_to_contain(p);
        }
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code maskforge_raster_drawer::render(double dots_per_mm, layer_raster &layer) const
    {
        if(!extent.is_valid()) {
            LOG_ERROR("Nothing was drawn");
            return error_empty_layer;
        }
        FAIL_IF(dots_per_mm <= 0, error_invalid_configuration);

        double raster_w = std::max(1.0, ceil(extent.width() * dots_per_mm));
        double raster_h = std::max(1.0, ceil(extent.height() * dots_per_mm));

        if(!image_size_ok(raster_w, raster_h)) {
            LOG_ERROR("Layer extent {:g}x{:g}mm at {:g} dots/mm needs a {:g}x{:g} raster, too large", extent.width(), extent.height(), dots_per_mm, raster_w,
                      raster_h);
            return error_raster_too_large;
        }

        int width = static_cast<int>(raster_w);
        int height = static_cast<int>(raster_h);

        LOG_VERBOSE("Rendering {} entities at {} dots/mm into {}x{}", entities.size(), dots_per_mm, width, height);

        layer.image = gray_image(width, height, 255);
        layer.min_x_mm = extent.min_pos.x;
        layer.max_y_mm = extent.max_pos.y;
        layer.width_mm = extent.width();
        layer.height_mm = extent.height();

        double const min_x = extent.min_pos.x;
        double const max_y = extent.max_pos.y;

        std::vector<std::vector<vec2d>> polygons;

        for(auto const &entity : entities) {

            // nothing but holes draws nothing
            if(!entity.has_exposure) {
                continue;
            }

            TESStesselator *tesselator = tessNewTess(nullptr);
            FAIL_IF(tesselator == nullptr, error_tesselation_failed);
            DEFER(tessDeleteTess(tesselator));

            for(auto const &c : entity.contours) {
                tessAddContour(tesselator, 2, entity.points.data() + c.offset * 2, sizeof(float) * 2, static_cast<int>(c.count));
            }

            // explicit normal so the contour orientation is taken as given
            TESSreal normal[3] = { 0, 0, 1 };
            if(tessTesselate(tesselator, TESS_WINDING_POSITIVE, TESS_BOUNDARY_CONTOURS, 0, 2, normal) == 0) {
                LOG_ERROR("Tesselation of entity {} failed", entity.entity_id);
                return error_tesselation_failed;
            }

            TESSreal const *verts = tessGetVertices(tesselator);
            int const *elems = tessGetElements(tesselator);
            int const num_elems = tessGetElementCount(tesselator);

            polygons.clear();
            for(int i = 0; i < num_elems; ++i) {
                int base = elems[i * 2];
                int count = elems[i * 2 + 1];
                std::vector<vec2d> &polygon = polygons.emplace_back();
                polygon.reserve(count);
                for(int j = 0; j < count; ++j) {
                    TESSreal const *v = verts + (base + j) * 2;
                    polygon.emplace_back((v[0] - min_x) * dots_per_mm, (max_y - v[1]) * dots_per_mm);
                }
            }
            fill_polygons(layer.image, polygons, entity.polarity == polarity_dark ? 0 : 255);
        }
        LOG_VERBOSE("Rendered layer {}", layer);
        return ok;
    }

}    // namespace maskforge_lib
