//////////////////////////////////////////////////////////////////////
// the three source types turned into display canvases

#pragma once

#include <optional>
#include <string>

#include "maskforge_error.h"
#include "maskforge_geometry.h"
#include "maskforge_compositor.h"
#include "maskforge_gerber.h"
#include "maskforge_gds.h"

namespace maskforge_lib
{
    //////////////////////////////////////////////////////////////////////
    // grayscale source, thresholded, into both circles

    maskforge_error_code bitmap_to_canvas(gray_image const &source, display_geometry const &display, circle_projection_spec const &circles,
                                          int threshold_value, gray_image &canvas);

    //////////////////////////////////////////////////////////////////////
    // twice the display density so the Lanczos step has something to work with

    int gerber_dots_per_mm(display_geometry const &display);

    maskforge_error_code rasterize_gerber(gerber_file const &gerber, double dots_per_mm, layer_raster &layer);

    maskforge_error_code gerber_to_canvas(gerber_file const &gerber, display_geometry const &display, pcb_placement_spec const &pcb, bool mirror,
                                          bool inverted, gray_image &canvas);

    //////////////////////////////////////////////////////////////////////
    // the cell, centred on its own bounding box, at display scale, one inset's worth of pixels

    maskforge_error_code rasterize_gds(gds_library const &library, std::string const &cell_name, int layer, display_geometry const &display,
                                       circle_layout const &layout, gray_image &raster);

    maskforge_error_code gds_to_canvas(gds_library const &library, std::string const &cell_name, int layer, display_geometry const &display,
                                       circle_projection_spec const &circles, gray_image &canvas);

    //////////////////////////////////////////////////////////////////////
    // first top level cell and first layer, for when nobody says

    maskforge_error_code gds_default_cell(gds_library const &library, std::string &cell_name);

    maskforge_error_code gds_default_layer(gds_library const &library, int &layer);

}    // namespace maskforge_lib
