//////////////////////////////////////////////////////////////////////
// GDSII stream: library model, discovery and flattening
// all coordinates are micrometres once loaded

#pragma once

#include <map>
#include <string>
#include <vector>
#include <filesystem>

#include "maskforge_error.h"
#include "maskforge_2d.h"

namespace maskforge_lib
{
    using namespace maskforge_2d;

    //////////////////////////////////////////////////////////////////////

    enum gds_record_type : uint8_t
    {
        gds_header = 0x00,
        gds_bgnlib = 0x01,
        gds_libname = 0x02,
        gds_units = 0x03,
        gds_endlib = 0x04,
        gds_bgnstr = 0x05,
        gds_strname = 0x06,
        gds_endstr = 0x07,
        gds_boundary = 0x08,
        gds_path = 0x09,
        gds_sref = 0x0A,
        gds_aref = 0x0B,
        gds_text = 0x0C,
        gds_layer = 0x0D,
        gds_datatype = 0x0E,
        gds_width = 0x0F,
        gds_xy = 0x10,
        gds_endel = 0x11,
        gds_sname = 0x12,
        gds_colrow = 0x13,
        gds_node = 0x15,
        gds_texttype = 0x16,
        gds_presentation = 0x17,
        gds_string = 0x19,
        gds_strans = 0x1A,
        gds_mag = 0x1B,
        gds_angle = 0x1C,
        gds_pathtype = 0x21,
        gds_propattr = 0x2B,
        gds_propvalue = 0x2C,
        gds_box = 0x2D,
        gds_boxtype = 0x2E,
        gds_bgnextn = 0x30,
        gds_endextn = 0x31
    };

    enum gds_data_type : uint8_t
    {
        gds_data_none = 0,
        gds_data_bitarray = 1,
        gds_data_int16 = 2,
        gds_data_int32 = 3,
        gds_data_real4 = 4,
        gds_data_real8 = 5,
        gds_data_ascii = 6
    };

    enum gds_element_type
    {
        gds_element_boundary,
        gds_element_path,
        gds_element_box,
        gds_element_sref,
        gds_element_aref,
        gds_element_text,
        gds_element_node
    };

    char const *gds_element_type_name(gds_element_type type);

    // excess-64 base 16 floating point
    double gds_decode_real8(uint8_t const *bytes);

    //////////////////////////////////////////////////////////////////////
    // STRANS, MAG, ANGLE: reflect about X, then magnify, then rotate counter clockwise

    struct gds_transform
    {
        bool reflect{ false };
        double magnification{ 1.0 };
        double angle_degrees{ 0.0 };

        matrix to_matrix(vec2d const &origin) const;
    };

    //////////////////////////////////////////////////////////////////////
    // one closed shape, contours with the same winding rule (holes run the other way)

    struct gds_polygon
    {
        int layer{};
        int datatype{};
        std::vector<std::vector<vec2d>> contours;

        std::string to_string() const
        {
            return fmt::format("POLYGON: LAYER {}/{} CONTOURS: {}", layer, datatype, contours.size());
        }
    };

    //////////////////////////////////////////////////////////////////////

    struct gds_element
    {
        gds_element_type element_type{ gds_element_boundary };
        int layer{};
        int datatype{};
        std::vector<vec2d> points;

        // paths
        double width{};
        int path_type{};
        double begin_extension{};
        double end_extension{};

        // references
        std::string reference;
        gds_transform transform{};
        int columns{ 1 };
        int rows{ 1 };

        // boundary, box and path as filled outlines, in the cell's own space
        std::vector<gds_polygon> polygons;

        std::string to_string() const
        {
            return fmt::format("ELEMENT: {} LAYER {}/{} POINTS: {} {}", gds_element_type_name(element_type), layer, datatype, points.size(), reference);
        }
    };

    //////////////////////////////////////////////////////////////////////

    struct gds_cell
    {
        std::string name;
        std::vector<gds_element> elements;
    };

    //////////////////////////////////////////////////////////////////////
    // result of flattening, nothing in the library refers to it

    struct gds_geometry
    {
        std::vector<gds_polygon> polygons;

        rect bounding_box() const;

        std::vector<gds_polygon> select(int layer, int datatype) const;
    };

    //////////////////////////////////////////////////////////////////////

    struct gds_library
    {
        std::string name;
        double user_units_per_db{ 1e-3 };
        double meters_per_db{ 1e-9 };
        std::vector<gds_cell> cells;
        std::map<std::string, size_t> cell_index;

        maskforge_error_code load(std::filesystem::path const &file_path);
        maskforge_error_code load(uint8_t const *data, size_t size);

        double um_per_db() const
        {
            return meters_per_db * 1e6;
        }

        gds_cell const *find_cell(std::string const &cell_name) const;

        // file order
        std::vector<std::string> list_cells() const;

        // sorted, unique, across all cells
        std::vector<int> list_layers() const;

        // cells nobody references, file order
        std::vector<std::string> top_cells() const;

        maskforge_error_code flatten(std::string const &cell_name, gds_geometry &geometry) const;

        maskforge_error_code flatten_cell(gds_cell const &cell, matrix const &transform, std::vector<std::string> &stack, gds_geometry &geometry) const;
    };

}    // namespace maskforge_lib

MASKFORGE_MAKE_FORMATTER(maskforge_lib::gds_polygon);
MASKFORGE_MAKE_FORMATTER(maskforge_lib::gds_element);
