//////////////////////////////////////////////////////////////////////

#include <algorithm>
#include <cmath>
#include <set>

#include <clipper2/clipper.h>

#include "maskforge_error.h"
#include "maskforge_util.h"
#include "maskforge_gds.h"

LOG_CONTEXT("gds", debug);

namespace
{
    using namespace maskforge_lib;

    //////////////////////////////////////////////////////////////////////
    // big endian records: u16 length (including the header), u8 record type, u8 data type

    struct gds_record
    {
        uint8_t record_type{};
        uint8_t data_type{};
        uint8_t const *data{};
        size_t size{};
        size_t file_offset{};

        int16_t get_int16(size_t index) const
        {
            uint8_t const *p = data + index * 2;
            return static_cast<int16_t>((p[0] << 8) | p[1]);
        }

        int32_t get_int32(size_t index) const
        {
            uint8_t const *p = data + index * 4;
            return static_cast<int32_t>((static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) | (static_cast<uint32_t>(p[2]) << 8) |
                                        static_cast<uint32_t>(p[3]));
        }

        double get_real8(size_t index) const
        {
            return gds_decode_real8(data + index * 8);
        }

        std::string get_string() const
        {
            std::string s(reinterpret_cast<char const *>(data), size);
            while(!s.empty() && s.back() == '\0') {
                s.pop_back();
            }
            return s;
        }
    };

    //////////////////////////////////////////////////////////////////////

    struct gds_stream
    {
        uint8_t const *data{};
        size_t size{};
        size_t pos{};

        bool eof() const
        {
            return pos >= size;
        }

        maskforge_error_code read_record(gds_record &record)
        {
            if(size - pos < 4) {
                LOG_ERROR("Truncated record header at offset {}", pos);
                return error_bad_gds_record;
            }
            size_t length = (static_cast<size_t>(data[pos]) << 8) | data[pos + 1];
            if(length < 4 || (length & 1) != 0 || length > size - pos) {
                LOG_ERROR("Bad record length {} at offset {}", length, pos);
                return error_bad_gds_record;
            }
            record.record_type = data[pos + 2];
            record.data_type = data[pos + 3];
            record.data = data + pos + 4;
            record.size = length - 4;
            record.file_offset = pos;
            pos += length;
            return ok;
        }
    };

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code expect_data(gds_record const &record, gds_data_type data_type, size_t min_size)
    {
        if(record.data_type != data_type || record.size < min_size) {
            LOG_ERROR("Record 0x{:02X} at offset {}: expected data type {} with at least {} bytes, got type {} with {} bytes", record.record_type,
                      record.file_offset, static_cast<int>(data_type), min_size, record.data_type, record.size);
            return error_bad_gds_record;
        }
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    bool is_element_start(uint8_t record_type)
    {
        switch(record_type) {
        case gds_boundary:
        case gds_path:
        case gds_sref:
        case gds_aref:
        case gds_text:
        case gds_node:
        case gds_box:
            return true;
        }
        return false;
    }

    //////////////////////////////////////////////////////////////////////

    gds_element_type element_type_from_record(uint8_t record_type)
    {
        switch(record_type) {
        case gds_path:
            return gds_element_path;
        case gds_sref:
            return gds_element_sref;
        case gds_aref:
            return gds_element_aref;
        case gds_text:
            return gds_element_text;
        case gds_node:
            return gds_element_node;
        case gds_box:
            return gds_element_box;
        default:
            return gds_element_boundary;
        }
    }

    //////////////////////////////////////////////////////////////////////
    // the stream repeats the first point at the end, drop it

    std::vector<vec2d> closed_outline(std::vector<vec2d> const &points)
    {
        std::vector<vec2d> outline = points;
        if(outline.size() > 1 && outline.front() == outline.back()) {
            outline.pop_back();
        }
        return outline;
    }

    //////////////////////////////////////////////////////////////////////
    // widen a path centre line into polygons

    std::vector<std::vector<vec2d>> inflate_path(gds_element const &element)
    {
        std::vector<std::vector<vec2d>> result;

        if(element.points.size() < 2 || element.width == 0) {
            LOG_VERBOSE("Degenerate path on layer {} ignored", element.layer);
            return result;
        }

        std::vector<vec2d> line = element.points;
        double half_width = fabs(element.width) / 2;

        Clipper2Lib::EndType end_type = Clipper2Lib::EndType::Butt;

        switch(element.path_type) {

        case 1:
            end_type = Clipper2Lib::EndType::Round;
            break;

        case 2:
            end_type = Clipper2Lib::EndType::Square;
            break;

        case 4: {
            // custom extensions, move the end points along the first and last segments
            auto extend = [](vec2d const &from, vec2d const &to, double distance) {
                vec2d d = to.subtract(from);
                double len = d.length();
                if(len == 0) {
                    return to;
                }
                return to.add(d.scale(distance / len));
            };
            line.front() = extend(line[1], line[0], element.begin_extension);
            line.back() = extend(line[line.size() - 2], line.back(), element.end_extension);
        } break;

        default:
            break;
        }

        Clipper2Lib::PathD path;
        path.reserve(line.size());
        for(auto const &p : line) {
            path.push_back(Clipper2Lib::PointD(p.x, p.y));
        }

        Clipper2Lib::PathsD inflated = Clipper2Lib::InflatePaths({ path }, half_width, Clipper2Lib::JoinType::Miter, end_type, 2.0, 4);

        for(auto const &inflated_path : inflated) {
            std::vector<vec2d> &contour = result.emplace_back();
            contour.reserve(inflated_path.size());
            for(auto const &p : inflated_path) {
                contour.emplace_back(p.x, p.y);
            }
        }
        return result;
    }

    //////////////////////////////////////////////////////////////////////

    void build_polygons(gds_element &element)
    {
        gds_polygon polygon;
        polygon.layer = element.layer;
        polygon.datatype = element.datatype;

        switch(element.element_type) {

        case gds_element_boundary:
        case gds_element_box: {
            std::vector<vec2d> outline = closed_outline(element.points);
            if(outline.size() < 3) {
                LOG_VERBOSE("Degenerate {} on layer {} ignored", gds_element_type_name(element.element_type), element.layer);
                return;
            }
            polygon.contours.push_back(std::move(outline));
        } break;

        case gds_element_path:
            polygon.contours = inflate_path(element);
            if(polygon.contours.empty()) {
                return;
            }
            break;

        default:
            return;
        }
        element.polygons.push_back(std::move(polygon));
    }

}    // namespace

namespace maskforge_lib
{
    //////////////////////////////////////////////////////////////////////

    char const *gds_element_type_name(gds_element_type type)
    {
        switch(type) {
        case gds_element_boundary:
            return "boundary";
        case gds_element_path:
            return "path";
        case gds_element_box:
            return "box";
        case gds_element_sref:
            return "sref";
        case gds_element_aref:
            return "aref";
        case gds_element_text:
            return "text";
        case gds_element_node:
            return "node";
        }
        return "?";
    }

    //////////////////////////////////////////////////////////////////////

    double gds_decode_real8(uint8_t const *bytes)
    {
        uint64_t bits = 0;
        for(int i = 0; i < 8; ++i) {
            bits = (bits << 8) | bytes[i];
        }
        bool negative = (bits >> 63) != 0;
        int exponent = static_cast<int>((bits >> 56) & 0x7f) - 64;
        uint64_t mantissa = bits & 0x00ffffffffffffffull;
        double value = std::ldexp(static_cast<double>(mantissa), exponent * 4 - 56);
        return negative ? -value : value;
    }

    //////////////////////////////////////////////////////////////////////

    matrix gds_transform::to_matrix(vec2d const &origin) const
    {
        matrix m = matrix::scale({ magnification, reflect ? -magnification : magnification });
        m = matrix::multiply(m, matrix::rotate(angle_degrees));
        return matrix::multiply(m, matrix::translate(origin));
    }

    //////////////////////////////////////////////////////////////////////

    rect gds_geometry::bounding_box() const
    {
        rect box = rect::empty();
        for(auto const &polygon : polygons) {
            for(auto const &contour : polygon.contours) {
                for(auto const &p : contour) {
                    box.expand_to_contain(p);
                }
            }
        }
        return box;
    }

    //////////////////////////////////////////////////////////////////////

    std::vector<gds_polygon> gds_geometry::select(int layer, int datatype) const
    {
        std::vector<gds_polygon> selected;
        for(auto const &polygon : polygons) {
            if(polygon.layer == layer && polygon.datatype == datatype) {
                selected.push_back(polygon);
            }
        }
        return selected;
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code gds_library::load(std::filesystem::path const &file_path)
    {
        std::vector<uint8_t> bytes;
        CHECK(maskforge_util::load_file(file_path, bytes));
        maskforge_error_code error = load(bytes.data(), bytes.size());
        if(error != ok) {
            LOG_ERROR("Loading {} failed: {}", file_path.string(), get_error_text(error));
        }
        return error;
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code gds_library::load(uint8_t const *data, size_t size)
    {
        name.clear();
        cells.clear();
        cell_index.clear();

        FAIL_IF(data == nullptr || size == 0, error_empty_file);

        gds_stream stream{ data, size, 0 };

        gds_cell *cell{ nullptr };
        gds_element *element{ nullptr };
        bool got_header{ false };
        bool done{ false };

        double scale = um_per_db();

        while(!done) {

            if(stream.eof()) {
                LOG_ERROR("Missing ENDLIB");
                return error_unexpected_eof;
            }

            gds_record record;
            CHECK(stream.read_record(record));

            uint8_t type = record.record_type;

            if(!got_header && type != gds_header) {
                LOG_ERROR("Not a GDSII stream, first record is 0x{:02X}", type);
                return error_bad_gds_structure;
            }

            if(is_element_start(type)) {
                if(cell == nullptr || element != nullptr) {
                    LOG_ERROR("Element record 0x{:02X} at offset {} outside a structure", type, record.file_offset);
                    return error_bad_gds_structure;
                }
                element = &cell->elements.emplace_back();
                element->element_type = element_type_from_record(type);
                continue;
            }

            switch(type) {

            case gds_header:
                got_header = true;
                break;

            case gds_bgnlib:
            case gds_propattr:
            case gds_propvalue:
            case gds_presentation:
            case gds_string:
            case gds_texttype:
                break;

            case gds_libname:
                name = record.get_string();
                break;

            case gds_units:
                CHECK(expect_data(record, gds_data_real8, 16));
                user_units_per_db = record.get_real8(0);
                meters_per_db = record.get_real8(1);
                FAIL_IF(meters_per_db <= 0, error_bad_gds_record);
                scale = um_per_db();
                LOG_VERBOSE("Units: {} user units, {} m per database unit", user_units_per_db, meters_per_db);
                break;

            case gds_bgnstr:
                FAIL_IF(cell != nullptr, error_bad_gds_structure);
                cell = &cells.emplace_back();
                break;

            case gds_strname:
                FAIL_IF(cell == nullptr, error_bad_gds_structure);
                cell->name = record.get_string();
                if(cell_index.contains(cell->name)) {
                    LOG_WARNING("Duplicate cell {}, the last one wins", cell->name);
                }
                cell_index[cell->name] = cells.size() - 1;
                break;

            case gds_endstr:
                FAIL_IF(cell == nullptr || element != nullptr, error_bad_gds_structure);
                LOG_DEBUG("Cell {}: {} elements", cell->name, cell->elements.size());
                cell = nullptr;
                break;

            case gds_endlib:
                FAIL_IF(cell != nullptr, error_bad_gds_structure);
                done = true;
                break;

            case gds_endel:
                FAIL_IF(element == nullptr, error_bad_gds_structure);
                build_polygons(*element);
                element = nullptr;
                break;

            case gds_layer:
                FAIL_IF(element == nullptr, error_bad_gds_structure);
                CHECK(expect_data(record, gds_data_int16, 2));
                element->layer = record.get_int16(0);
                break;

            case gds_datatype:
            case gds_boxtype:
                FAIL_IF(element == nullptr, error_bad_gds_structure);
                CHECK(expect_data(record, gds_data_int16, 2));
                element->datatype = record.get_int16(0);
                break;

            case gds_width:
                FAIL_IF(element == nullptr, error_bad_gds_structure);
                CHECK(expect_data(record, gds_data_int32, 4));
                element->width = record.get_int32(0) * scale;
                if(element->width < 0) {
                    LOG_VERBOSE("Absolute path width treated as relative");
                }
                break;

            case gds_pathtype:
                FAIL_IF(element == nullptr, error_bad_gds_structure);
                CHECK(expect_data(record, gds_data_int16, 2));
                element->path_type = record.get_int16(0);
                break;

            case gds_bgnextn:
                FAIL_IF(element == nullptr, error_bad_gds_structure);
                CHECK(expect_data(record, gds_data_int32, 4));
                element->begin_extension = record.get_int32(0) * scale;
                break;

            case gds_endextn:
                FAIL_IF(element == nullptr, error_bad_gds_structure);
                CHECK(expect_data(record, gds_data_int32, 4));
                element->end_extension = record.get_int32(0) * scale;
                break;

            case gds_xy: {
                FAIL_IF(element == nullptr, error_bad_gds_structure);
                CHECK(expect_data(record, gds_data_int32, 8));
                size_t num_points = record.size / 8;
                element->points.clear();
                element->points.reserve(num_points);
                for(size_t i = 0; i < num_points; ++i) {
                    element->points.emplace_back(record.get_int32(i * 2) * scale, record.get_int32(i * 2 + 1) * scale);
                }
            } break;

            case gds_sname:
                FAIL_IF(element == nullptr, error_bad_gds_structure);
                element->reference = record.get_string();
                break;

            case gds_colrow:
                FAIL_IF(element == nullptr, error_bad_gds_structure);
                CHECK(expect_data(record, gds_data_int16, 4));
                element->columns = record.get_int16(0);
                element->rows = record.get_int16(1);
                FAIL_IF(element->columns < 1 || element->rows < 1, error_bad_gds_record);
                break;

            case gds_strans:
                FAIL_IF(element == nullptr, error_bad_gds_structure);
                CHECK(expect_data(record, gds_data_bitarray, 2));
                element->transform.reflect = (record.get_int16(0) & 0x8000) != 0;
                if((record.get_int16(0) & 0x0006) != 0) {
                    LOG_WARNING("Absolute magnification or angle in a reference is treated as relative");
                }
                break;

            case gds_mag:
                FAIL_IF(element == nullptr, error_bad_gds_structure);
                CHECK(expect_data(record, gds_data_real8, 8));
                element->transform.magnification = record.get_real8(0);
                break;

            case gds_angle:
                FAIL_IF(element == nullptr, error_bad_gds_structure);
                CHECK(expect_data(record, gds_data_real8, 8));
                element->transform.angle_degrees = record.get_real8(0);
                break;

            default:
                LOG_DEBUG("Skipping record 0x{:02X} at offset {}", type, record.file_offset);
                break;
            }
        }
        LOG_VERBOSE("Library {}: {} cells", name, cells.size());
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    gds_cell const *gds_library::find_cell(std::string const &cell_name) const
    {
        auto f = cell_index.find(cell_name);
        if(f == cell_index.end()) {
            return nullptr;
        }
        return &cells[f->second];
    }

    //////////////////////////////////////////////////////////////////////

    std::vector<std::string> gds_library::list_cells() const
    {
        std::vector<std::string> names;
        for(auto const &cell : cells) {
            names.push_back(cell.name);
        }
        return names;
    }

    //////////////////////////////////////////////////////////////////////

    std::vector<int> gds_library::list_layers() const
    {
        std::set<int> layers;
        for(auto const &cell : cells) {
            for(auto const &element : cell.elements) {
                switch(element.element_type) {
                case gds_element_boundary:
                case gds_element_path:
                case gds_element_box:
                    layers.insert(element.layer);
                    break;
                default:
                    break;
                }
            }
        }
        return std::vector<int>(layers.begin(), layers.end());
    }

    //////////////////////////////////////////////////////////////////////

    std::vector<std::string> gds_library::top_cells() const
    {
        std::set<std::string> referenced;
        for(auto const &cell : cells) {
            for(auto const &element : cell.elements) {
                if(element.element_type == gds_element_sref || element.element_type == gds_element_aref) {
                    referenced.insert(element.reference);
                }
            }
        }
        std::vector<std::string> top;
        for(auto const &cell : cells) {
            if(!referenced.contains(cell.name)) {
                top.push_back(cell.name);
            }
        }
        return top;
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code gds_library::flatten(std::string const &cell_name, gds_geometry &geometry) const
    {
        gds_cell const *cell = find_cell(cell_name);
        if(cell == nullptr) {
            LOG_ERROR("Cell {} not found", cell_name);
            return error_cell_not_found;
        }
        geometry.polygons.clear();
        std::vector<std::string> stack;
        CHECK(flatten_cell(*cell, matrix::identity(), stack, geometry));
        LOG_VERBOSE("Flattened {}: {} polygons", cell_name, geometry.polygons.size());
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code gds_library::flatten_cell(gds_cell const &cell, matrix const &transform, std::vector<std::string> &stack,
                                                   gds_geometry &geometry) const
    {
        if(std::find(stack.begin(), stack.end(), cell.name) != stack.end()) {
            LOG_ERROR("Cell {} references itself", cell.name);
            return error_gds_recursive_reference;
        }
        stack.push_back(cell.name);

        for(auto const &element : cell.elements) {

            switch(element.element_type) {

            case gds_element_boundary:
            case gds_element_path:
            case gds_element_box:
                for(auto const &polygon : element.polygons) {
                    gds_polygon &flat = geometry.polygons.emplace_back(polygon);
                    for(auto &contour : flat.contours) {
                        transform_points(transform, contour);
                    }
                }
                break;

            case gds_element_sref:
            case gds_element_aref: {
                gds_cell const *child = find_cell(element.reference);
                if(child == nullptr) {
                    LOG_ERROR("Cell {} references missing cell {}", cell.name, element.reference);
                    return error_gds_missing_reference;
                }
                FAIL_IF(element.points.empty(), error_bad_gds_structure);

                vec2d origin = element.points[0];

                if(element.element_type == gds_element_sref) {
                    matrix m = matrix::multiply(element.transform.to_matrix(origin), transform);
                    CHECK(flatten_cell(*child, m, stack, geometry));
                    break;
                }

                FAIL_IF(element.points.size() < 3, error_bad_gds_structure);

                vec2d column_step = element.points[1].subtract(origin).scale(1.0 / element.columns);
                vec2d row_step = element.points[2].subtract(origin).scale(1.0 / element.rows);

                for(int r = 0; r < element.rows; ++r) {
                    for(int c = 0; c < element.columns; ++c) {
                        vec2d position = origin.add(column_step.scale(c)).add(row_step.scale(r));
                        matrix m = matrix::multiply(element.transform.to_matrix(position), transform);
                        CHECK(flatten_cell(*child, m, stack, geometry));
                    }
                }
            } break;

            default:
                break;
            }
        }
        stack.pop_back();
        return ok;
    }

}    // namespace maskforge_lib
