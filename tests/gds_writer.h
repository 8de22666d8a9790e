#pragma once

#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

#include "maskforge_gds.h"

namespace gds_test
{
    using namespace maskforge_lib;

    //////////////////////////////////////////////////////////////////////
    // builds a GDSII stream in memory, database unit is 1nm

    struct gds_writer
    {
        std::vector<uint8_t> bytes;

        void begin(uint8_t record_type, uint8_t data_type, size_t payload)
        {
            size_t length = payload + 4;
            bytes.push_back(static_cast<uint8_t>(length >> 8));
            bytes.push_back(static_cast<uint8_t>(length));
            bytes.push_back(record_type);
            bytes.push_back(data_type);
        }

        void put16(int v)
        {
            bytes.push_back(static_cast<uint8_t>((v >> 8) & 0xff));
            bytes.push_back(static_cast<uint8_t>(v & 0xff));
        }

        void put32(int32_t v)
        {
            uint32_t u = static_cast<uint32_t>(v);
            for(int shift = 24; shift >= 0; shift -= 8) {
                bytes.push_back(static_cast<uint8_t>(u >> shift));
            }
        }

        void put_real8(double v)
        {
            uint64_t bits = 0;
            if(v != 0) {
                bool negative = v < 0;
                v = fabs(v);
                int exponent = 64;
                while(v >= 1) {
                    v /= 16;
                    exponent += 1;
                }
                while(v < 1.0 / 16) {
                    v *= 16;
                    exponent -= 1;
                }
                uint64_t mantissa = static_cast<uint64_t>(v * 72057594037927936.0);
                bits = (negative ? (1ull << 63) : 0) | (static_cast<uint64_t>(exponent) << 56) | mantissa;
            }
            for(int shift = 56; shift >= 0; shift -= 8) {
                bytes.push_back(static_cast<uint8_t>(bits >> shift));
            }
        }

        void empty(uint8_t record_type)
        {
            begin(record_type, gds_data_none, 0);
        }

        void int16s(uint8_t record_type, std::initializer_list<int> values, uint8_t data_type = gds_data_int16)
        {
            begin(record_type, data_type, values.size() * 2);
            for(int v : values) {
                put16(v);
            }
        }

        void int32s(uint8_t record_type, std::initializer_list<int32_t> values)
        {
            begin(record_type, gds_data_int32, values.size() * 4);
            for(int32_t v : values) {
                put32(v);
            }
        }

        void real8s(uint8_t record_type, std::initializer_list<double> values)
        {
            begin(record_type, gds_data_real8, values.size() * 8);
            for(double v : values) {
                put_real8(v);
            }
        }

        void string(uint8_t record_type, std::string s)
        {
            if((s.size() & 1) != 0) {
                s.push_back('\0');
            }
            begin(record_type, gds_data_ascii, s.size());
            bytes.insert(bytes.end(), s.begin(), s.end());
        }

        //////////////////////////////////////////////////////////////////////

        void library(std::string const &name = "LIB")
        {
            int16s(gds_header, { 600 });
            int16s(gds_bgnlib, { 126, 1, 1, 0, 0, 0, 126, 1, 1, 0, 0, 0 });
            string(gds_libname, name);
            real8s(gds_units, { 1e-3, 1e-9 });
        }

        void end_library()
        {
            empty(gds_endlib);
        }

        void cell(std::string const &name)
        {
            int16s(gds_bgnstr, { 126, 1, 1, 0, 0, 0, 126, 1, 1, 0, 0, 0 });
            string(gds_strname, name);
        }

        void end_cell()
        {
            empty(gds_endstr);
        }

        // axis aligned rectangle as a closed boundary
        void boundary(int layer, int32_t x0, int32_t y0, int32_t x1, int32_t y1, int datatype = 0)
        {
            empty(gds_boundary);
            int16s(gds_layer, { layer });
            int16s(gds_datatype, { datatype });
            int32s(gds_xy, { x0, y0, x1, y0, x1, y1, x0, y1, x0, y0 });
            empty(gds_endel);
        }

        void box(int layer, int32_t x0, int32_t y0, int32_t x1, int32_t y1)
        {
            empty(gds_box);
            int16s(gds_layer, { layer });
            int16s(gds_boxtype, { 0 });
            int32s(gds_xy, { x0, y0, x1, y0, x1, y1, x0, y1, x0, y0 });
            empty(gds_endel);
        }

        void path(int layer, int path_type, int32_t width, std::initializer_list<int32_t> xy)
        {
            empty(gds_path);
            int16s(gds_layer, { layer });
            int16s(gds_datatype, { 0 });
            int16s(gds_pathtype, { path_type });
            int32s(gds_width, { width });
            int32s(gds_xy, xy);
            empty(gds_endel);
        }

        void sref(std::string const &name, int32_t x, int32_t y, bool reflect = false, double mag = 1, double angle = 0)
        {
            empty(gds_sref);
            string(gds_sname, name);
            if(reflect || mag != 1 || angle != 0) {
                int16s(gds_strans, { reflect ? 0x8000 : 0 }, gds_data_bitarray);
                if(mag != 1) {
                    real8s(gds_mag, { mag });
                }
                if(angle != 0) {
                    real8s(gds_angle, { angle });
                }
            }
            int32s(gds_xy, { x, y });
            empty(gds_endel);
        }

        void aref(std::string const &name, int columns, int rows, std::initializer_list<int32_t> xy)
        {
            empty(gds_aref);
            string(gds_sname, name);
            int16s(gds_colrow, { columns, rows });
            int32s(gds_xy, xy);
            empty(gds_endel);
        }

        maskforge_error_code load(gds_library &library) const
        {
            return library.load(bytes.data(), bytes.size());
        }
    };

}    // namespace gds_test

using gds_test::gds_writer;
