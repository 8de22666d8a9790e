#pragma once

#include <cstdint>
#include <filesystem>

#include "maskforge_error.h"
#include "maskforge_image.h"

namespace maskforge_lib
{
    // any format stb_image understands, converted to one channel
    maskforge_error_code load_image(std::filesystem::path const &path, gray_image &image);

    maskforge_error_code decode_image(uint8_t const *data, size_t size, gray_image &image);

    // single 8 bit channel PNG
    maskforge_error_code save_png(std::filesystem::path const &path, gray_image const &image);

}    // namespace maskforge_lib
