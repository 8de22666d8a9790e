//////////////////////////////////////////////////////////////////////

#include <vector>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include "maskforge_util.h"
#include "maskforge_image_io.h"

LOG_CONTEXT("image_io", verbose);

namespace maskforge_lib
{
    //////////////////////////////////////////////////////////////////////

    maskforge_error_code decode_image(uint8_t const *data, size_t size, gray_image &image)
    {
        FAIL_IF(data == nullptr || size == 0, error_empty_file);

        int w;
        int h;
        int channels_in_file;
        stbi_uc *pixels = stbi_load_from_memory(data, static_cast<int>(size), &w, &h, &channels_in_file, 1);

        if(pixels == nullptr) {
            LOG_ERROR("Can't decode image: {}", stbi_failure_reason());
            return error_image_decode_failed;
        }

        DEFER(stbi_image_free(pixels));

        LOG_VERBOSE("Decoded {}x{} image with {} channel(s)", w, h, channels_in_file);

        image = gray_image(w, h);
        std::copy(pixels, pixels + static_cast<size_t>(w) * h, image.pixels.begin());
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code load_image(std::filesystem::path const &path, gray_image &image)
    {
        std::vector<uint8_t> data;
        CHECK(maskforge_util::load_file(path, data));
        CHECK(decode_image(data.data(), data.size(), image));
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_error_code save_png(std::filesystem::path const &path, gray_image const &image)
    {
        FAIL_IF(image.empty(), error_png_write_failed);

        std::string filename = path.string();

        if(stbi_write_png(filename.c_str(), image.width, image.height, 1, image.pixels.data(), image.width) == 0) {
            LOG_ERROR("Can't write {}", filename);
            return error_png_write_failed;
        }
        LOG_INFO("Saved {} ({})", filename, image);
        return ok;
    }

}    // namespace maskforge_lib
