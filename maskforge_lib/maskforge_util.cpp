//////////////////////////////////////////////////////////////////////

#include <algorithm>
#include <cctype>
#include <fstream>

#include "maskforge_util.h"

LOG_CONTEXT("util", info);

namespace maskforge_util
{
    //////////////////////////////////////////////////////////////////////

    std::string to_lowercase(std::string const &s)
    {
        std::string result = s;
        std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    //////////////////////////////////////////////////////////////////////

    maskforge_lib::maskforge_error_code load_file(std::filesystem::path const &path, std::vector<uint8_t> &data)
    {
        using namespace maskforge_lib;

        std::error_code ec;

        if(!std::filesystem::exists(path, ec)) {
            LOG_ERROR("File not found: {}", path.string());
            return error_file_not_found;
        }

        FAIL_IF(!std::filesystem::is_regular_file(path, ec), error_not_a_file);

        uintmax_t file_size = std::filesystem::file_size(path, ec);
        FAIL_IF(ec, error_cant_read_file);
        FAIL_IF(file_size == 0, error_empty_file);

        std::ifstream file(path, std::ios::binary);
        FAIL_IF(!file, error_cant_read_file);

        data.resize(static_cast<size_t>(file_size));
        file.read(reinterpret_cast<char *>(data.data()), static_cast<std::streamsize>(file_size));
        FAIL_IF(file.gcount() != static_cast<std::streamsize>(file_size), error_cant_read_file);

        LOG_VERBOSE("Loaded {} bytes from {}", data.size(), path.string());
        return ok;
    }

}    // namespace maskforge_util
