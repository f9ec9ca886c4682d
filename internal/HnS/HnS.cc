#include "HnS.hh"
#include "PhotoHnS/PhotoHnS.hh"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace Meow
{


std::optional<std::string> HnS::validate_path(const std::string& path)
{
    /*Use it only inside method*/
    namespace fs = std::filesystem;

    /*Empty check*/
    if (path.empty())
        return std::nullopt;

    try
    {
        fs::path f_path(path);
        /*Check existence and directory*/
        if (!fs::exists(f_path) || fs::is_directory(f_path))
            return std::nullopt;

        std::string extension = f_path.extension().string();
        if (!extension.empty() && extension[0] == '.') {
            extension.erase(0, 1);
        }
        std::transform(extension.begin(), extension.end(), extension.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        return extension;
    } catch (const fs::filesystem_error& e)
    {
        std::cerr << CLI_RED << "Error while HnS::validate_path: " << e.what() << CLI_RESET << std::endl;
        return std::nullopt;
    }

}

std::optional<HeaderResolution> HnS::readHeaderOnly(const std::string& path)
{
    auto ext_opt = validate_path(path);
    if (!ext_opt) {
        return std::nullopt;
    }
    const std::string ext = ext_opt.value();

    // PHOTO: lossless raster formats only
    if (PhotoHnS::is_supported_carrier(ext)) {
        PhotoHnS photo;
        return photo.read_header_only(path);
    }

    return std::nullopt;
}


} // Meow
