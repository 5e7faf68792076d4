#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "raster.h"

namespace atlasfix::core {

// Decoding keeps the image's own channel count (1-4) so callers can tell
// whether the source carried alpha.
bool decode_png(const std::vector<unsigned char>& bytes, Raster& out, std::string& error);
bool load_png(const std::filesystem::path& path, Raster& out, std::string& error);

bool encode_png(const Raster& raster, std::vector<unsigned char>& out, std::string& error);
bool write_png(const std::filesystem::path& path, const Raster& raster, std::string& error);

bool read_binary_file(const std::filesystem::path& path, std::vector<unsigned char>& out, std::string& error);
bool write_binary_file(const std::filesystem::path& path, const std::vector<unsigned char>& bytes, std::string& error);

} // namespace atlasfix::core
