#include "commands/commands.h"
#include "core/png_io.h"
#include "core/raster.h"
#include "core/stex_codec.h"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "test_support.h"

namespace fs = std::filesystem;
using namespace atlasfix::core;

static fs::path MakeTempPath(const std::string& prefix)
{
  static std::uint64_t counter = 0;
  ++counter;

  std::error_code ec;
  fs::path root = fs::temp_directory_path(ec);
  if (ec || root.empty()) {
    root = fs::current_path(ec);
    if (ec || root.empty()) {
      root = fs::path(".");
    }
  }

  const auto stamp = static_cast<std::uint64_t>(
    std::chrono::high_resolution_clock::now().time_since_epoch().count());
  return root / (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(counter));
}

static void RemoveQuietly(const fs::path& path)
{
  std::error_code ec;
  fs::remove(path, ec);
}

struct CommandResult {
  int code = -1;
  std::string out;
  std::string err;
};

// Runs a command entry point with captured stdout/stderr. args excludes the
// program name.
static CommandResult RunCommand(int (*run)(int, char**), const char* program, const std::vector<std::string>& args)
{
  std::vector<std::string> storage;
  storage.push_back(program);
  storage.insert(storage.end(), args.begin(), args.end());
  std::vector<char*> argv;
  for (std::string& arg : storage) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);

  std::ostringstream out;
  std::ostringstream err;
  std::streambuf* old_out = std::cout.rdbuf(out.rdbuf());
  std::streambuf* old_err = std::cerr.rdbuf(err.rdbuf());

  CommandResult result;
  result.code = run(static_cast<int>(storage.size()), argv.data());

  std::cout.rdbuf(old_out);
  std::cerr.rdbuf(old_err);
  result.out = out.str();
  result.err = err.str();
  return result;
}

static CommandResult RunAtlasfix(const std::vector<std::string>& args)
{
  return RunCommand(run_atlasfix, "atlasfix", args);
}

static CommandResult RunStextool(const std::vector<std::string>& args)
{
  return RunCommand(run_stextool, "stextool", args);
}

static bool Contains(const std::string& text, const std::string& needle)
{
  return text.find(needle) != std::string::npos;
}

static fs::path WriteAtlasWithSquare(const std::string& prefix)
{
  Raster atlas = make_blank_raster(1024, 1024, k_rgba_channels);
  PaintRect(atlas, 0, 0, 50, 50);
  const fs::path path = MakeTempPath(prefix).replace_extension(".png");
  std::string error;
  if (!write_png(path, atlas, error)) {
    std::cerr << "could not write " << path << ": " << error << "\n";
  }
  return path;
}

static fs::path WriteProfiles(const std::string& text)
{
  const fs::path path = MakeTempPath("atlasfix_cmd_profiles").replace_extension(".cfg");
  std::ofstream out(path);
  out << text;
  return path;
}

// A 256x128 RGBA8 container with 64 bytes of payload.
static fs::path WriteTexture(std::uint32_t texture_flags, std::uint32_t format)
{
  std::vector<unsigned char> bytes = {'G', 'D', 'S', 'T',
                                      0x00, 0x01, 0x00, 0x00,
                                      0x80, 0x00, 0x00, 0x00};
  for (int shift = 0; shift < 32; shift += 8) {
    bytes.push_back(static_cast<unsigned char>((texture_flags >> shift) & 0xFFU));
  }
  for (int shift = 0; shift < 32; shift += 8) {
    bytes.push_back(static_cast<unsigned char>((format >> shift) & 0xFFU));
  }
  bytes.resize(bytes.size() + 64, 0xAB);

  const fs::path path = MakeTempPath("atlasfix_cmd_texture").replace_extension(".stex");
  std::string error;
  if (!write_binary_file(path, bytes, error)) {
    std::cerr << "could not write " << path << ": " << error << "\n";
  }
  return path;
}

static fs::path WriteSmallImage()
{
  Raster image = make_blank_raster(4, 2, k_rgba_channels);
  for (int y = 0; y < 2; ++y) {
    for (int x = 0; x < 4; ++x) {
      PaintPixel(image, x, y);
    }
  }
  const fs::path path = MakeTempPath("atlasfix_cmd_image").replace_extension(".png");
  std::string error;
  if (!write_png(path, image, error)) {
    std::cerr << "could not write " << path << ": " << error << "\n";
  }
  return path;
}

static void TestAtlasfixCentersSquare()
{
  const fs::path input = WriteAtlasWithSquare("atlasfix_cmd_in");
  const fs::path output = MakeTempPath("atlasfix_cmd_out").replace_extension(".png");

  const CommandResult result = RunAtlasfix({"--mode", "icon", input.string(), "-o", output.string()});
  EXPECT_EQ(result.code, 0);
  EXPECT_TRUE(result.out.empty());

  Raster fixed;
  std::string error;
  ASSERT_TRUE(load_png(output, fixed, error));
  EXPECT_EQ(fixed.width, 1024);
  EXPECT_EQ(fixed.channels, 4);
  EXPECT_TRUE(IsOpaqueAt(fixed, 145, 145));
  EXPECT_TRUE(IsOpaqueAt(fixed, 194, 194));
  EXPECT_FALSE(IsOpaqueAt(fixed, 0, 0));

  RemoveQuietly(input);
  RemoveQuietly(output);
}

static void TestAtlasfixUsesProfileFromConfig()
{
  const fs::path input = WriteAtlasWithSquare("atlasfix_cmd_in");
  const fs::path output = MakeTempPath("atlasfix_cmd_out").replace_extension(".png");
  const fs::path profiles = WriteProfiles("[profile lowered]\nmode = icon\nplacement = bottom\n");

  const CommandResult result = RunAtlasfix({"--profiles-config", profiles.string(), "--profile", "lowered",
                                            "--verbose", input.string(), "--output", output.string()});
  EXPECT_EQ(result.code, 0);
  EXPECT_TRUE(Contains(result.err, "atlasfix: profile lowered (filter icon, placement bottom"));
  EXPECT_TRUE(Contains(result.err, "at 145,291"));

  Raster fixed;
  std::string error;
  ASSERT_TRUE(load_png(output, fixed, error));
  EXPECT_TRUE(IsOpaqueAt(fixed, 145, 291));
  EXPECT_TRUE(IsOpaqueAt(fixed, 194, 340));
  EXPECT_FALSE(IsOpaqueAt(fixed, 145, 290));

  const CommandResult listing = RunAtlasfix({"--profiles-config", profiles.string(), "--list-profiles"});
  EXPECT_EQ(listing.code, 0);
  EXPECT_TRUE(Contains(listing.out, "lowered filter=icon placement=bottom"));
  EXPECT_TRUE(Contains(listing.out, "faces filter=silhouette placement=bottom"));

  RemoveQuietly(input);
  RemoveQuietly(output);
  RemoveQuietly(profiles);
}

static void TestAtlasfixRejectsModeWithProfile()
{
  const fs::path input = WriteAtlasWithSquare("atlasfix_cmd_in");
  const fs::path output = MakeTempPath("atlasfix_cmd_out").replace_extension(".png");

  const CommandResult result = RunAtlasfix({"--mode", "icon", "--profile", "icons", input.string(),
                                            "-o", output.string()});
  EXPECT_EQ(result.code, 1);
  EXPECT_TRUE(Contains(result.err, "Error: --mode and --profile cannot be combined"));
  EXPECT_FALSE(fs::exists(output));

  RemoveQuietly(input);
}

static void TestAtlasfixReportsBadArguments()
{
  const fs::path input = WriteAtlasWithSquare("atlasfix_cmd_in");
  const fs::path output = MakeTempPath("atlasfix_cmd_out").replace_extension(".png");
  const fs::path profiles = WriteProfiles("[profile lowered]\nplacement = bottom\n");

  CommandResult result = RunAtlasfix({"--profiles-config", profiles.string(), "--profile", "nope",
                                      input.string(), "-o", output.string()});
  EXPECT_EQ(result.code, 1);
  EXPECT_TRUE(Contains(result.err, "Error: Unknown profile: nope"));

  result = RunAtlasfix({"--mode", "diagonal", input.string(), "-o", output.string()});
  EXPECT_EQ(result.code, 1);
  EXPECT_TRUE(Contains(result.err, "Error: Alignment mode must be"));

  result = RunAtlasfix({"--frobnicate", input.string()});
  EXPECT_EQ(result.code, 1);
  EXPECT_TRUE(Contains(result.err, "Error: Unknown option: --frobnicate"));

  result = RunAtlasfix({input.string(), input.string()});
  EXPECT_EQ(result.code, 1);
  EXPECT_TRUE(Contains(result.err, "Error: Too many arguments"));

  result = RunAtlasfix({(input.string() + ".missing"), "-o", output.string()});
  EXPECT_EQ(result.code, 1);
  EXPECT_TRUE(Contains(result.err, "Input file does not exist"));
  EXPECT_FALSE(fs::exists(output));

  result = RunAtlasfix({"--help"});
  EXPECT_EQ(result.code, 0);
  EXPECT_TRUE(Contains(result.out, "Usage: atlasfix"));

  RemoveQuietly(input);
  RemoveQuietly(profiles);
}

static void TestAtlasfixValidatesImage()
{
  const fs::path small = MakeTempPath("atlasfix_cmd_small").replace_extension(".png");
  const fs::path opaque = MakeTempPath("atlasfix_cmd_rgb").replace_extension(".png");
  const fs::path output = MakeTempPath("atlasfix_cmd_out").replace_extension(".png");
  std::string error;
  ASSERT_TRUE(write_png(small, make_blank_raster(512, 512, k_rgba_channels), error));
  ASSERT_TRUE(write_png(opaque, make_blank_raster(1024, 1024, 3), error));

  CommandResult result = RunAtlasfix({small.string(), "-o", output.string()});
  EXPECT_EQ(result.code, 1);
  EXPECT_TRUE(Contains(result.err, "Error: Input image must be 1024x1024 pixels"));
  EXPECT_FALSE(fs::exists(output));

  result = RunAtlasfix({opaque.string(), "-o", output.string()});
  EXPECT_EQ(result.code, 1);
  EXPECT_TRUE(Contains(result.err, "Error: Input image must have an alpha channel"));

  RemoveQuietly(small);
  RemoveQuietly(opaque);
}

static void TestAtlasfixWarnsOnEmptyAtlas()
{
  const fs::path input = MakeTempPath("atlasfix_cmd_empty").replace_extension(".png");
  const fs::path output = MakeTempPath("atlasfix_cmd_out").replace_extension(".png");
  std::string error;
  ASSERT_TRUE(write_png(input, make_blank_raster(1024, 1024, k_rgba_channels), error));

  const CommandResult result = RunAtlasfix({input.string(), "-o", output.string()});
  EXPECT_EQ(result.code, 0);
  EXPECT_TRUE(Contains(result.err, "Warning: No cell received any content"));
  EXPECT_TRUE(fs::exists(output));

  RemoveQuietly(input);
  RemoveQuietly(output);
}

static void TestStextoolReplacesInPlace()
{
  const fs::path texture = WriteTexture(0x07U, 0x05U | k_feature_has_mipmaps);
  const fs::path image = WriteSmallImage();

  const CommandResult result = RunStextool({"replace", texture.string(), image.string(),
                                            "--texture-flags", "0x10", "--feature-flags", "0x00020000"});
  EXPECT_EQ(result.code, 0);
  EXPECT_TRUE(Contains(result.err, "stextool: " + texture.filename().string() + " 256x128"));
  EXPECT_TRUE(Contains(result.err, "-> 4x2 RGBA8"));

  std::vector<unsigned char> bytes;
  std::string error;
  ASSERT_TRUE(read_binary_file(texture, bytes, error));
  EXPECT_EQ(bytes.size(), k_stex_header_size + static_cast<size_t>(4 * 2 * 4));

  StexHeader header;
  ASSERT_TRUE(parse_stex_header(bytes, header, error));
  EXPECT_EQ(header.width, 4);
  EXPECT_EQ(header.height, 2);
  EXPECT_EQ(header.texture_flags, k_texture_flag_convert_to_linear);
  EXPECT_EQ(header.feature_flags(), k_feature_stream);
  EXPECT_EQ(header.image_format_id(), static_cast<std::uint32_t>(ImageFormat::RGBA8));

  const CommandResult info = RunStextool({"info", texture.string()});
  EXPECT_EQ(info.code, 0);
  EXPECT_TRUE(Contains(info.out, "width: 4\n"));
  EXPECT_TRUE(Contains(info.out, "texture_flags: 0x00000010\n"));
  EXPECT_TRUE(Contains(info.out, "format: RGBA8"));
  EXPECT_TRUE(Contains(info.out, "(STREAM)"));

  RemoveQuietly(texture);
  RemoveQuietly(image);
}

static void TestStextoolWritesSeparateOutput()
{
  const fs::path texture = WriteTexture(0x07U, 0x05U);
  const fs::path image = WriteSmallImage();
  const fs::path output = MakeTempPath("atlasfix_cmd_texture_out").replace_extension(".stex");

  const CommandResult result = RunStextool({"replace", texture.string(), image.string(),
                                            "--format", "RGB565", "-o", output.string()});
  EXPECT_EQ(result.code, 0);

  std::vector<unsigned char> original;
  std::vector<unsigned char> written;
  std::string error;
  ASSERT_TRUE(read_binary_file(texture, original, error));
  ASSERT_TRUE(read_binary_file(output, written, error));
  EXPECT_EQ(original.size(), k_stex_header_size + static_cast<size_t>(64));
  EXPECT_EQ(written.size(), k_stex_header_size + static_cast<size_t>(4 * 2 * 2));

  StexHeader header;
  ASSERT_TRUE(parse_stex_header(written, header, error));
  EXPECT_EQ(header.texture_flags, 0x07U);
  EXPECT_EQ(header.image_format_id(), static_cast<std::uint32_t>(ImageFormat::RGB565));

  RemoveQuietly(texture);
  RemoveQuietly(image);
  RemoveQuietly(output);
}

static void TestStextoolReportsBadArguments()
{
  const fs::path texture = WriteTexture(0x07U, 0x05U);
  const fs::path image = WriteSmallImage();

  CommandResult result = RunStextool({"replace", texture.string(), image.string(), "--texture-flags", "0xZZ"});
  EXPECT_EQ(result.code, 1);
  EXPECT_TRUE(Contains(result.err, "Error: Invalid --texture-flags value: 0xZZ"));

  result = RunStextool({"replace", texture.string(), image.string(), "--format", "BC7"});
  EXPECT_EQ(result.code, 1);

  result = RunStextool({"replace", texture.string()});
  EXPECT_EQ(result.code, 1);
  EXPECT_TRUE(Contains(result.err, "Error: replace needs a texture file and an image file"));

  // Failed replaces leave the container alone.
  std::vector<unsigned char> bytes;
  std::string error;
  ASSERT_TRUE(read_binary_file(texture, bytes, error));
  EXPECT_EQ(bytes.size(), k_stex_header_size + static_cast<size_t>(64));

  result = RunStextool({"info", (texture.string() + ".missing")});
  EXPECT_EQ(result.code, 1);
  EXPECT_TRUE(Contains(result.err, "Error: Failed to open file"));

  result = RunStextool({"info"});
  EXPECT_EQ(result.code, 1);

  result = RunStextool({"repack", texture.string()});
  EXPECT_EQ(result.code, 1);
  EXPECT_TRUE(Contains(result.err, "Error: Unknown command: repack"));

  result = RunStextool({});
  EXPECT_EQ(result.code, 1);
  EXPECT_TRUE(Contains(result.out, "Usage: stextool"));

  RemoveQuietly(texture);
  RemoveQuietly(image);
}

int main()
{
  TestAtlasfixCentersSquare();
  TestAtlasfixUsesProfileFromConfig();
  TestAtlasfixRejectsModeWithProfile();
  TestAtlasfixReportsBadArguments();
  TestAtlasfixValidatesImage();
  TestAtlasfixWarnsOnEmptyAtlas();
  TestStextoolReplacesInPlace();
  TestStextoolWritesSeparateOutput();
  TestStextoolReportsBadArguments();

  return FinishTests("atlasfix_commands_tests");
}
