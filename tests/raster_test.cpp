#include <gtest/gtest.h>

#include "chunk_writer.h"
#include "rwdump_content.h"
#include "rwdump_core.h"

using namespace rwdump;
using namespace rwdump_test;

namespace {

constexpr std::uint32_t kPlatformD3D8 = 8;
constexpr std::uint32_t kPlatformPS2 = 6;

struct RasterFields
{
    std::uint32_t platform = kPlatformD3D8;
    std::uint32_t filter_word = 0x02110000; // linear, wrap/wrap
    std::string name = "body";
    std::string mask = "";
    std::uint32_t raster_format = 0x0500;
    std::uint32_t format_word = 0;
    std::uint16_t width = 64;
    std::uint16_t height = 32;
    std::uint8_t depth = 32;
    std::uint8_t levels = 1;
    std::uint8_t type = 4;
    std::uint8_t flags = 0;
    std::vector<std::uint8_t> pixels;
};

std::vector<std::uint8_t> RasterBody(const RasterFields &f)
{
    ByteWriter w;
    w.u32(f.platform).u32(f.filter_word);
    w.fixed_string(f.name, 32).fixed_string(f.mask, 32);
    w.u32(f.raster_format).u32(f.format_word);
    w.u16(f.width).u16(f.height).u8(f.depth).u8(f.levels).u8(f.type).u8(f.flags);
    w.bytes(f.pixels);
    return w.data();
}

Raster Decode(const std::vector<std::uint8_t> &bytes, std::uint32_t version,
              const DecodeOptions &options = DecodeOptions())
{
    ByteStream in(bytes.data(), bytes.size());
    return decode_raster(in, version, options);
}

} // namespace

TEST(RasterTest, ModernLayoutReadsD3DFormatAndFlags) {
    RasterFields f;
    f.format_word = 0x31545844; // "DXT1"
    f.flags = 0x80 | 0x10;
    f.pixels = {1, 2, 3, 4, 5};

    const Raster raster = Decode(RasterBody(f), 0x36003);
    EXPECT_EQ(raster.platform_id, kPlatformD3D8);
    EXPECT_EQ(raster.filtering, FilterMode::Linear);
    EXPECT_EQ(raster.addressing[0], AddressMode::Wrap);
    EXPECT_EQ(raster.addressing[1], AddressMode::Wrap);
    EXPECT_EQ(raster.name, "body");
    EXPECT_EQ(raster.mask_name, "");
    EXPECT_EQ(raster.raster_format, 0x0500u);
    ASSERT_TRUE(raster.d3d_format.has_value());
    EXPECT_EQ(*raster.d3d_format, 0x31545844u);
    EXPECT_EQ(raster.width, 64);
    EXPECT_EQ(raster.height, 32);
    EXPECT_EQ(raster.depth, 32);
    EXPECT_EQ(raster.mip_levels, 1);
    EXPECT_EQ(raster.raster_type, 4);
    EXPECT_TRUE(raster.has_alpha);
    EXPECT_FALSE(raster.is_cube_texture);
    EXPECT_FALSE(raster.has_auto_mipmaps);
    EXPECT_TRUE(raster.is_compressed);
    EXPECT_FALSE(raster.compression.has_value());
    EXPECT_EQ(raster.pixel_data, (std::vector<std::uint8_t>{1, 2, 3, 4, 5}));
}

TEST(RasterTest, ModernAlphaComesFromFlagBitOnly) {
    RasterFields f;
    f.format_word = 21; // nonzero, but not an alpha flag in this layout
    f.flags = 0x40 | 0x20;

    const Raster raster = Decode(RasterBody(f), 0x36003);
    EXPECT_FALSE(raster.has_alpha);
    EXPECT_TRUE(raster.is_cube_texture);
    EXPECT_TRUE(raster.has_auto_mipmaps);
    EXPECT_FALSE(raster.is_compressed);
}

TEST(RasterTest, LegacyLayoutReadsAlphaWordAndCompression) {
    RasterFields f;
    f.platform = kPlatformPS2;
    f.format_word = 1;
    f.flags = 0x80;
    f.name = "a_name_that_fills_the_whole_slot";

    const Raster raster = Decode(RasterBody(f), 0x35000);
    EXPECT_TRUE(raster.has_alpha);
    EXPECT_FALSE(raster.d3d_format.has_value());
    ASSERT_TRUE(raster.compression.has_value());
    EXPECT_EQ(*raster.compression, 0x80);
    EXPECT_FALSE(raster.is_cube_texture);
    EXPECT_FALSE(raster.is_compressed);
    EXPECT_EQ(raster.name, "a_name_that_fills_the_whole_slot");
    EXPECT_TRUE(raster.pixel_data.empty());
}

TEST(RasterTest, BadFilterWordReportsWordOffset) {
    RasterFields f;
    f.filter_word = 0x07110000;
    const auto bytes = RasterBody(f);

    try {
        Decode(bytes, 0x36003);
        FAIL() << "expected DecodeError";
    } catch (const DecodeError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidEnumValue);
        EXPECT_EQ(e.offset(), 4u);
    }

    DecodeOptions permissive;
    permissive.strict_enums = false;
    EXPECT_EQ(static_cast<int>(Decode(bytes, 0x36003, permissive).filtering), 7);
}

TEST(RasterTest, ShortHeaderIsTruncated) {
    RasterFields f;
    auto bytes = RasterBody(f);
    bytes.resize(74);

    try {
        Decode(bytes, 0x36003);
        FAIL() << "expected DecodeError";
    } catch (const DecodeError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::TruncatedInput);
        EXPECT_EQ(e.offset(), 72u);
    }
}

TEST(RasterTest, DecodedThroughTextureDictionary) {
    RasterFields f;
    f.name = "wheel";
    f.pixels = {9, 9};

    ByteWriter count;
    count.u16(1).u16(kPlatformD3D8);
    const auto native = MakeChunk(RW_CHUNK_TEXTURE_NATIVE, kLibraryId36003,
                                  Concat({MakeChunk(RW_CHUNK_STRUCT, kLibraryId36003, RasterBody(f)),
                                          MakeChunk(RW_CHUNK_EXTENSION, kLibraryId36003, {})}));
    const auto txd = MakeChunk(RW_CHUNK_TEX_DICTIONARY, kLibraryId36003,
                               Concat({MakeChunk(RW_CHUNK_STRUCT, kLibraryId36003, count.data()), native}));

    auto root = decode_chunk(txd.data(), txd.size());
    ASSERT_NE(root->get<StructPayload>(), nullptr);
    ASSERT_EQ(root->children.size(), 2u);

    const auto *raster = root->children[1]->get<Raster>();
    ASSERT_NE(raster, nullptr);
    EXPECT_EQ(raster->name, "wheel");
    EXPECT_EQ(raster->pixel_data.size(), 2u);
}
