/*
**  Command & Conquer Renegade(tm)
**  Copyright 2025 Electronic Arts Inc.
**
**  This program is free software: you can redistribute it and/or modify
**  it under the terms of the GNU General Public License as published by
**  the Free Software Foundation, either version 3 of the License, or
**  (at your option) any later version.
**
**  This program is distributed in the hope that it will be useful,
**  but WITHOUT ANY WARRANTY; without even the implied warranty of
**  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
**  GNU General Public License for more details.
**
**  You should have received a copy of the GNU General Public License
**  along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#include "rwdump_content.h"

#include "rwdump_log.h"

namespace rwdump
{
namespace
{

/*
** Packed field layout
*/
constexpr std::uint32_t RASTER_FILTER_SHIFT = 24;  // bits 24-31 of the filter/address word
constexpr std::uint32_t RASTER_ADDRESS_SHIFT = 16; // bits 16-23, two nibbles

constexpr std::uint8_t ADDRESS_U_SHIFT = 4; // high nibble
constexpr std::uint8_t ADDRESS_NIBBLE_MASK = 0x0F;

constexpr std::uint8_t RASTER_FLAG_HAS_ALPHA = 0x80;   // bit 7
constexpr std::uint8_t RASTER_FLAG_CUBE = 0x40;        // bit 6
constexpr std::uint8_t RASTER_FLAG_AUTO_MIPMAP = 0x20; // bit 5
constexpr std::uint8_t RASTER_FLAG_COMPRESSED = 0x10;  // bit 4

constexpr std::uint8_t FILTER_MODE_MAX = static_cast<std::uint8_t>(FilterMode::LinearMipLinear);
constexpr std::uint8_t ADDRESS_MODE_MAX = static_cast<std::uint8_t>(AddressMode::Border);

std::uint8_t AddressNibbleU(std::uint8_t packed)
{
    return static_cast<std::uint8_t>((packed >> ADDRESS_U_SHIFT) & ADDRESS_NIBBLE_MASK);
}

std::uint8_t AddressNibbleV(std::uint8_t packed)
{
    return static_cast<std::uint8_t>(packed & ADDRESS_NIBBLE_MASK);
}

template <typename Enum>
Enum CheckedEnum(std::uint8_t raw, std::uint8_t max, const char *what, std::size_t offset, const DecodeOptions &options)
{
    if (raw > max) {
        if (options.strict_enums) {
            throw DecodeError(ErrorKind::InvalidEnumValue, offset,
                              std::string(what) + " value " + std::to_string(raw) + " out of range");
        }
        qCDebug(lcRwDumpDecode) << "Keeping unknown" << what << "value" << static_cast<int>(raw);
    }
    return static_cast<Enum>(raw);
}

std::array<AddressMode, 2> UnpackAddressing(std::uint8_t packed, std::size_t offset, const DecodeOptions &options)
{
    return {CheckedEnum<AddressMode>(AddressNibbleU(packed), ADDRESS_MODE_MAX, "addressing mode", offset, options),
            CheckedEnum<AddressMode>(AddressNibbleV(packed), ADDRESS_MODE_MAX, "addressing mode", offset, options)};
}

} // namespace

const char *filter_mode_name(FilterMode mode)
{
    switch (mode) {
    case FilterMode::None:
        return "None";
    case FilterMode::Nearest:
        return "Nearest";
    case FilterMode::Linear:
        return "Linear";
    case FilterMode::MipNearest:
        return "Mip Nearest";
    case FilterMode::MipLinear:
        return "Mip Linear";
    case FilterMode::LinearMipNearest:
        return "Linear Mip Nearest";
    case FilterMode::LinearMipLinear:
        return "Linear Mip Linear";
    }
    return nullptr;
}

const char *address_mode_name(AddressMode mode)
{
    switch (mode) {
    case AddressMode::None:
        return "None";
    case AddressMode::Wrap:
        return "Wrap";
    case AddressMode::Mirror:
        return "Mirror";
    case AddressMode::Clamp:
        return "Clamp";
    case AddressMode::Border:
        return "Border";
    }
    return nullptr;
}

Material decode_material(ByteStream &in, std::uint32_t version)
{
    Material mat;
    in.read_u32(); // flags, unused
    mat.color.r = in.read_u8();
    mat.color.g = in.read_u8();
    mat.color.b = in.read_u8();
    mat.color.a = in.read_u8();
    in.read_u32(); // unused
    in.read_u32(); // is textured; the texture child says the same

    if (version > RW_VERSION_MATERIAL_SURFACE_PROPS) {
        SurfaceProperties props;
        props.ambient = in.read_f32();
        props.specular = in.read_f32();
        props.diffuse = in.read_f32();
        mat.surface_properties = props;
    }

    return mat;
}

Texture decode_texture(ByteStream &in, const DecodeOptions &options)
{
    Texture tex;

    std::size_t at = in.offset();
    tex.filtering = CheckedEnum<FilterMode>(in.read_u8(), FILTER_MODE_MAX, "filter mode", at, options);

    at = in.offset();
    tex.addressing = UnpackAddressing(in.read_u8(), at, options);

    tex.has_mipmaps = in.read_u16() != 0;
    return tex;
}

Raster decode_raster(ByteStream &in, std::uint32_t version, const DecodeOptions &options)
{
    Raster raster;
    raster.platform_id = in.read_u32();

    const std::size_t filter_at = in.offset();
    const std::uint32_t filter_word = in.read_u32();
    raster.filtering = CheckedEnum<FilterMode>(static_cast<std::uint8_t>(filter_word >> RASTER_FILTER_SHIFT),
                                               FILTER_MODE_MAX, "filter mode", filter_at, options);
    raster.addressing =
        UnpackAddressing(static_cast<std::uint8_t>((filter_word >> RASTER_ADDRESS_SHIFT) & 0xFF), filter_at, options);

    raster.name = in.read_fixed_string(RW_RASTER_NAME_LEN);
    raster.mask_name = in.read_fixed_string(RW_RASTER_NAME_LEN);
    raster.raster_format = in.read_u32();

    const bool modern = version >= RW_VERSION_RASTER_FORMAT;

    const std::uint32_t format_word = in.read_u32();
    if (modern) {
        raster.d3d_format = format_word;
    } else {
        raster.has_alpha = format_word != 0;
    }

    raster.width = in.read_u16();
    raster.height = in.read_u16();
    raster.depth = in.read_u8();
    raster.mip_levels = in.read_u8();
    raster.raster_type = in.read_u8();

    const std::uint8_t flags = in.read_u8();
    if (modern) {
        raster.has_alpha = (flags & RASTER_FLAG_HAS_ALPHA) != 0;
        raster.is_cube_texture = (flags & RASTER_FLAG_CUBE) != 0;
        raster.has_auto_mipmaps = (flags & RASTER_FLAG_AUTO_MIPMAP) != 0;
        raster.is_compressed = (flags & RASTER_FLAG_COMPRESSED) != 0;
    } else {
        raster.compression = flags;
    }

    raster.pixel_data = in.read_remaining();
    return raster;
}

} // namespace rwdump
