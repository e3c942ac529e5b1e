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

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rwdump
{

/*
** Geometry format bits
*/
enum : std::uint32_t
{
    RW_GEOMETRY_TRISTRIP = 0x00000001,
    RW_GEOMETRY_POSITIONS = 0x00000002,
    RW_GEOMETRY_TEXTURED = 0x00000004,
    RW_GEOMETRY_PRELIT = 0x00000008,
    RW_GEOMETRY_NORMALS = 0x00000010,
    RW_GEOMETRY_LIGHT = 0x00000020,
    RW_GEOMETRY_MODULATE_MATERIAL_COLOR = 0x00000040,
    RW_GEOMETRY_TEXTURED2 = 0x00000080,
    RW_GEOMETRY_TEX_SETS_MASK = 0x00FF0000,
    RW_GEOMETRY_NATIVE = 0x01000000,
};

constexpr int RW_GEOMETRY_TEX_SETS_SHIFT = 16;

// Format-version thresholds for the layout branches.
constexpr std::uint32_t RW_VERSION_GEOMETRY_SURFACE_PROPS = 0x34000; // below: legacy block present
constexpr std::uint32_t RW_VERSION_MATERIAL_SURFACE_PROPS = 0x30400; // above: block present
constexpr std::uint32_t RW_VERSION_RASTER_FORMAT = 0x36003;          // at/above: modern raster header

constexpr std::size_t RW_RASTER_NAME_LEN = 32;

enum class FilterMode : std::uint8_t
{
    None = 0,
    Nearest = 1,
    Linear = 2,
    MipNearest = 3,
    MipLinear = 4,
    LinearMipNearest = 5,
    LinearMipLinear = 6,
};

enum class AddressMode : std::uint8_t
{
    None = 0,
    Wrap = 1,
    Mirror = 2,
    Clamp = 3,
    Border = 4,
};

struct RGBA
{
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    std::uint8_t a = 0;
};

struct TexCoord
{
    float u = 0.0f;
    float v = 0.0f;
};

struct Vector3
{
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
};

struct Sphere
{
    Vector3 center;
    float radius = 0.0f;
};

struct SurfaceProperties
{
    float ambient = 0.0f;
    float specular = 0.0f;
    float diffuse = 0.0f;
};

// Field order matches the stream; the first two indices are swapped on disk.
struct Triangle
{
    std::uint16_t vertex2 = 0;
    std::uint16_t vertex1 = 0;
    std::uint16_t material_id = 0;
    std::uint16_t vertex3 = 0;

    std::array<std::uint16_t, 3> indices() const { return {vertex1, vertex2, vertex3}; }
};

struct Geometry
{
    std::uint32_t format = 0;
    std::uint32_t triangle_count = 0;
    std::uint32_t vertex_count = 0;
    std::uint32_t morph_target_count = 0;
    std::optional<SurfaceProperties> surface_properties;
    std::vector<RGBA> prelit;
    std::vector<std::vector<TexCoord>> tex_coords;
    std::vector<Triangle> triangles;
    Sphere bounding_sphere;
    std::vector<Vector3> vertices;
    std::vector<Vector3> normals;

    bool is_tristrip() const { return (format & RW_GEOMETRY_TRISTRIP) != 0; }
    bool is_native() const { return (format & RW_GEOMETRY_NATIVE) != 0; }
    std::uint32_t channel_count() const;
};

struct Material
{
    RGBA color;
    std::optional<SurfaceProperties> surface_properties;
};

struct Texture
{
    FilterMode filtering = FilterMode::None;
    std::array<AddressMode, 2> addressing = {AddressMode::None, AddressMode::None};
    bool has_mipmaps = false;
};

struct Raster
{
    std::uint32_t platform_id = 0;
    FilterMode filtering = FilterMode::None;
    std::array<AddressMode, 2> addressing = {AddressMode::None, AddressMode::None};
    std::string name;
    std::string mask_name;
    std::uint32_t raster_format = 0;
    std::optional<std::uint32_t> d3d_format; // modern layout only
    bool has_alpha = false;
    std::uint16_t width = 0;
    std::uint16_t height = 0;
    std::uint8_t depth = 0;
    std::uint8_t mip_levels = 0;
    std::uint8_t raster_type = 0;
    std::optional<std::uint8_t> compression; // legacy layout only
    bool is_cube_texture = false;
    bool has_auto_mipmaps = false;
    bool is_compressed = false;
    std::vector<std::uint8_t> pixel_data;
};

const char *filter_mode_name(FilterMode mode);
const char *address_mode_name(AddressMode mode);

} // namespace rwdump
