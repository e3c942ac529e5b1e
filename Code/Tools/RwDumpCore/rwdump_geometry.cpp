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

namespace rwdump
{
namespace
{

std::uint32_t ChannelCount(std::uint32_t format)
{
    const std::uint32_t explicit_sets = (format & RW_GEOMETRY_TEX_SETS_MASK) >> RW_GEOMETRY_TEX_SETS_SHIFT;
    if (explicit_sets != 0) {
        return explicit_sets;
    }
    if (format & RW_GEOMETRY_TEXTURED2) {
        return 2;
    }
    if (format & RW_GEOMETRY_TEXTURED) {
        return 1;
    }
    return 0;
}

SurfaceProperties ReadSurfaceProperties(ByteStream &in)
{
    SurfaceProperties props;
    props.ambient = in.read_f32();
    props.specular = in.read_f32();
    props.diffuse = in.read_f32();
    return props;
}

Vector3 ReadVector3(ByteStream &in)
{
    Vector3 v;
    v.x = in.read_f32();
    v.y = in.read_f32();
    v.z = in.read_f32();
    return v;
}

// Counts come straight from the stream, so reserve only what the remaining
// bytes could possibly hold.
template <typename T>
void ReserveFor(std::vector<T> &out, std::uint32_t count, std::size_t record_size, const ByteStream &in)
{
    const std::size_t fits = in.remaining() / record_size;
    out.reserve(count < fits ? count : fits);
}

std::vector<Vector3> ReadVector3Array(ByteStream &in, std::uint32_t count)
{
    std::vector<Vector3> out;
    ReserveFor(out, count, 12, in);
    for (std::uint32_t i = 0; i < count; ++i) {
        out.push_back(ReadVector3(in));
    }
    return out;
}

} // namespace

std::uint32_t Geometry::channel_count() const
{
    return ChannelCount(format);
}

Geometry decode_geometry(ByteStream &in, std::uint32_t version)
{
    Geometry geo;
    geo.format = in.read_u32();
    geo.triangle_count = in.read_u32();
    geo.vertex_count = in.read_u32();
    geo.morph_target_count = in.read_u32();

    const std::uint32_t channels = ChannelCount(geo.format);

    if (version < RW_VERSION_GEOMETRY_SURFACE_PROPS) {
        geo.surface_properties = ReadSurfaceProperties(in);
    }

    // Native geometry keeps prelit, UVs and triangles in a platform blob.
    if (!geo.is_native()) {
        if (geo.format & RW_GEOMETRY_PRELIT) {
            ReserveFor(geo.prelit, geo.vertex_count, 4, in);
            for (std::uint32_t i = 0; i < geo.vertex_count; ++i) {
                RGBA color;
                color.r = in.read_u8();
                color.g = in.read_u8();
                color.b = in.read_u8();
                color.a = in.read_u8();
                geo.prelit.push_back(color);
            }
        }

        for (std::uint32_t set = 0; set < channels; ++set) {
            std::vector<TexCoord> coords;
            ReserveFor(coords, geo.vertex_count, 8, in);
            for (std::uint32_t i = 0; i < geo.vertex_count; ++i) {
                TexCoord uv;
                uv.u = in.read_f32();
                uv.v = in.read_f32();
                coords.push_back(uv);
            }
            geo.tex_coords.push_back(std::move(coords));
        }

        ReserveFor(geo.triangles, geo.triangle_count, 8, in);
        for (std::uint32_t i = 0; i < geo.triangle_count; ++i) {
            Triangle tri;
            tri.vertex2 = in.read_u16();
            tri.vertex1 = in.read_u16();
            tri.material_id = in.read_u16();
            tri.vertex3 = in.read_u16();
            geo.triangles.push_back(tri);
        }
    }

    // TODO: morph targets past the first are left unread.
    geo.bounding_sphere.center = ReadVector3(in);
    geo.bounding_sphere.radius = in.read_f32();

    const std::uint32_t has_vertices = in.read_u32();
    const std::uint32_t has_normals = in.read_u32();

    if (has_vertices != 0) {
        geo.vertices = ReadVector3Array(in, geo.vertex_count);
    }
    if (has_normals != 0) {
        geo.normals = ReadVector3Array(in, geo.vertex_count);
    }

    return geo;
}

} // namespace rwdump
