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

#include "rwdump_core.h"

#include <iomanip>
#include <sstream>

namespace rwdump
{
namespace
{

std::string FormatFloat(float value)
{
    std::ostringstream out;
    out << std::fixed << std::setprecision(3) << value;
    return out.str();
}

std::string FormatVec3(const Vector3 &vec)
{
    std::ostringstream out;
    out << std::fixed << std::setprecision(3) << vec.x << " " << vec.y << " " << vec.z;
    return out.str();
}

std::string FormatRGBA(const RGBA &color)
{
    std::ostringstream out;
    out << static_cast<unsigned int>(color.r) << " " << static_cast<unsigned int>(color.g) << " "
        << static_cast<unsigned int>(color.b) << " " << static_cast<unsigned int>(color.a);
    return out.str();
}

std::string FormatBool(bool value)
{
    return value ? "true" : "false";
}

std::string FilterName(FilterMode mode)
{
    const char *name = filter_mode_name(mode);
    return name ? name : std::to_string(static_cast<unsigned int>(mode));
}

std::string AddressName(AddressMode mode)
{
    const char *name = address_mode_name(mode);
    return name ? name : std::to_string(static_cast<unsigned int>(mode));
}

void AddRow(std::vector<FieldRow> &rows, const char *name, const char *type, const std::string &value)
{
    rows.push_back(FieldRow{name ? name : std::string(), type ? type : std::string(), value});
}

void AddFlag(std::vector<FieldRow> &rows, const char *group, const char *flag)
{
    AddRow(rows, group, "flag", flag ? flag : "");
}

void AddSubitems(std::vector<FieldRow> &rows, const Chunk &chunk)
{
    for (const auto &child : chunk.children) {
        const char *name = chunk_name(child->id());
        std::string label = name ? name : ("Unknown " + format_hex(child->id()));
        AddRow(rows, label.c_str(), "chunk", "");
    }
}

void AddSurfaceProperties(std::vector<FieldRow> &rows, const std::optional<SurfaceProperties> &props)
{
    if (!props) {
        AddRow(rows, "SurfaceProperties", "string", "absent");
        return;
    }
    AddRow(rows, "Ambient", "float", FormatFloat(props->ambient));
    AddRow(rows, "Specular", "float", FormatFloat(props->specular));
    AddRow(rows, "Diffuse", "float", FormatFloat(props->diffuse));
}

void AddGeometryFormat(std::vector<FieldRow> &rows, std::uint32_t format)
{
    AddRow(rows, "Format", "uint32", format_hex(format));
    if (format & RW_GEOMETRY_TRISTRIP) AddFlag(rows, "Format", "RW_GEOMETRY_TRISTRIP");
    if (format & RW_GEOMETRY_POSITIONS) AddFlag(rows, "Format", "RW_GEOMETRY_POSITIONS");
    if (format & RW_GEOMETRY_TEXTURED) AddFlag(rows, "Format", "RW_GEOMETRY_TEXTURED");
    if (format & RW_GEOMETRY_PRELIT) AddFlag(rows, "Format", "RW_GEOMETRY_PRELIT");
    if (format & RW_GEOMETRY_NORMALS) AddFlag(rows, "Format", "RW_GEOMETRY_NORMALS");
    if (format & RW_GEOMETRY_LIGHT) AddFlag(rows, "Format", "RW_GEOMETRY_LIGHT");
    if (format & RW_GEOMETRY_MODULATE_MATERIAL_COLOR) AddFlag(rows, "Format", "RW_GEOMETRY_MODULATE_MATERIAL_COLOR");
    if (format & RW_GEOMETRY_TEXTURED2) AddFlag(rows, "Format", "RW_GEOMETRY_TEXTURED2");
    if (format & RW_GEOMETRY_NATIVE) AddFlag(rows, "Format", "RW_GEOMETRY_NATIVE");
}

void AddGeometryRows(std::vector<FieldRow> &rows, const Geometry &geo)
{
    AddGeometryFormat(rows, geo.format);
    AddRow(rows, "NumTriangles", "uint32", std::to_string(geo.triangle_count));
    AddRow(rows, "NumVertices", "uint32", std::to_string(geo.vertex_count));
    AddRow(rows, "NumMorphTargets", "uint32", std::to_string(geo.morph_target_count));
    AddRow(rows, "NumTexSets", "uint32", std::to_string(geo.channel_count()));
    if (geo.surface_properties) {
        AddSurfaceProperties(rows, geo.surface_properties);
    }
    AddRow(rows, "PrelitColors", "count", std::to_string(geo.prelit.size()));
    for (std::size_t i = 0; i < geo.tex_coords.size(); ++i) {
        const std::string name = "TexCoords[" + std::to_string(i) + "]";
        AddRow(rows, name.c_str(), "count", std::to_string(geo.tex_coords[i].size()));
    }
    AddRow(rows, "Triangles", "count", std::to_string(geo.triangles.size()));
    AddRow(rows, "BoundingSphere.Center", "vec3", FormatVec3(geo.bounding_sphere.center));
    AddRow(rows, "BoundingSphere.Radius", "float", FormatFloat(geo.bounding_sphere.radius));
    AddRow(rows, "Vertices", "count", std::to_string(geo.vertices.size()));
    AddRow(rows, "Normals", "count", std::to_string(geo.normals.size()));
}

void AddRasterRows(std::vector<FieldRow> &rows, const Raster &raster)
{
    AddRow(rows, "PlatformID", "uint32", format_hex(raster.platform_id));
    AddRow(rows, "Filtering", "string", FilterName(raster.filtering));
    AddRow(rows, "AddressU", "string", AddressName(raster.addressing[0]));
    AddRow(rows, "AddressV", "string", AddressName(raster.addressing[1]));
    AddRow(rows, "Name", "string", raster.name);
    AddRow(rows, "MaskName", "string", raster.mask_name);
    AddRow(rows, "RasterFormat", "uint32", format_hex(raster.raster_format));
    if (raster.d3d_format) {
        AddRow(rows, "D3DFormat", "uint32", format_hex(*raster.d3d_format));
    }
    AddRow(rows, "Width", "uint16", std::to_string(raster.width));
    AddRow(rows, "Height", "uint16", std::to_string(raster.height));
    AddRow(rows, "Depth", "uint8", std::to_string(raster.depth));
    AddRow(rows, "NumLevels", "uint8", std::to_string(raster.mip_levels));
    AddRow(rows, "RasterType", "uint8", std::to_string(raster.raster_type));
    if (raster.compression) {
        AddRow(rows, "Compression", "uint8", std::to_string(*raster.compression));
    }
    AddRow(rows, "HasAlpha", "bool", FormatBool(raster.has_alpha));
    if (raster.is_cube_texture) AddFlag(rows, "Flags", "CUBE_TEXTURE");
    if (raster.has_auto_mipmaps) AddFlag(rows, "Flags", "AUTO_MIPMAPS");
    if (raster.is_compressed) AddFlag(rows, "Flags", "COMPRESSED");
    AddRow(rows, "PixelData", "bytes", std::to_string(raster.pixel_data.size()));
}

} // namespace

std::vector<FieldRow> describe_chunk(const Chunk &chunk)
{
    std::vector<FieldRow> rows;

    if (const auto *text = chunk.get<Text>()) {
        AddRow(rows, chunk.id() == RW_CHUNK_NODE_NAME ? "Node Name" : "String", "string", text->value);
    } else if (const auto *geo = chunk.get<Geometry>()) {
        AddGeometryRows(rows, *geo);
    } else if (const auto *mat = chunk.get<Material>()) {
        AddRow(rows, "Color", "rgba", FormatRGBA(mat->color));
        AddSurfaceProperties(rows, mat->surface_properties);
    } else if (const auto *tex = chunk.get<Texture>()) {
        AddRow(rows, "Filtering", "string", FilterName(tex->filtering));
        AddRow(rows, "AddressU", "string", AddressName(tex->addressing[0]));
        AddRow(rows, "AddressV", "string", AddressName(tex->addressing[1]));
        AddRow(rows, "HasMipmaps", "bool", FormatBool(tex->has_mipmaps));
    } else if (const auto *raster = chunk.get<Raster>()) {
        AddRasterRows(rows, *raster);
    } else if (const auto *payload = chunk.get<StructPayload>()) {
        AddRow(rows, "Struct", "bytes", std::to_string(payload->bytes.size()));
    } else if (const auto *opaque = chunk.get<Opaque>()) {
        AddRow(rows, "Type", "uint32", format_hex(opaque->tag));
        AddRow(rows, "Data", "bytes", std::to_string(opaque->bytes.size()));
    }

    if (!chunk.children.empty()) {
        AddSubitems(rows, chunk);
    }

    return rows;
}

} // namespace rwdump
