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

#include "rwdump_ids.h"

#include <cstddef>

namespace rwdump
{
namespace
{

struct ChunkInfo
{
    std::uint32_t tag;
    const char *name;
    bool container;
};

const ChunkInfo kChunkTable[] = {
    {RW_CHUNK_STRUCT, "Struct", false},
    {RW_CHUNK_STRING, "String", false},
    {RW_CHUNK_EXTENSION, "Extension", true},
    {RW_CHUNK_CAMERA, "Camera", true},
    {RW_CHUNK_TEXTURE, "Texture", true},
    {RW_CHUNK_MATERIAL, "Material", true},
    {RW_CHUNK_MATERIAL_LIST, "Material List", true},
    {RW_CHUNK_ATOMIC_SECTION, "Atomic Section", true},
    {RW_CHUNK_PLANE_SECTION, "Plane Section", true},
    {RW_CHUNK_WORLD, "World", true},
    {RW_CHUNK_FRAME_LIST, "Frame List", true},
    {RW_CHUNK_GEOMETRY, "Geometry", true},
    {RW_CHUNK_CLUMP, "Clump", true},
    {RW_CHUNK_LIGHT, "Light", true},
    {RW_CHUNK_ATOMIC, "Atomic", true},
    {RW_CHUNK_TEXTURE_NATIVE, "Texture Native", true},
    {RW_CHUNK_TEX_DICTIONARY, "Texture Dictionary", true},
    {RW_CHUNK_GEOMETRY_LIST, "Geometry List", true},
    {RW_CHUNK_MORPH_PLG, "Morph PLG", false},
    {RW_CHUNK_SKIN_PLG, "Skin PLG", false},
    {RW_CHUNK_PARTICLES_PLG, "Particles PLG", false},
    {RW_CHUNK_HANIM_PLG, "HAnim PLG", false},
    {RW_CHUNK_MATERIAL_EFFECTS_PLG, "Material Effects PLG", false},
    {RW_CHUNK_BIN_MESH_PLG, "Bin Mesh PLG", false},
    {RW_CHUNK_NATIVE_DATA_PLG, "Native Data PLG", false},
    {RW_CHUNK_NODE_NAME, "Node Name", false},
};

const ChunkInfo *FindChunk(std::uint32_t tag)
{
    for (const auto &info : kChunkTable) {
        if (info.tag == tag) {
            return &info;
        }
    }
    return nullptr;
}

} // namespace

const char *chunk_name(std::uint32_t tag)
{
    const ChunkInfo *info = FindChunk(tag);
    return info ? info->name : nullptr;
}

bool chunk_is_known(std::uint32_t tag)
{
    return FindChunk(tag) != nullptr;
}

bool chunk_has_children(std::uint32_t tag)
{
    const ChunkInfo *info = FindChunk(tag);
    return info && info->container;
}

} // namespace rwdump
