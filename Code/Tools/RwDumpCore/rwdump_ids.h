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

#include <cstdint>

namespace rwdump
{

/*
** Chunk type tags. The code space is open: tags not listed here are legal and
** decode as opaque leaves.
*/
enum : std::uint32_t
{
    RW_CHUNK_STRUCT = 0x00000001,
    RW_CHUNK_STRING = 0x00000002,
    RW_CHUNK_EXTENSION = 0x00000003,
    RW_CHUNK_CAMERA = 0x00000005,
    RW_CHUNK_TEXTURE = 0x00000006,
    RW_CHUNK_MATERIAL = 0x00000007,
    RW_CHUNK_MATERIAL_LIST = 0x00000008,
    RW_CHUNK_ATOMIC_SECTION = 0x00000009,
    RW_CHUNK_PLANE_SECTION = 0x0000000A,
    RW_CHUNK_WORLD = 0x0000000B,
    RW_CHUNK_FRAME_LIST = 0x0000000E,
    RW_CHUNK_GEOMETRY = 0x0000000F,
    RW_CHUNK_CLUMP = 0x00000010,
    RW_CHUNK_LIGHT = 0x00000012,
    RW_CHUNK_ATOMIC = 0x00000014,
    RW_CHUNK_TEXTURE_NATIVE = 0x00000015,
    RW_CHUNK_TEX_DICTIONARY = 0x00000016,
    RW_CHUNK_GEOMETRY_LIST = 0x0000001A,

    // plugin chunks, all leaf-only
    RW_CHUNK_MORPH_PLG = 0x00000105,
    RW_CHUNK_SKIN_PLG = 0x00000116,
    RW_CHUNK_PARTICLES_PLG = 0x00000118,
    RW_CHUNK_HANIM_PLG = 0x0000011E,
    RW_CHUNK_MATERIAL_EFFECTS_PLG = 0x00000120,
    RW_CHUNK_BIN_MESH_PLG = 0x0000050E,
    RW_CHUNK_NATIVE_DATA_PLG = 0x00000510,
    RW_CHUNK_NODE_NAME = 0x0253F2FE,
};

// Display name for a known tag, nullptr otherwise.
const char *chunk_name(std::uint32_t tag);

bool chunk_is_known(std::uint32_t tag);

// True only for known tags whose payload is a sequence of child chunks.
// Unknown tags are leaves.
bool chunk_has_children(std::uint32_t tag);

} // namespace rwdump
