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

#include "rwdump_core.h"
#include "rwdump_stream.h"

#include <cstddef>
#include <cstdint>
#include <string>

namespace rwdump
{

/*
** Content dispatcher. Maps a tag and resolved version to the payload grammar:
**
**   String, Node Name     -> Text
**   Struct                -> StructPayload
**   Geometry              -> Geometry
**   Material              -> Material
**   Texture               -> Texture
**   Texture Native        -> Raster
**   other known container -> StructPayload (struct child bytes)
**   anything else         -> Opaque
**
** Container tags reach here with the payload of their leading struct child.
** Only the grammar decoders can throw; the fallbacks never fail.
*/
ChunkContent decode_content(std::uint32_t tag, std::uint32_t version, ByteStream &payload,
                            const DecodeOptions &options = DecodeOptions());

// NUL-trimmed UTF-8; invalid encodings come back empty.
std::string decode_text(const std::uint8_t *data, std::size_t size);

Geometry decode_geometry(ByteStream &payload, std::uint32_t version);
Material decode_material(ByteStream &payload, std::uint32_t version);
Texture decode_texture(ByteStream &payload, const DecodeOptions &options = DecodeOptions());
Raster decode_raster(ByteStream &payload, std::uint32_t version, const DecodeOptions &options = DecodeOptions());

} // namespace rwdump
