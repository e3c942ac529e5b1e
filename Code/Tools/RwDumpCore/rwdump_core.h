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

#include "rwdump_error.h"
#include "rwdump_ids.h"
#include "rwdump_types.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace rwdump
{

class ByteStream;

constexpr std::size_t RW_CHUNK_HEADER_SIZE = 12;

struct LibraryVersion
{
    std::uint32_t version = 0;
    std::uint32_t build = 0;
};

// Unpacks the library id word of a chunk header. Ids with a nonzero upper
// half use the packed 3.x layout; anything else is a bare pre-3.1 version.
LibraryVersion decode_library_id(std::uint32_t library_id);

// "3.6.0.3" style rendering of an unpacked version.
std::string format_version(std::uint32_t version);

// "0x1A" style rendering used by labels, field rows and error text.
std::string format_hex(std::uint32_t value);

struct ChunkHeader
{
    std::uint32_t type = 0;
    std::uint32_t size = 0;
    std::uint32_t library_id = 0;
    std::uint32_t version = 0;
    std::uint32_t build = 0;
};

// Reads the 12-byte header and resolves version/build. The payload is not
// bounds-checked here.
ChunkHeader read_chunk_header(ByteStream &stream);

/*
** Decoded chunk content
*/
struct Marker
{
};

struct Opaque
{
    std::uint32_t tag = 0;
    std::vector<std::uint8_t> bytes;
};

struct StructPayload
{
    std::vector<std::uint8_t> bytes;
};

struct Text
{
    std::string value;
};

using ChunkContent = std::variant<Marker, Opaque, StructPayload, Text, Geometry, Material, Texture, Raster>;

struct Chunk
{
    ChunkHeader header;
    ChunkContent content;
    std::vector<std::unique_ptr<Chunk>> children;

    std::uint32_t id() const { return header.type; }
    std::uint32_t length() const { return header.size; }

    template <typename T>
    const T *get() const
    {
        return std::get_if<T>(&content);
    }

    // First direct child with the given tag, nullptr if none.
    const Chunk *find_child(std::uint32_t tag) const;
};

struct DecodeOptions
{
    // When false, packed enumerators outside the known range keep their raw
    // value instead of failing the decode.
    bool strict_enums = true;

    // Deepest container nesting accepted before the decode fails with
    // BoundsError.
    std::size_t max_depth = 1024;
};

// Decodes the single chunk framed at the start of [data, data + size) and
// reports the number of bytes it occupied (header plus declared payload).
std::unique_ptr<Chunk> decode_chunk(const std::uint8_t *data,
                                    std::size_t size,
                                    std::size_t *consumed = nullptr,
                                    const DecodeOptions &options = DecodeOptions());

// Decodes a run of sibling chunks that must fill [data, data + size) exactly.
std::vector<std::unique_ptr<Chunk>> decode_chunks(const std::uint8_t *data,
                                                  std::size_t size,
                                                  const DecodeOptions &options = DecodeOptions());

std::vector<std::unique_ptr<Chunk>> decode_chunks(const std::vector<std::uint8_t> &bytes,
                                                  const DecodeOptions &options = DecodeOptions());

class ChunkFile
{
public:
    bool load(const std::string &path, const DecodeOptions &options = DecodeOptions());
    bool load_from_memory(const std::vector<std::uint8_t> &bytes, const DecodeOptions &options = DecodeOptions());
    void clear();

    const std::vector<std::unique_ptr<Chunk>> &roots() const { return _roots; }
    const std::string &last_error() const { return _lastError; }

private:
    std::vector<std::unique_ptr<Chunk>> _roots;
    std::string _lastError;
};

struct FieldRow
{
    std::string name;
    std::string type;
    std::string value;
};

std::vector<FieldRow> describe_chunk(const Chunk &chunk);

// One-line tree label: name or tag, size, version and build.
std::string format_chunk_label(const Chunk &chunk);

// Render the raw leaf bytes into a simple hex+ASCII view. Text chunks show
// the decoded string, without NUL padding. A max_bytes of 0 shows everything.
std::string build_hex_view(const Chunk &chunk, std::size_t bytes_per_line = 16, std::size_t max_bytes = 0);

} // namespace rwdump
