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

#include "rwdump_content.h"
#include "rwdump_log.h"
#include "rwdump_stream.h"

#include <QByteArray>
#include <QFile>
#include <QString>

#include <algorithm>
#include <sstream>

namespace rwdump
{
namespace
{

/*
** Second pass over a container: the leading struct child carries the typed
** payload of the container itself, so it is re-dispatched under the
** container's tag and version. Runs after every child has been decoded.
*/
ChunkContent DecodeStructChild(const Chunk &chunk, std::size_t payload_offset, const DecodeOptions &options)
{
    if (chunk.children.empty() || chunk.children.front()->id() != RW_CHUNK_STRUCT) {
        return Marker();
    }

    const auto *payload = chunk.children.front()->get<StructPayload>();
    if (!payload) {
        return Marker();
    }

    ByteStream stream(payload->bytes.data(), payload->bytes.size(), payload_offset + RW_CHUNK_HEADER_SIZE);
    return decode_content(chunk.header.type, chunk.header.version, stream, options);
}

std::unique_ptr<Chunk> DecodeChunk(ByteStream &stream, const DecodeOptions &options, std::size_t depth)
{
    if (depth > options.max_depth) {
        throw DecodeError(ErrorKind::BoundsError, stream.offset(),
                          "chunk nesting deeper than " + std::to_string(options.max_depth) + " levels");
    }

    auto chunk = std::make_unique<Chunk>();
    chunk->header = read_chunk_header(stream);
    const ChunkHeader &header = chunk->header;

    if (header.size > stream.remaining()) {
        throw DecodeError(ErrorKind::BoundsError, stream.offset(),
                          "chunk " + format_hex(header.type) + " declares " + std::to_string(header.size) +
                              " payload bytes, " + std::to_string(stream.remaining()) + " available");
    }

    const std::size_t payload_offset = stream.offset();
    ByteStream payload = stream.slice(header.size);

    if (chunk_has_children(header.type)) {
        while (!payload.at_end()) {
            chunk->children.push_back(DecodeChunk(payload, options, depth + 1));
        }
        chunk->content = DecodeStructChild(*chunk, payload_offset, options);
    } else {
        chunk->content = decode_content(header.type, header.version, payload, options);
    }

    return chunk;
}

const std::vector<std::uint8_t> *RawBytes(const Chunk &chunk)
{
    if (const auto *opaque = chunk.get<Opaque>()) {
        return &opaque->bytes;
    }
    if (const auto *payload = chunk.get<StructPayload>()) {
        return &payload->bytes;
    }
    return nullptr;
}

} // namespace

LibraryVersion decode_library_id(std::uint32_t library_id)
{
    LibraryVersion result;
    if (library_id & 0xFFFF0000u) {
        result.version = (((library_id >> 14) & 0x3FF00u) + 0x30000u) | ((library_id >> 16) & 0x3Fu);
        result.build = library_id & 0xFFFFu;
    } else {
        result.version = library_id << 8;
        result.build = 0;
    }
    return result;
}

std::string format_hex(std::uint32_t value)
{
    std::ostringstream out;
    out << "0x" << std::uppercase << std::hex << value;
    return out.str();
}

std::string format_version(std::uint32_t version)
{
    std::ostringstream out;
    out << ((version >> 16) & 0xF) << '.' << ((version >> 12) & 0xF) << '.' << ((version >> 8) & 0xF) << '.'
        << (version & 0xFF);
    return out.str();
}

ChunkHeader read_chunk_header(ByteStream &stream)
{
    if (stream.remaining() < RW_CHUNK_HEADER_SIZE) {
        throw DecodeError(ErrorKind::TruncatedInput, stream.offset(),
                          "chunk header needs 12 bytes, " + std::to_string(stream.remaining()) + " left");
    }

    ChunkHeader header;
    header.type = stream.read_u32();
    header.size = stream.read_u32();
    header.library_id = stream.read_u32();

    const LibraryVersion unpacked = decode_library_id(header.library_id);
    header.version = unpacked.version;
    header.build = unpacked.build;
    return header;
}

const Chunk *Chunk::find_child(std::uint32_t tag) const
{
    for (const auto &child : children) {
        if (child->id() == tag) {
            return child.get();
        }
    }
    return nullptr;
}

std::unique_ptr<Chunk> decode_chunk(const std::uint8_t *data,
                                    std::size_t size,
                                    std::size_t *consumed,
                                    const DecodeOptions &options)
{
    ByteStream stream(data, size);
    auto chunk = DecodeChunk(stream, options, 0);
    if (consumed) {
        *consumed = stream.position();
    }
    return chunk;
}

std::vector<std::unique_ptr<Chunk>> decode_chunks(const std::uint8_t *data,
                                                  std::size_t size,
                                                  const DecodeOptions &options)
{
    std::vector<std::unique_ptr<Chunk>> chunks;
    ByteStream stream(data, size);
    while (!stream.at_end()) {
        chunks.push_back(DecodeChunk(stream, options, 0));
    }
    return chunks;
}

std::vector<std::unique_ptr<Chunk>> decode_chunks(const std::vector<std::uint8_t> &bytes,
                                                  const DecodeOptions &options)
{
    return decode_chunks(bytes.data(), bytes.size(), options);
}

bool ChunkFile::load(const std::string &path, const DecodeOptions &options)
{
    clear();

    QFile file(QString::fromStdString(path));
    if (!file.open(QIODevice::ReadOnly))
    {
        _lastError = "cannot open " + path + ": " + file.errorString().toStdString();
        qCWarning(lcRwDumpFile) << "Failed to open" << file.fileName() << ":" << file.errorString();
        return false;
    }

    const QByteArray raw = file.readAll();
    file.close();

    qCDebug(lcRwDumpFile) << "Read" << raw.size() << "bytes from" << file.fileName();

    const std::vector<std::uint8_t> bytes(raw.begin(), raw.end());
    return load_from_memory(bytes, options);
}

bool ChunkFile::load_from_memory(const std::vector<std::uint8_t> &bytes, const DecodeOptions &options)
{
    clear();

    try
    {
        _roots = decode_chunks(bytes, options);
    }
    catch (const DecodeError &error)
    {
        _roots.clear();
        _lastError = error.what();
        qCWarning(lcRwDumpFile) << "Decode failed:" << error.what();
        return false;
    }

    return true;
}

void ChunkFile::clear()
{
    _roots.clear();
    _lastError.clear();
}

std::string format_chunk_label(const Chunk &chunk)
{
    std::ostringstream out;
    const char *name = chunk_name(chunk.id());
    if (name) {
        out << name << " (" << format_hex(chunk.id()) << ", " << chunk.length() << " bytes)";
    } else {
        out << "Chunk " << format_hex(chunk.id()) << " (" << chunk.length() << " bytes)";
    }
    out << " v" << format_version(chunk.header.version);
    if (chunk.header.build != 0) {
        out << " build " << format_hex(chunk.header.build);
    }
    return out.str();
}

std::string build_hex_view(const Chunk &chunk, std::size_t bytes_per_line, std::size_t max_bytes)
{
    if (!chunk.children.empty() || std::holds_alternative<Marker>(chunk.content)) {
        return "This chunk is a wrapper for other chunks.";
    }

    std::vector<std::uint8_t> text_bytes;
    const std::vector<std::uint8_t> *raw = RawBytes(chunk);
    if (!raw) {
        if (const auto *text = chunk.get<Text>()) {
            text_bytes.assign(text->value.begin(), text->value.end());
            raw = &text_bytes;
        } else {
            return "No raw bytes kept for this chunk.";
        }
    }

    if (bytes_per_line == 0) {
        bytes_per_line = 16;
    }

    const auto &data = *raw;
    const std::size_t shown = (max_bytes == 0) ? data.size() : std::min(max_bytes, data.size());

    std::ostringstream out;
    for (std::size_t i = 0; i < shown; i += bytes_per_line)
    {
        const auto line_bytes = std::min<std::size_t>(bytes_per_line, shown - i);

        for (std::size_t j = 0; j < line_bytes; ++j)
        {
            out.width(2);
            out.fill('0');
            out << std::hex << static_cast<int>(data[i + j]) << ' ';
        }

        // pad the hex field so ASCII column lines up
        if (line_bytes < bytes_per_line)
        {
            out << std::string((bytes_per_line - line_bytes) * 3, ' ');
        }

        out << "  ";
        for (std::size_t j = 0; j < line_bytes; ++j)
        {
            const auto c = data[i + j];
            if (c >= 32 && c < 127)
            {
                out << static_cast<char>(c);
            }
            else
            {
                out << '.';
            }
        }

        if (i + line_bytes < shown)
        {
            out << '\n';
        }
    }

    if (shown < data.size())
    {
        out << std::dec << "\n... " << (data.size() - shown) << " more bytes";
    }

    return out.str();
}

} // namespace rwdump
