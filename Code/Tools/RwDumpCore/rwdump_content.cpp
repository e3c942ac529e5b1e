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

#include <QByteArrayView>
#include <QString>
#include <QStringDecoder>

#include <cstring>

namespace rwdump
{

std::string decode_text(const std::uint8_t *data, std::size_t size)
{
    if (!data || size == 0) {
        return std::string();
    }

    const char *cdata = reinterpret_cast<const char *>(data);
    const void *end = std::memchr(cdata, 0, size);
    const std::size_t length = end ? static_cast<std::size_t>(static_cast<const char *>(end) - cdata) : size;

    QStringDecoder decoder(QStringDecoder::Utf8);
    const QString text = decoder(QByteArrayView(cdata, static_cast<qsizetype>(length)));
    if (decoder.hasError()) {
        qCDebug(lcRwDumpDecode) << "Dropping string with invalid UTF-8," << length << "bytes";
        return std::string();
    }
    return text.toStdString();
}

ChunkContent decode_content(std::uint32_t tag, std::uint32_t version, ByteStream &payload, const DecodeOptions &options)
{
    switch (tag) {
    case RW_CHUNK_STRING:
    case RW_CHUNK_NODE_NAME:
    {
        const auto bytes = payload.read_remaining();
        return Text{decode_text(bytes.data(), bytes.size())};
    }
    case RW_CHUNK_STRUCT:
        return StructPayload{payload.read_remaining()};
    case RW_CHUNK_GEOMETRY:
        return decode_geometry(payload, version);
    case RW_CHUNK_MATERIAL:
        return decode_material(payload, version);
    case RW_CHUNK_TEXTURE:
        return decode_texture(payload, options);
    case RW_CHUNK_TEXTURE_NATIVE:
        return decode_raster(payload, version, options);
    default:
        break;
    }

    if (chunk_has_children(tag)) {
        return StructPayload{payload.read_remaining()};
    }

    if (!chunk_is_known(tag)) {
        qCDebug(lcRwDumpDecode).nospace() << "Unknown chunk type 0x" << QString::number(tag, 16).toUpper()
                                          << ", keeping " << payload.remaining() << " bytes opaque";
    }
    return Opaque{tag, payload.read_remaining()};
}

} // namespace rwdump
