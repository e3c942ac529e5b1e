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

#include "rwdump_stream.h"

#include "rwdump_error.h"

#include <cstring>

namespace rwdump
{

ByteStream::ByteStream(const std::uint8_t *data, std::size_t size, std::size_t base_offset)
    : _data(data)
    , _size(data ? size : 0)
    , _base(base_offset)
{
}

const std::uint8_t *ByteStream::take(std::size_t count)
{
    if (count > remaining()) {
        throw DecodeError(ErrorKind::TruncatedInput, offset(),
                          "need " + std::to_string(count) + " bytes, " + std::to_string(remaining()) + " left");
    }
    const std::uint8_t *ptr = _data + _pos;
    _pos += count;
    return ptr;
}

std::uint8_t ByteStream::read_u8()
{
    return *take(1);
}

std::uint16_t ByteStream::read_u16()
{
    const std::uint8_t *p = take(2);
    return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}

std::uint32_t ByteStream::read_u32()
{
    const std::uint8_t *p = take(4);
    return static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8) |
        (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
}

float ByteStream::read_f32()
{
    const std::uint32_t bits = read_u32();
    float value = 0.0f;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

std::string ByteStream::read_fixed_string(std::size_t width)
{
    const char *text = reinterpret_cast<const char *>(take(width));
    const void *end = std::memchr(text, 0, width);
    const std::size_t length = end ? static_cast<std::size_t>(static_cast<const char *>(end) - text) : width;
    return std::string(text, length);
}

std::vector<std::uint8_t> ByteStream::read_bytes(std::size_t count)
{
    const std::uint8_t *p = take(count);
    return std::vector<std::uint8_t>(p, p + count);
}

std::vector<std::uint8_t> ByteStream::read_remaining()
{
    return read_bytes(remaining());
}

ByteStream ByteStream::slice(std::size_t count)
{
    const std::size_t start = offset();
    const std::uint8_t *p = take(count);
    return ByteStream(p, count, start);
}

} // namespace rwdump
