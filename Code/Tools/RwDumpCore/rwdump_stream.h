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

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace rwdump
{

// Bounds-checked little-endian cursor over a borrowed byte range. Every read
// past the end throws DecodeError(TruncatedInput) with the absolute offset of
// the field that did not fit.
class ByteStream
{
public:
    ByteStream(const std::uint8_t *data, std::size_t size, std::size_t base_offset = 0);

    std::size_t size() const { return _size; }
    std::size_t position() const { return _pos; }
    std::size_t remaining() const { return _size - _pos; }
    bool at_end() const { return _pos == _size; }

    // Absolute offset of the cursor within the outermost buffer.
    std::size_t offset() const { return _base + _pos; }

    std::uint8_t read_u8();
    std::uint16_t read_u16();
    std::uint32_t read_u32();
    float read_f32();

    // Fixed-width field with trailing NUL padding stripped.
    std::string read_fixed_string(std::size_t width);

    std::vector<std::uint8_t> read_bytes(std::size_t count);
    std::vector<std::uint8_t> read_remaining();

    // Splits the next `count` bytes off as an independent stream and advances
    // past them.
    ByteStream slice(std::size_t count);

private:
    const std::uint8_t *take(std::size_t count);

    const std::uint8_t *_data;
    std::size_t _size;
    std::size_t _pos = 0;
    std::size_t _base;
};

} // namespace rwdump
