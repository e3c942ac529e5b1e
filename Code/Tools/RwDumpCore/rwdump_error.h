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
#include <stdexcept>
#include <string>

namespace rwdump
{

enum class ErrorKind
{
    TruncatedInput,   // a fixed-size field runs past the end of its region
    BoundsError,      // a chunk declares more payload than its parent holds
    InvalidEnumValue, // a packed enumerator has no defined meaning
};

const char *error_kind_name(ErrorKind kind);

// Thrown by every decoder. The offset is absolute within the buffer handed to
// decode_chunk()/decode_chunks(), or relative to the payload when a leaf
// decoder is called directly.
class DecodeError : public std::runtime_error
{
public:
    DecodeError(ErrorKind kind, std::size_t offset, const std::string &detail);

    ErrorKind kind() const { return _kind; }
    std::size_t offset() const { return _offset; }

private:
    ErrorKind _kind;
    std::size_t _offset;
};

} // namespace rwdump
