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

#include "rwdump_error.h"

#include <sstream>

namespace rwdump
{
namespace
{

std::string BuildMessage(ErrorKind kind, std::size_t offset, const std::string &detail)
{
    std::ostringstream out;
    out << error_kind_name(kind) << " at offset 0x" << std::uppercase << std::hex << offset;
    if (!detail.empty()) {
        out << ": " << detail;
    }
    return out.str();
}

} // namespace

const char *error_kind_name(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::TruncatedInput:
        return "TruncatedInput";
    case ErrorKind::BoundsError:
        return "BoundsError";
    case ErrorKind::InvalidEnumValue:
        return "InvalidEnumValue";
    }
    return "Unknown";
}

DecodeError::DecodeError(ErrorKind kind, std::size_t offset, const std::string &detail)
    : std::runtime_error(BuildMessage(kind, offset, detail))
    , _kind(kind)
    , _offset(offset)
{
}

} // namespace rwdump
