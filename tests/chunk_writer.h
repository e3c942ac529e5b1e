#pragma once

#include <cstdint>
#include <cstring>
#include <initializer_list>
#include <string>
#include <vector>

namespace rwdump_test
{

// Little-endian byte builder for test inputs.
class ByteWriter
{
public:
    ByteWriter &u8(std::uint8_t value)
    {
        _bytes.push_back(value);
        return *this;
    }

    ByteWriter &u16(std::uint16_t value)
    {
        u8(static_cast<std::uint8_t>(value & 0xFF));
        return u8(static_cast<std::uint8_t>(value >> 8));
    }

    ByteWriter &u32(std::uint32_t value)
    {
        for (int shift = 0; shift < 32; shift += 8) {
            u8(static_cast<std::uint8_t>((value >> shift) & 0xFF));
        }
        return *this;
    }

    ByteWriter &f32(float value)
    {
        std::uint32_t bits = 0;
        std::memcpy(&bits, &value, sizeof(bits));
        return u32(bits);
    }

    ByteWriter &bytes(const std::vector<std::uint8_t> &data)
    {
        _bytes.insert(_bytes.end(), data.begin(), data.end());
        return *this;
    }

    ByteWriter &fixed_string(const std::string &text, std::size_t width)
    {
        for (std::size_t i = 0; i < width; ++i) {
            u8(i < text.size() ? static_cast<std::uint8_t>(text[i]) : 0);
        }
        return *this;
    }

    const std::vector<std::uint8_t> &data() const { return _bytes; }

private:
    std::vector<std::uint8_t> _bytes;
};

inline std::vector<std::uint8_t> MakeChunk(std::uint32_t type, std::uint32_t library_id,
                                           const std::vector<std::uint8_t> &payload)
{
    ByteWriter out;
    out.u32(type).u32(static_cast<std::uint32_t>(payload.size())).u32(library_id).bytes(payload);
    return out.data();
}

inline std::vector<std::uint8_t> Concat(std::initializer_list<std::vector<std::uint8_t>> parts)
{
    std::vector<std::uint8_t> out;
    for (const auto &part : parts) {
        out.insert(out.end(), part.begin(), part.end());
    }
    return out;
}

// Library ids for the two packings.
constexpr std::uint32_t kLibraryId36003 = 0x1803FFFF; // 3.6.0.3, build 0xFFFF
constexpr std::uint32_t kLibraryId33002 = 0x0C02FFFF; // 3.3.0.2, build 0xFFFF
constexpr std::uint32_t kLibraryIdLegacy310 = 0x00000310;

} // namespace rwdump_test
