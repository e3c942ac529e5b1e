#include <gtest/gtest.h>

#include "chunk_writer.h"
#include "rwdump_error.h"
#include "rwdump_stream.h"

using namespace rwdump;
using namespace rwdump_test;

TEST(ByteStreamTest, ReadsLittleEndian) {
    ByteWriter w;
    w.u8(0xAB).u16(0x1234).u32(0xDEADBEEF).f32(1.5f);
    ByteStream in(w.data().data(), w.data().size());

    EXPECT_EQ(in.read_u8(), 0xAB);
    EXPECT_EQ(in.read_u16(), 0x1234);
    EXPECT_EQ(in.read_u32(), 0xDEADBEEFu);
    EXPECT_FLOAT_EQ(in.read_f32(), 1.5f);
    EXPECT_TRUE(in.at_end());
}

TEST(ByteStreamTest, ReadPastEndReportsFieldOffset) {
    ByteWriter w;
    w.u16(1).u8(2);
    ByteStream in(w.data().data(), w.data().size(), 100);

    in.read_u16();
    try {
        in.read_u32();
        FAIL() << "expected DecodeError";
    } catch (const DecodeError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::TruncatedInput);
        EXPECT_EQ(e.offset(), 102u);
    }
    // the failed read does not move the cursor
    EXPECT_EQ(in.position(), 2u);
}

TEST(ByteStreamTest, FixedStringStripsPadding) {
    ByteWriter w;
    w.fixed_string("body", 8).fixed_string("", 4);
    ByteStream in(w.data().data(), w.data().size());

    EXPECT_EQ(in.read_fixed_string(8), "body");
    EXPECT_EQ(in.read_fixed_string(4), "");
    EXPECT_TRUE(in.at_end());
}

TEST(ByteStreamTest, SliceKeepsAbsoluteOffsets) {
    ByteWriter w;
    w.u32(0).u32(7).u32(9);
    ByteStream in(w.data().data(), w.data().size());

    in.read_u32();
    ByteStream inner = in.slice(4);
    EXPECT_EQ(inner.offset(), 4u);
    EXPECT_EQ(inner.read_u32(), 7u);
    EXPECT_TRUE(inner.at_end());
    EXPECT_EQ(in.read_u32(), 9u);
}

TEST(ByteStreamTest, ReadRemainingDrainsStream) {
    ByteWriter w;
    w.u8(1).u8(2).u8(3);
    ByteStream in(w.data().data(), w.data().size());

    in.read_u8();
    EXPECT_EQ(in.read_remaining(), (std::vector<std::uint8_t>{2, 3}));
    EXPECT_TRUE(in.read_remaining().empty());
}
