#include <gtest/gtest.h>

#include "chunk_writer.h"
#include "rwdump_core.h"
#include "rwdump_stream.h"

using namespace rwdump;
using namespace rwdump_test;

TEST(LibraryIdTest, PackedIdSplitsVersionAndBuild) {
    const LibraryVersion v = decode_library_id(0x00020001);
    EXPECT_EQ(v.version, 0x00030002u);
    EXPECT_EQ(v.build, 1u);
}

TEST(LibraryIdTest, LegacyIdShiftsIntoVersion) {
    const LibraryVersion v = decode_library_id(0x00000310);
    EXPECT_EQ(v.version, 0x00031000u);
    EXPECT_EQ(v.build, 0u);
}

TEST(LibraryIdTest, RealWorldIds) {
    EXPECT_EQ(decode_library_id(kLibraryId36003).version, 0x36003u);
    EXPECT_EQ(decode_library_id(kLibraryId36003).build, 0xFFFFu);
    EXPECT_EQ(decode_library_id(kLibraryId33002).version, 0x33002u);
    EXPECT_EQ(decode_library_id(0).version, 0u);
}

TEST(LibraryIdTest, FormatsDottedVersion) {
    EXPECT_EQ(format_version(0x36003), "3.6.0.3");
    EXPECT_EQ(format_version(0x31000), "3.1.0.0");
}

TEST(ChunkHeaderTest, ReadsThreeWordsAndResolvesVersion) {
    ByteWriter w;
    w.u32(RW_CHUNK_CLUMP).u32(0x1234).u32(kLibraryId36003);
    ByteStream in(w.data().data(), w.data().size());

    const ChunkHeader header = read_chunk_header(in);
    EXPECT_EQ(header.type, static_cast<std::uint32_t>(RW_CHUNK_CLUMP));
    EXPECT_EQ(header.size, 0x1234u);
    EXPECT_EQ(header.library_id, kLibraryId36003);
    EXPECT_EQ(header.version, 0x36003u);
    EXPECT_EQ(header.build, 0xFFFFu);
    EXPECT_TRUE(in.at_end());
}

TEST(ChunkHeaderTest, ShortHeaderIsTruncated) {
    ByteWriter w;
    w.u32(RW_CHUNK_CLUMP).u32(0);
    ByteStream in(w.data().data(), w.data().size());

    try {
        read_chunk_header(in);
        FAIL() << "expected DecodeError";
    } catch (const DecodeError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::TruncatedInput);
        EXPECT_EQ(e.offset(), 0u);
    }
}
