#include <gtest/gtest.h>

#include "chunk_writer.h"
#include "rwdump_content.h"

using namespace rwdump;
using namespace rwdump_test;

namespace {

ChunkContent Dispatch(std::uint32_t tag, std::uint32_t version, const std::vector<std::uint8_t> &bytes)
{
    ByteStream in(bytes.data(), bytes.size());
    return decode_content(tag, version, in);
}

} // namespace

TEST(ContentTest, StringAndNodeNameBecomeText) {
    const std::vector<std::uint8_t> bytes = {'w', 'h', 'e', 'e', 'l', 0, 'x', 'x'};

    const auto text = Dispatch(RW_CHUNK_STRING, 0x36003, bytes);
    ASSERT_TRUE(std::holds_alternative<Text>(text));
    EXPECT_EQ(std::get<Text>(text).value, "wheel");

    const auto node = Dispatch(RW_CHUNK_NODE_NAME, 0x36003, {'r', 'o', 'o', 't'});
    ASSERT_TRUE(std::holds_alternative<Text>(node));
    EXPECT_EQ(std::get<Text>(node).value, "root");
}

TEST(ContentTest, InvalidUtf8IsDropped) {
    const std::vector<std::uint8_t> bytes = {0xFF, 0xFE, 'a', 0};
    EXPECT_EQ(decode_text(bytes.data(), bytes.size()), "");
    EXPECT_EQ(decode_text(nullptr, 0), "");

    const std::vector<std::uint8_t> accented = {0xC3, 0xA9, 't', 0xC3, 0xA9};
    EXPECT_EQ(decode_text(accented.data(), accented.size()), "\xC3\xA9t\xC3\xA9");
}

TEST(ContentTest, StructKeepsRawBytes) {
    const auto content = Dispatch(RW_CHUNK_STRUCT, 0x36003, {1, 2, 3});
    ASSERT_TRUE(std::holds_alternative<StructPayload>(content));
    EXPECT_EQ(std::get<StructPayload>(content).bytes, (std::vector<std::uint8_t>{1, 2, 3}));
}

TEST(ContentTest, ContainerWithoutGrammarKeepsStructBytes) {
    const auto content = Dispatch(RW_CHUNK_ATOMIC, 0x36003, {4, 5});
    ASSERT_TRUE(std::holds_alternative<StructPayload>(content));
    EXPECT_EQ(std::get<StructPayload>(content).bytes.size(), 2u);
}

TEST(ContentTest, PluginAndUnknownTagsAreOpaque) {
    const auto plugin = Dispatch(RW_CHUNK_BIN_MESH_PLG, 0x36003, {7, 7});
    ASSERT_TRUE(std::holds_alternative<Opaque>(plugin));
    EXPECT_EQ(std::get<Opaque>(plugin).tag, static_cast<std::uint32_t>(RW_CHUNK_BIN_MESH_PLG));

    const auto unknown = Dispatch(0x12345678, 0x36003, {});
    ASSERT_TRUE(std::holds_alternative<Opaque>(unknown));
    EXPECT_EQ(std::get<Opaque>(unknown).tag, 0x12345678u);
    EXPECT_TRUE(std::get<Opaque>(unknown).bytes.empty());
}

TEST(ContentTest, GrammarTagsRouteToDecoders) {
    ByteWriter texture;
    texture.u8(1).u8(0x11).u16(0);
    EXPECT_TRUE(std::holds_alternative<Texture>(Dispatch(RW_CHUNK_TEXTURE, 0x36003, texture.data())));

    ByteWriter material;
    material.u32(0).u8(1).u8(2).u8(3).u8(4).u32(0).u32(0);
    EXPECT_TRUE(std::holds_alternative<Material>(Dispatch(RW_CHUNK_MATERIAL, 0x30000, material.data())));
}

TEST(ChunkIdsTest, NamesAndContainers) {
    EXPECT_STREQ(chunk_name(RW_CHUNK_MATERIAL_LIST), "Material List");
    EXPECT_STREQ(chunk_name(RW_CHUNK_TEXTURE_NATIVE), "Texture Native");
    EXPECT_STREQ(chunk_name(RW_CHUNK_NODE_NAME), "Node Name");
    EXPECT_EQ(chunk_name(0xDEADBEEF), nullptr);

    EXPECT_TRUE(chunk_has_children(RW_CHUNK_CLUMP));
    EXPECT_TRUE(chunk_has_children(RW_CHUNK_EXTENSION));
    EXPECT_FALSE(chunk_has_children(RW_CHUNK_STRUCT));
    EXPECT_FALSE(chunk_has_children(RW_CHUNK_STRING));
    EXPECT_FALSE(chunk_has_children(RW_CHUNK_SKIN_PLG));
    EXPECT_FALSE(chunk_has_children(0xDEADBEEF));

    EXPECT_TRUE(chunk_is_known(RW_CHUNK_SKIN_PLG));
    EXPECT_FALSE(chunk_is_known(0xDEADBEEF));
}
