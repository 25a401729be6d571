// ==============================================================================
// test_cfb_gtest.cpp - Unit tests for the Compound File reader
// ==============================================================================
//
// Tests:
// TST-CFB-001: Load_ListsStreamsInOrder
// TST-CFB-002: OpenStream_MiniStream
// TST-CFB-003: OpenStream_RegularSectors
// TST-CFB-004: OpenStream_UnknownPath
// TST-CFB-005: Load_BadSignature
// TST-CFB-006: Load_TooSmall
// TST-CFB-007: OpenStream_TruncatedFile
// TST-CFB-008: Load_EmptyContainer
// TST-CFB-009: Load_CyclicDifat
// TST-CFB-010: OpenStream_CyclicFatChain
// TST-CFB-011: OpenStream_NextSectorOutOfRange
//
// ==============================================================================

#include <jumplist/cfb.hpp>

#include <gtest/gtest.h>

#include "support/builders.hpp"

namespace jumplist::io::cfb {

namespace {

std::vector<std::uint8_t> pattern(std::size_t n, std::uint8_t seed) {
    std::vector<std::uint8_t> out(n);
    for (std::size_t i = 0; i < n; ++i) {
        out[i] = static_cast<std::uint8_t>(seed + i * 7);
    }
    return out;
}

void set_u32(std::vector<std::uint8_t>& bytes, std::size_t offset, std::uint32_t v) {
    for (std::size_t i = 0; i < 4; ++i) {
        bytes[offset + i] = static_cast<std::uint8_t>(v >> (8 * i));
    }
}

/// Заголовок v3, у которого DIFAT сектор 0 ссылается сам на себя
std::vector<std::uint8_t> self_linked_difat() {
    test::ByteWriter w;
    w.u8(0xD0).u8(0xCF).u8(0x11).u8(0xE0).u8(0xA1).u8(0xB1).u8(0x1A).u8(0xE1);
    w.zeros(16);
    w.u16(0x3E).u16(3).u16(0xFFFE).u16(9).u16(6).zeros(6);
    w.u32(0).u32(0xFFFFFFFF).u32(1).u32(0).u32(4096);
    w.u32(0xFFFFFFFE).u32(0);
    w.u32(0).u32(0xFFFFFFFF);
    for (std::size_t i = 0; i < 109; ++i) {
        w.u32(0xFFFFFFFF);
    }
    // Сектор 0: нули, последний u32 (следующий DIFAT) = 0
    w.zeros(512);
    return w.take();
}

}  // namespace

TEST(CfbTest, TST_CFB_001_Load_ListsStreamsInOrder) {
    auto bytes = test::build_compound_file(
        {{"1", pattern(100, 1)}, {"DestList", pattern(200, 2)}, {"c", pattern(10, 3)}});

    CompoundFile cf;
    ASSERT_TRUE(cf.load(bytes)) << cf.last_error()->format();
    EXPECT_TRUE(cf.loaded());
    EXPECT_EQ(cf.major_version(), 3);

    auto streams = cf.list_streams();
    ASSERT_EQ(streams.size(), 3U);
    EXPECT_EQ(streams[0].name, "1");
    EXPECT_EQ(streams[1].name, "DestList");
    EXPECT_EQ(streams[1].path, "DestList");
    EXPECT_EQ(streams[1].size, 200U);
    EXPECT_EQ(streams[2].name, "c");
}

TEST(CfbTest, TST_CFB_002_OpenStream_MiniStream) {
    auto expected = pattern(130, 9);
    auto bytes = test::build_compound_file({{"a", pattern(70, 4)}, {"b", expected}});

    CompoundFile cf;
    ASSERT_TRUE(cf.load(bytes));

    auto result = cf.open_stream("b");
    ASSERT_TRUE(std::holds_alternative<std::vector<std::uint8_t>>(result));
    EXPECT_EQ(std::get<std::vector<std::uint8_t>>(result), expected);
}

TEST(CfbTest, TST_CFB_003_OpenStream_RegularSectors) {
    auto big = pattern(5000, 5);
    auto bytes = test::build_compound_file({{"small", pattern(20, 1)}, {"big", big}});

    CompoundFile cf;
    ASSERT_TRUE(cf.load(bytes));

    auto result = cf.open_stream("big");
    ASSERT_TRUE(std::holds_alternative<std::vector<std::uint8_t>>(result));
    EXPECT_EQ(std::get<std::vector<std::uint8_t>>(result), big);
}

TEST(CfbTest, TST_CFB_004_OpenStream_UnknownPath) {
    auto bytes = test::build_compound_file({{"a", pattern(10, 1)}});
    CompoundFile cf;
    ASSERT_TRUE(cf.load(bytes));

    auto result = cf.open_stream("missing");
    ASSERT_TRUE(std::holds_alternative<JumplistError>(result));
    EXPECT_EQ(std::get<JumplistError>(result).kind, JumplistErrorKind::Structure);
    EXPECT_EQ(std::get<JumplistError>(result).field, "missing");
}

TEST(CfbTest, TST_CFB_005_Load_BadSignature) {
    auto bytes = test::build_compound_file({{"a", pattern(10, 1)}});
    bytes[0] = 0x00;

    CompoundFile cf;
    EXPECT_FALSE(cf.load(bytes));
    EXPECT_FALSE(cf.loaded());
    ASSERT_TRUE(cf.last_error().has_value());
    EXPECT_NE(cf.last_error()->message.find("signature"), std::string::npos);
}

TEST(CfbTest, TST_CFB_006_Load_TooSmall) {
    CompoundFile cf;
    EXPECT_FALSE(cf.load(std::vector<std::uint8_t>(100, 0)));
    ASSERT_TRUE(cf.last_error().has_value());
    EXPECT_EQ(cf.last_error()->kind, JumplistErrorKind::Structure);
}

TEST(CfbTest, TST_CFB_007_OpenStream_TruncatedFile) {
    auto big = pattern(6000, 2);
    auto bytes = test::build_compound_file({{"big", big}});
    bytes.resize(bytes.size() - 1024);

    CompoundFile cf;
    ASSERT_TRUE(cf.load(bytes));
    auto result = cf.open_stream("big");
    EXPECT_TRUE(std::holds_alternative<JumplistError>(result));
}

TEST(CfbTest, TST_CFB_008_Load_EmptyContainer) {
    auto bytes = test::build_compound_file({});
    CompoundFile cf;
    ASSERT_TRUE(cf.load(bytes));
    EXPECT_TRUE(cf.list_streams().empty());
}

TEST(CfbTest, TST_CFB_009_Load_CyclicDifat) {
    auto bytes = self_linked_difat();
    ASSERT_EQ(bytes.size(), 1024U);

    CompoundFile cf;
    EXPECT_FALSE(cf.load(bytes));
    EXPECT_FALSE(cf.loaded());
    ASSERT_TRUE(cf.last_error().has_value());
    EXPECT_EQ(cf.last_error()->kind, JumplistErrorKind::Structure);
    EXPECT_NE(cf.last_error()->message.find("cyclic"), std::string::npos);
}

TEST(CfbTest, TST_CFB_010_OpenStream_CyclicFatChain) {
    // "big" занимает сектора 2..11; запись FAT сектора 11 -> 2
    auto bytes = test::build_compound_file({{"big", pattern(5000, 3)}});
    set_u32(bytes, 512 + 11 * 4, 2);

    CompoundFile cf;
    ASSERT_TRUE(cf.load(bytes)) << cf.last_error()->format();
    auto result = cf.open_stream("big");
    ASSERT_TRUE(std::holds_alternative<JumplistError>(result));
    EXPECT_EQ(std::get<JumplistError>(result).kind, JumplistErrorKind::Structure);
    EXPECT_NE(std::get<JumplistError>(result).message.find("cyclic"), std::string::npos);
}

TEST(CfbTest, TST_CFB_011_OpenStream_NextSectorOutOfRange) {
    auto bytes = test::build_compound_file({{"big", pattern(5000, 4)}});
    set_u32(bytes, 512 + 5 * 4, 5000);

    CompoundFile cf;
    ASSERT_TRUE(cf.load(bytes));
    auto result = cf.open_stream("big");
    ASSERT_TRUE(std::holds_alternative<JumplistError>(result));
    EXPECT_NE(std::get<JumplistError>(result).message.find("outside the allocation table"),
              std::string::npos);
}

}  // namespace jumplist::io::cfb
