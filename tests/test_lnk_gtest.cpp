// ==============================================================================
// test_lnk_gtest.cpp - Unit tests for the Shell Link decoder
// ==============================================================================
//
// Tests:
// TST-LNK-001: Decode_LocalPathAndStrings
// TST-LNK-002: Decode_TrackerHostname
// TST-LNK-003: Decode_CursorStopsAfterTerminalBlock
// TST-LNK-004: Decode_IdListPath
// TST-LNK-005: Decode_BadHeaderSize
// TST-LNK-006: Decode_BadClassId
// TST-LNK-007: Decode_Truncated
// TST-LNK-008: Normalize_FieldSet
// TST-LNK-009: ToValue_OmitsAbsentStrings
//
// ==============================================================================

#include <jumplist/lnk.hpp>

#include <gtest/gtest.h>

#include "support/builders.hpp"

namespace jumplist::io::lnk {

using test::ByteWriter;
using test::LnkSpec;

namespace {

ShellLink decode_ok(const std::vector<std::uint8_t>& bytes) {
    auto result = decode_shell_link(bytes);
    if (auto* err = std::get_if<JumplistError>(&result)) {
        ADD_FAILURE() << err->format();
        return ShellLink{};
    }
    return std::get<ShellLink>(result);
}

}  // namespace

TEST(LnkTest, TST_LNK_001_Decode_LocalPathAndStrings) {
    LnkSpec spec;
    spec.local_base_path = "C:\\Windows\\notepad.exe";
    spec.volume_label = "SYSTEM";
    spec.name = "Notepad";
    spec.arguments = "/p \"report.txt\"";
    spec.working_dir = "C:\\Windows";
    spec.file_size = 4096;

    ShellLink link = decode_ok(test::build_lnk(spec));

    EXPECT_EQ(link.target_full_path(), "C:\\Windows\\notepad.exe");
    ASSERT_TRUE(link.name_string().has_value());
    EXPECT_EQ(*link.name_string(), "Notepad");
    ASSERT_TRUE(link.command_line_arguments().has_value());
    EXPECT_EQ(*link.command_line_arguments(), "/p \"report.txt\"");
    EXPECT_EQ(link.working_dir.value_or(""), "C:\\Windows");
    EXPECT_EQ(link.header.file_size, 4096U);
    ASSERT_TRUE(link.link_info.has_value());
    EXPECT_EQ(link.link_info->volume_label.value_or(""), "SYSTEM");
    EXPECT_EQ(link.link_info->drive_serial_number.value_or(0), 0x1234ABCDU);
    EXPECT_FALSE(link.tracker.has_value());
}

TEST(LnkTest, TST_LNK_002_Decode_TrackerHostname) {
    LnkSpec spec;
    spec.local_base_path = "C:\\a.txt";
    spec.machine_id = "workstation7";

    ShellLink link = decode_ok(test::build_lnk(spec));

    ASSERT_TRUE(link.tracker.has_value());
    EXPECT_EQ(link.tracker->machine_id, "workstation7");
    EXPECT_EQ(link.tracker->volume_droid, "11111111-2222-3333-4444-555555555555");
    EXPECT_EQ(link.tracker->file_droid, "66666666-7777-8888-9999-AAAAAAAAAAAA");
}

TEST(LnkTest, TST_LNK_003_Decode_CursorStopsAfterTerminalBlock) {
    LnkSpec spec;
    spec.local_base_path = "C:\\a.txt";
    spec.name = "A";
    auto lnk = test::build_lnk(spec);

    ByteWriter w;
    w.bytes(lnk).u32(0xCAFEBABE);
    ByteCursor cursor(w.data());

    auto result = decode_shell_link(cursor);
    ASSERT_TRUE(std::holds_alternative<ShellLink>(result));
    EXPECT_EQ(cursor.position(), lnk.size());

    std::uint32_t marker = 0;
    ASSERT_TRUE(cursor.read_u32("marker", marker));
    EXPECT_EQ(marker, 0xCAFEBABEU);
}

TEST(LnkTest, TST_LNK_004_Decode_IdListPath) {
    ByteWriter items;
    // Volume item "C:\"
    items.u16(25).u8(0x2F).ascii("C:\\").zeros(25 - 6);
    // File entry item, ANSI name at 0x0E
    items.u16(26).u8(0x32).u8(0).u32(10).u32(0).u16(0x20).ascii("notes.txt").zeros(3);
    items.u16(0);

    ByteWriter w;
    w.u32(0x4C).guid(test::LNK_CLSID).u32(HAS_LINK_TARGET_ID_LIST | IS_UNICODE).u32(0);
    w.u64(0).u64(0).u64(0).u32(0).i32(0).u32(1).u16(0).zeros(10);
    w.u16(static_cast<std::uint16_t>(items.size())).bytes(items.data());
    w.u32(0);

    ShellLink link = decode_ok(w.data());
    ASSERT_TRUE(link.id_list_path.has_value());
    EXPECT_EQ(*link.id_list_path, "C:\\notes.txt");
    EXPECT_EQ(link.target_full_path(), "C:\\notes.txt");
}

TEST(LnkTest, TST_LNK_005_Decode_BadHeaderSize) {
    auto bytes = test::build_lnk(LnkSpec{});
    bytes[0] = 0x50;

    auto result = decode_shell_link(bytes);
    ASSERT_TRUE(std::holds_alternative<JumplistError>(result));
    EXPECT_EQ(std::get<JumplistError>(result).kind, JumplistErrorKind::EmbeddedDecode);
}

TEST(LnkTest, TST_LNK_006_Decode_BadClassId) {
    auto bytes = test::build_lnk(LnkSpec{});
    bytes[4] ^= 0xFF;

    auto result = decode_shell_link(bytes);
    ASSERT_TRUE(std::holds_alternative<JumplistError>(result));
    const auto& err = std::get<JumplistError>(result);
    EXPECT_EQ(err.kind, JumplistErrorKind::EmbeddedDecode);
    EXPECT_NE(err.message.find("class id"), std::string::npos);
}

TEST(LnkTest, TST_LNK_007_Decode_Truncated) {
    LnkSpec spec;
    spec.name = "Truncated entry";
    auto bytes = test::build_lnk(spec);
    bytes.resize(0x4C + 6);

    auto result = decode_shell_link(bytes);
    ASSERT_TRUE(std::holds_alternative<JumplistError>(result));
    const auto& err = std::get<JumplistError>(result);
    EXPECT_EQ(err.kind, JumplistErrorKind::EmbeddedDecode);
    EXPECT_EQ(err.field, "lnk.name_string");
}

TEST(LnkTest, TST_LNK_008_Normalize_FieldSet) {
    LnkSpec spec;
    spec.local_base_path = "D:\\data\\x.bin";
    spec.machine_id = "host";
    spec.file_size = 42;

    FlatRecord r = decode_ok(test::build_lnk(spec)).normalize();

    EXPECT_EQ(r.size(), 11U);
    EXPECT_EQ(r["target_full_path"], "D:\\data\\x.bin");
    EXPECT_EQ(r["target_size"], "42");
    EXPECT_EQ(r["target_hostname"], "host");
    EXPECT_EQ(r["target_creation_time"], "2021-01-01T00:00:00Z");
    EXPECT_EQ(r["drive_serial_number"], "1234ABCD");
    EXPECT_EQ(r["working_dir"], "");
}

TEST(LnkTest, TST_LNK_009_ToValue_OmitsAbsentStrings) {
    LnkSpec spec;
    spec.local_base_path = "C:\\a.txt";
    spec.name = "A";

    Value v = decode_ok(test::build_lnk(spec)).to_value();
    ASSERT_TRUE(v.is_object());
    EXPECT_TRUE(v.has("name_string"));
    EXPECT_FALSE(v.has("command_line_arguments"));
    EXPECT_TRUE(v.has("link_info"));
    ASSERT_NE(v.get("target_full_path"), nullptr);
    EXPECT_EQ(v.get("target_full_path")->as_string(), "C:\\a.txt");
}

}  // namespace jumplist::io::lnk
