// ==============================================================================
// test_platform_gtest.cpp - Тесты платформенного слоя (GoogleTest)
// ==============================================================================
//
// TST-PLAT-001..TST-PLAT-006
//
// ==============================================================================

#include "jumplist/platform.hpp"

#include <filesystem>
#include <gtest/gtest.h>
#include <string>

namespace jumplist::platform::test {

// TST-PLAT-001
TEST(PlatformTest, OsName_Known) {
    std::string name = os_name();
#if defined(__linux__)
    EXPECT_EQ(name, "Linux");
#else
    EXPECT_FALSE(name.empty());
#endif
}

// TST-PLAT-002
TEST(PlatformTest, PathConversion_Roundtrip) {
    const std::string original =
        "Recent/AutomaticDestinations/5f7b5f1e01b83767.automaticDestinations-ms";
    EXPECT_EQ(path_to_utf8(path_from_utf8(original)), original);
    EXPECT_TRUE(path_to_utf8(std::filesystem::path()).empty());
}

// TST-PLAT-003
TEST(PlatformTest, PathConversion_NonAscii) {
    const std::string original = "\xD0\x9E\xD1\x82\xD1\x87\xD1\x91\xD1\x82.customDestinations-ms";
    std::filesystem::path p = path_from_utf8(original);
    EXPECT_EQ(path_to_utf8(p), original);
    EXPECT_EQ(path_to_utf8(p.extension()), ".customDestinations-ms");
}

// TST-PLAT-004
TEST(PlatformTest, GlobChars_Detected) {
    EXPECT_TRUE(has_glob_chars("Recent/*.automaticDestinations-ms"));
    EXPECT_TRUE(has_glob_chars("user?"));
    EXPECT_TRUE(has_glob_chars("[ab]"));
    EXPECT_FALSE(has_glob_chars("Recent/AutomaticDestinations"));
}

// TST-PLAT-005
TEST(PlatformTest, UsersRoot) {
    std::string root = path_to_utf8(users_root());
#ifdef _WIN32
    EXPECT_NE(root.find("\\Users"), std::string::npos);
#else
    EXPECT_EQ(root, "/mnt/c/Users");
#endif
}

// TST-PLAT-006
TEST(PlatformTest, ExpandGlob_NoMatchIsEmpty) {
    const std::filesystem::path dir = std::filesystem::temp_directory_path() / "jumplist_glob_none";
    std::string pattern = path_to_utf8(dir / "*.customDestinations-ms");
    EXPECT_TRUE(expand_glob(pattern).empty());
}

}  // namespace jumplist::platform::test
