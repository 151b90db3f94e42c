#include <string>

#include <gtest/gtest.h>

#include "objkey/key/component_validator.h"

using objkey::core::ErrorCode;
using objkey::key::IsValidComponent;
using objkey::key::ValidateComponent;

TEST(ComponentValidator, AcceptsSimpleNames) {
    EXPECT_TRUE(IsValidComponent("bucket1"));
    EXPECT_TRUE(IsValidComponent("obj-1.txt"));
    EXPECT_TRUE(IsValidComponent("foo_bar"));
    EXPECT_TRUE(IsValidComponent(".test"));
    EXPECT_TRUE(IsValidComponent("ABCxyz0123456789"));
}

TEST(ComponentValidator, ReturnsCandidateUnchanged) {
    const std::string name = "Report_2024-01.final.pdf";
    auto result = ValidateComponent(name);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value(), name);
    EXPECT_EQ(result.value().data(), name.data());
}

TEST(ComponentValidator, RejectsEmpty) {
    auto result = ValidateComponent("");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::kEmptyComponent);
    EXPECT_FALSE(result.error().index.has_value());
    EXPECT_FALSE(result.error().character.has_value());
}

TEST(ComponentValidator, RejectsTraversal) {
    for (const char* segment : {".", ".."}) {
        auto result = ValidateComponent(segment);
        ASSERT_FALSE(result.ok()) << segment;
        EXPECT_EQ(result.error().code, ErrorCode::kTraversalSegment) << segment;
        EXPECT_EQ(result.error().component, segment);
    }
    EXPECT_FALSE(IsValidComponent("../secret"));
    EXPECT_FALSE(IsValidComponent("a/b"));
}

TEST(ComponentValidator, DotsInsideLongerNamesAreNotTraversal) {
    EXPECT_TRUE(IsValidComponent("..."));
    EXPECT_TRUE(IsValidComponent("..foo"));
    EXPECT_TRUE(IsValidComponent("foo.."));
    EXPECT_TRUE(IsValidComponent("a..b"));
}

TEST(ComponentValidator, RejectsCharactersOutsideWhitelist) {
    for (const char* name : {"foo$bar", "foo&bar", "foo#bar", "foo/bar", "foo|bar", "foo\\bar",
                             "foo bar", "foo:bar", "foo%2Fbar", "foo~", "*"}) {
        auto result = ValidateComponent(name);
        ASSERT_FALSE(result.ok()) << name;
        EXPECT_EQ(result.error().code, ErrorCode::kInvalidCharacter) << name;
    }
}

TEST(ComponentValidator, ReportsFirstOffendingCharacterAndOffset) {
    auto result = ValidateComponent("foo$bar#");
    ASSERT_FALSE(result.ok());
    const auto& error = result.error();
    EXPECT_EQ(error.code, ErrorCode::kInvalidCharacter);
    ASSERT_TRUE(error.character.has_value());
    EXPECT_EQ(*error.character, '$');
    ASSERT_TRUE(error.offset.has_value());
    EXPECT_EQ(*error.offset, 3u);
    EXPECT_EQ(error.component, "foo$bar#");
    EXPECT_NE(error.message.find("'$'"), std::string::npos);
    EXPECT_NE(error.message.find("offset 3"), std::string::npos);
}

TEST(ComponentValidator, RejectsNonAsciiAndControlBytes) {
    // "café" in UTF-8.
    auto utf8 = ValidateComponent("caf\xc3\xa9");
    ASSERT_FALSE(utf8.ok());
    EXPECT_EQ(utf8.error().code, ErrorCode::kInvalidCharacter);
    EXPECT_EQ(*utf8.error().offset, 3u);

    const std::string with_nul("ab\0cd", 5);
    auto nul = ValidateComponent(with_nul);
    ASSERT_FALSE(nul.ok());
    EXPECT_EQ(*nul.error().character, '\0');
    EXPECT_NE(nul.error().message.find("\\x00"), std::string::npos);

    EXPECT_FALSE(IsValidComponent("tab\there"));
    EXPECT_FALSE(IsValidComponent("line\n"));
}

TEST(ComponentValidator, EveryWhitelistedByteIsAccepted) {
    for (int c = 0; c < 256; ++c) {
        const char ch = static_cast<char>(c);
        const bool expected = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
                              (ch >= '0' && ch <= '9') || ch == '-' || ch == '_' || ch == '.';
        EXPECT_EQ(objkey::key::IsAllowedCharacter(ch), expected) << "byte " << c;
        const std::string name = std::string("x") + ch + "y";
        EXPECT_EQ(IsValidComponent(name), expected) << "byte " << c;
    }
}
