#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "objkey/key/key_path.h"

using objkey::core::ErrorCode;
using objkey::key::KeyPath;
using objkey::key::KeyPathView;

TEST(KeyPathView, FromStaticStrings) {
    auto path = KeyPathView::Create({"foo", "bar"});
    ASSERT_TRUE(path.ok());
    EXPECT_EQ(path.value().Render(), "foo/bar");
}

TEST(KeyPathView, BorrowsCallerStrings) {
    const std::vector<std::string> components{"foo", "bar"};
    auto path = KeyPathView::Create(components);
    ASSERT_TRUE(path.ok());
    ASSERT_EQ(path.value().size(), 2u);
    EXPECT_EQ(path.value().components()[0].data(), components[0].data());
    EXPECT_EQ(path.value().components()[1].data(), components[1].data());
}

TEST(KeyPathView, RejectsInvalidCharacters) {
    EXPECT_TRUE(KeyPathView::Create({"foo-bar"}).ok());
    EXPECT_TRUE(KeyPathView::Create({"foo_bar"}).ok());
    EXPECT_TRUE(KeyPathView::Create({"foo.bar"}).ok());
    EXPECT_TRUE(KeyPathView::Create({".test"}).ok());

    EXPECT_FALSE(KeyPathView::Create({"foo$bar"}).ok());
    EXPECT_FALSE(KeyPathView::Create({"foo/bar"}).ok());
    EXPECT_FALSE(KeyPathView::Create({"foo\\bar"}).ok());
    EXPECT_FALSE(KeyPathView::Create({"."}).ok());
    EXPECT_FALSE(KeyPathView::Create({".."}).ok());
}

TEST(KeyPathView, FromDelimitedReferencesInput) {
    const std::string input = "alpha/beta";
    auto path = KeyPathView::FromDelimited(input);
    ASSERT_TRUE(path.ok());
    ASSERT_EQ(path.value().size(), 2u);
    EXPECT_EQ(path.value().components()[0].data(), input.data());
    EXPECT_EQ(path.value().components()[1].data(), input.data() + 6);
    EXPECT_EQ(path.value().Render(), input);
}

TEST(KeyPathView, FailedJoinLeavesViewUnchanged) {
    auto path = KeyPathView::Create({"foo"});
    ASSERT_TRUE(path.ok());
    auto joined = path.value().Join("..");
    ASSERT_FALSE(joined.ok());
    EXPECT_EQ(joined.error().code, ErrorCode::kTraversalSegment);
    EXPECT_EQ(path.value().Render(), "foo");
}

TEST(KeyPathView, ToOwnedCopiesText) {
    KeyPath owned;
    {
        std::string buffer = "temp/key";
        auto view = KeyPathView::FromDelimited(buffer);
        ASSERT_TRUE(view.ok());
        owned = view.value().ToOwned();
        EXPECT_EQ(view.value(), owned);
    }
    EXPECT_EQ(owned.Render(), "temp/key");
}

TEST(KeyPathView, AsViewReferencesOwner) {
    auto owned = KeyPath::Create({"one", "two"});
    ASSERT_TRUE(owned.ok());
    const KeyPathView view = owned.value().AsView();
    ASSERT_EQ(view.size(), 2u);
    EXPECT_EQ(view.components()[0].data(), owned.value().components()[0].data());
    EXPECT_EQ(view.Render(), "one/two");
}

TEST(KeyPathView, ConversionRoundTripPreservesEquality) {
    auto original = KeyPath::Create({"a", "b.c", "d-e_f"});
    ASSERT_TRUE(original.ok());
    const KeyPath round_trip = original.value().AsView().ToOwned();
    EXPECT_EQ(round_trip, original.value());
    EXPECT_EQ(round_trip.Render(), original.value().Render());
}

TEST(KeyPathView, ComparesAcrossVariants) {
    auto owned = KeyPath::Create({"x", "y"});
    auto view = KeyPathView::Create({"x", "y"});
    auto other = KeyPathView::Create({"x", "z"});
    ASSERT_TRUE(owned.ok());
    ASSERT_TRUE(view.ok());
    ASSERT_TRUE(other.ok());

    EXPECT_TRUE(owned.value() == view.value());
    EXPECT_TRUE(view.value() == owned.value());
    EXPECT_TRUE(owned.value() != other.value());
    EXPECT_FALSE(KeyPath() == view.value());
    EXPECT_TRUE(KeyPath() == KeyPathView());
}
