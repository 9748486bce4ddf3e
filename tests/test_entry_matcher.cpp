#include <gtest/gtest.h>

#include "rebootto/entry_matcher.hpp"

namespace {

using rebootto::BootCatalog;
using rebootto::BootEntry;
using rebootto::lookup;

BootCatalog MakeCatalog() {
    BootCatalog c;
    c.entries = {
        {0, "Windows Boot Manager"},
        {3, "Ubuntu"},
        {4, "debuntu"},
        {5, "ubuntu"},
        {9, "7"},
        {12, "ubuntu-old"},
    };
    return c;
}

TEST(EntryMatcherTest, NumericQueryMatchesId) {
    auto c = MakeCatalog();
    auto e = lookup(c, "5");
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->name, "ubuntu");

    auto padded = lookup(c, "0012");
    ASSERT_TRUE(padded.has_value());
    EXPECT_EQ(padded->id, 12);
}

TEST(EntryMatcherTest, NumericQueryNeverMatchesName) {
    auto c = MakeCatalog();
    EXPECT_FALSE(lookup(c, "7").has_value());
}

TEST(EntryMatcherTest, NamePrefixIsCaseSensitive) {
    auto c = MakeCatalog();
    auto e = lookup(c, "ub");
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->id, 5);

    auto upper = lookup(c, "Ub");
    ASSERT_TRUE(upper.has_value());
    EXPECT_EQ(upper->id, 3);

    EXPECT_FALSE(lookup(c, "bun").has_value());
    EXPECT_FALSE(lookup(c, "UB").has_value());
}

TEST(EntryMatcherTest, FirstMatchWins) {
    BootCatalog c;
    c.entries = {{1, "Linux"}, {2, "Linux"}, {1, "duplicate id"}};

    EXPECT_EQ(lookup(c, "Lin")->id, 1);
    EXPECT_EQ(lookup(c, "1")->name, "Linux");
}

TEST(EntryMatcherTest, PlusSignedQueryIsNumeric) {
    BootCatalog c;
    c.entries = {{7, "Linux"}, {8, "+7 rescue"}, {3, "+9 other"}};

    auto e = lookup(c, "+7");
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->name, "Linux");
    EXPECT_EQ(lookup(c, "+0003")->id, 3);
    EXPECT_FALSE(lookup(c, "+9").has_value());
}

TEST(EntryMatcherTest, NoMatch) {
    auto c = MakeCatalog();
    EXPECT_FALSE(lookup(c, "zzz").has_value());
    EXPECT_FALSE(lookup(c, "42").has_value());
    EXPECT_FALSE(lookup(BootCatalog{}, "ubuntu").has_value());
}

TEST(EntryMatcherTest, OutOfRangeNumberIsTreatedAsName) {
    BootCatalog c;
    c.entries = {{1, "70000 rescue"}};
    auto e = lookup(c, "70000");
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->id, 1);
}

TEST(EntryMatcherTest, EmptyQueryMatchesFirstEntry) {
    auto c = MakeCatalog();
    auto e = lookup(c, "");
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->id, 0);
}

} // namespace
