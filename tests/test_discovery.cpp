#include "kiln/discovery.hpp"

#include "temp_dir.hpp"

#include <gtest/gtest.h>

using namespace kiln;
using kiln::test::TempDir;

TEST(GlobTest, StarStaysWithinSegment) {
    EXPECT_TRUE(glob_match("/p/src/*.ts", "/p/src/a.ts"));
    EXPECT_FALSE(glob_match("/p/src/*.ts", "/p/src/nested/a.ts"));
    EXPECT_FALSE(glob_match("/p/src/*.ts", "/p/src/a.tsx"));
    EXPECT_TRUE(glob_match("/p/src/?.ts", "/p/src/a.ts"));
    EXPECT_FALSE(glob_match("/p/src/?.ts", "/p/src/ab.ts"));
}

TEST(GlobTest, DoubleStarSpansSegments) {
    EXPECT_TRUE(glob_match("/p/src/**/*.ts", "/p/src/a.ts"));
    EXPECT_TRUE(glob_match("/p/src/**/*.ts", "/p/src/x/y/z/a.ts"));
    EXPECT_FALSE(glob_match("/p/src/**/*.ts", "/p/lib/a.ts"));
    EXPECT_TRUE(glob_match("/p/**/node_modules/**", "/p/a/node_modules/pkg/index.ts"));
}

TEST(GlobTest, BracesAlternate) {
    EXPECT_TRUE(glob_match("/p/src/**/*.{ts,tsx}", "/p/src/View.tsx"));
    EXPECT_TRUE(glob_match("/p/src/**/*.{ts,tsx}", "/p/src/a/b.ts"));
    EXPECT_FALSE(glob_match("/p/src/**/*.{ts,tsx}", "/p/src/a.js"));
}

TEST(GlobTest, ExpandsNestedBraces) {
    EXPECT_EQ(expand_braces("src/*.{ts,{js,jsx}}"),
              (std::vector<std::string>{"src/*.ts", "src/*.js", "src/*.jsx"}));
    EXPECT_EQ(expand_braces("plain"), (std::vector<std::string>{"plain"}));
    EXPECT_EQ(expand_braces("broken{a,b"), (std::vector<std::string>{"broken{a,b"}));
}

TEST(GlobEntryResolverTest, WalksIncludesAndAppliesExcludes) {
    TempDir dir;
    std::string a = dir.write("src/a.ts", "");
    std::string b = dir.write("src/nested/b.tsx", "");
    dir.write("src/nested/c.test.ts", "");
    dir.write("src/readme.md", "");
    dir.write("node_modules/pkg/index.ts", "");

    GlobEntryResolver resolver(dir.str(), {"src/**/*.{ts,tsx}"}, {"!**/*.test.ts"});
    auto files = resolver.resolve();
    ASSERT_TRUE(files.has_value()) << files.error();
    EXPECT_EQ(*files, (std::vector<std::string>{a, b}));
}

TEST(GlobEntryResolverTest, AcceptsLiteralFiles) {
    TempDir dir;
    std::string a = dir.write("src/a.ts", "");
    GlobEntryResolver resolver(dir.str(), {"src/a.ts", "src/missing.ts"});
    auto files = resolver.resolve();
    ASSERT_TRUE(files.has_value());
    EXPECT_EQ(*files, (std::vector<std::string>{a}));
}

TEST(GlobEntryResolverTest, DeduplicatesOverlappingPatterns) {
    TempDir dir;
    std::string a = dir.write("src/a.ts", "");
    GlobEntryResolver resolver(dir.str(), {"src/*.ts", "src/**/*.ts", "src/a.ts"});
    auto files = resolver.resolve();
    ASSERT_TRUE(files.has_value());
    EXPECT_EQ(files->size(), 1u);
}

TEST(GlobEntryResolverTest, FailsWhenNothingMatches) {
    TempDir dir;
    dir.write("src/a.js", "");
    GlobEntryResolver resolver(dir.str(), {"src/**/*.ts"});
    EXPECT_FALSE(resolver.resolve().has_value());

    GlobEntryResolver empty(dir.str(), {});
    EXPECT_FALSE(empty.resolve().has_value());
}
