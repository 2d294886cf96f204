#include <memory>
#include <string>
#include <vector>
#include "gtest/gtest.h"

#include "src/search_strategy.h"
#include "src/line_cache.h"
#include "src/lib/metrics.h"
#include "test/test_files.h"

using std::string;
using std::unique_ptr;
using std::vector;

const strategy_kind kFileStrategies[] = {
    kStrategyLinear,
    kStrategyBulk,
    kStrategyMmap,
    kStrategyGrep,
    kStrategyGrepFirst,
    kStrategyAwk,
};

class search_strategy_test : public ::testing::Test {
protected:
    unique_ptr<search_strategy> make(strategy_kind kind, const string &path) {
        return make_strategy(kind, path, nullptr);
    }

    scratch_dir dir_;
};

TEST(StrategyNameTest, RoundTrips) {
    strategy_kind kinds[] = {
        kStrategyLinear, kStrategyBulk, kStrategyMmap, kStrategyGrep,
        kStrategyGrepFirst, kStrategyAwk, kStrategyCache,
    };
    for (auto kind : kinds) {
        strategy_kind parsed;
        ASSERT_TRUE(parse_strategy(strategy_name(kind), &parsed)) << strategy_name(kind);
        EXPECT_EQ(kind, parsed);
    }
    strategy_kind parsed;
    EXPECT_FALSE(parse_strategy("regex", &parsed));
    EXPECT_FALSE(parse_strategy("", &parsed));
}

TEST_F(search_strategy_test, AllStrategiesAgree) {
    string path = dir_.write("lookup.txt", make_haystack(10000));
    line_cache cache = line_cache::build(path);
    cache_strategy cached(&cache);

    for (auto kind : kFileStrategies) {
        unique_ptr<search_strategy> s = make(kind, path);
        ASSERT_TRUE(s.get() != nullptr);
        EXPECT_EQ(kind, s->kind());
        EXPECT_TRUE(s->search("needle\n")) << s->name();
        EXPECT_TRUE(s->search("key0")) << s->name();
        EXPECT_TRUE(s->search("key9999\r\n")) << s->name();
        EXPECT_FALSE(s->search("absent")) << s->name();
        EXPECT_FALSE(s->search("needl")) << s->name();
        EXPECT_FALSE(s->search("eedle")) << s->name();
        EXPECT_FALSE(s->search("key")) << s->name();
    }

    EXPECT_TRUE(cached.search("needle\n"));
    EXPECT_TRUE(cached.search("key0"));
    EXPECT_FALSE(cached.search("absent"));
}

TEST_F(search_strategy_test, QueriesAreSanitized) {
    string path = dir_.write("lookup.txt", make_haystack(10));
    for (auto kind : kFileStrategies) {
        unique_ptr<search_strategy> s = make(kind, path);
        EXPECT_TRUE(s->search(string("  nee\x01" "dle\0\r\n", 12))) << s->name();
        EXPECT_TRUE(s->search("key\xff" "5")) << s->name();
    }
}

TEST_F(search_strategy_test, LastLineWithoutNewline) {
    string path = dir_.write("lookup.txt", "key0\nkey1\nneedle");

    EXPECT_TRUE(make(kStrategyLinear, path)->search("needle"));
    EXPECT_TRUE(make(kStrategyMmap, path)->search("needle"));
    EXPECT_TRUE(make(kStrategyGrep, path)->search("needle"));
    EXPECT_TRUE(make(kStrategyAwk, path)->search("needle"));
    // The bulk strategy looks for "needle\n" and so misses the last line.
    EXPECT_FALSE(make(kStrategyBulk, path)->search("needle"));

    EXPECT_TRUE(make(kStrategyBulk, path)->search("key1"));
}

TEST_F(search_strategy_test, MissingFileFailsClosed) {
    string path = dir_.path("missing.txt");
    for (auto kind : kFileStrategies) {
        unique_ptr<search_strategy> s = make(kind, path);
        bool found = true;
        EXPECT_NO_THROW(found = s->search("needle")) << s->name();
        EXPECT_FALSE(found) << s->name();
    }
}

TEST_F(search_strategy_test, ErrorsAreCounted) {
    string path = dir_.path("missing.txt");
    unique_ptr<search_strategy> s = make(kStrategyMmap, path);
    s->search("warm");
    long before = metric::lookup("search.mmap.errors");
    EXPECT_FALSE(s->search("needle"));
    EXPECT_EQ(before + 1, metric::lookup("search.mmap.errors"));
}

TEST_F(search_strategy_test, QueriesAndMatchesAreCounted) {
    string path = dir_.write("lookup.txt", "needle\n");
    unique_ptr<search_strategy> s = make(kStrategyLinear, path);
    s->search("warm");
    long queries = metric::lookup("search.linear.queries");
    long matches = metric::lookup("search.linear.matches");
    EXPECT_TRUE(s->search("needle"));
    EXPECT_FALSE(s->search("other"));
    EXPECT_EQ(queries + 2, metric::lookup("search.linear.queries"));
    EXPECT_EQ(matches + 1, metric::lookup("search.linear.matches"));
}

TEST_F(search_strategy_test, EmptyFile) {
    string path = dir_.write("lookup.txt", "");
    for (auto kind : kFileStrategies) {
        EXPECT_FALSE(make(kind, path)->search("needle")) << strategy_name(kind);
    }
}

TEST_F(search_strategy_test, SeesCurrentContents) {
    string path = dir_.write("lookup.txt", "before\n");
    unique_ptr<search_strategy> s = make(kStrategyMmap, path);
    EXPECT_TRUE(s->search("before"));
    dir_.write("lookup.txt", "after\n");
    EXPECT_FALSE(s->search("before"));
    EXPECT_TRUE(s->search("after"));
}

TEST_F(search_strategy_test, CrlfFiles) {
    string path = dir_.write("lookup.txt", "alpha\r\nneedle\r\nomega\r\n");
    EXPECT_TRUE(make(kStrategyLinear, path)->search("needle"));
    EXPECT_TRUE(make(kStrategyBulk, path)->search("needle"));
    EXPECT_TRUE(make(kStrategyMmap, path)->search("needle"));
}

TEST_F(search_strategy_test, QuoteCharactersInKeys) {
    string path = dir_.write("lookup.txt",
                             "say \"hi\"\n"
                             "back\\slash\n"
                             "-v\n");
    for (auto kind : kFileStrategies) {
        unique_ptr<search_strategy> s = make(kind, path);
        EXPECT_TRUE(s->search("say \"hi\"")) << s->name();
        EXPECT_TRUE(s->search("back\\slash")) << s->name();
        EXPECT_TRUE(s->search("-v")) << s->name();
        EXPECT_FALSE(s->search("say \"")) << s->name();
    }
}

TEST_F(search_strategy_test, CacheStrategyWithoutCache) {
    cache_strategy s(nullptr);
    EXPECT_FALSE(s.search("needle"));
    EXPECT_EQ(kStrategyCache, s.kind());
    EXPECT_STREQ("cache", s.name());
}

TEST(MakeStrategyTest, CacheNeedsALineCache) {
    EXPECT_TRUE(make_strategy(kStrategyCache, "/nonexistent", nullptr).get() == nullptr);
}

TEST(MmapScanTest, ContainsLine) {
    const string data = "alpha\nbeta\r\n\ngamma";
    auto has = [&](const string &key) {
        return mmap_scan_strategy::contains_line(data.data(), data.size(), key);
    };
    EXPECT_TRUE(has("alpha"));
    EXPECT_TRUE(has("beta"));
    EXPECT_TRUE(has("gamma"));
    EXPECT_TRUE(has(""));
    EXPECT_FALSE(has("alph"));
    EXPECT_FALSE(has("lpha"));
    EXPECT_FALSE(has("eta"));
    EXPECT_FALSE(has("gam"));
}

TEST(MmapScanTest, EmptyKeyNeedsAnEmptyLine) {
    const string data = "alpha\nbeta\n";
    EXPECT_FALSE(mmap_scan_strategy::contains_line(data.data(), data.size(), ""));
}

TEST(MmapScanTest, IgnoresSurroundingWhitespace) {
    const string data = "x\n  needle \t\n\xc2\xa0nbsp\xe3\x80\x80\nx pad\n";
    auto has = [&](const string &key) {
        return mmap_scan_strategy::contains_line(data.data(), data.size(), key);
    };
    EXPECT_TRUE(has("needle"));
    EXPECT_TRUE(has("nbsp"));
    EXPECT_FALSE(has("pad"));
    EXPECT_FALSE(has("eedle"));
}

TEST(MmapScanTest, CarriageReturnStartsALine) {
    const string data = "alpha\rneedle\romega\r\n\r\r\nlast";
    auto has = [&](const string &key) {
        return mmap_scan_strategy::contains_line(data.data(), data.size(), key);
    };
    EXPECT_TRUE(has("alpha"));
    EXPECT_TRUE(has("needle"));
    EXPECT_TRUE(has("omega"));
    EXPECT_TRUE(has("last"));
    // "\r\r\n" after a terminator holds two empty lines.
    EXPECT_TRUE(has(""));
}

TEST(MmapScanTest, CrlfIsOneTerminator) {
    const string data = "alpha\r\nbeta\r\n";
    EXPECT_FALSE(mmap_scan_strategy::contains_line(data.data(), data.size(), ""));
}

TEST(MmapScanTest, BlankLineMatchesEmptyKey) {
    const string data = "alpha\n \t\nbeta";
    EXPECT_TRUE(mmap_scan_strategy::contains_line(data.data(), data.size(), ""));
}

TEST(MmapScanTest, LaterOccurrenceOnLineStart) {
    const string data = "xneedle\nneedlex\nneedle\n";
    EXPECT_TRUE(mmap_scan_strategy::contains_line(data.data(), data.size(), "needle"));
}

TEST(BulkReadTest, SplitLines) {
    vector<string> lines = bulk_read_strategy::split_lines("a\nb\r\nc\rd");
    ASSERT_EQ(4u, lines.size());
    EXPECT_EQ("a\n", lines[0]);
    EXPECT_EQ("b\n", lines[1]);
    EXPECT_EQ("c\n", lines[2]);
    EXPECT_EQ("d", lines[3]);

    EXPECT_TRUE(bulk_read_strategy::split_lines("").empty());
    lines = bulk_read_strategy::split_lines("\n\n");
    ASSERT_EQ(2u, lines.size());
    EXPECT_EQ("\n", lines[1]);
}
