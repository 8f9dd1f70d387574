#include <gtest/gtest.h>
#include "../src/CacheControl.hpp"

class CacheControlTest : public ::testing::Test {
protected:
    CacheDirectives parse(const std::string & value) {
        http::fields headers;
        headers.insert(http::field::cache_control, value);
        return parseCacheControl(headers);
    }
};

TEST_F(CacheControlTest, ParsesValuesAndFlags) {
    CacheDirectives cc = parse("max-age=60, No-Cache, public, must-revalidate");
    ASSERT_TRUE(cc.maxAge.has_value());
    EXPECT_EQ(*cc.maxAge, 60);
    EXPECT_TRUE(cc.noCache);
    EXPECT_TRUE(cc.isPublic);
    EXPECT_TRUE(cc.mustRevalidate);
    EXPECT_FALSE(cc.noStore);
    EXPECT_FALSE(cc.isPrivate);
}

TEST_F(CacheControlTest, ReadsEveryHeaderLine) {
    http::fields headers;
    headers.insert(http::field::cache_control, "max-age=10");
    headers.insert(http::field::cache_control, "no-store");
    CacheDirectives cc = parseCacheControl(headers);
    ASSERT_TRUE(cc.maxAge.has_value());
    EXPECT_EQ(*cc.maxAge, 10);
    EXPECT_TRUE(cc.noStore);
}

TEST_F(CacheControlTest, DropsInvalidOrMissingValues) {
    CacheDirectives cc = parse("max-age=abc, min-fresh, s-maxage=-1, no-store");
    EXPECT_FALSE(cc.maxAge.has_value());
    EXPECT_FALSE(cc.minFresh.has_value());
    EXPECT_FALSE(cc.sMaxAge.has_value());
    EXPECT_TRUE(cc.noStore);
}

TEST_F(CacheControlTest, MaxStaleValueIsOptional) {
    CacheDirectives bare = parse("max-stale");
    EXPECT_TRUE(bare.maxStale);
    EXPECT_FALSE(bare.maxStaleValue.has_value());

    CacheDirectives valued = parse("max-stale=30");
    EXPECT_TRUE(valued.maxStale);
    ASSERT_TRUE(valued.maxStaleValue.has_value());
    EXPECT_EQ(*valued.maxStaleValue, 30);
}

TEST_F(CacheControlTest, AcceptsQuotedValueAndIgnoresUnknown) {
    CacheDirectives cc = parse("max-age=\"30\", community=\"UCI\"");
    ASSERT_TRUE(cc.maxAge.has_value());
    EXPECT_EQ(*cc.maxAge, 30);
}

TEST_F(CacheControlTest, NoHeaderMeansNoDirectives) {
    http::fields headers;
    CacheDirectives cc = parseCacheControl(headers);
    EXPECT_FALSE(cc.maxAge.has_value());
    EXPECT_FALSE(cc.noCache);
    EXPECT_FALSE(cc.noStore);
}

TEST(HttpDateTest, ParsesAllThreeFormats) {
    const time_t expected = 784111777;
    auto imf = parseHttpDate("Sun, 06 Nov 1994 08:49:37 GMT");
    auto rfc850 = parseHttpDate("Sunday, 06-Nov-94 08:49:37 GMT");
    auto asctime = parseHttpDate("Sun Nov  6 08:49:37 1994");
    ASSERT_TRUE(imf.has_value());
    ASSERT_TRUE(rfc850.has_value());
    ASSERT_TRUE(asctime.has_value());
    EXPECT_EQ(*imf, expected);
    EXPECT_EQ(*rfc850, expected);
    EXPECT_EQ(*asctime, expected);
}

TEST(HttpDateTest, RejectsGarbage) {
    EXPECT_FALSE(parseHttpDate("").has_value());
    EXPECT_FALSE(parseHttpDate("yesterday").has_value());
    EXPECT_FALSE(parseHttpDate("Sun, 06 Nov 1994 08:49:37 GMT trailing").has_value());
}

TEST(HttpDateTest, FormatsImfFixdate) {
    EXPECT_EQ(formatHttpDate(784111777), "Sun, 06 Nov 1994 08:49:37 GMT");
    time_t now = time(nullptr);
    auto parsed = parseHttpDate(formatHttpDate(now));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, now);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
