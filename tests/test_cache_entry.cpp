#include <gtest/gtest.h>
#include "../src/CacheEntry.hpp"
#include "../src/Response.hpp"

TEST(CacheEntryTest, FromResponseDropsTransferEncoding) {
    http::fields headers;
    headers.set("Transfer-Encoding", "chunked");
    headers.set("ETag", "\"abc\"");
    Response response(200, headers, std::make_unique<StringBodyStream>("hello", true));
    CacheEntry entry = CacheEntry::fromResponse(response, "hello");
    EXPECT_FALSE(entry.hasHeader("Transfer-Encoding"));
    EXPECT_EQ(entry.getETag(), "\"abc\"");
    EXPECT_EQ(entry.getBody(), "hello");
    EXPECT_EQ(entry.getReason(), "OK");
}

TEST(CacheEntryTest, VaryRecordMatching) {
    CacheEntry entry(200, "OK", http::fields(), "body");
    entry.setVary({{"accept-language", std::string("en")}, {"accept-encoding", std::nullopt}});

    http::fields match;
    match.set("Accept-Language", "en");
    EXPECT_TRUE(entry.varyMatches(match));

    http::fields other;
    other.set("Accept-Language", "fr");
    EXPECT_FALSE(entry.varyMatches(other));

    http::fields extra;
    extra.set("Accept-Language", "en");
    extra.set("Accept-Encoding", "gzip");
    EXPECT_FALSE(entry.varyMatches(extra));

    EXPECT_FALSE(entry.varyMatches(http::fields()));
}

TEST(CacheEntryTest, MergeKeepsContentLength) {
    http::fields stored;
    stored.set("Content-Length", "5");
    stored.set("Cache-Control", "max-age=60");
    stored.insert("Set-Cookie", "a=1");
    stored.insert("Set-Cookie", "b=2");
    CacheEntry entry(200, "OK", stored, "hello");

    http::fields update;
    update.set("Content-Length", "0");
    update.set("Cache-Control", "max-age=600");
    update.insert("Set-Cookie", "c=3");
    entry.mergeHeaders(update);

    EXPECT_EQ(entry.getHeader("Content-Length"), "5");
    EXPECT_EQ(entry.getHeader("Cache-Control"), "max-age=600");
    EXPECT_EQ(std::distance(entry.getHeaders().equal_range("Set-Cookie").first,
                            entry.getHeaders().equal_range("Set-Cookie").second), 1);

    CacheEntry again = entry;
    again.mergeHeaders(update);
    EXPECT_EQ(again, entry);
}

TEST(CacheEntryTest, DateAndRedirectAccessors) {
    http::fields headers;
    headers.set("Date", "Sun, 06 Nov 1994 08:49:37 GMT");
    headers.set("Last-Modified", "Sat, 05 Nov 1994 08:49:37 GMT");
    CacheEntry entry(301, "", headers, "");
    ASSERT_TRUE(entry.getDate().has_value());
    EXPECT_EQ(*entry.getDate(), 784111777);
    EXPECT_TRUE(entry.isPermanentRedirect());
    EXPECT_TRUE(entry.hasValidators());
    EXPECT_EQ(entry.getReason(), "Moved Permanently");

    CacheEntry plain(200, "OK", http::fields(), "");
    EXPECT_FALSE(plain.getDate().has_value());
    EXPECT_FALSE(plain.isPermanentRedirect());
    EXPECT_FALSE(plain.hasValidators());
    EXPECT_TRUE(isPermanentRedirectStatus(308));
    EXPECT_FALSE(isPermanentRedirectStatus(302));
}

TEST(CacheChoiceTest, AddVariantIgnoresDuplicates) {
    CacheChoice choice;
    choice.addVariant("a");
    choice.addVariant("b");
    choice.addVariant("a");
    ASSERT_EQ(choice.variantKeys.size(), 2u);
    EXPECT_EQ(choice.variantKeys[1], "b");
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
