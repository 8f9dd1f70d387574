#ifndef CACHECONTROL_HPP
#define CACHECONTROL_HPP

#include <string>
#include <optional>
#include <ctime>
#include <boost/beast/http.hpp>

namespace http = boost::beast::http;

// Cache-Control directives understood by the controller (RFC 7234 5.2).
struct CacheDirectives {
    std::optional<long> maxAge;
    std::optional<long> sMaxAge;
    std::optional<long> minFresh;
    // "max-stale" may come without a value, meaning any staleness
    bool maxStale = false;
    std::optional<long> maxStaleValue;
    bool noCache = false;
    bool noStore = false;
    bool noTransform = false;
    bool onlyIfCached = false;
    bool mustRevalidate = false;
    bool isPublic = false;
    bool isPrivate = false;
    bool proxyRevalidate = false;
};

CacheDirectives parseCacheControl(const http::fields & headers);

// parse a single header value; used by parseCacheControl for each line
void parseCacheControlValue(const std::string & value, CacheDirectives & directives);

// IMF-fixdate, RFC 850 and asctime formats, all in GMT
std::optional<time_t> parseHttpDate(const std::string & value);

std::string formatHttpDate(time_t time);

// first value of a header, or empty
std::string headerValue(const http::fields & headers, http::field name);
std::string headerValue(const http::fields & headers, const std::string & name);

#endif
