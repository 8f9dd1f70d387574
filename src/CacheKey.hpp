#ifndef CACHEKEY_HPP
#define CACHEKEY_HPP

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <boost/beast/http.hpp>

namespace http = boost::beast::http;

// Values of the varied request headers, keyed by lowercase header
// name. nullopt marks a header the request did not carry.
typedef std::map<std::string, std::optional<std::string>> VaryValues;

class CacheKey {
public:
    // Lowercase scheme and authority, empty path becomes "/", the
    // fragment is dropped. Throws std::invalid_argument unless the URL
    // is absolute.
    static std::string normalizeUrl(const std::string & url);

    // hex SHA-224 of the normalized method, URL and varied header values
    static std::string derive(const std::string & method, const std::string & url,
                              const VaryValues & vary = VaryValues());

    // key under which a GET for url is stored
    static std::string cacheUrl(const std::string & url);

    // lowercase header names listed by every Vary line, without duplicates
    static std::vector<std::string> varyHeaderNames(const http::fields & headers);

    // the request's values for the given header names
    static VaryValues collectVaryValues(const http::fields & requestHeaders,
                                        const std::vector<std::string> & names);

    static std::string sha224Hex(const std::string & data);
};

#endif
