#include "CacheControl.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <ctime>
#include <vector>
#include <iomanip>
#include <sstream>
#include <boost/algorithm/string.hpp>

using namespace std;

static Logger & logger = Logger::getInstance();

// a directive value must be a plain non-negative integer
static optional<long> parseSeconds(const string & text) {
    if (text.empty() || text.size() > 18) {
        return nullopt;
    }
    for (char c : text) {
        if (!isdigit(static_cast<unsigned char>(c))) {
            return nullopt;
        }
    }
    return stol(text);
}

void parseCacheControlValue(const string & value, CacheDirectives & directives) {
    vector<string> parts;
    boost::split(parts, value, boost::is_any_of(","));

    for (string & part : parts) {
        boost::trim(part);
        if (part.empty()) {
            continue;
        }

        string name = part;
        string arg;
        bool hasArg = false;
        size_t eq = part.find('=');
        if (eq != string::npos) {
            name = part.substr(0, eq);
            arg = part.substr(eq + 1);
            boost::trim(name);
            boost::trim(arg);
            // quoted-string form, e.g. max-age="60"
            if (arg.size() >= 2 && arg.front() == '"' && arg.back() == '"') {
                arg = arg.substr(1, arg.size() - 2);
            }
            hasArg = true;
        }
        boost::to_lower(name);

        if (name == "max-age" || name == "s-maxage" || name == "min-fresh") {
            if (!hasArg) {
                logger.debug("Missing value for cache-control directive: " + name);
                continue;
            }
            optional<long> seconds = parseSeconds(arg);
            if (!seconds) {
                logger.debug("Invalid value for cache-control directive " + name + ", must be int");
                continue;
            }
            if (name == "max-age") directives.maxAge = seconds;
            else if (name == "s-maxage") directives.sMaxAge = seconds;
            else directives.minFresh = seconds;
        } else if (name == "max-stale") {
            directives.maxStale = true;
            if (hasArg) {
                directives.maxStaleValue = parseSeconds(arg);
                if (!directives.maxStaleValue) {
                    logger.debug("Invalid value for cache-control directive max-stale, must be int");
                }
            }
        } else if (name == "no-cache") {
            directives.noCache = true;
        } else if (name == "no-store") {
            directives.noStore = true;
        } else if (name == "no-transform") {
            directives.noTransform = true;
        } else if (name == "only-if-cached") {
            directives.onlyIfCached = true;
        } else if (name == "must-revalidate") {
            directives.mustRevalidate = true;
        } else if (name == "public") {
            directives.isPublic = true;
        } else if (name == "private") {
            directives.isPrivate = true;
        } else if (name == "proxy-revalidate") {
            directives.proxyRevalidate = true;
        } else {
            logger.debug("Ignoring unknown cache-control directive: " + name);
        }
    }
}

CacheDirectives parseCacheControl(const http::fields & headers) {
    CacheDirectives directives;
    auto range = headers.equal_range(http::field::cache_control);
    for (auto it = range.first; it != range.second; ++it) {
        parseCacheControlValue(string(it->value()), directives);
    }
    return directives;
}

optional<time_t> parseHttpDate(const string & value) {
    static const char * const formats[] = {
        "%a, %d %b %Y %H:%M:%S GMT", // IMF-fixdate
        "%A, %d-%b-%y %H:%M:%S GMT", // RFC 850
        "%a %b %d %H:%M:%S %Y",      // asctime
    };

    string text = boost::trim_copy(value);
    if (text.empty()) {
        return nullopt;
    }
    for (const char * format : formats) {
        struct tm tm;
        memset(&tm, 0, sizeof(tm));
        const char * end = strptime(text.c_str(), format, &tm);
        if (end != nullptr && *end == '\0') {
            return timegm(&tm);
        }
    }
    return nullopt;
}

string formatHttpDate(time_t time) {
    struct tm tm;
    gmtime_r(&time, &tm);
    char buffer[64];
    size_t n = strftime(buffer, sizeof(buffer), "%a, %d %b %Y %H:%M:%S GMT", &tm);
    return string(buffer, n);
}

string headerValue(const http::fields & headers, http::field name) {
    auto it = headers.find(name);
    return (it != headers.end()) ? string(it->value()) : "";
}

string headerValue(const http::fields & headers, const string & name) {
    auto it = headers.find(name);
    return (it != headers.end()) ? string(it->value()) : "";
}
