#include "CacheKey.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <openssl/sha.h>
#include <boost/algorithm/string.hpp>

using namespace std;

string CacheKey::normalizeUrl(const string & url) {
    size_t schemeEnd = url.find("://");
    if (schemeEnd == string::npos || schemeEnd == 0) {
        throw invalid_argument("Only absolute URIs are allowed. uri = " + url);
    }
    string scheme = url.substr(0, schemeEnd);
    string rest = url.substr(schemeEnd + 3);

    // drop the fragment before splitting off path and query
    size_t hash = rest.find('#');
    if (hash != string::npos) {
        rest = rest.substr(0, hash);
    }

    size_t pathStart = rest.find_first_of("/?");
    string authority = rest.substr(0, pathStart);
    if (authority.empty()) {
        throw invalid_argument("Only absolute URIs are allowed. uri = " + url);
    }
    string requestUri = (pathStart == string::npos) ? "" : rest.substr(pathStart);
    if (requestUri.empty() || requestUri[0] == '?') {
        requestUri = "/" + requestUri;
    }

    boost::to_lower(scheme);
    boost::to_lower(authority);
    return scheme + "://" + authority + requestUri;
}

string CacheKey::sha224Hex(const string & data) {
    unsigned char digest[SHA224_DIGEST_LENGTH];
    SHA224(reinterpret_cast<const unsigned char *>(data.data()), data.size(), digest);

    stringstream ss;
    for (int i = 0; i < SHA224_DIGEST_LENGTH; i++) {
        ss << hex << setw(2) << setfill('0') << static_cast<int>(digest[i]);
    }
    return ss.str();
}

string CacheKey::derive(const string & method, const string & url, const VaryValues & vary) {
    string input = boost::to_upper_copy(method) + " " + normalizeUrl(url);
    // std::map keeps the names sorted, so header order never matters
    for (const auto & pair : vary) {
        input += "\n" + boost::to_lower_copy(pair.first);
        if (pair.second) {
            input += ":" + *pair.second;
        } else {
            input += "\x01";
        }
    }
    return sha224Hex(input);
}

string CacheKey::cacheUrl(const string & url) {
    return derive("GET", url);
}

vector<string> CacheKey::varyHeaderNames(const http::fields & headers) {
    vector<string> names;
    auto range = headers.equal_range(http::field::vary);
    for (auto it = range.first; it != range.second; ++it) {
        vector<string> parts;
        string value(it->value());
        boost::split(parts, value, boost::is_any_of(","));
        for (string & part : parts) {
            boost::trim(part);
            boost::to_lower(part);
            if (!part.empty() && find(names.begin(), names.end(), part) == names.end()) {
                names.push_back(part);
            }
        }
    }
    return names;
}

VaryValues CacheKey::collectVaryValues(const http::fields & requestHeaders,
                                       const vector<string> & names) {
    VaryValues values;
    for (const string & name : names) {
        auto it = requestHeaders.find(name);
        if (it == requestHeaders.end()) {
            values[boost::to_lower_copy(name)] = nullopt;
        } else {
            values[boost::to_lower_copy(name)] = string(it->value());
        }
    }
    return values;
}
