#include "Request.hpp"
#include <algorithm>
#include <cctype>

std::atomic<int> Request::next_id(0);

static std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return s;
}

Request::Request(const std::string & method, const std::string & url)
    : id(next_id++), method(upper(method)), url(url) {}

Request::Request(const std::string & method, const std::string & url, const http::fields & headers)
    : id(next_id++), method(upper(method)), url(url), headers(headers) {}

std::string Request::getHeader(const std::string & key) const {
    auto it = headers.find(key);
    return (it != headers.end()) ? std::string(it->value()) : "";
}

bool Request::hasHeader(const std::string & key) const {
    return headers.find(key) != headers.end();
}

void Request::setHeader(const std::string & key, const std::string & value) {
    headers.set(key, value);
}

void Request::setHeaders(const std::map<std::string, std::string> & values) {
    for (const auto & pair : values) {
        headers.set(pair.first, pair.second);
    }
}
