#include "CacheEntry.hpp"
#include "CacheControl.hpp"
#include "Response.hpp"

#include <algorithm>
#include <boost/algorithm/string.hpp>

using namespace std;

bool isPermanentRedirectStatus(int status) {
    return status == 301 || status == 308;
}

CacheEntry::CacheEntry() : status(0), version(11), stored_at(0) {}

CacheEntry::CacheEntry(int status,
    const string & reason,
    const http::fields & headers,
    const string & body,
    time_t stored_at)
:   status(status),
    reason(reason),
    version(11),
    headers(headers),
    body(body),
    stored_at(stored_at) {
    if (this->reason.empty()) {
        this->reason = string(http::obsolete_reason(http::int_to_status(status)));
    }
}

CacheEntry CacheEntry::fromResponse(const Response & response, const string & body) {
    CacheEntry entry(response.getStatus(), response.getReason(), response.getHeaders(), body);
    entry.setVersion(response.getVersion());
    // the stored body is already de-chunked
    entry.headers.erase(http::field::transfer_encoding);
    return entry;
}

void CacheEntry::setStatus(int code) {
    status = code;
    reason = string(http::obsolete_reason(http::int_to_status(code)));
}

string CacheEntry::getHeader(const string & key) const {
    return headerValue(headers, key);
}

bool CacheEntry::hasHeader(const string & key) const {
    return headers.find(key) != headers.end();
}

string CacheEntry::getETag() const {
    return headerValue(headers, http::field::etag);
}

string CacheEntry::getLastModified() const {
    return headerValue(headers, http::field::last_modified);
}

optional<time_t> CacheEntry::getDate() const {
    if (!hasHeader("Date")) {
        return nullopt;
    }
    return parseHttpDate(getHeader("Date"));
}

bool CacheEntry::hasValidators() const {
    return hasHeader("ETag") || hasHeader("Last-Modified");
}

bool CacheEntry::isPermanentRedirect() const {
    return isPermanentRedirectStatus(status);
}

bool CacheEntry::varyMatches(const http::fields & requestHeaders) const {
    for (const auto & pair : vary) {
        auto it = requestHeaders.find(pair.first);
        if (it == requestHeaders.end()) {
            if (pair.second) return false;
        } else if (!pair.second || *pair.second != string(it->value())) {
            return false;
        }
    }
    return true;
}

void CacheEntry::mergeHeaders(const http::fields & update) {
    // a name may repeat in the update; drop the old values once, then
    // append every new line in order
    vector<string> replaced;
    for (const auto & field : update) {
        string name(field.name_string());
        if (boost::iequals(name, "Content-Length")) {
            continue;
        }
        bool seen = false;
        for (const string & r : replaced) {
            if (boost::iequals(r, name)) {
                seen = true;
                break;
            }
        }
        if (!seen) {
            headers.erase(name);
            replaced.push_back(name);
        }
        headers.insert(name, field.value());
    }
}

bool CacheEntry::operator==(const CacheEntry & other) const {
    if (status != other.status || reason != other.reason || version != other.version ||
        body != other.body || stored_at != other.stored_at || vary != other.vary) {
        return false;
    }
    auto a = headers.begin();
    auto b = other.headers.begin();
    for (; a != headers.end() && b != other.headers.end(); ++a, ++b) {
        if (!boost::iequals(string(a->name_string()), string(b->name_string())) ||
            a->value() != b->value()) {
            return false;
        }
    }
    return a == headers.end() && b == other.headers.end();
}

void CacheChoice::addVariant(const string & key) {
    if (find(variantKeys.begin(), variantKeys.end(), key) == variantKeys.end()) {
        variantKeys.push_back(key);
    }
}
