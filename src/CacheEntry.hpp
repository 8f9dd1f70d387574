#ifndef CACHEENTRY_HPP
#define CACHEENTRY_HPP

#include <string>
#include <vector>
#include <optional>
#include <ctime>
#include <boost/beast/http.hpp>

#include "CacheKey.hpp"

namespace http = boost::beast::http;

class Response;

// A stored response. With a separate-body storage the body member is
// empty and the bytes live next to the metadata.
class CacheEntry {

    private:
        int status;
        std::string reason;
        unsigned version;
        http::fields headers;
        std::string body;
        time_t stored_at;
        VaryValues vary;

    public:
        CacheEntry();
        CacheEntry(int status,
                   const std::string & reason,
                   const http::fields & headers,
                   const std::string & body,
                   time_t stored_at = time(nullptr));

        // copy status line and headers of a live response
        static CacheEntry fromResponse(const Response & response, const std::string & body);

        int getStatus() const { return status; }
        void setStatus(int code);
        const std::string & getReason() const { return reason; }
        unsigned getVersion() const { return version; }
        void setVersion(unsigned v) { version = v; }

        const http::fields & getHeaders() const { return headers; }
        http::fields & getHeaders() { return headers; }
        std::string getHeader(const std::string & key) const;
        bool hasHeader(const std::string & key) const;

        const std::string & getBody() const { return body; }
        void setBody(const std::string & data) { body = data; }

        time_t getStoredAt() const { return stored_at; }
        void setStoredAt(time_t t) { stored_at = t; }

        const VaryValues & getVary() const { return vary; }
        void setVary(const VaryValues & values) { vary = values; }

        std::string getETag() const;
        std::string getLastModified() const;
        std::optional<time_t> getDate() const;
        bool hasValidators() const;
        bool isPermanentRedirect() const;

        // the request header values recorded at storage time match
        bool varyMatches(const http::fields & requestHeaders) const;

        // replace headers with those of a 304; Content-Length is kept
        void mergeHeaders(const http::fields & update);

        bool operator==(const CacheEntry & other) const;
        bool operator!=(const CacheEntry & other) const { return !(*this == other); }
};

// Stored under a resource's primary key when its responses carry Vary:
// which request headers select a variant and which variant keys exist.
struct CacheChoice {
    std::vector<std::string> varyNames;
    std::vector<std::string> variantKeys;

    void addVariant(const std::string & key);

    bool operator==(const CacheChoice & other) const {
        return varyNames == other.varyNames && variantKeys == other.variantKeys;
    }
};

bool isPermanentRedirectStatus(int status);

#endif
