#ifndef RESPONSE_HPP
#define RESPONSE_HPP

#include <string>
#include <memory>
#include <functional>
#include <boost/beast/http.hpp>

#include "BodyStream.hpp"
#include "CacheState.hpp"

namespace http = boost::beast::http;

class Response {
private:
    int status;
    std::string reason;
    unsigned version;
    http::fields headers;
    std::unique_ptr<BodyStream> body;
    std::function<void()> releaseHook;
    CacheState state;

public:
    Response() : status(0), version(11), state(MISS) {}
    Response(int status, const http::fields & headers, std::unique_ptr<BodyStream> body,
             const std::string & reason = "");
    ~Response();

    Response(const Response &) = delete;
    Response & operator=(const Response &) = delete;

    int getStatus() const { return status; }
    void setStatus(int code);

    const std::string & getReason() const { return reason; }
    void setReason(const std::string & text) { reason = text; }

    unsigned getVersion() const { return version; }
    void setVersion(unsigned v) { version = v; }
    std::string getVersionStr() const {
        return "HTTP/" + std::to_string(version / 10) + "." + std::to_string(version % 10);
    }

    std::string getHeader(const std::string & key) const;
    bool hasHeader(const std::string & key) const;
    const http::fields & getHeaders() const { return headers; }
    http::fields & getHeaders() { return headers; }

    BodyStream * getBody() const { return body.get(); }
    std::unique_ptr<BodyStream> takeBody() { return std::move(body); }
    void setBody(std::unique_ptr<BodyStream> stream) { body = std::move(stream); }

    // read the remaining body into a string
    std::string readBody();

    bool isChunked() const { return body && body->isChunked(); }

    // called once when the response is released, e.g. to give a
    // connection back
    void onRelease(std::function<void()> hook) { releaseHook = std::move(hook); }
    void release();

    CacheState getCacheState() const { return state; }
    void setCacheState(CacheState s) { state = s; }
    bool fromCache() const { return state == HIT_FRESH || state == HIT_STALE_REVALIDATING; }
};

#endif
