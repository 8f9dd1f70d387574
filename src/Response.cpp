#include "Response.hpp"

const char * cacheStateName(CacheState state) {
    switch (state) {
        case MISS: return "MISS";
        case HIT_FRESH: return "HIT_FRESH";
        case HIT_STALE_REVALIDATING: return "HIT_STALE_REVALIDATING";
        case STORED: return "STORED";
        case PASSTHROUGH: return "PASSTHROUGH";
        case INVALIDATED: return "INVALIDATED";
    }
    return "UNKNOWN";
}

Response::Response(int status, const http::fields & headers, std::unique_ptr<BodyStream> body,
                   const std::string & reason)
    : status(status), reason(reason), version(11), headers(headers), body(std::move(body)), state(MISS) {
    if (this->reason.empty()) {
        this->reason = std::string(http::obsolete_reason(http::int_to_status(status)));
    }
    if (!this->body) {
        this->body = std::make_unique<StringBodyStream>("");
    }
}

Response::~Response() {
    release();
}

void Response::setStatus(int code) {
    status = code;
    reason = std::string(http::obsolete_reason(http::int_to_status(code)));
}

std::string Response::getHeader(const std::string & key) const {
    auto it = headers.find(key);
    return (it != headers.end()) ? std::string(it->value()) : "";
}

bool Response::hasHeader(const std::string & key) const {
    return headers.find(key) != headers.end();
}

std::string Response::readBody() {
    if (!body) {
        return "";
    }
    return readAll(*body);
}

void Response::release() {
    if (releaseHook) {
        auto hook = std::move(releaseHook);
        releaseHook = nullptr;
        hook();
    }
}
