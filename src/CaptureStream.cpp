#include "CaptureStream.hpp"

CaptureStream::CaptureStream(std::unique_ptr<BodyStream> inner, CommitCallback callback)
    : inner(std::move(inner)), callback(std::move(callback)), committed(false), discarded(false) {}

size_t CaptureStream::read(char * buffer, size_t size) {
    if (discarded || size == 0) {
        return 0;
    }
    size_t n = inner->read(buffer, size);
    if (!committed) {
        captured.append(buffer, n);
        // a chunked body is complete once the terminal chunk was seen,
        // even if the caller never asks for the next read
        if (inner->isComplete()) {
            commit();
        } else if (n == 0) {
            // the inner stream stopped short, e.g. its connection was released
            discard();
        }
    }
    return n;
}

void CaptureStream::discard() {
    if (discarded) {
        return;
    }
    logger.debug("body ended after " + std::to_string(captured.size()) +
                 " bytes, not caching a partial body");
    discarded = true;
    captured.clear();
    captured.shrink_to_fit();
}

void CaptureStream::close() {
    if (!committed) {
        discard();
    }
    inner->close();
}

void CaptureStream::commit() {
    committed = true;
    std::string body;
    body.swap(captured);
    if (!callback) {
        return;
    }
    try {
        callback(body);
    }
    catch (const std::exception & e) {
        // storing is best effort, the caller still gets the body
        logger.error("failed to cache response body: " + std::string(e.what()));
    }
}
