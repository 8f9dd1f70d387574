#ifndef CAPTURESTREAM_HPP
#define CAPTURESTREAM_HPP

#include <string>
#include <memory>
#include <functional>

#include "BodyStream.hpp"
#include "Logger.hpp"

// Decorates a body stream: the caller reads the same bytes in the same
// order, every byte is mirrored into a buffer, and the commit callback
// gets the buffer once the inner stream reports the body complete.
// Closing early, or the inner stream ending before it is complete, drops
// the buffer without committing.
class CaptureStream : public BodyStream {
public:
    typedef std::function<void(const std::string & body)> CommitCallback;

    CaptureStream(std::unique_ptr<BodyStream> inner, CommitCallback callback);

    // exceptions from the inner stream reach the caller unchanged
    size_t read(char * buffer, size_t size) override;
    void close() override;
    bool isClosed() const override { return inner->isClosed(); }
    bool isChunked() const override { return inner->isChunked(); }
    bool isComplete() const override { return inner->isComplete(); }

    bool isCommitted() const { return committed; }
    size_t bufferedSize() const { return captured.size(); }

private:
    std::unique_ptr<BodyStream> inner;
    CommitCallback callback;
    std::string captured;
    bool committed;
    bool discarded;
    static inline Logger & logger = Logger::getInstance();

    void commit();
    void discard();
};

#endif
