#ifndef BODYSTREAM_HPP
#define BODYSTREAM_HPP

#include <string>
#include <fstream>
#include <cstddef>
#include <memory>

// A readable response body. read() returns 0 at the end of the body.
class BodyStream {
public:
    virtual ~BodyStream() = default;

    virtual size_t read(char * buffer, size_t size) = 0;

    // stop reading; further reads return 0
    virtual void close() = 0;

    virtual bool isClosed() const = 0;

    // the body uses chunked transfer encoding on the wire
    virtual bool isChunked() const { return false; }

    // the whole body has been received, including the terminal chunk
    // of a chunked body; reads may still return buffered bytes
    virtual bool isComplete() const = 0;
};

class StringBodyStream : public BodyStream {
public:
    explicit StringBodyStream(std::string data, bool chunked = false);

    size_t read(char * buffer, size_t size) override;
    void close() override { closed = true; }
    bool isClosed() const override { return closed; }
    bool isChunked() const override { return chunked; }
    bool isComplete() const override { return offset >= data.size(); }

private:
    std::string data;
    size_t offset;
    bool chunked;
    bool closed;
};

class FileBodyStream : public BodyStream {
public:
    // throws std::runtime_error if the file cannot be opened
    explicit FileBodyStream(const std::string & path);

    size_t read(char * buffer, size_t size) override;
    void close() override;
    bool isClosed() const override { return !file.is_open(); }
    bool isComplete() const override { return eof; }

private:
    std::ifstream file;
    bool eof;
};

// drain a stream into a string
std::string readAll(BodyStream & stream);

#endif
