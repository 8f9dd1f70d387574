#include "BodyStream.hpp"
#include <algorithm>
#include <cstring>
#include <stdexcept>

StringBodyStream::StringBodyStream(std::string data, bool chunked)
    : data(std::move(data)), offset(0), chunked(chunked), closed(false) {}

size_t StringBodyStream::read(char * buffer, size_t size) {
    if (closed || offset >= data.size()) {
        return 0;
    }
    size_t n = std::min(size, data.size() - offset);
    std::memcpy(buffer, data.data() + offset, n);
    offset += n;
    return n;
}

FileBodyStream::FileBodyStream(const std::string & path)
    : file(path, std::ios::binary), eof(false) {
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open body file: " + path);
    }
}

size_t FileBodyStream::read(char * buffer, size_t size) {
    if (!file.is_open() || eof) {
        return 0;
    }
    file.read(buffer, static_cast<std::streamsize>(size));
    std::streamsize got = file.gcount();
    if (file.eof()) {
        eof = true;
    } else if (file.fail()) {
        throw std::runtime_error("Failed to read body file");
    }
    return static_cast<size_t>(got);
}

void FileBodyStream::close() {
    if (file.is_open()) file.close();
}

std::string readAll(BodyStream & stream) {
    std::string result;
    char buffer[8192];
    while (true) {
        size_t n = stream.read(buffer, sizeof(buffer));
        if (n == 0) {
            break;
        }
        result.append(buffer, n);
    }
    return result;
}
