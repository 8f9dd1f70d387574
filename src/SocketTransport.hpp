#ifndef SOCKETTRANSPORT_HPP
#define SOCKETTRANSPORT_HPP

#include <string>
#include <memory>
#include <utility>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "BodyStream.hpp"
#include "Logger.hpp"
#include "Transport.hpp"

namespace beast = boost::beast;
namespace http = boost::beast::http;

// One TCP connection. Closing is idempotent; the last owner closes it.
class Connection {
public:
    explicit Connection(int fd) : fd(fd) {}
    ~Connection() { close(); }

    Connection(const Connection &) = delete;
    Connection & operator=(const Connection &) = delete;

    int getFd() const { return fd; }
    bool isOpen() const { return fd >= 0; }
    void close();

private:
    int fd;
};

// Response body read straight off the socket through a Beast parser.
class SocketBodyStream : public BodyStream {
public:
    SocketBodyStream(std::shared_ptr<Connection> connection,
                     std::unique_ptr<http::response_parser<http::buffer_body>> parser,
                     beast::flat_buffer buffer,
                     int id);

    // throws std::runtime_error on a socket or parse error
    size_t read(char * buffer, size_t size) override;
    void close() override { connection->close(); }
    bool isClosed() const override { return !connection->isOpen(); }
    bool isChunked() const override { return chunked; }
    bool isComplete() const override { return parser->is_done(); }

private:
    std::shared_ptr<Connection> connection;
    std::unique_ptr<http::response_parser<http::buffer_body>> parser;
    beast::flat_buffer pending;
    bool chunked;
    int id;
    static inline Logger & logger = Logger::getInstance();

    // false once the peer closed the connection
    bool receiveMore();
};

// Plain HTTP/1.1 over a blocking socket, one connection per request.
class SocketTransport : public Transport {
public:
    explicit SocketTransport(int timeout_seconds = 10);

    std::unique_ptr<Response> send(const Request & request) override;

    struct Target {
        std::string host;
        int port;
        // path and query
        std::string path;
    };

    // throws std::invalid_argument for anything but an absolute http URL
    static Target parseUrl(const std::string & url);

    static std::string buildRequest(const Request & request, const Target & target);

private:
    int timeout_seconds;
    static inline Logger & logger = Logger::getInstance();

    int connect_to_server(const std::string & host, int port, int id);
    void send_all(int server_fd, const std::string & data, int id);
};

#endif
