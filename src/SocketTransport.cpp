#include "SocketTransport.hpp"

#include <unistd.h>
#include <netdb.h>
#include <cerrno>
#include <cstring>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <boost/asio/buffer.hpp>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

namespace asio = boost::asio;

void Connection::close() {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

SocketBodyStream::SocketBodyStream(std::shared_ptr<Connection> connection,
    std::unique_ptr<http::response_parser<http::buffer_body>> parser,
    beast::flat_buffer buffer,
    int id)
:   connection(std::move(connection)),
    parser(std::move(parser)),
    pending(std::move(buffer)),
    chunked(this->parser->chunked()),
    id(id) {}

bool SocketBodyStream::receiveMore() {
    char chunk[8192];
    while (true) {
        ssize_t n = recv(connection->getFd(), chunk, sizeof(chunk), 0);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::runtime_error("recv failed: " + std::string(strerror(errno)));
        }
        if (n == 0) {
            logger.debug(id, "connection closed by server");
            return false;
        }
        pending.commit(asio::buffer_copy(pending.prepare(n), asio::buffer(chunk, n)));
        return true;
    }
}

size_t SocketBodyStream::read(char * buffer, size_t size) {
    if (size == 0 || !connection->isOpen() || parser->is_done()) {
        return 0;
    }

    auto & body = parser->get().body();
    body.data = buffer;
    body.size = size;

    boost::system::error_code ec;
    bool needMore = pending.size() == 0;
    while (!parser->is_done()) {
        if (needMore) {
            // hand out what we have instead of blocking for more
            if (body.size < size) {
                break;
            }
            if (!receiveMore()) {
                parser->put_eof(ec);
                if (ec) {
                    throw std::runtime_error("connection closed before end of body: " + ec.message());
                }
                break;
            }
            needMore = false;
        }

        size_t used = parser->put(pending.data(), ec);
        pending.consume(used);
        if (ec == http::error::need_buffer) {
            ec = {};
            break;
        }
        if (ec == http::error::need_more) {
            ec = {};
            needMore = true;
            continue;
        }
        if (ec) {
            throw std::runtime_error("failed to parse response body: " + ec.message());
        }
        if (pending.size() == 0) {
            needMore = true;
        }
    }

    size_t produced = size - body.size;
    body.data = nullptr;
    body.size = 0;
    return produced;
}

SocketTransport::SocketTransport(int timeout_seconds) : timeout_seconds(timeout_seconds) {}

SocketTransport::Target SocketTransport::parseUrl(const std::string & url) {
    const std::string scheme = "http://";
    if (url.size() <= scheme.size() || !boost::istarts_with(url, scheme)) {
        throw std::invalid_argument("only absolute http URLs are supported: " + url);
    }
    std::string rest = url.substr(scheme.size());
    size_t hash = rest.find('#');
    if (hash != std::string::npos) {
        rest = rest.substr(0, hash);
    }

    size_t end = rest.find_first_of("/?");
    std::string authority = rest.substr(0, end);
    std::string path = (end == std::string::npos) ? "/" : rest.substr(end);
    if (path[0] == '?') {
        path = "/" + path;
    }

    // drop userinfo
    size_t at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }

    Target target;
    target.port = 80;
    size_t colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']', colon) == std::string::npos) {
        std::string port = authority.substr(colon + 1);
        authority = authority.substr(0, colon);
        try {
            target.port = boost::lexical_cast<int>(port);
        }
        catch (const boost::bad_lexical_cast &) {
            throw std::invalid_argument("invalid port in URL: " + url);
        }
        if (target.port <= 0 || target.port > 65535) {
            throw std::invalid_argument("invalid port in URL: " + url);
        }
    }
    if (authority.size() > 2 && authority.front() == '[' && authority.back() == ']') {
        authority = authority.substr(1, authority.size() - 2);
    }
    if (authority.empty()) {
        throw std::invalid_argument("URL has no host: " + url);
    }
    target.host = authority;
    target.path = path;
    return target;
}

std::string SocketTransport::buildRequest(const Request & request, const Target & target) {
    http::request<http::string_body> req;
    req.method_string(request.getMethod());
    req.target(target.path);
    req.version(11);

    std::string host = target.host;
    if (host.find(':') != std::string::npos) {
        host = "[" + host + "]";
    }
    if (target.port != 80) {
        host += ":" + std::to_string(target.port);
    }
    req.set(http::field::host, host);

    // copy the caller's headers, except the ones we own
    for (const auto & field : request.getHeaders()) {
        if (field.name() == http::field::host || field.name() == http::field::connection) {
            continue;
        }
        req.insert(field.name_string(), field.value());
    }
    req.set(http::field::connection, "close");

    if (request.hasBody()) {
        req.body() = request.getBody();
        req.prepare_payload();
    }
    return boost::lexical_cast<std::string>(req);
}

int SocketTransport::connect_to_server(const std::string & host, int port, int id) {
    logger.debug(id, "Attempting to connect to " + host + ":" + std::to_string(port));

    struct addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo * result = nullptr;
    int rc = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &result);
    if (rc != 0) {
        logger.error(id, "Failed to resolve hostname " + host + ": " + gai_strerror(rc));
        throw std::runtime_error("Failed to resolve hostname " + host);
    }

    int server_fd = -1;
    std::string lastError = "no address";
    for (struct addrinfo * ai = result; ai != nullptr; ai = ai->ai_next) {
        server_fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (server_fd < 0) {
            lastError = strerror(errno);
            continue;
        }

        struct timeval tv;
        tv.tv_sec = timeout_seconds;
        tv.tv_usec = 0;
        if (setsockopt(server_fd, SOL_SOCKET, SO_RCVTIMEO, (const char*)&tv, sizeof(tv)) < 0) {
            logger.error(id, "Failed to set receive timeout: " + std::string(strerror(errno)));
        }
        if (setsockopt(server_fd, SOL_SOCKET, SO_SNDTIMEO, (const char*)&tv, sizeof(tv)) < 0) {
            logger.error(id, "Failed to set send timeout: " + std::string(strerror(errno)));
        }

        if (connect(server_fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            break;
        }
        lastError = strerror(errno);
        ::close(server_fd);
        server_fd = -1;
    }
    freeaddrinfo(result);

    if (server_fd < 0) {
        logger.error(id, "Failed to connect to " + host + ": " + lastError);
        throw std::runtime_error("Failed to connect to server " + host + ":" + std::to_string(port));
    }
    logger.debug(id, "Successfully connected to server on fd " + std::to_string(server_fd));
    return server_fd;
}

void SocketTransport::send_all(int server_fd, const std::string & data, int id) {
    size_t total_sent = 0;
    while (total_sent < data.length()) {
        ssize_t sent = ::send(server_fd, data.c_str() + total_sent, data.length() - total_sent, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::runtime_error("Failed to send request: " + std::string(strerror(errno)));
        }
        total_sent += sent;
    }
    logger.debug(id, "sent " + std::to_string(total_sent) + " bytes to server");
}

std::unique_ptr<Response> SocketTransport::send(const Request & request) {
    const int id = request.getId();
    Target target = parseUrl(request.getUrl());
    std::string wire = buildRequest(request, target);

    logger.info(id, "Requesting \"" + request.getMethod() + " " + request.getUrl() + "\" from " + target.host);
    auto connection = std::make_shared<Connection>(connect_to_server(target.host, target.port, id));
    send_all(connection->getFd(), wire, id);

    auto parser = std::make_unique<http::response_parser<http::buffer_body>>();
    parser->body_limit(std::numeric_limits<std::uint64_t>::max());
    if (request.getMethod() == "HEAD") {
        parser->skip(true);
    }

    beast::flat_buffer buffer;
    boost::system::error_code ec;
    char chunk[8192];
    while (!parser->is_header_done()) {
        ssize_t n = recv(connection->getFd(), chunk, sizeof(chunk), 0);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::runtime_error("recv failed: " + std::string(strerror(errno)));
        }
        if (n == 0) {
            throw std::runtime_error("connection closed before response header");
        }
        buffer.commit(asio::buffer_copy(buffer.prepare(n), asio::buffer(chunk, n)));

        size_t used = parser->put(buffer.data(), ec);
        buffer.consume(used);
        if (ec == http::error::need_more) {
            ec = {};
            continue;
        }
        if (ec) {
            logger.error(id, "failed to parse response header: " + ec.message());
            throw std::runtime_error("failed to parse response header: " + ec.message());
        }
    }
    parser->eager(true);

    const auto & head = parser->get();
    http::fields headers;
    for (const auto & field : head) {
        headers.insert(field.name_string(), field.value());
    }
    int status = head.result_int();
    std::string reason(head.reason());
    unsigned version = head.version();
    logger.info(id, "Received \"" + std::to_string(status) + " " + reason + "\" from " + target.host);

    auto body = std::make_unique<SocketBodyStream>(connection, std::move(parser), std::move(buffer), id);
    auto response = std::make_unique<Response>(status, headers, std::move(body), reason);
    response->setVersion(version);
    response->onRelease([connection]() { connection->close(); });
    return response;
}
