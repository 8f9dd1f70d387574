#include <gtest/gtest.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <atomic>
#include <cstring>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "../src/CacheControl.hpp"
#include "../src/CachingAdapter.hpp"
#include "../src/SocketTransport.hpp"

// Loopback origin: answers each accepted connection with the next
// canned response and records the raw requests.
class LoopbackServer {
public:
    explicit LoopbackServer(std::vector<std::string> replies) : accepted(0), replies(std::move(replies)) {
        listen_fd = socket(AF_INET, SOCK_STREAM, 0);
        if (listen_fd < 0) {
            throw std::runtime_error("Failed to create socket");
        }
        int opt = 1;
        setsockopt(listen_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        struct sockaddr_in address;
        memset(&address, 0, sizeof(address));
        address.sin_family = AF_INET;
        address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        address.sin_port = 0;
        if (bind(listen_fd, (struct sockaddr *)&address, sizeof(address)) < 0) {
            throw std::runtime_error("Failed to bind");
        }
        socklen_t len = sizeof(address);
        getsockname(listen_fd, (struct sockaddr *)&address, &len);
        port = ntohs(address.sin_port);
        if (listen(listen_fd, 10) < 0) {
            throw std::runtime_error("Failed to listen");
        }
        worker = std::thread(&LoopbackServer::serve, this);
    }

    ~LoopbackServer() {
        shutdown(listen_fd, SHUT_RDWR);
        close(listen_fd);
        if (worker.joinable()) {
            worker.join();
        }
    }

    std::string url(const std::string & path) const {
        return "http://127.0.0.1:" + std::to_string(port) + path;
    }

    int port;
    std::vector<std::string> requests;
    std::atomic<int> accepted;

private:
    void serve() {
        for (const std::string & reply : replies) {
            int client_fd = accept(listen_fd, nullptr, nullptr);
            if (client_fd < 0) {
                return;
            }
            accepted++;
            std::string request;
            char buffer[4096];
            while (request.find("\r\n\r\n") == std::string::npos) {
                ssize_t n = recv(client_fd, buffer, sizeof(buffer), 0);
                if (n <= 0) break;
                request.append(buffer, n);
            }
            requests.push_back(request);
            size_t sent = 0;
            while (sent < reply.size()) {
                ssize_t n = send(client_fd, reply.data() + sent, reply.size() - sent, MSG_NOSIGNAL);
                if (n <= 0) break;
                sent += n;
            }
            close(client_fd);
        }
    }

    int listen_fd;
    std::vector<std::string> replies;
    std::thread worker;
};

class SocketTransportTest : public ::testing::Test {
protected:
    SocketTransport transport{5};
};

TEST_F(SocketTransportTest, ReadsContentLengthBody) {
    std::cout << "\n=== Starting ReadsContentLengthBody ===" << std::endl;
    LoopbackServer server({"HTTP/1.1 200 OK\r\nContent-Length: 5\r\nX-Test: yes\r\n\r\nhello"});

    Request request("GET", server.url("/path?q=1"));
    request.setHeader("Accept", "text/plain");
    auto response = transport.send(request);

    EXPECT_EQ(response->getStatus(), 200);
    EXPECT_EQ(response->getReason(), "OK");
    EXPECT_EQ(response->getHeader("X-Test"), "yes");
    EXPECT_FALSE(response->isChunked());
    EXPECT_EQ(response->readBody(), "hello");
    EXPECT_TRUE(response->getBody()->isComplete());
    response->release();

    ASSERT_EQ(server.requests.size(), 1u);
    const std::string & raw = server.requests[0];
    EXPECT_EQ(raw.rfind("GET /path?q=1 HTTP/1.1\r\n", 0), 0u);
    EXPECT_NE(raw.find("Host: 127.0.0.1:" + std::to_string(server.port) + "\r\n"), std::string::npos);
    EXPECT_NE(raw.find("Connection: close\r\n"), std::string::npos);
    EXPECT_NE(raw.find("Accept: text/plain\r\n"), std::string::npos);
    std::cout << "=== Completed ReadsContentLengthBody ===" << std::endl;
}

TEST_F(SocketTransportTest, ReadsChunkedBody) {
    std::cout << "\n=== Starting ReadsChunkedBody ===" << std::endl;
    LoopbackServer server({"HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
                           "5\r\nhello\r\n6\r\n world\r\n0\r\n\r\n"});

    auto response = transport.send(Request("GET", server.url("/chunked")));
    EXPECT_TRUE(response->isChunked());
    EXPECT_EQ(response->readBody(), "hello world");
    EXPECT_TRUE(response->getBody()->isComplete());
    std::cout << "=== Completed ReadsChunkedBody ===" << std::endl;
}

TEST_F(SocketTransportTest, ReadsUntilCloseWithoutLength) {
    LoopbackServer server({"HTTP/1.1 200 OK\r\nConnection: close\r\n\r\nstreamed until close"});
    auto response = transport.send(Request("GET", server.url("/")));
    EXPECT_EQ(response->readBody(), "streamed until close");
}

TEST_F(SocketTransportTest, TruncatedBodyThrows) {
    LoopbackServer server({"HTTP/1.1 200 OK\r\nContent-Length: 100\r\n\r\nshort"});
    auto response = transport.send(Request("GET", server.url("/")));
    EXPECT_THROW(response->readBody(), std::runtime_error);
}

TEST_F(SocketTransportTest, SendsRequestBody) {
    LoopbackServer server({"HTTP/1.1 201 Created\r\nContent-Length: 0\r\n\r\n"});
    Request request("POST", server.url("/items"));
    request.setBody("name=widget");
    auto response = transport.send(request);
    EXPECT_EQ(response->getStatus(), 201);
    EXPECT_EQ(response->readBody(), "");
    ASSERT_EQ(server.requests.size(), 1u);
    EXPECT_NE(server.requests[0].find("Content-Length: 11\r\n"), std::string::npos);
}

TEST_F(SocketTransportTest, ConnectionRefused) {
    int port;
    {
        LoopbackServer server{std::vector<std::string>()};
        port = server.port;
    }
    Request request("GET", "http://127.0.0.1:" + std::to_string(port) + "/");
    EXPECT_THROW(transport.send(request), std::runtime_error);
}

TEST(SocketTransportUrlTest, ParsesUrls) {
    SocketTransport::Target target = SocketTransport::parseUrl("http://Example.com:8080/a/b?x=1#frag");
    EXPECT_EQ(target.host, "Example.com");
    EXPECT_EQ(target.port, 8080);
    EXPECT_EQ(target.path, "/a/b?x=1");

    SocketTransport::Target bare = SocketTransport::parseUrl("http://example.com");
    EXPECT_EQ(bare.port, 80);
    EXPECT_EQ(bare.path, "/");

    EXPECT_THROW(SocketTransport::parseUrl("https://example.com/"), std::invalid_argument);
    EXPECT_THROW(SocketTransport::parseUrl("/relative"), std::invalid_argument);
    EXPECT_THROW(SocketTransport::parseUrl("http://example.com:http/"), std::invalid_argument);
}

TEST(SocketTransportAdapterTest, CachesOverTheWire) {
    std::cout << "\n=== Starting CachesOverTheWire ===" << std::endl;
    std::string date = formatHttpDate(time(nullptr));
    LoopbackServer server({"HTTP/1.1 200 OK\r\nDate: " + date + "\r\nCache-Control: max-age=3600\r\n"
                           "Transfer-Encoding: chunked\r\n\r\n4\r\nwire\r\n5\r\n body\r\n0\r\n\r\n"});

    CachingAdapter adapter(std::make_unique<SocketTransport>(5));
    auto first = adapter.send(Request("GET", server.url("/cached")));
    EXPECT_EQ(first->readBody(), "wire body");
    first->release();

    auto second = adapter.send(Request("GET", server.url("/cached")));
    EXPECT_TRUE(second->fromCache());
    EXPECT_FALSE(second->hasHeader("Transfer-Encoding"));
    EXPECT_EQ(second->readBody(), "wire body");
    EXPECT_EQ(server.accepted.load(), 1);
    std::cout << "=== Completed CachesOverTheWire ===" << std::endl;
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
