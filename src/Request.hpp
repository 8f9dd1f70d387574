#ifndef REQUEST_HPP
#define REQUEST_HPP

#include <string>
#include <map>
#include <atomic>
#include <boost/beast/http.hpp>

namespace http = boost::beast::http;

// What the adapter and the controller know about an outgoing request:
// method, absolute URL and header fields. The body, if any, is
// forwarded untouched by the transport.
class Request {
private:
    static std::atomic<int> next_id;
    int id;
    std::string method;
    std::string url;
    http::fields headers;
    std::string body;

public:
    Request() : id(-1) {}
    Request(const std::string & method, const std::string & url);
    Request(const std::string & method, const std::string & url, const http::fields & headers);

    int getId() const { return id; }

    const std::string & getMethod() const { return method; }
    const std::string & getUrl() const { return url; }

    std::string getHeader(const std::string & key) const;
    bool hasHeader(const std::string & key) const;
    void setHeader(const std::string & key, const std::string & value);
    void setHeaders(const std::map<std::string, std::string> & values);

    const http::fields & getHeaders() const { return headers; }
    http::fields & getHeaders() { return headers; }

    bool hasBody() const { return !body.empty(); }
    const std::string & getBody() const { return body; }
    void setBody(const std::string & data) { body = data; }
};

#endif
