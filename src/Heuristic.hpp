#ifndef HEURISTIC_HPP
#define HEURISTIC_HPP

#include <string>
#include <optional>
#include <boost/beast/http.hpp>

#include "Response.hpp"

namespace http = boost::beast::http;

// Hook run on a network response before the controller decides whether
// to store it. A policy may add freshness headers when the origin sent
// none.
class Heuristic {
public:
    virtual ~Heuristic() = default;

    // set every header returned by updateHeaders(), then the Warning
    // header if warning() returns one
    void apply(Response & response);

protected:
    // headers to add or replace; empty leaves the response alone
    virtual http::fields updateHeaders(const Response & response) = 0;

    // text for a Warning header, e.g. "110 - \"Response is Stale\""
    virtual std::optional<std::string> warning(const Response & response) {
        (void)response;
        return std::nullopt;
    }
};

#endif
