#ifndef TRANSPORT_HPP
#define TRANSPORT_HPP

#include <memory>

#include "Request.hpp"
#include "Response.hpp"

// Sends a request to the origin. Errors are thrown to the caller.
class Transport {
public:
    virtual ~Transport() = default;

    virtual std::unique_ptr<Response> send(const Request & request) = 0;
};

#endif
