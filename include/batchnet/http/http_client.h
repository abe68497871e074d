#pragma once

#include <cstddef>

#include "batchnet/http/client_options.h"
#include "batchnet/http/http_types.h"

namespace batchnet::http {

// Sends one request and waits for its response.
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual Response send_request(const Request& request, ClientOptions options = {}) = 0;
};

// Queues requests and completes them when the caller drives the client.
class IBatchClient {
public:
    virtual ~IBatchClient() = default;

    virtual void send_async_request(const Request& request, ClientOptions options = {}) = 0;

    // One pass of the event loop.
    virtual void proceed() = 0;

    // Calls proceed() until nothing is queued.
    virtual void flush() = 0;

    virtual std::size_t count() const = 0;
};

} // namespace batchnet::http
