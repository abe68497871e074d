#pragma once

#include <chrono>
#include <functional>
#include <string>

#include "batchnet/http/client_errors.h"
#include "batchnet/http/http_types.h"

namespace batchnet::http {

// Invoked once per transfer. Exactly one of `response` and `error` is set.
using Callback = std::function<void(const Request& request,
                                    const Response* response,
                                    const TransferError* error)>;

// Decides whether a server push for `url` (announced while `parent` was in
// flight) is accepted.
using PushFilter = std::function<bool(const Request& parent, const std::string& url)>;

struct ClientOptions {
    Callback callback;

    bool allowRedirects{false};
    int  maxRedirects{5};

    // Zero means no limit.
    std::chrono::milliseconds timeout{0};

    bool verify{true};

    // Proxy URL, e.g. "http://proxy:3128". Empty means direct.
    std::string proxy;

    bool       usePushedResponse{true};
    PushFilter pushFilter;
};

// Validates `options` and fills in defaults. Throws InvalidOptionError.
ClientOptions resolve_options(ClientOptions options);

} // namespace batchnet::http
