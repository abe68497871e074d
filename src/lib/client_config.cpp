#include "batchnet/config/client_config.h"

#include <chrono>

namespace batchnet::config {

http::ClientOptions make_options(const RequestDefaults& defaults)
{
    http::ClientOptions o;
    o.allowRedirects    = defaults.allowRedirects;
    o.maxRedirects      = defaults.maxRedirects;
    o.timeout           = std::chrono::milliseconds(defaults.timeoutMs);
    o.verify            = defaults.verify;
    o.proxy             = defaults.proxy;
    o.usePushedResponse = defaults.usePushedResponse;
    return o;
}

} // namespace batchnet::config
