#pragma once

#include <cstddef>
#include <string>

#include "batchnet/core/logging.h"
#include "batchnet/http/client_options.h"

namespace batchnet::config {

// Per-request defaults. Callbacks and push filters are code, not config.
struct RequestDefaults {
    bool        allowRedirects{false};
    int         maxRedirects{5};
    long        timeoutMs{0};          // 0 = no limit
    bool        verify{true};
    std::string proxy;
    bool        usePushedResponse{true};
};

struct EngineConfig {
    std::size_t maxIdleHandles{5};     // released easy handles kept for reuse
    bool        serverPush{false};     // HTTP/2 multiplexing + push acceptance
    long        maxHostConnections{0}; // 0 = transport default
    int         waitTimeoutMs{1000};   // upper bound of one readiness wait
};

struct LoggingConfig {
    log::Level level{log::Level::Info};
};

struct ClientConfig {
    RequestDefaults defaults;
    EngineConfig    engine;
    LoggingConfig   logging;
};

// ClientOptions carrying `cfg.defaults`, with no callback set.
http::ClientOptions make_options(const RequestDefaults& defaults);

class ClientConfigStore {
public:
    virtual ~ClientConfigStore() = default;

    virtual ClientConfig load() = 0;
    virtual void         save(const ClientConfig& cfg) = 0;
};

} // namespace batchnet::config
