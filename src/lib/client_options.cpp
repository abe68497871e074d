#include "batchnet/http/client_options.h"

#include "batchnet/util/text.h"

#include <string>
#include <utility>

namespace batchnet::http {

static bool proxy_scheme_supported(const std::string& proxy)
{
    static const char* const schemes[] = {
        "http://", "https://", "socks4://", "socks4a://", "socks5://", "socks5h://",
    };
    const std::string lower = util::to_lower(proxy);
    for (const char* s : schemes) {
        if (util::starts_with(lower, s)) {
            return true;
        }
    }
    return false;
}

ClientOptions resolve_options(ClientOptions options)
{
    if (!options.callback) {
        options.callback = [](const Request&, const Response*, const TransferError*) {};
    }

    if (options.maxRedirects < 0) {
        throw InvalidOptionError("max_redirects must not be negative, got " +
                                 std::to_string(options.maxRedirects));
    }

    if (options.timeout.count() < 0) {
        throw InvalidOptionError("timeout must not be negative, got " +
                                 std::to_string(options.timeout.count()) + "ms");
    }

    if (!options.proxy.empty() && !proxy_scheme_supported(options.proxy)) {
        throw InvalidOptionError("unsupported proxy URL '" + options.proxy + "'");
    }

    return options;
}

} // namespace batchnet::http
