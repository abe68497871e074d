#include <cstdio>
#include <deque>
#include <exception>
#include <string>
#include <string_view>
#include <vector>

#include "batchnet/app/fetch_args.h"
#include "batchnet/config/client_config.h"
#include "batchnet/config/client_config_yaml_store.h"
#include "batchnet/core/logging.h"
#include "batchnet/http/multi_client.h"
#include "batchnet/platform/posix/curl_transfer_engine.h"

using namespace batchnet;

static const char* TAG = "fetch";

static void print_result(const http::Request& req,
                         const http::Response* resp,
                         const http::TransferError* err,
                         bool& anyFailed)
{
    if (resp) {
        std::printf("%u %s %zu\n",
                    static_cast<unsigned>(resp->statusCode),
                    req.url.c_str(),
                    resp->body.size());
    } else {
        std::printf("ERR %s %s\n", req.url.c_str(), err ? err->reason().c_str() : "unknown error");
        anyFailed = true;
    }
}

int main(int argc, char** argv)
{
    std::vector<std::string_view> rawArgs;
    for (int i = 1; i < argc; ++i) {
        rawArgs.emplace_back(argv[i]);
    }

    std::string error;
    auto parsed = app::parse_fetch_args(rawArgs, error);
    if (!parsed) {
        std::fprintf(stderr, "batchnet-fetch: %s\n%s", error.c_str(), app::fetch_usage());
        return 2;
    }
    const app::FetchArgs& args = *parsed;
    if (args.showHelp) {
        std::fputs(app::fetch_usage(), stdout);
        return 0;
    }

    config::ClientConfig cfg{};
    if (!args.configPath.empty()) {
        try {
            cfg = config::YamlClientConfigStore(args.configPath).load();
        } catch (const std::exception& ex) {
            std::fprintf(stderr, "batchnet-fetch: bad config '%s': %s\n", args.configPath.c_str(), ex.what());
            return 2;
        }
    }

    log::set_threshold(cfg.logging.level);

    platform::posix::CurlTransferEngine engine(cfg.engine);
    http::MultiClient client(engine);

    // Requests are borrowed by the client; a deque keeps their addresses.
    std::deque<http::Request> requests;
    for (const auto& url : args.urls) {
        http::Request req;
        req.method  = args.method;
        req.url     = url;
        req.headers = args.headers;
        req.body    = args.body;
        requests.push_back(std::move(req));
    }

    bool anyFailed = false;
    http::ClientOptions options = config::make_options(cfg.defaults);
    options.callback = [&anyFailed](const http::Request& req,
                                    const http::Response* resp,
                                    const http::TransferError* err) {
        print_result(req, resp, err, anyFailed);
    };

    BN_LOGI(TAG, "Fetching %zu URL(s) %s", requests.size(), args.sync ? "one by one" : "as one batch");

    try {
        if (args.sync) {
            for (const auto& req : requests) {
                try {
                    (void)client.send_request(req, options);
                } catch (const http::TransferError& ex) {
                    // Already reported through the callback.
                    BN_LOGD(TAG, "%s", ex.what());
                }
            }
        } else {
            for (const auto& req : requests) {
                client.send_async_request(req, options);
            }
            try {
                client.flush();
            } catch (const http::TransferError& ex) {
                BN_LOGD(TAG, "%s", ex.what());
            }
        }
    } catch (const http::ClientError& ex) {
        std::fprintf(stderr, "batchnet-fetch: %s\n", ex.what());
        return 1;
    }

    return anyFailed ? 1 : 0;
}
