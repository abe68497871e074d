#pragma once

#include "batchnet/http/transfer_engine.h"

#if BN_WITH_CURL == 1

#include <array>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <curl/curl.h>

#include "batchnet/config/client_config.h"
#include "batchnet/http/response_builder.h"

namespace batchnet::platform::posix {

// ITransferEngine on top of libcurl's easy and multi interfaces.
//
// Easy handles are pooled: up to `maxIdleHandles` released handles are
// reset and kept for reuse instead of being cleaned up.
class CurlTransferEngine final : public http::ITransferEngine {
public:
    explicit CurlTransferEngine(config::EngineConfig settings = {});
    ~CurlTransferEngine() override;

    CurlTransferEngine(const CurlTransferEngine&) = delete;
    CurlTransferEngine& operator=(const CurlTransferEngine&) = delete;

    http::TransferHandle create_handle() override;
    void configure(http::TransferHandle handle,
                   const http::Request& request,
                   const http::ClientOptions& options,
                   http::ResponseBuilder& builder) override;

    http::BatchHandle create_batch() override;
    void destroy_batch(http::BatchHandle batch) override;

    void attach(http::BatchHandle batch, http::TransferHandle handle) override;
    void detach(http::BatchHandle batch, http::TransferHandle handle) override;

    http::StepResult step(http::BatchHandle batch) override;
    void wait_ready(http::BatchHandle batch) override;
    std::optional<http::FinishedTransfer> next_finished(http::BatchHandle batch) override;

    void release(http::TransferHandle handle) override;

    http::TransferErrorKind classify(int result) const override;
    std::string describe(int result, http::TransferHandle handle) const override;

    std::optional<http::PushedResponse> take_pushed(http::BatchHandle batch,
                                                    http::TransferHandle handle,
                                                    int result) override;

    std::size_t idle_handles() const noexcept { return _idle.size(); }

private:
    struct Transfer {
        const http::Request*       request{nullptr};
        const http::ClientOptions* options{nullptr};
        curl_slist*                headers{nullptr};
        std::array<char, CURL_ERROR_SIZE> errorBuffer{};
    };

    struct Pushed {
        CURLM*                                 multi{nullptr};
        std::unique_ptr<http::Request>         request;
        std::unique_ptr<http::ResponseBuilder> builder;
    };

    static std::size_t header_cb(char* ptr, std::size_t size, std::size_t nmemb, void* userdata);
    static std::size_t body_cb(char* ptr, std::size_t size, std::size_t nmemb, void* userdata);
    static int push_cb(CURL* parent, CURL* easy, std::size_t numHeaders,
                       struct curl_pushheaders* headers, void* userp);

    int accept_push(CURL* parent, CURL* easy, struct curl_pushheaders* headers);
    void drop_pushed(CURLM* multi);

    config::EngineConfig _settings;

    std::unordered_map<CURL*, std::unique_ptr<Transfer>> _transfers;
    std::unordered_map<CURL*, Pushed>                    _pushed;
    std::vector<CURL*>                                   _idle;
};

} // namespace batchnet::platform::posix

#endif // BN_WITH_CURL
