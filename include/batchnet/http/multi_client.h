#pragma once

#include <cstddef>
#include <exception>
#include <optional>

#include "batchnet/http/client_errors.h"
#include "batchnet/http/client_options.h"
#include "batchnet/http/http_client.h"
#include "batchnet/http/http_types.h"
#include "batchnet/http/pushed_response_cache.h"
#include "batchnet/http/transfer_engine.h"
#include "batchnet/http/transfer_queue.h"

namespace batchnet::http {

// Drives many transfers through one batch handle of an ITransferEngine.
//
// Nothing happens in the background: transfers only make progress inside
// proceed(), flush() and send_request(), on the calling thread. One
// instance must not be used from several threads at once. Errors are
// reported per batch, so callers that need their failures isolated from
// each other should use one MultiClient each.
//
// Requests are borrowed and must stay alive until their callback has run.
class MultiClient final : public IHttpClient, public IBatchClient {
public:
    explicit MultiClient(ITransferEngine& engine);
    ~MultiClient() override;

    MultiClient(const MultiClient&) = delete;
    MultiClient& operator=(const MultiClient&) = delete;

    // Queues `request`. Its callback runs during a later proceed()/flush(),
    // or right away when a matching pushed response is cached.
    void send_async_request(const Request& request, ClientOptions options = {}) override;

    // Queues `request`, flushes the whole queue and returns its response.
    // Throws the first TransferError of the draining pass even when it
    // belongs to another queued request.
    Response send_request(const Request& request, ClientOptions options = {}) override;

    // One pass: attach queued transfers, run the batch until no transfer is
    // active, then complete everything that finished. The first
    // TransferError of the pass is thrown if the pass empties the queue.
    // Callbacks may call back into the client.
    void proceed() override;

    void flush() override;

    std::size_t count() const override { return _queue.size(); }

    bool has_batch() const noexcept { return _batch != nullptr; }

    PushedResponseCache&       pushed_responses()       { return _pushed; }
    const PushedResponseCache& pushed_responses() const { return _pushed; }

private:
    void prepare_queued();
    StepResult drive();
    void complete(const FinishedTransfer& done,
                  std::optional<TransferError>& firstError,
                  std::exception_ptr& callbackError);
    void store_pushed(const FinishedTransfer& done);
    void parse_error(const Request& request, int result, TransferHandle handle) const;
    bool answer_from_push(const Request& request, const ClientOptions& options);
    void destroy_batch();

    ITransferEngine&    _engine;
    BatchHandle         _batch{nullptr};
    std::size_t         _batchGeneration{0}; // bumped on every destroy
    TransferQueue       _queue;
    PushedResponseCache _pushed;
};

} // namespace batchnet::http
