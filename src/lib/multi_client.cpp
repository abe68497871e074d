#include "batchnet/http/multi_client.h"

#include "batchnet/core/logging.h"
#include "batchnet/http/response_builder.h"

#include <memory>
#include <utility>

namespace batchnet::http {

static constexpr const char* TAG = "multi";

MultiClient::MultiClient(ITransferEngine& engine)
    : _engine(engine)
{
}

MultiClient::~MultiClient()
{
    // Pending callbacks are dropped; only native resources are returned.
    for (QueueEntry* entry : _queue.prepared()) {
        _engine.detach(_batch, entry->handle());
        _engine.release(entry->handle());
    }
    destroy_batch();
}

bool MultiClient::answer_from_push(const Request& request, const ClientOptions& options)
{
    if (!options.usePushedResponse || _pushed.size() == 0) {
        return false;
    }

    std::optional<Response> cached = _pushed.take(request.url);
    if (!cached) {
        return false;
    }

    BN_LOGD(TAG, "Answering %s from a pushed response", request.url.c_str());
    options.callback(request, &*cached, nullptr);
    return true;
}

void MultiClient::send_async_request(const Request& request, ClientOptions options)
{
    ClientOptions resolved = resolve_options(std::move(options));

    if (answer_from_push(request, resolved)) {
        return;
    }

    _queue.enqueue(request, std::move(resolved));
}

Response MultiClient::send_request(const Request& request, ClientOptions options)
{
    ClientOptions resolved = resolve_options(std::move(options));

    // Shared with the wrapped callback, which may outlive this call if
    // flush() throws before our transfer completes.
    struct Outcome {
        std::optional<Response>      response;
        std::optional<TransferError> error;
    };
    auto outcome = std::make_shared<Outcome>();

    resolved.callback = [outcome, original = std::move(resolved.callback)](
                            const Request& req, const Response* resp, const TransferError* err) {
        if (resp) {
            outcome->response = *resp;
        }
        if (err) {
            outcome->error = *err;
        }
        original(req, resp, err);
    };

    if (!answer_from_push(request, resolved)) {
        _queue.enqueue(request, std::move(resolved));
    }
    flush();

    if (outcome->response) {
        return std::move(*outcome->response);
    }
    if (outcome->error) {
        throw *outcome->error;
    }
    throw ClientError("request to " + request.url + " completed without a response");
}

void MultiClient::flush()
{
    while (!_queue.empty()) {
        proceed();
    }
}

void MultiClient::proceed()
{
    if (_queue.empty()) {
        return;
    }

    if (!_batch) {
        _batch = _engine.create_batch();
        if (!_batch) {
            throw EngineError("unable to create batch handle");
        }
        BN_LOGD(TAG, "Batch handle created");
    }

    prepare_queued();

    StepResult last = drive();
    while (last.ok && last.stillActive) {
        _engine.wait_ready(_batch);
        last = drive();
    }
    if (!last.ok) {
        BN_LOGW(TAG, "Transfer batch reported a failure; %zu transfer(s) pending", _queue.size());
    }

    std::optional<TransferError> firstError;
    std::exception_ptr callbackError;

    // A callback may start a nested pass which completes the rest of this
    // batch, or drains the queue and destroys it.
    const std::size_t generation = _batchGeneration;
    while (_batch && _batchGeneration == generation) {
        std::optional<FinishedTransfer> done = _engine.next_finished(_batch);
        if (!done) {
            break;
        }
        complete(*done, firstError, callbackError);
    }

    if (_queue.empty()) {
        destroy_batch();
    }

    if (callbackError) {
        std::rethrow_exception(callbackError);
    }

    if (_queue.empty()) {
        if (firstError) {
            throw *firstError;
        }
        return;
    }

    // Transfer errors of a pass that leaves the queue non-empty are only
    // reported through their callbacks.
    if (!last.ok) {
        throw EngineError("transfer batch failed");
    }
}

void MultiClient::prepare_queued()
{
    for (QueueEntry* entry : _queue.queued()) {
        TransferHandle handle = _engine.create_handle();

        auto builder = std::make_unique<ResponseBuilder>(entry->request());
        try {
            _engine.configure(handle, entry->request(), entry->options(), *builder);
            _engine.attach(_batch, handle);
        } catch (const std::exception& ex) {
            // The entry stays Queued and is retried by the next pass.
            BN_LOGE(TAG, "Failed to start %s: %s", entry->request().url.c_str(), ex.what());
            _engine.release(handle);
            throw;
        }

        entry->prepare(handle, std::move(builder));
    }
}

StepResult MultiClient::drive()
{
    StepResult r;
    do {
        r = _engine.step(_batch);
    } while (r.ok && r.mayHaveMore);
    return r;
}

void MultiClient::parse_error(const Request& request, int result, TransferHandle handle) const
{
    if (result == 0) {
        return;
    }
    throw TransferError(request, _engine.classify(result), result, _engine.describe(result, handle));
}

void MultiClient::complete(const FinishedTransfer& done,
                           std::optional<TransferError>& firstError,
                           std::exception_ptr& callbackError)
{
    QueueEntry* entry = _queue.find(done.handle);
    if (!entry) {
        store_pushed(done);
        return;
    }

    std::optional<Response> response;
    std::optional<TransferError> error;
    try {
        parse_error(entry->request(), done.result, done.handle);
        response = entry->builder()->build();
    } catch (const TransferError& ex) {
        BN_LOGD(TAG, "%s", ex.what());
        error = ex;
        if (!firstError) {
            firstError = ex;
        }
    }

    _engine.detach(_batch, done.handle);
    _engine.release(done.handle);
    QueueEntry finished = _queue.remove(*entry);

    try {
        finished.options().callback(finished.request(),
                                    response ? &*response : nullptr,
                                    error ? &*error : nullptr);
    } catch (...) {
        // Siblings still complete; the first callback failure is rethrown
        // at the end of the pass.
        if (!callbackError) {
            callbackError = std::current_exception();
        }
    }
}

void MultiClient::store_pushed(const FinishedTransfer& done)
{
    try {
        std::optional<PushedResponse> pushed = _engine.take_pushed(_batch, done.handle, done.result);
        if (pushed) {
            BN_LOGD(TAG, "Cached pushed response for %s", pushed->url.c_str());
            _pushed.put(std::move(pushed->url), std::move(pushed->response));
        }
    } catch (const ClientError& ex) {
        BN_LOGW(TAG, "Dropping pushed transfer: %s", ex.what());
    }
}

void MultiClient::destroy_batch()
{
    if (!_batch) {
        return;
    }
    _engine.destroy_batch(_batch);
    _batch = nullptr;
    ++_batchGeneration;
    BN_LOGD(TAG, "Batch handle destroyed");
}

} // namespace batchnet::http
