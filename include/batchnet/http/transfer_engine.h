#pragma once

#include <optional>
#include <string>
#include <utility>

#include "batchnet/http/client_errors.h"
#include "batchnet/http/client_options.h"
#include "batchnet/http/http_types.h"

namespace batchnet::http {

class ResponseBuilder;

// Opaque engine handles. Each engine maps them onto its native types.
struct TransferHandleTag;
struct BatchHandleTag;
using TransferHandle = TransferHandleTag*;
using BatchHandle    = BatchHandleTag*;

// Outcome of one non-blocking step over a batch.
struct StepResult {
    bool ok{true};            // false: the batch itself failed
    bool stillActive{false};  // transfers are still running
    bool mayHaveMore{false};  // step again before waiting
};

struct FinishedTransfer {
    TransferHandle handle{nullptr};
    int            result{0};   // 0 is success
};

struct PushedResponse {
    std::string url;
    Response    response;
};

// Transport capability driven by MultiClient. A single engine instance may
// serve several batches; handles are never shared between batches.
class ITransferEngine {
public:
    virtual ~ITransferEngine() = default;

    // Throws EngineError when no handle can be allocated.
    virtual TransferHandle create_handle() = 0;

    // Binds `request` and `options` to `handle` and routes the transport's
    // header and body output into `builder`. All three must outlive the
    // transfer.
    virtual void configure(TransferHandle handle,
                           const Request& request,
                           const ClientOptions& options,
                           ResponseBuilder& builder) = 0;

    // Returns nullptr on failure.
    virtual BatchHandle create_batch() = 0;
    virtual void destroy_batch(BatchHandle batch) = 0;

    virtual void attach(BatchHandle batch, TransferHandle handle) = 0;
    virtual void detach(BatchHandle batch, TransferHandle handle) = 0;

    virtual StepResult step(BatchHandle batch) = 0;

    // Blocks until at least one transfer is ready, or the engine's own
    // wait slice elapses.
    virtual void wait_ready(BatchHandle batch) = 0;

    // Takes the next finished transfer, or nullopt when none is pending.
    // Completions are handed out one at a time so that a pass started from
    // inside a completion callback still sees the ones not yet taken.
    virtual std::optional<FinishedTransfer> next_finished(BatchHandle batch) = 0;

    virtual void release(TransferHandle handle) = 0;

    // Maps a non-zero transport result onto a failure kind.
    virtual TransferErrorKind classify(int result) const = 0;

    // Human readable reason for a non-zero result.
    virtual std::string describe(int result, TransferHandle handle) const = 0;

    // Consumes a finished transfer the caller does not track (a server
    // push). The handle is detached and released either way. Returns the
    // pushed response when one could be built.
    virtual std::optional<PushedResponse> take_pushed(BatchHandle batch,
                                                      TransferHandle handle,
                                                      int result) = 0;
};

} // namespace batchnet::http
