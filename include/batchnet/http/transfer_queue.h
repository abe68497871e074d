#pragma once

#include <cstddef>
#include <list>
#include <memory>
#include <vector>

#include "batchnet/http/client_options.h"
#include "batchnet/http/http_types.h"
#include "batchnet/http/response_builder.h"
#include "batchnet/http/transfer_engine.h"

namespace batchnet::http {

enum class EntryState {
    Queued,     // request + options only
    Prepared,   // handle attached to the batch, builder bound to it
};

class QueueEntry {
public:
    QueueEntry(const Request& request, ClientOptions options);

    EntryState state() const noexcept
    {
        return _handle ? EntryState::Prepared : EntryState::Queued;
    }

    const Request&       request() const noexcept { return *_request; }
    const ClientOptions& options() const noexcept { return _options; }
    TransferHandle       handle()  const noexcept { return _handle; }
    ResponseBuilder*     builder() const noexcept { return _builder.get(); }

    // Queued -> Prepared. An entry is prepared at most once.
    void prepare(TransferHandle handle, std::unique_ptr<ResponseBuilder> builder);

private:
    const Request*                   _request;
    ClientOptions                    _options;
    TransferHandle                   _handle{nullptr};
    std::unique_ptr<ResponseBuilder> _builder;
};

// Ordered work list of a MultiClient. Entry addresses stay valid until the
// entry itself is removed.
class TransferQueue {
public:
    QueueEntry& enqueue(const Request& request, ClientOptions options);

    std::size_t size() const noexcept { return _entries.size(); }
    bool empty() const noexcept { return _entries.empty(); }

    // Entries still waiting for a handle, in insertion order.
    std::vector<QueueEntry*> queued();

    std::vector<QueueEntry*> prepared();

    // Returns nullptr if no prepared entry owns `handle`.
    QueueEntry* find(TransferHandle handle);

    // Removes `entry` and hands it back to the caller.
    QueueEntry remove(const QueueEntry& entry);

private:
    std::list<QueueEntry> _entries;
};

} // namespace batchnet::http
