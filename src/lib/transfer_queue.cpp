#include "batchnet/http/transfer_queue.h"

#include <stdexcept>
#include <utility>

namespace batchnet::http {

QueueEntry::QueueEntry(const Request& request, ClientOptions options)
    : _request(&request)
    , _options(std::move(options))
{
}

void QueueEntry::prepare(TransferHandle handle, std::unique_ptr<ResponseBuilder> builder)
{
    if (_handle) {
        throw std::logic_error("queue entry already prepared");
    }
    if (!handle || !builder) {
        throw std::invalid_argument("prepare needs a handle and a builder");
    }
    _handle = handle;
    _builder = std::move(builder);
}

QueueEntry& TransferQueue::enqueue(const Request& request, ClientOptions options)
{
    return _entries.emplace_back(request, std::move(options));
}

std::vector<QueueEntry*> TransferQueue::queued()
{
    std::vector<QueueEntry*> out;
    for (auto& e : _entries) {
        if (e.state() == EntryState::Queued) {
            out.push_back(&e);
        }
    }
    return out;
}

std::vector<QueueEntry*> TransferQueue::prepared()
{
    std::vector<QueueEntry*> out;
    for (auto& e : _entries) {
        if (e.state() == EntryState::Prepared) {
            out.push_back(&e);
        }
    }
    return out;
}

QueueEntry* TransferQueue::find(TransferHandle handle)
{
    if (!handle) {
        return nullptr;
    }
    for (auto& e : _entries) {
        if (e.handle() == handle) {
            return &e;
        }
    }
    return nullptr;
}

QueueEntry TransferQueue::remove(const QueueEntry& entry)
{
    for (auto it = _entries.begin(); it != _entries.end(); ++it) {
        if (&*it == &entry) {
            QueueEntry out = std::move(*it);
            _entries.erase(it);
            return out;
        }
    }
    throw std::out_of_range("entry is not in this queue");
}

} // namespace batchnet::http
