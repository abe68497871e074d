#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "batchnet/http/response_builder.h"
#include "batchnet/http/transfer_engine.h"

namespace batchnet::tests {

using http::BatchHandle;
using http::TransferHandle;

// How a scripted transfer ends.
struct FakeOutcome {
    int         result{0};        // non-zero = transport failure
    int         steps{1};         // step() calls until it finishes
    std::uint16_t status{200};
    std::string body;
    bool        sendStatusLine{true};
};

// Deterministic ITransferEngine. Transfers finish after a scripted number
// of step() calls; everything the coordinator does is counted so tests can
// check handle and batch bookkeeping.
class FakeTransferEngine final : public http::ITransferEngine {
public:
    static constexpr int kConnectFailure = 7;

    // Outcome for every transfer whose URL is `url`.
    void script(const std::string& url, FakeOutcome outcome) { _script[url] = std::move(outcome); }

    // A finished transfer the coordinator never created, reported on the
    // after the scripted completions.
    void inject_push(const std::string& url, http::Response response)
    {
        auto t = std::make_unique<Transfer>();
        t->pushedUrl = url;
        t->pushedResponse = std::move(response);
        _pendingPushes.push_back(handle_of(*t));
        _transfers.push_back(std::move(t));
    }

    bool failCreateBatch{false};
    bool failCreateHandle{false};
    bool failStep{false};
    std::size_t failStepFrom{0}; // step() calls from this one on fail; 0 = never
    int  failAttaches{0}; // this many attach() calls throw EngineError

    std::size_t handlesCreated{0};
    std::size_t handlesReleased{0};
    std::size_t batchesCreated{0};
    std::size_t batchesDestroyed{0};
    std::size_t waits{0};
    std::size_t stepCalls{0};
    std::size_t pushesTaken{0};
    std::vector<std::string> attachOrder;
    std::vector<std::string> completionOrder;

    std::size_t live_handles() const { return handlesCreated - handlesReleased; }
    bool batch_live() const { return _batch != nullptr; }

    TransferHandle create_handle() override
    {
        if (failCreateHandle) {
            throw http::EngineError("fake: out of handles");
        }
        auto t = std::make_unique<Transfer>();
        TransferHandle h = handle_of(*t);
        _transfers.push_back(std::move(t));
        ++handlesCreated;
        return h;
    }

    void configure(TransferHandle handle,
                   const http::Request& request,
                   const http::ClientOptions& /*options*/,
                   http::ResponseBuilder& builder) override
    {
        Transfer& t = lookup(handle);
        t.request = &request;
        t.builder = &builder;
        auto it = _script.find(request.url);
        t.outcome = it != _script.end() ? it->second : FakeOutcome{};
        if (t.outcome.body.empty() && t.outcome.result == 0) {
            t.outcome.body = "ok:" + request.url;
        }
        t.remaining = t.outcome.steps;
    }

    BatchHandle create_batch() override
    {
        if (failCreateBatch) {
            return nullptr;
        }
        if (_batch) {
            throw std::logic_error("fake: second live batch");
        }
        ++batchesCreated;
        _batch = static_cast<BatchHandle>(static_cast<void*>(&_batchStorage));
        return _batch;
    }

    void destroy_batch(BatchHandle batch) override
    {
        check_batch(batch);
        for (const auto& t : _transfers) {
            if (t->attached) {
                throw std::logic_error("fake: batch destroyed with attached transfers");
            }
        }
        ++batchesDestroyed;
        _batch = nullptr;
    }

    void attach(BatchHandle batch, TransferHandle handle) override
    {
        check_batch(batch);
        Transfer& t = lookup(handle);
        if (t.attached || !t.request) {
            throw std::logic_error("fake: bad attach");
        }
        if (failAttaches > 0) {
            --failAttaches;
            throw http::EngineError("fake: attach refused");
        }
        t.attached = true;
        attachOrder.push_back(t.request->url);
    }

    void detach(BatchHandle batch, TransferHandle handle) override
    {
        check_batch(batch);
        Transfer& t = lookup(handle);
        if (!t.attached) {
            throw std::logic_error("fake: detach of unattached transfer");
        }
        t.attached = false;
    }

    http::StepResult step(BatchHandle batch) override
    {
        check_batch(batch);
        http::StepResult r;
        ++stepCalls;
        if (failStep || (failStepFrom != 0 && stepCalls >= failStepFrom)) {
            r.ok = false;
            return r;
        }

        for (const auto& tp : _transfers) {
            Transfer& t = *tp;
            if (!t.attached || t.done) {
                continue;
            }
            if (--t.remaining > 0) {
                r.stillActive = true;
                continue;
            }
            finish(t);
        }
        return r;
    }

    void wait_ready(BatchHandle batch) override
    {
        check_batch(batch);
        ++waits;
    }

    std::optional<http::FinishedTransfer> next_finished(BatchHandle batch) override
    {
        check_batch(batch);
        if (!_finished.empty()) {
            http::FinishedTransfer done = _finished.front();
            _finished.pop_front();
            return done;
        }
        if (!_pendingPushes.empty()) {
            TransferHandle h = _pendingPushes.front();
            _pendingPushes.pop_front();
            return http::FinishedTransfer{h, 0};
        }
        return std::nullopt;
    }

    void release(TransferHandle handle) override
    {
        Transfer& t = lookup(handle);
        if (t.released || t.attached) {
            throw std::logic_error("fake: bad release");
        }
        t.released = true;
        ++handlesReleased;
    }

    http::TransferErrorKind classify(int result) const override
    {
        return result == kConnectFailure ? http::TransferErrorKind::Network
                                         : http::TransferErrorKind::Request;
    }

    std::string describe(int result, TransferHandle /*handle*/) const override
    {
        return "fake failure " + std::to_string(result);
    }

    std::optional<http::PushedResponse> take_pushed(BatchHandle batch,
                                                    TransferHandle handle,
                                                    int result) override
    {
        check_batch(batch);
        Transfer& t = lookup(handle);
        ++pushesTaken;
        if (result != 0 || t.pushedUrl.empty()) {
            return std::nullopt;
        }
        return http::PushedResponse{t.pushedUrl, t.pushedResponse};
    }

private:
    struct Transfer {
        const http::Request*   request{nullptr};
        http::ResponseBuilder* builder{nullptr};
        FakeOutcome            outcome;
        int                    remaining{0};
        bool                   attached{false};
        bool                   done{false};
        bool                   released{false};

        std::string    pushedUrl;
        http::Response pushedResponse;
    };

    static TransferHandle handle_of(Transfer& t)
    {
        return static_cast<TransferHandle>(static_cast<void*>(&t));
    }

    Transfer& lookup(TransferHandle handle)
    {
        for (const auto& t : _transfers) {
            if (handle_of(*t) == handle) {
                return *t;
            }
        }
        throw std::logic_error("fake: unknown handle");
    }

    void check_batch(BatchHandle batch) const
    {
        if (!_batch || batch != _batch) {
            throw std::logic_error("fake: wrong or dead batch handle");
        }
    }

    void finish(Transfer& t)
    {
        t.done = true;
        completionOrder.push_back(t.request->url);
        if (t.outcome.result == 0) {
            if (t.outcome.sendStatusLine) {
                t.builder->add_header_line("HTTP/1.1 " + std::to_string(t.outcome.status) + " Fake\r\n");
            }
            t.builder->add_header_line("Content-Type: text/plain\r\n");
            t.builder->append_body(t.outcome.body.data(), t.outcome.body.size());
        }
        _finished.push_back(http::FinishedTransfer{handle_of(t), t.outcome.result});
    }

    std::map<std::string, FakeOutcome>         _script;
    std::vector<std::unique_ptr<Transfer>>     _transfers;
    std::deque<http::FinishedTransfer>         _finished;
    std::deque<TransferHandle>                 _pendingPushes;

    int         _batchStorage{0};
    BatchHandle _batch{nullptr};
};

} // namespace batchnet::tests
