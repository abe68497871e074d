#include "batchnet/platform/posix/curl_transfer_engine.h"

#if BN_WITH_CURL == 1

#include <cstring>
#include <exception>
#include <limits>
#include <string>
#include <string_view>
#include <utility>

// curl headers are only included in curl-specific files
#include <curl/curl.h>

#include "batchnet/core/logging.h"
#include "batchnet/http/response_builder.h"

namespace batchnet::platform::posix {

using http::BatchHandle;
using http::TransferHandle;

static constexpr const char* TAG = "curl";

static void ensure_curl_global_init()
{
    static const bool inited = []{
        curl_global_init(CURL_GLOBAL_DEFAULT);
        return true;
    }();
    (void)inited;
}

static CURL* to_easy(TransferHandle h)
{
    return static_cast<CURL*>(static_cast<void*>(h));
}

static TransferHandle to_handle(CURL* easy)
{
    return static_cast<TransferHandle>(static_cast<void*>(easy));
}

static CURLM* to_multi(BatchHandle b)
{
    return static_cast<CURLM*>(static_cast<void*>(b));
}

static BatchHandle to_batch(CURLM* multi)
{
    return static_cast<BatchHandle>(static_cast<void*>(multi));
}

static long http_version_for(const std::string& v)
{
    if (v == "1.0") return CURL_HTTP_VERSION_1_0;
    if (v == "1.1") return CURL_HTTP_VERSION_1_1;
    if (v == "2" || v == "2.0") return CURL_HTTP_VERSION_2_0;
    return CURL_HTTP_VERSION_NONE;
}

// Guard overflow: n = size * nmemb. Returns 0 when it would overflow.
static std::size_t chunk_size(std::size_t size, std::size_t nmemb)
{
    if (size != 0 && nmemb > (std::numeric_limits<std::size_t>::max() / size)) {
        return 0;
    }
    return size * nmemb;
}

std::size_t CurlTransferEngine::header_cb(char* ptr, std::size_t size, std::size_t nmemb, void* userdata)
{
    auto* builder = static_cast<http::ResponseBuilder*>(userdata);
    const std::size_t n = chunk_size(size, nmemb);
    if (!builder || !ptr || n == 0) {
        return 0; // abort transfer
    }

    try {
        builder->add_header_line(std::string_view(ptr, n));
    } catch (const std::exception& ex) {
        BN_LOGE(TAG, "Header callback failed: %s", ex.what());
        return 0;
    }
    return n;
}

std::size_t CurlTransferEngine::body_cb(char* ptr, std::size_t size, std::size_t nmemb, void* userdata)
{
    auto* builder = static_cast<http::ResponseBuilder*>(userdata);
    if (!builder) {
        return 0;
    }

    const std::size_t n = chunk_size(size, nmemb);
    if (n == 0 || !ptr) {
        return 0;
    }

    try {
        builder->append_body(ptr, n);
    } catch (const std::exception& ex) {
        BN_LOGE(TAG, "Body callback failed: %s", ex.what());
        return 0;
    }
    return n;
}

int CurlTransferEngine::push_cb(CURL* parent, CURL* easy, std::size_t /*numHeaders*/,
                                struct curl_pushheaders* headers, void* userp)
{
    auto* self = static_cast<CurlTransferEngine*>(userp);
    if (!self) {
        return CURL_PUSH_DENY;
    }

    try {
        return self->accept_push(parent, easy, headers);
    } catch (const std::exception& ex) {
        BN_LOGE(TAG, "Refusing server push: %s", ex.what());
        return CURL_PUSH_DENY;
    }
}

int CurlTransferEngine::accept_push(CURL* parent, CURL* easy, struct curl_pushheaders* headers)
{
    auto it = _transfers.find(parent);
    if (it == _transfers.end() || !it->second->request) {
        return CURL_PUSH_DENY;
    }
    const Transfer& origin = *it->second;

    const char* path = curl_pushheader_byname(headers, ":path");
    if (!path) {
        return CURL_PUSH_DENY;
    }
    const char* scheme = curl_pushheader_byname(headers, ":scheme");
    const char* authority = curl_pushheader_byname(headers, ":authority");

    std::string url;
    if (scheme && authority) {
        url.append(scheme).append("://").append(authority);
    }
    url.append(path);

    if (origin.options && origin.options->pushFilter &&
        !origin.options->pushFilter(*origin.request, url)) {
        BN_LOGD(TAG, "Push for %s rejected by filter", url.c_str());
        return CURL_PUSH_DENY;
    }

    char* priv = nullptr;
    curl_easy_getinfo(parent, CURLINFO_PRIVATE, &priv);
    CURLM* multi = static_cast<CURLM*>(static_cast<void*>(priv));

    Pushed pushed;
    pushed.multi = multi;
    pushed.request = std::make_unique<http::Request>();
    pushed.request->url = url;
    pushed.builder = std::make_unique<http::ResponseBuilder>(*pushed.request);

    curl_easy_setopt(easy, CURLOPT_HEADERFUNCTION, &CurlTransferEngine::header_cb);
    curl_easy_setopt(easy, CURLOPT_HEADERDATA, pushed.builder.get());
    curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, &CurlTransferEngine::body_cb);
    curl_easy_setopt(easy, CURLOPT_WRITEDATA, pushed.builder.get());

    _pushed.insert_or_assign(easy, std::move(pushed));
    BN_LOGD(TAG, "Accepted server push for %s", url.c_str());
    return CURL_PUSH_OK;
}

CurlTransferEngine::CurlTransferEngine(config::EngineConfig settings)
    : _settings(settings)
{
    ensure_curl_global_init();
}

CurlTransferEngine::~CurlTransferEngine()
{
    for (auto& kv : _transfers) {
        if (kv.second->headers) {
            curl_slist_free_all(kv.second->headers);
        }
        curl_easy_cleanup(kv.first);
    }
    _transfers.clear();

    for (auto& kv : _pushed) {
        curl_easy_cleanup(kv.first);
    }
    _pushed.clear();

    for (CURL* easy : _idle) {
        curl_easy_cleanup(easy);
    }
    _idle.clear();
}

TransferHandle CurlTransferEngine::create_handle()
{
    CURL* easy = nullptr;
    if (!_idle.empty()) {
        easy = _idle.back();
        _idle.pop_back();
    } else {
        easy = curl_easy_init();
    }

    if (!easy) {
        throw http::EngineError("unable to create transfer handle");
    }

    _transfers[easy] = std::make_unique<Transfer>();
    return to_handle(easy);
}

void CurlTransferEngine::configure(TransferHandle handle,
                                   const http::Request& request,
                                   const http::ClientOptions& options,
                                   http::ResponseBuilder& builder)
{
    CURL* easy = to_easy(handle);
    auto it = _transfers.find(easy);
    if (it == _transfers.end()) {
        throw http::EngineError("configure called with an unknown transfer handle");
    }
    Transfer& t = *it->second;
    t.request = &request;
    t.options = &options;
    t.errorBuffer[0] = '\0';

    curl_easy_setopt(easy, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(easy, CURLOPT_ERRORBUFFER, t.errorBuffer.data());
    curl_easy_setopt(easy, CURLOPT_NOSIGNAL, 1L);

    curl_easy_setopt(easy, CURLOPT_HEADERFUNCTION, &CurlTransferEngine::header_cb);
    curl_easy_setopt(easy, CURLOPT_HEADERDATA, &builder);
    curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, &CurlTransferEngine::body_cb);
    curl_easy_setopt(easy, CURLOPT_WRITEDATA, &builder);

    if (request.method == "HEAD") {
        curl_easy_setopt(easy, CURLOPT_NOBODY, 1L);
    } else if (request.method == "GET") {
        curl_easy_setopt(easy, CURLOPT_HTTPGET, 1L);
    } else {
        curl_easy_setopt(easy, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    if (!request.body.empty()) {
        curl_easy_setopt(easy, CURLOPT_POSTFIELDSIZE_LARGE,
                         static_cast<curl_off_t>(request.body.size()));
        curl_easy_setopt(easy, CURLOPT_COPYPOSTFIELDS, request.body.data());
    }

    curl_easy_setopt(easy, CURLOPT_HTTP_VERSION, http_version_for(request.protocolVersion));

    // Build request headers
    if (t.headers) {
        curl_slist_free_all(t.headers);
        t.headers = nullptr;
    }
    for (const auto& kv : request.headers) {
        std::string line;
        line.reserve(kv.first.size() + 2 + kv.second.size());
        line.append(kv.first);
        line.append(": ");
        line.append(kv.second);
        t.headers = curl_slist_append(t.headers, line.c_str());
    }
    if (t.headers) {
        curl_easy_setopt(easy, CURLOPT_HTTPHEADER, t.headers);
    }

    if (options.timeout.count() > 0) {
        curl_easy_setopt(easy, CURLOPT_TIMEOUT_MS, static_cast<long>(options.timeout.count()));
    }

    curl_easy_setopt(easy, CURLOPT_FOLLOWLOCATION, options.allowRedirects ? 1L : 0L);
    curl_easy_setopt(easy, CURLOPT_MAXREDIRS, static_cast<long>(options.maxRedirects));

    curl_easy_setopt(easy, CURLOPT_SSL_VERIFYPEER, options.verify ? 1L : 0L);
    curl_easy_setopt(easy, CURLOPT_SSL_VERIFYHOST, options.verify ? 2L : 0L);

    if (!options.proxy.empty()) {
        curl_easy_setopt(easy, CURLOPT_PROXY, options.proxy.c_str());
    }
}

BatchHandle CurlTransferEngine::create_batch()
{
    CURLM* multi = curl_multi_init();
    if (!multi) {
        BN_LOGE(TAG, "curl_multi_init failed");
        return nullptr;
    }

    if (_settings.maxHostConnections > 0) {
        curl_multi_setopt(multi, CURLMOPT_MAX_HOST_CONNECTIONS, _settings.maxHostConnections);
    }

    if (_settings.serverPush) {
        curl_multi_setopt(multi, CURLMOPT_PIPELINING, CURLPIPE_MULTIPLEX);
        curl_multi_setopt(multi, CURLMOPT_PUSHFUNCTION, &CurlTransferEngine::push_cb);
        curl_multi_setopt(multi, CURLMOPT_PUSHDATA, this);
    }

    return to_batch(multi);
}

void CurlTransferEngine::drop_pushed(CURLM* multi)
{
    for (auto it = _pushed.begin(); it != _pushed.end();) {
        if (it->second.multi == multi) {
            curl_multi_remove_handle(multi, it->first);
            curl_easy_cleanup(it->first);
            it = _pushed.erase(it);
        } else {
            ++it;
        }
    }
}

void CurlTransferEngine::destroy_batch(BatchHandle batch)
{
    CURLM* multi = to_multi(batch);
    if (!multi) {
        return;
    }
    drop_pushed(multi);
    curl_multi_cleanup(multi);
}

void CurlTransferEngine::attach(BatchHandle batch, TransferHandle handle)
{
    CURL* easy = to_easy(handle);

    // Lets the push callback find the batch a parent transfer belongs to.
    curl_easy_setopt(easy, CURLOPT_PRIVATE, static_cast<void*>(to_multi(batch)));

    CURLMcode rc = curl_multi_add_handle(to_multi(batch), easy);
    if (rc != CURLM_OK) {
        throw http::EngineError(std::string("unable to attach transfer: ") + curl_multi_strerror(rc));
    }
}

void CurlTransferEngine::detach(BatchHandle batch, TransferHandle handle)
{
    CURLMcode rc = curl_multi_remove_handle(to_multi(batch), to_easy(handle));
    if (rc != CURLM_OK) {
        BN_LOGW(TAG, "curl_multi_remove_handle: %s", curl_multi_strerror(rc));
    }
}

http::StepResult CurlTransferEngine::step(BatchHandle batch)
{
    int running = 0;
    CURLMcode mc = curl_multi_perform(to_multi(batch), &running);

    http::StepResult r;
    r.mayHaveMore = (mc == CURLM_CALL_MULTI_PERFORM);
    r.ok = (mc == CURLM_OK) || r.mayHaveMore;
    r.stillActive = running > 0;

    if (!r.ok) {
        BN_LOGE(TAG, "curl_multi_perform: %s", curl_multi_strerror(mc));
    }
    return r;
}

void CurlTransferEngine::wait_ready(BatchHandle batch)
{
    int numfds = 0;
    CURLMcode mc = curl_multi_poll(to_multi(batch), nullptr, 0, _settings.waitTimeoutMs, &numfds);
    if (mc != CURLM_OK) {
        BN_LOGW(TAG, "curl_multi_poll: %s", curl_multi_strerror(mc));
    }
}

std::optional<http::FinishedTransfer> CurlTransferEngine::next_finished(BatchHandle batch)
{
    CURLMsg* msg = nullptr;
    int msgsLeft = 0;
    while ((msg = curl_multi_info_read(to_multi(batch), &msgsLeft))) {
        if (msg->msg != CURLMSG_DONE) {
            continue;
        }
        http::FinishedTransfer done;
        done.handle = to_handle(msg->easy_handle);
        done.result = static_cast<int>(msg->data.result);
        return done;
    }
    return std::nullopt;
}

void CurlTransferEngine::release(TransferHandle handle)
{
    CURL* easy = to_easy(handle);
    auto it = _transfers.find(easy);
    if (it == _transfers.end()) {
        BN_LOGW(TAG, "release called with an unknown transfer handle");
        return;
    }

    if (it->second->headers) {
        curl_slist_free_all(it->second->headers);
    }
    _transfers.erase(it);

    if (_idle.size() < _settings.maxIdleHandles) {
        curl_easy_reset(easy);
        _idle.push_back(easy);
    } else {
        curl_easy_cleanup(easy);
    }
}

http::TransferErrorKind CurlTransferEngine::classify(int result) const
{
    switch (static_cast<CURLcode>(result)) {
    case CURLE_COULDNT_RESOLVE_PROXY:
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_CONNECT:
    case CURLE_OPERATION_TIMEDOUT:
    case CURLE_SSL_CONNECT_ERROR:
        return http::TransferErrorKind::Network;
    default:
        return http::TransferErrorKind::Request;
    }
}

std::string CurlTransferEngine::describe(int result, TransferHandle handle) const
{
    auto it = _transfers.find(to_easy(handle));
    if (it != _transfers.end() && it->second->errorBuffer[0] != '\0') {
        return std::string(it->second->errorBuffer.data());
    }
    return curl_easy_strerror(static_cast<CURLcode>(result));
}

std::optional<http::PushedResponse> CurlTransferEngine::take_pushed(BatchHandle batch,
                                                                    TransferHandle handle,
                                                                    int result)
{
    CURL* easy = to_easy(handle);
    curl_multi_remove_handle(to_multi(batch), easy);

    auto it = _pushed.find(easy);
    if (it == _pushed.end()) {
        BN_LOGW(TAG, "Finished transfer matches no request or push; discarding");
        curl_easy_cleanup(easy);
        return std::nullopt;
    }

    Pushed pushed = std::move(it->second);
    _pushed.erase(it);
    curl_easy_cleanup(easy);

    if (result != CURLE_OK) {
        BN_LOGW(TAG, "Pushed transfer for %s failed: %s",
                pushed.request->url.c_str(), curl_easy_strerror(static_cast<CURLcode>(result)));
        return std::nullopt;
    }

    http::PushedResponse out;
    out.url = pushed.request->url;
    out.response = pushed.builder->build();
    return out;
}

} // namespace batchnet::platform::posix

#endif // BN_WITH_CURL
