#include "batchnet/http/client_errors.h"

#include "batchnet/http/http_types.h"

#include <utility>

namespace batchnet::http {

const char* to_string(TransferErrorKind kind)
{
    switch (kind) {
    case TransferErrorKind::Network:  return "network";
    case TransferErrorKind::Request:  return "request";
    case TransferErrorKind::Response: return "response";
    }
    return "unknown";
}

static std::string format_message(const Request& request,
                                  TransferErrorKind kind,
                                  const std::string& reason)
{
    std::string msg;
    msg.reserve(request.method.size() + request.url.size() + reason.size() + 24);
    msg.append(to_string(kind));
    msg.append(" error: ");
    msg.append(request.method);
    msg.push_back(' ');
    msg.append(request.url);
    msg.append(": ");
    msg.append(reason);
    return msg;
}

TransferError::TransferError(const Request& request,
                             TransferErrorKind kind,
                             int nativeCode,
                             std::string reason)
    : ClientError(format_message(request, kind, reason))
    , _request(&request)
    , _kind(kind)
    , _nativeCode(nativeCode)
    , _reason(std::move(reason))
    , _method(request.method)
    , _url(request.url)
{
}

} // namespace batchnet::http
