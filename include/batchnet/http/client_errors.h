#pragma once

#include <stdexcept>
#include <string>

namespace batchnet::http {

struct Request;

// Base of every error raised by the client.
class ClientError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Batch or transfer handle could not be created, or the batch itself failed.
class EngineError : public ClientError {
public:
    using ClientError::ClientError;
};

class InvalidOptionError : public ClientError {
public:
    using ClientError::ClientError;
};

enum class TransferErrorKind {
    Network,   // resolve, connect, timeout, TLS handshake
    Request,   // any other transport failure
    Response,  // transport succeeded but no usable response was produced
};

const char* to_string(TransferErrorKind kind);

// One transfer finished without a usable response.
//
// This is a value type: the coordinator copies the first one of a draining
// pass and rethrows it after every callback of the pass has run.
class TransferError : public ClientError {
public:
    TransferError(const Request& request,
                  TransferErrorKind kind,
                  int nativeCode,
                  std::string reason);

    TransferErrorKind kind() const noexcept { return _kind; }
    int native_code() const noexcept { return _nativeCode; }
    const std::string& reason() const noexcept { return _reason; }

    // The originating request. Borrowed, like the request itself.
    const Request& request() const noexcept { return *_request; }

    const std::string& method() const noexcept { return _method; }
    const std::string& url() const noexcept { return _url; }

private:
    const Request*    _request;
    TransferErrorKind _kind;
    int               _nativeCode;
    std::string       _reason;
    std::string       _method;
    std::string       _url;
};

} // namespace batchnet::http
