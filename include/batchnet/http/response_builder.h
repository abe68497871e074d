#pragma once

#include <cstddef>
#include <string_view>

#include "batchnet/http/http_types.h"

namespace batchnet::http {

// Accumulates what the transport hands back for one transfer (raw header
// lines, then body bytes) and turns it into a Response.
class ResponseBuilder {
public:
    explicit ResponseBuilder(const Request& request);

    // One header line, with or without its trailing CRLF. A status line
    // starts over, so interim (1xx) and redirect responses are dropped.
    void add_header_line(std::string_view line);

    void append_body(const char* data, std::size_t len);

    bool has_status() const noexcept { return _hasStatus; }

    // Throws TransferError (kind Response) if no status line was received.
    Response build() const;

    const Request& request() const noexcept { return _request; }

private:
    bool parse_status_line(std::string_view line);

    const Request& _request;
    bool     _hasStatus{false};
    Response _response;
};

} // namespace batchnet::http
