#include "batchnet/http/response_builder.h"

#include "batchnet/core/logging.h"
#include "batchnet/http/client_errors.h"
#include "batchnet/util/text.h"

#include <cctype>

namespace batchnet::http {

static constexpr const char* TAG = "builder";

ResponseBuilder::ResponseBuilder(const Request& request)
    : _request(request)
{
}

bool ResponseBuilder::parse_status_line(std::string_view line)
{
    // HTTP/<version> <code> [<reason>]
    if (!util::starts_with(line, "HTTP/")) {
        return false;
    }
    line.remove_prefix(5);

    const std::size_t sp = line.find(' ');
    if (sp == std::string_view::npos || sp == 0) {
        return false;
    }
    std::string_view version = line.substr(0, sp);
    std::string_view rest = util::trim_ws(line.substr(sp + 1));

    if (rest.size() < 3) {
        return false;
    }
    unsigned code = 0;
    for (std::size_t i = 0; i < 3; ++i) {
        const unsigned char c = static_cast<unsigned char>(rest[i]);
        if (!std::isdigit(c)) {
            return false;
        }
        code = code * 10 + (c - '0');
    }
    if (rest.size() > 3 && rest[3] != ' ') {
        return false;
    }

    _response = Response{};
    _response.protocolVersion.assign(version.data(), version.size());
    _response.statusCode = static_cast<std::uint16_t>(code);
    const std::string_view reason = util::trim_ws(rest.substr(3));
    _response.reasonPhrase.assign(reason.data(), reason.size());
    _hasStatus = true;
    return true;
}

void ResponseBuilder::add_header_line(std::string_view line)
{
    line = util::trim_ws(line);
    if (line.empty()) {
        return;
    }

    if (util::starts_with(line, "HTTP/")) {
        if (!parse_status_line(line)) {
            BN_LOGW(TAG, "Ignoring malformed status line for %s", _request.url.c_str());
        }
        return;
    }

    const std::size_t colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return;
    }

    const std::string_view name = util::trim_ws(line.substr(0, colon));
    const std::string_view value = util::trim_ws(line.substr(colon + 1));
    _response.headers.emplace_back(std::string(name), std::string(value));
}

void ResponseBuilder::append_body(const char* data, std::size_t len)
{
    if (!data || len == 0) {
        return;
    }
    _response.body.append(data, len);
}

Response ResponseBuilder::build() const
{
    if (!_hasStatus) {
        throw TransferError(_request, TransferErrorKind::Response, 0,
                            "no HTTP status line received");
    }
    return _response;
}

} // namespace batchnet::http
