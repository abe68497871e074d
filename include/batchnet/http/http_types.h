#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace batchnet::http {

using Header  = std::pair<std::string, std::string>;
using Headers = std::vector<Header>;

// Case-insensitive lookup of the first header called `name`.
std::optional<std::string_view> find_header(const Headers& headers, std::string_view name);

// An outgoing HTTP request. The transfer machinery never modifies it and
// only borrows it, so it must outlive the delivery of its callback.
struct Request {
    std::string method{"GET"};
    std::string url;
    std::string protocolVersion{"1.1"};   // "1.0", "1.1", "2.0"
    Headers     headers;
    std::string body;

    std::optional<std::string_view> header(std::string_view name) const
    {
        return find_header(headers, name);
    }
};

struct Response {
    std::string   protocolVersion;
    std::uint16_t statusCode{0};
    std::string   reasonPhrase;
    Headers       headers;
    std::string   body;

    std::optional<std::string_view> header(std::string_view name) const
    {
        return find_header(headers, name);
    }
};

} // namespace batchnet::http
