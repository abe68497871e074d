#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

#include "batchnet/http/http_types.h"

namespace batchnet::http {

// Responses the server pushed ahead of being asked, keyed by URL.
class PushedResponseCache {
public:
    // Replaces any earlier push for the same URL.
    void put(std::string url, Response response);

    // Removes and returns the push for `url`, if any.
    std::optional<Response> take(const std::string& url);

    bool contains(const std::string& url) const;
    std::size_t size() const noexcept { return _responses.size(); }
    void clear() { _responses.clear(); }

private:
    std::unordered_map<std::string, Response> _responses;
};

} // namespace batchnet::http
