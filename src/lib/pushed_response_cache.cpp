#include "batchnet/http/pushed_response_cache.h"

#include <utility>

namespace batchnet::http {

void PushedResponseCache::put(std::string url, Response response)
{
    _responses.insert_or_assign(std::move(url), std::move(response));
}

std::optional<Response> PushedResponseCache::take(const std::string& url)
{
    auto it = _responses.find(url);
    if (it == _responses.end()) {
        return std::nullopt;
    }
    Response out = std::move(it->second);
    _responses.erase(it);
    return out;
}

bool PushedResponseCache::contains(const std::string& url) const
{
    return _responses.find(url) != _responses.end();
}

} // namespace batchnet::http
