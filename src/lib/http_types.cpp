#include "batchnet/http/http_types.h"

#include "batchnet/util/text.h"

namespace batchnet::http {

std::optional<std::string_view> find_header(const Headers& headers, std::string_view name)
{
    for (const auto& h : headers) {
        if (util::iequals(h.first, name)) {
            return std::string_view(h.second);
        }
    }
    return std::nullopt;
}

} // namespace batchnet::http
