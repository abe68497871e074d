#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "batchnet/http/http_types.h"

namespace batchnet::app {

struct FetchArgs {
    std::string              configPath;
    std::string              method{"GET"};
    http::Headers            headers;
    std::string              body;
    bool                     sync{false};
    bool                     showHelp{false};
    std::vector<std::string> urls;
};

// Parses everything after argv[0]. On failure returns nullopt and fills
// `error`.
std::optional<FetchArgs> parse_fetch_args(const std::vector<std::string_view>& args,
                                          std::string& error);

const char* fetch_usage();

} // namespace batchnet::app
