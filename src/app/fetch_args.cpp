#include "batchnet/app/fetch_args.h"

#include "batchnet/util/text.h"

#include <cctype>
#include <utility>

namespace batchnet::app {

const char* fetch_usage()
{
    return "usage: batchnet-fetch [-c config.yaml] [-X METHOD] [-H 'Name: value']... "
           "[-d body] [--sync] URL...\n";
}

static bool parse_header(std::string_view raw, http::Header& out)
{
    const std::size_t colon = raw.find(':');
    if (colon == std::string_view::npos) {
        return false;
    }
    const std::string_view name = util::trim_ws(raw.substr(0, colon));
    if (name.empty()) {
        return false;
    }
    const std::string_view value = util::trim_ws(raw.substr(colon + 1));
    out.first.assign(name.data(), name.size());
    out.second.assign(value.data(), value.size());
    return true;
}

std::optional<FetchArgs> parse_fetch_args(const std::vector<std::string_view>& args,
                                          std::string& error)
{
    FetchArgs out;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string_view a = args[i];

        // Flags taking a value.
        if (a == "-c" || a == "-X" || a == "-H" || a == "-d") {
            if (i + 1 >= args.size()) {
                error = std::string("missing value for ") + std::string(a);
                return std::nullopt;
            }
            const std::string_view v = args[++i];

            if (a == "-c") {
                out.configPath.assign(v.data(), v.size());
            } else if (a == "-X") {
                out.method.clear();
                for (char c : v) {
                    out.method.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
                }
            } else if (a == "-H") {
                http::Header h;
                if (!parse_header(v, h)) {
                    error = "malformed header '" + std::string(v) + "'";
                    return std::nullopt;
                }
                out.headers.push_back(std::move(h));
            } else {
                out.body.assign(v.data(), v.size());
            }
            continue;
        }

        if (a == "--sync") {
            out.sync = true;
        } else if (a == "-h" || a == "--help") {
            out.showHelp = true;
        } else if (util::starts_with(a, "-")) {
            error = "unknown option " + std::string(a);
            return std::nullopt;
        } else {
            out.urls.emplace_back(a);
        }
    }

    if (out.urls.empty() && !out.showHelp) {
        error = "no URL given";
        return std::nullopt;
    }

    return out;
}

} // namespace batchnet::app
