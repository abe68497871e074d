#include "doctest.h"

#include "batchnet/app/fetch_args.h"

#include <string>
#include <string_view>
#include <vector>

using batchnet::app::FetchArgs;
using batchnet::app::parse_fetch_args;

TEST_CASE("parse_fetch_args: full command line")
{
    std::vector<std::string_view> args{
        "-c", "client.yaml",
        "-X", "post",
        "-H", "Content-Type: application/json",
        "-H", "X-Trace:abc",
        "-d", "{}",
        "--sync",
        "http://a/", "http://b/",
    };

    std::string error;
    auto parsed = parse_fetch_args(args, error);
    REQUIRE(parsed.has_value());

    const FetchArgs& a = *parsed;
    CHECK(a.configPath == "client.yaml");
    CHECK(a.method == "POST");
    REQUIRE(a.headers.size() == 2);
    CHECK(a.headers[0].first == "Content-Type");
    CHECK(a.headers[0].second == "application/json");
    CHECK(a.headers[1].first == "X-Trace");
    CHECK(a.headers[1].second == "abc");
    CHECK(a.body == "{}");
    CHECK(a.sync);
    REQUIRE(a.urls.size() == 2);
    CHECK(a.urls[1] == "http://b/");
}

TEST_CASE("parse_fetch_args: defaults")
{
    std::string error;
    auto parsed = parse_fetch_args({"http://only/"}, error);
    REQUIRE(parsed.has_value());
    CHECK(parsed->method == "GET");
    CHECK_FALSE(parsed->sync);
    CHECK(parsed->headers.empty());
    CHECK(parsed->configPath.empty());
}

TEST_CASE("parse_fetch_args: errors")
{
    std::string error;

    CHECK_FALSE(parse_fetch_args({}, error).has_value());
    CHECK(error == "no URL given");

    CHECK_FALSE(parse_fetch_args({"-H"}, error).has_value());
    CHECK(error == "missing value for -H");

    CHECK_FALSE(parse_fetch_args({"-H", "nocolon", "http://a/"}, error).has_value());
    CHECK(error.find("malformed header") != std::string::npos);

    CHECK_FALSE(parse_fetch_args({"--bogus", "http://a/"}, error).has_value());
    CHECK(error == "unknown option --bogus");
}

TEST_CASE("parse_fetch_args: help needs no URL")
{
    std::string error;
    auto parsed = parse_fetch_args({"--help"}, error);
    REQUIRE(parsed.has_value());
    CHECK(parsed->showHelp);
}
