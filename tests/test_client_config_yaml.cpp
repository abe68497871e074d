#include "doctest.h"

#include "batchnet/config/client_config.h"
#include "batchnet/config/client_config_yaml_store.h"

#include <chrono>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <unistd.h>

using batchnet::config::ClientConfig;
using batchnet::config::YamlClientConfigStore;
using batchnet::config::client_config_to_yaml;
using batchnet::config::load_client_config_from_string;
using batchnet::config::make_options;

namespace {

std::string temp_path(const char* name)
{
    return std::string("/tmp/batchnet_test_") + std::to_string(::getpid()) + "_" + name;
}

} // namespace

TEST_CASE("ClientConfig: full document")
{
    const std::string yaml = R"(
client:
  allow_redirects: true
  max_redirects: 3
  timeout_ms: 2500
  verify: false
  proxy: "http://proxy:3128"
  use_pushed_response: false
engine:
  max_idle_handles: 8
  server_push: true
  max_host_connections: 4
  wait_timeout_ms: 250
logging:
  level: Debug
)";

    ClientConfig cfg = load_client_config_from_string(yaml);

    CHECK(cfg.defaults.allowRedirects == true);
    CHECK(cfg.defaults.maxRedirects == 3);
    CHECK(cfg.defaults.timeoutMs == 2500);
    CHECK(cfg.defaults.verify == false);
    CHECK(cfg.defaults.proxy == "http://proxy:3128");
    CHECK(cfg.defaults.usePushedResponse == false);

    CHECK(cfg.engine.maxIdleHandles == 8);
    CHECK(cfg.engine.serverPush == true);
    CHECK(cfg.engine.maxHostConnections == 4);
    CHECK(cfg.engine.waitTimeoutMs == 250);

    CHECK(cfg.logging.level == batchnet::log::Level::Debug);
}

TEST_CASE("ClientConfig: missing keys keep defaults")
{
    ClientConfig cfg = load_client_config_from_string("client:\n  timeout_ms: 10\n");

    CHECK(cfg.defaults.timeoutMs == 10);
    CHECK(cfg.defaults.maxRedirects == 5);
    CHECK(cfg.defaults.verify == true);
    CHECK(cfg.engine.maxIdleHandles == 5);
    CHECK(cfg.engine.serverPush == false);

    ClientConfig empty = load_client_config_from_string("");
    CHECK(empty.engine.waitTimeoutMs == 1000);
    CHECK(empty.logging.level == batchnet::log::Level::Info);
}

TEST_CASE("ClientConfig: malformed YAML throws")
{
    CHECK_THROWS_AS(load_client_config_from_string("client: [unterminated"), std::runtime_error);
    CHECK_THROWS_AS(load_client_config_from_string("client:\n  max_redirects: lots\n"),
                    std::runtime_error);
    CHECK_THROWS_AS(load_client_config_from_string("logging:\n  level: chatty\n"),
                    std::runtime_error);
}

TEST_CASE("ClientConfig: make_options copies request defaults")
{
    ClientConfig cfg;
    cfg.defaults.allowRedirects = true;
    cfg.defaults.timeoutMs = 1500;
    cfg.defaults.proxy = "socks5://p:1080";

    auto o = make_options(cfg.defaults);
    CHECK(o.allowRedirects == true);
    CHECK(o.timeout == std::chrono::milliseconds(1500));
    CHECK(o.proxy == "socks5://p:1080");
    CHECK_FALSE(static_cast<bool>(o.callback));
}

TEST_CASE("YamlClientConfigStore: save then load")
{
    const std::string path = temp_path("roundtrip.yaml");

    ClientConfig cfg;
    cfg.defaults.maxRedirects = 9;
    cfg.defaults.proxy = "http://p:8080";
    cfg.engine.serverPush = true;
    cfg.engine.maxIdleHandles = 2;
    cfg.logging.level = batchnet::log::Level::Error;

    YamlClientConfigStore store(path);
    store.save(cfg);

    ClientConfig loaded = store.load();
    CHECK(loaded.defaults.maxRedirects == 9);
    CHECK(loaded.defaults.proxy == "http://p:8080");
    CHECK(loaded.engine.serverPush == true);
    CHECK(loaded.engine.maxIdleHandles == 2);
    CHECK(loaded.logging.level == batchnet::log::Level::Error);

    CHECK(client_config_to_yaml(loaded) == client_config_to_yaml(cfg));

    std::remove(path.c_str());
}

TEST_CASE("YamlClientConfigStore: missing file yields defaults")
{
    YamlClientConfigStore store(temp_path("does_not_exist.yaml"));
    ClientConfig cfg = store.load();
    CHECK(cfg.defaults.maxRedirects == 5);
    CHECK(cfg.engine.maxIdleHandles == 5);
}
