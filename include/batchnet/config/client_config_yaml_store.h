#pragma once

#include <string>

#include "batchnet/config/client_config.h"

namespace batchnet::config {

// File-backed YAML implementation of ClientConfigStore.
class YamlClientConfigStore : public ClientConfigStore {
public:
    explicit YamlClientConfigStore(std::string path);

    // A missing file yields defaults. Malformed YAML throws std::runtime_error.
    ClientConfig load() override;
    void         save(const ClientConfig& cfg) override;

private:
    std::string _path;
};

// Parses a YAML document. Missing keys keep their defaults.
ClientConfig load_client_config_from_string(const std::string& yaml);

std::string client_config_to_yaml(const ClientConfig& cfg);

} // namespace batchnet::config
